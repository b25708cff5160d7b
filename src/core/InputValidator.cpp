/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "InputValidator.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace habitat {

namespace {

std::string fmt(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

void append_conflicts(std::ostringstream& oss, const std::vector<ParameterConflict>& conflicts,
                      const char* label) {
    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << label << " " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }
}

} // namespace

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid analysis parameters:\n\n";
    append_conflicts(oss, conflicts, "Conflict");
    oss << "\nRun aborted due to invalid parameters.\n";
    return oss.str();
}

std::string ValidationResult::format_warning_message() const {
    if (warnings.empty()) {
        return "";
    }

    std::ostringstream oss;
    append_conflicts(oss, warnings, "Warning");
    return oss.str();
}

const std::vector<std::string>& InputValidator::supported_formats() {
    static const std::vector<std::string> formats = {"shapefile", "gpkg", "geojson"};
    return formats;
}

ValidationResult InputValidator::validate(const AnalysisConfig& config) const {
    ValidationResult result;
    result.is_valid = true;

    auto add = [&result](std::optional<ParameterConflict> conflict) {
        if (conflict) {
            result.conflicts.push_back(std::move(*conflict));
            result.is_valid = false;
        }
    };

    // Range checks are meaningless on NaN, so stop at the first failure here
    auto finite_conflict = check_finite_parameters(config);
    if (finite_conflict) {
        add(std::move(finite_conflict));
        return result;
    }

    add(check_window_parameters(config));
    add(check_buffer_parameters(config));
    add(check_coverage_threshold(config));
    add(check_processing_options(config));

    if (result.is_valid) {
        auto unreachable = check_threshold_reachable(config);
        if (unreachable) {
            result.warnings.push_back(std::move(*unreachable));
        }
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_finite_parameters(
    const AnalysisConfig& config) const {

    const std::pair<const char*, double> values[] = {
        {"--segment-length", config.segment_length},
        {"--sample-interval", config.sample_interval},
        {"--buffer-margin", config.buffer_margin},
        {"--min-coverage", config.min_coverage_length},
    };

    ParameterConflict conflict;
    for (const auto& [name, value] : values) {
        if (!std::isfinite(value)) {
            conflict.involved_params.push_back(std::string(name) + " " + fmt(value));
        }
    }
    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }

    conflict.description = "Distance parameters must be finite numbers";
    conflict.suggestions = {"Provide plain distances such as 4000 or 4km"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_window_parameters(
    const AnalysisConfig& config) const {

    ParameterConflict conflict;
    conflict.involved_params = {
        "--segment-length " + fmt(config.segment_length),
        "--sample-interval " + fmt(config.sample_interval)
    };

    if (config.segment_length <= 0.0) {
        conflict.description = "Segment length must be positive";
        conflict.suggestions = {"Use --segment-length 4000 (the reference window length)"};
        return conflict;
    }

    if (config.sample_interval <= 0.0) {
        conflict.description = "Sample interval must be positive";
        conflict.suggestions = {"Use --sample-interval 50 (the reference step)"};
        return conflict;
    }

    if (config.sample_interval > config.segment_length) {
        conflict.description = "Sample interval exceeds segment length";
        conflict.involved_params.push_back(
            "Calculation: " + fmt(config.sample_interval) + " > " + fmt(config.segment_length));
        conflict.suggestions = {
            "Use --sample-interval " + fmt(config.segment_length) + " or less",
            "Use --segment-length " + fmt(config.sample_interval) + " or more"
        };
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_buffer_parameters(
    const AnalysisConfig& config) const {

    if (config.buffer_margin < 0.0) {
        ParameterConflict conflict;
        conflict.description = "Buffer margin must not be negative";
        conflict.involved_params = {"--buffer-margin " + fmt(config.buffer_margin)};
        conflict.suggestions = {"Use --buffer-margin 0 to classify against the polygons as given"};
        return conflict;
    }

    if (config.buffer_arc_segments < 1) {
        ParameterConflict conflict;
        conflict.description = "Buffer arc segments must be at least 1";
        conflict.involved_params = {"--arc-segments " + std::to_string(config.buffer_arc_segments)};
        conflict.suggestions = {"Use --arc-segments 5 (the reference resolution)"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_coverage_threshold(
    const AnalysisConfig& config) const {

    if (config.min_coverage_length < 0.0) {
        ParameterConflict conflict;
        conflict.description = "Minimum coverage length must not be negative";
        conflict.involved_params = {"--min-coverage " + fmt(config.min_coverage_length)};
        conflict.suggestions = {"Use --min-coverage 0 to mark every segment suitable"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_threshold_reachable(
    const AnalysisConfig& config) const {

    if (config.min_coverage_length <= config.segment_length) {
        return std::nullopt;
    }

    ParameterConflict warning;
    warning.description = "Minimum coverage length exceeds segment length, no segment can be suitable";
    warning.involved_params = {
        "--min-coverage " + fmt(config.min_coverage_length),
        "--segment-length " + fmt(config.segment_length)
    };
    warning.suggestions = {"Use --min-coverage " + fmt(config.segment_length) + " or less"};
    return warning;
}

std::optional<ParameterConflict> InputValidator::check_processing_options(
    const AnalysisConfig& config) const {

    if (config.num_threads < 0) {
        ParameterConflict conflict;
        conflict.description = "Thread count must not be negative";
        conflict.involved_params = {"--threads " + std::to_string(config.num_threads)};
        conflict.suggestions = {"Use --threads 0 to detect the hardware concurrency"};
        return conflict;
    }

    if (config.output_formats.empty()) {
        ParameterConflict conflict;
        conflict.description = "No output format selected";
        conflict.involved_params = {"--output-formats"};
        conflict.suggestions = {"Use one or more of: shapefile, gpkg, geojson"};
        return conflict;
    }

    const auto& formats = supported_formats();
    for (size_t i = 0; i < config.output_formats.size(); ++i) {
        const auto& format = config.output_formats[i];
        if (std::find(formats.begin(), formats.end(), format) == formats.end()) {
            ParameterConflict conflict;
            conflict.description = "Unsupported output format '" + format + "'";
            conflict.involved_params = {"--output-formats"};
            conflict.suggestions = {"Use one or more of: shapefile, gpkg, geojson"};
            return conflict;
        }
        // Each format owns one <base>_all and one <base>_suitable dataset
        if (std::find(config.output_formats.begin(), config.output_formats.begin() + i, format) !=
            config.output_formats.begin() + i) {
            ParameterConflict conflict;
            conflict.description = "Output format '" + format + "' is listed more than once";
            conflict.involved_params = {"--output-formats"};
            conflict.suggestions = {"List each format once"};
            return conflict;
        }
    }

    return std::nullopt;
}

} // namespace habitat
