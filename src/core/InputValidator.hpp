/**
 * @file InputValidator.hpp
 * @brief Validation of analysis parameters before a run starts
 *
 * Detects contradictory or out-of-range parameters and reports them with
 * the offending values and suggested fixes.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace habitat {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;                   // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 *
 * Conflicts make the configuration unusable. Warnings describe a valid
 * configuration that is unlikely to be what the user meant.
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;
    std::vector<ParameterConflict> warnings;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }
    bool has_warnings() const { return !warnings.empty(); }

    std::string format_error_message() const;
    std::string format_warning_message() const;
};

/**
 * @brief Validates analysis parameters for contradictions
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @return Validation result with any conflicts and warnings found
     */
    ValidationResult validate(const AnalysisConfig& config) const;

    /**
     * @brief Output formats accepted by the vector writer
     */
    static const std::vector<std::string>& supported_formats();

private:
    /**
     * @brief Every distance parameter must be a finite number
     */
    std::optional<ParameterConflict> check_finite_parameters(
        const AnalysisConfig& config) const;

    /**
     * @brief segment_length > 0 and 0 < sample_interval <= segment_length
     */
    std::optional<ParameterConflict> check_window_parameters(
        const AnalysisConfig& config) const;

    /**
     * @brief buffer_margin >= 0 and buffer_arc_segments >= 1
     */
    std::optional<ParameterConflict> check_buffer_parameters(
        const AnalysisConfig& config) const;

    /**
     * @brief min_coverage_length >= 0
     */
    std::optional<ParameterConflict> check_coverage_threshold(
        const AnalysisConfig& config) const;

    /**
     * @brief A threshold above the segment length can never be met
     */
    std::optional<ParameterConflict> check_threshold_reachable(
        const AnalysisConfig& config) const;

    /**
     * @brief Thread count and output format names
     */
    std::optional<ParameterConflict> check_processing_options(
        const AnalysisConfig& config) const;
};

} // namespace habitat
