/**
 * @file RunReportWriter.cpp
 * @brief Implementation of the JSON run report
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RunReportWriter.hpp"
#include "../core/Logger.hpp"
#include <cmath>
#include <fstream>

using json = nlohmann::json;

namespace habitat {

json RunReportWriter::to_json(const AnalysisConfig& config, const RunSummary& summary,
                              const std::vector<std::string>& output_files) {
    json report;

    report["parameters"] = {
        {"segment_length", config.segment_length},
        {"sample_interval", config.sample_interval},
        {"buffer_margin", config.buffer_margin},
        {"min_coverage_length", config.min_coverage_length},
        {"buffer_arc_segments", config.buffer_arc_segments},
        {"parallel_processing", config.parallel_processing}
    };

    report["inputs"] = {
        {"lines", config.lines_path},
        {"polygons", config.polygons_path}
    };

    report["results"] = {
        {"total_segments", summary.total_segments},
        {"suitable_segments", summary.suitable_segments},
        {"success_rate", round_decimals(summary.success_rate(), 1)},
        {"lines_processed", summary.lines_processed},
        {"parts_processed", summary.parts_processed},
        {"parts_too_short", summary.parts_too_short},
        {"coverage_features_used", summary.coverage_features_used}
    };

    json skipped = json::array();
    for (const auto& failure : summary.skipped_features) {
        json entry = {
            {"source", failure.source == FeatureFailure::Source::LINES ? "lines" : "polygons"},
            {"feature_id", failure.feature_id},
            {"reason", failure.reason}
        };
        entry["part_index"] = failure.part_index ? json(*failure.part_index) : json(nullptr);
        skipped.push_back(std::move(entry));
    }
    report["skipped_features"] = std::move(skipped);

    report["timing_ms"] = {
        {"coverage", summary.coverage_time.count()},
        {"classification", summary.classification_time.count()}
    };

    report["outputs"] = output_files;

    return report;
}

void RunReportWriter::write(const std::string& path, const AnalysisConfig& config, const RunSummary& summary,
                            const std::vector<std::string>& output_files) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw DatasetError("cannot write run report '" + path + "'");
    }

    file << to_json(config, summary, output_files).dump(2) << "\n";
    if (!file) {
        throw DatasetError("failed while writing run report '" + path + "'");
    }

    Logger("RunReportWriter").detailed("Wrote run report " + path);
}

} // namespace habitat
