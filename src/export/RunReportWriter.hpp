/**
 * @file RunReportWriter.hpp
 * @brief JSON report of a finished run
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace habitat {

/**
 * @brief Serializes the parameters, statistics and outputs of a run
 *
 * Layout:
 * {
 *   "parameters": { segment_length, sample_interval, buffer_margin, ... },
 *   "inputs":     { lines, polygons },
 *   "results":    { total_segments, suitable_segments, success_rate, ... },
 *   "skipped_features": [ { source, feature_id, part_index, reason } ],
 *   "timing_ms":  { coverage, classification },
 *   "outputs":    [ paths ]
 * }
 */
class RunReportWriter {
public:
    static nlohmann::json to_json(const AnalysisConfig& config, const RunSummary& summary,
                                  const std::vector<std::string>& output_files);

    /**
     * @throws DatasetError if the file cannot be written
     */
    static void write(const std::string& path, const AnalysisConfig& config, const RunSummary& summary,
                      const std::vector<std::string>& output_files);
};

} // namespace habitat
