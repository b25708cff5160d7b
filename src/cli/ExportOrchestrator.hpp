/**
 * @file ExportOrchestrator.hpp
 * @brief Runs the analysis from datasets on disk to output datasets
 *
 * Separates dataset handling (opening inputs, creating one writer per
 * output format, writing the report) from the analysis itself, which only
 * sees abstract sources and sinks.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include "../core/Logger.hpp"
#include "../core/OutputTracker.hpp"
#include <string>
#include <vector>

namespace habitat {

/**
 * @brief Orchestrates a complete file-based run
 *
 * Order of work:
 * 1. validate the configuration
 * 2. open both input layers
 * 3. build the coverage region (fails before any output exists)
 * 4. create the "all" and "suitable" datasets for every format
 * 5. segment and classify, streaming into the writers
 * 6. close the writers and write <base>_summary.json
 */
class ExportOrchestrator {
public:
    explicit ExportOrchestrator(const AnalysisConfig& config);
    ~ExportOrchestrator();

    /**
     * @brief Execute the run
     * @throws AnalysisError (or a subclass) on any fatal error
     */
    RunSummary run();

    /**
     * @brief Path of an output dataset, e.g. output/river_segments_all.shp
     * @param stream "all" or "suitable"
     */
    std::string output_path(const std::string& format, const std::string& stream) const;

    std::string summary_path() const;

    const OutputTracker& get_output_tracker() const { return output_tracker_; }
    std::vector<std::string> get_output_files() const { return output_tracker_.getOutputFiles(); }

private:
    AnalysisConfig config_;
    Logger logger_;
    OutputTracker output_tracker_;

    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;
    ExportOrchestrator(ExportOrchestrator&&) = delete;
    ExportOrchestrator& operator=(ExportOrchestrator&&) = delete;
};

} // namespace habitat
