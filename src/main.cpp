/**
 * @file main.cpp
 * @brief Main entry point for the river habitat suitability segmenter
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "habitat_analyzer.hpp"
#include "UnitParser.hpp"
#include "core/Logger.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ExportOrchestrator.hpp"
#include "version.h"
#include <chrono>
#include <iomanip>
#include <iostream>

using namespace habitat;

/**
 * @brief Apply the global logging configuration before any component logs
 */
void configure_logging(const CommandLineInterface& cli) {
    const auto& config = cli.get_config();
    Logger::setDefaultLevel(static_cast<LogLevel>(config.log_level));
    Logger::parseLogConfig(cli.get_log_config());
    if (config.log_file) {
        Logger::setGlobalLogFile(config.log_file);
    }
}

/**
 * @brief Print run summary
 */
void print_run_summary(const RunSummary& summary, const std::vector<std::string>& output_files) {
    std::cout << "\n=== Run Summary ===\n";
    std::cout << "Segments: " << summary.total_segments << "\n";
    std::cout << "Suitable: " << summary.suitable_segments << "\n";
    std::cout << "Success rate: " << std::fixed << std::setprecision(1)
              << summary.success_rate() << "%\n";
    if (!summary.skipped_features.empty()) {
        std::cout << "Skipped features: " << summary.skipped_features.size() << "\n";
    }
    if (!output_files.empty()) {
        std::cout << "Output files:\n";
        for (const auto& file : output_files) {
            std::cout << "  " << file << "\n";
        }
    }
    std::cout << "===================\n";
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::steady_clock::now();

    CommandLineInterface cli;
    switch (cli.parse_arguments(argc, argv)) {
        case ParseOutcome::EXIT_OK:    return 0;
        case ParseOutcome::EXIT_ERROR: return 1;
        case ParseOutcome::RUN:        break;
    }

    configure_logging(cli);
    const auto& config = cli.get_config();

    if (!cli.is_silent()) {
        std::cout << "habitat-seg v" << HABITAT_VERSION_STRING << "\n";
        std::cout << "River habitat suitability segmentation on GDAL/OGR\n";
    }

    if (config.log_level >= 4) {
        cli.print_config();
    }

    try {
        if (cli.is_dry_run()) {
            // Constructing the analyzer validates the parameters
            SuitabilityAnalyzer validator(config);
            if (!cli.is_silent()) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return 0;
        }

        ExportOrchestrator orchestrator(config);
        RunSummary summary = orchestrator.run();

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!cli.is_silent()) {
            print_run_summary(summary, orchestrator.get_output_files());
            std::cout << "\nCompleted in " << total_duration.count() << "ms\n";
        }
        return 0;

    } catch (const InvalidConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const AnalysisError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const UnitParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

// Example usage:
//
// ./habitat-seg --lines rivers.shp --polygons forest.shp
//
// ./habitat-seg --lines rivers.gpkg --lines-layer main_channels \
//               --polygons forest.gpkg --polygons-layer stands \
//               --segment-length 4km --min-coverage 1.9km \
//               --output-formats shapefile,gpkg --parallel -j 8
