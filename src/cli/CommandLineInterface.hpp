/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the habitat segmenter
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include "SimpleCommandLineParser.hpp"
#include "UnitParser.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace habitat {

/**
 * @brief Outcome of argument parsing
 */
enum class ParseOutcome {
    RUN,         ///< Configuration ready, continue with the run
    EXIT_OK,     ///< Help, version or --create-config handled
    EXIT_ERROR   ///< Invalid arguments or configuration file
};

/**
 * @brief Builds an AnalysisConfig from defaults, a JSON config file, the
 * environment and command line options, in increasing priority
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    ParseOutcome parse_arguments(int argc, char* argv[]);

    const AnalysisConfig& get_config() const { return config_; }

    /**
     * @brief Logger configuration string, e.g. "3,SuitabilityAnalyzer=5"
     */
    const std::string& get_log_config() const { return log_config_; }

    bool is_dry_run() const { return dry_run_; }
    bool is_silent() const { return silent_; }

    void print_config() const;

    /**
     * @brief Apply a parsed JSON configuration object
     *
     * Unknown keys are ignored. Distance keys accept numbers or unit strings.
     * @throws UnitParseError for malformed distances
     * @throws nlohmann::json::exception for values of the wrong type
     */
    void apply_config_json(const nlohmann::json& config);

    /**
     * @brief Apply HABITAT_LOG_LEVEL and HABITAT_LOG_FILE
     */
    void apply_environment();

    /**
     * @brief Default configuration as JSON, as written by --create-config
     */
    static nlohmann::json default_config_json();

    static std::vector<std::string> parse_formats(const std::string& formats_str);

private:
    AnalysisConfig config_;
    std::string log_config_ = "3";
    bool dry_run_ = false;
    bool silent_ = false;
    UnitParser unit_parser_;

    void register_options(SimpleCommandLineParser& parser) const;

    /**
     * @throws UnitParseError for malformed distances
     */
    void apply_command_line(const SimpleCommandLineParser& parser);

    bool create_default_config_file(const std::string& filename);
    bool load_config_file(const std::string& filename);

    double parse_distance(const std::string& value) const { return unit_parser_.parse_distance(value).value; }
};

} // namespace habitat
