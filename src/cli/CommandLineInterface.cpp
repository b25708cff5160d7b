/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CommandLineInterface.hpp"
#include "version.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace habitat {

namespace {

/**
 * @brief Leading bare level of a log configuration string ("4,Foo=6" -> 4)
 */
std::optional<int> default_level_of(const std::string& log_config) {
    std::istringstream iss(log_config);
    std::string token;
    while (std::getline(iss, token, ',')) {
        if (token.find('=') != std::string::npos) continue;
        try {
            return std::stoi(token);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    parser.begin_section("INPUT OPTIONS");
    parser.add_option("lines", "l", "Line dataset (river centerlines), any OGR vector format");
    parser.add_option("lines-layer", "", "Layer of the line dataset (default: first layer)");
    parser.add_option("polygons", "p", "Polygon dataset (coverage, e.g. forest stands)");
    parser.add_option("polygons-layer", "", "Layer of the polygon dataset (default: first layer)");
    parser.add_option("config", "c", "Path to JSON configuration file");

    parser.begin_section("ANALYSIS OPTIONS");
    parser.add_option("segment-length", "", "Window length, accepts units (e.g. 4km)", false, "4000");
    parser.add_option("sample-interval", "", "Window step and vertex spacing", false, "50");
    parser.add_option("buffer-margin", "", "Outward buffer of every coverage polygon", false, "20");
    parser.add_option("min-coverage", "", "Overlap length needed for a suitable segment", false, "1900");
    parser.add_option("arc-segments", "", "Buffer segments per quarter circle", false, "5");

    parser.begin_section("PROCESSING OPTIONS");
    parser.add_flag("parallel", "", "Classify the windows of each line part in parallel");
    parser.add_option("threads", "j", "Worker threads for --parallel, 0 = all cores", false, "0");
    parser.add_option("progress-interval", "", "Log progress every N segments, 0 disables", false, "25");

    parser.begin_section("OUTPUT OPTIONS");
    parser.add_option("output-dir", "o", "Output directory", false, "output");
    parser.add_option("base-name", "", "Prefix of the output files", false, "river_segments");
    parser.add_option("output-formats", "", "Comma-separated: shapefile,gpkg,geojson", false, "shapefile");
    parser.add_flag("no-summary", "", "Do not write <base>_summary.json");

    parser.begin_section("LOGGING AND UTILITY OPTIONS");
    parser.add_option("log-level", "", "1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "per facility: \"3,SuitabilityAnalyzer=5\"", false, "3");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("silent", "s", "Errors only, no banner (same as --log-level 1)");
    parser.add_flag("verbose", "v", "Log everything (same as --log-level 6)");
    parser.add_option("create-config", "", "Write a default configuration file to the given path and exit");
    parser.add_flag("dry-run", "", "Validate arguments and configuration without processing");
    parser.add_flag("version", "", "Show version information");
}

ParseOutcome CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("habitat-seg",
        "HABITAT-SEG - River habitat suitability segmenter\n"
        "\n"
        "Cuts every river centerline into overlapping fixed-length segments and\n"
        "marks a segment suitable when enough of its length runs through the\n"
        "buffered forest cover.\n"
        "\n"
        "Examples:\n"
        "  habitat-seg --lines rivers.shp --polygons forest.gpkg\n"
        "  habitat-seg -c lapland.json --output-formats shapefile,gpkg --parallel");

    register_options(parser);

    if (!parser.parse(argc, argv)) {
        // Help requested or error already reported
        bool help = false;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") help = true;
        }
        return help ? ParseOutcome::EXIT_OK : ParseOutcome::EXIT_ERROR;
    }

    if (parser.get_flag("version")) {
        std::cout << "habitat-seg v" << HABITAT_VERSION_STRING << std::endl;
        std::cout << "River habitat suitability segmentation on GDAL/OGR" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        return ParseOutcome::EXIT_OK;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            return ParseOutcome::EXIT_ERROR;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return ParseOutcome::EXIT_OK;
    }

    // Lowest to highest priority: file, environment, command line
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            return ParseOutcome::EXIT_ERROR;
        }
        config_.config_file = config_file.value();
    }

    apply_environment();

    try {
        apply_command_line(parser);
    } catch (const UnitParseError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return ParseOutcome::EXIT_ERROR;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return ParseOutcome::EXIT_ERROR;
    }

    dry_run_ = parser.get_flag("dry-run");

    if (!dry_run_ && (config_.lines_path.empty() || config_.polygons_path.empty())) {
        std::cerr << "Both --lines and --polygons are required (or set them in the config file)" << std::endl;
        return ParseOutcome::EXIT_ERROR;
    }

    return ParseOutcome::RUN;
}

void CommandLineInterface::apply_command_line(const SimpleCommandLineParser& parser) {
    auto require_int = [&parser](const std::string& name) -> std::optional<long long> {
        if (!parser.has(name)) return std::nullopt;
        auto value = parser.get_as<long long>(name);
        if (!value) {
            throw std::invalid_argument("--" + name + " expects an integer, got '" + parser.get(name).value() + "'");
        }
        return value;
    };

    // Inputs
    if (auto value = parser.get("lines")) config_.lines_path = value.value();
    if (auto value = parser.get("lines-layer")) config_.lines_layer = value.value();
    if (auto value = parser.get("polygons")) config_.polygons_path = value.value();
    if (auto value = parser.get("polygons-layer")) config_.polygons_layer = value.value();

    // Analysis parameters with unit suffix support (e.g. "4km", "65ft")
    if (auto value = parser.get("segment-length")) config_.segment_length = parse_distance(value.value());
    if (auto value = parser.get("sample-interval")) config_.sample_interval = parse_distance(value.value());
    if (auto value = parser.get("buffer-margin")) config_.buffer_margin = parse_distance(value.value());
    if (auto value = parser.get("min-coverage")) config_.min_coverage_length = parse_distance(value.value());
    if (auto value = require_int("arc-segments")) config_.buffer_arc_segments = static_cast<int>(value.value());

    // Processing
    if (parser.get_flag("parallel")) config_.parallel_processing = true;
    if (auto value = require_int("threads")) config_.num_threads = static_cast<int>(value.value());
    if (auto value = require_int("progress-interval")) {
        if (value.value() < 0) {
            throw std::invalid_argument("--progress-interval must not be negative");
        }
        config_.progress_interval = static_cast<size_t>(value.value());
    }

    // Outputs
    if (auto value = parser.get("output-dir")) {
        std::string path = value.value();
        if (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        config_.output_directory = path;
    }
    if (auto value = parser.get("base-name")) config_.base_name = value.value();
    if (auto value = parser.get("output-formats")) config_.output_formats = parse_formats(value.value());
    if (parser.get_flag("no-summary")) config_.write_summary = false;

    // Logging
    if (auto value = parser.get("log-level")) log_config_ = value.value();
    if (parser.get_flag("verbose")) log_config_ = "6";
    if (parser.get_flag("silent")) {
        log_config_ = "1";
        silent_ = true;
    }
    if (auto level = default_level_of(log_config_)) config_.log_level = level.value();
    if (auto value = parser.get("log-file")) config_.log_file = value.value();
}

void CommandLineInterface::apply_environment() {
    if (const char* level = std::getenv("HABITAT_LOG_LEVEL")) {
        if (*level) {
            log_config_ = level;
            if (auto parsed = default_level_of(log_config_)) config_.log_level = parsed.value();
        }
    }
    if (const char* file = std::getenv("HABITAT_LOG_FILE")) {
        if (*file) {
            config_.log_file = std::string(file);
        }
    }
}

void CommandLineInterface::apply_config_json(const json& config) {
    auto parse_distance_value = [this, &config](const std::string& key, double& target) {
        if (!config.contains(key) || config[key].is_null()) return;

        if (config[key].is_string()) {
            target = parse_distance(config[key].get<std::string>());
        } else {
            target = config[key].get<double>();
        }
    };

    // Inputs
    if (config.contains("lines")) config_.lines_path = config["lines"].get<std::string>();
    if (config.contains("lines_layer")) config_.lines_layer = config["lines_layer"].get<std::string>();
    if (config.contains("polygons")) config_.polygons_path = config["polygons"].get<std::string>();
    if (config.contains("polygons_layer")) config_.polygons_layer = config["polygons_layer"].get<std::string>();

    // Analysis parameters
    parse_distance_value("segment_length", config_.segment_length);
    parse_distance_value("sample_interval", config_.sample_interval);
    parse_distance_value("buffer_margin", config_.buffer_margin);
    parse_distance_value("min_coverage_length", config_.min_coverage_length);
    if (config.contains("buffer_arc_segments")) config_.buffer_arc_segments = config["buffer_arc_segments"].get<int>();

    // Processing
    if (config.contains("parallel_processing")) config_.parallel_processing = config["parallel_processing"].get<bool>();
    if (config.contains("threads")) config_.num_threads = config["threads"].get<int>();
    if (config.contains("progress_interval")) config_.progress_interval = config["progress_interval"].get<size_t>();

    // Outputs
    if (config.contains("output_dir")) config_.output_directory = config["output_dir"].get<std::string>();
    if (config.contains("base_name")) config_.base_name = config["base_name"].get<std::string>();
    if (config.contains("output_formats")) {
        const auto& formats = config["output_formats"];
        if (formats.is_array()) {
            config_.output_formats = formats.get<std::vector<std::string>>();
        } else {
            config_.output_formats = parse_formats(formats.get<std::string>());
        }
    }
    if (config.contains("write_summary")) config_.write_summary = config["write_summary"].get<bool>();
}

json CommandLineInterface::default_config_json() {
    const AnalysisConfig defaults;
    return json{
        {"lines", ""},
        {"lines_layer", ""},
        {"polygons", ""},
        {"polygons_layer", ""},
        {"segment_length", defaults.segment_length},
        {"sample_interval", defaults.sample_interval},
        {"buffer_margin", defaults.buffer_margin},
        {"min_coverage_length", defaults.min_coverage_length},
        {"buffer_arc_segments", defaults.buffer_arc_segments},
        {"parallel_processing", defaults.parallel_processing},
        {"threads", defaults.num_threads},
        {"progress_interval", defaults.progress_interval},
        {"output_dir", defaults.output_directory},
        {"base_name", defaults.base_name},
        {"output_formats", defaults.output_formats},
        {"write_summary", defaults.write_summary}
    };
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << default_config_json().dump(2) << "\n";
    return static_cast<bool>(file);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    try {
        json config;
        file >> config;
        if (!config.is_object()) {
            std::cerr << "Error: Config file must contain a JSON object" << std::endl;
            return false;
        }
        apply_config_json(config);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "Error parsing JSON config file: " << e.what() << std::endl;
        return false;
    } catch (const UnitParseError& e) {
        std::cerr << "Error in config file: " << e.what() << std::endl;
        return false;
    }
}

std::vector<std::string> CommandLineInterface::parse_formats(const std::string& formats_str) {
    std::vector<std::string> formats;
    std::istringstream iss(formats_str);
    std::string format;

    while (std::getline(iss, format, ',')) {
        format.erase(0, format.find_first_not_of(" \t"));
        format.erase(format.find_last_not_of(" \t") + 1);

        if (!format.empty()) {
            formats.push_back(format);
        }
    }

    return formats;
}

void CommandLineInterface::print_config() const {
    std::cout << "\n=== Configuration ===\n";
    if (config_.config_file) {
        std::cout << "Config file: " << *config_.config_file << "\n";
    }
    std::cout << "Lines: " << config_.lines_path;
    if (!config_.lines_layer.empty()) std::cout << " [" << config_.lines_layer << "]";
    std::cout << "\nPolygons: " << config_.polygons_path;
    if (!config_.polygons_layer.empty()) std::cout << " [" << config_.polygons_layer << "]";
    std::cout << "\nSegment length: " << config_.segment_length << "\n";
    std::cout << "Sample interval: " << config_.sample_interval << "\n";
    std::cout << "Buffer margin: " << config_.buffer_margin << " (" << config_.buffer_arc_segments
              << " segments per quarter circle)\n";
    std::cout << "Minimum coverage: " << config_.min_coverage_length << "\n";
    std::cout << "Parallel processing: " << (config_.parallel_processing ? "yes" : "no");
    if (config_.parallel_processing && config_.num_threads > 0) {
        std::cout << " (" << config_.num_threads << " threads)";
    }
    std::cout << "\nOutput directory: " << config_.output_directory << "\n";
    std::cout << "Base name: " << config_.base_name << "\n";
    std::cout << "Formats: ";
    for (size_t i = 0; i < config_.output_formats.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << config_.output_formats[i];
    }
    std::cout << "\n=====================\n\n";
}

} // namespace habitat
