/**
 * @file test_command_line_interface.cpp
 * @brief Tests for option parsing and configuration layering
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "cli/CommandLineInterface.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace habitat;
using json = nlohmann::json;

namespace {

ParseOutcome parse(CommandLineInterface& cli, std::vector<std::string> args) {
    args.insert(args.begin(), "habitat-seg");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return cli.parse_arguments(static_cast<int>(argv.size()), argv.data());
}

} // namespace

class CommandLineInterfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("HABITAT_LOG_LEVEL");
        unsetenv("HABITAT_LOG_FILE");
    }
};

TEST_F(CommandLineInterfaceTest, DefaultsWithRequiredInputs) {
    CommandLineInterface cli;
    ASSERT_EQ(parse(cli, {"--lines", "rivers.shp", "--polygons", "forest.shp"}), ParseOutcome::RUN);

    const auto& config = cli.get_config();
    EXPECT_EQ(config.lines_path, "rivers.shp");
    EXPECT_EQ(config.polygons_path, "forest.shp");
    EXPECT_DOUBLE_EQ(config.segment_length, 4000.0);
    EXPECT_DOUBLE_EQ(config.sample_interval, 50.0);
    EXPECT_DOUBLE_EQ(config.buffer_margin, 20.0);
    EXPECT_DOUBLE_EQ(config.min_coverage_length, 1900.0);
    EXPECT_EQ(config.output_formats, std::vector<std::string>{"shapefile"});
    EXPECT_FALSE(cli.is_dry_run());
}

TEST_F(CommandLineInterfaceTest, DistancesAcceptUnits) {
    CommandLineInterface cli;
    ASSERT_EQ(parse(cli, {"-l", "r.gpkg", "-p", "f.gpkg", "--segment-length", "2km",
                          "--min-coverage=1.2km", "--buffer-margin", "0",
                          "--output-formats", "gpkg, geojson", "--parallel", "-j", "4"}),
              ParseOutcome::RUN);

    const auto& config = cli.get_config();
    EXPECT_DOUBLE_EQ(config.segment_length, 2000.0);
    EXPECT_DOUBLE_EQ(config.min_coverage_length, 1200.0);
    EXPECT_DOUBLE_EQ(config.buffer_margin, 0.0);
    EXPECT_EQ(config.output_formats, (std::vector<std::string>{"gpkg", "geojson"}));
    EXPECT_TRUE(config.parallel_processing);
    EXPECT_EQ(config.num_threads, 4);
}

TEST_F(CommandLineInterfaceTest, MissingInputsAreAnError) {
    CommandLineInterface cli;
    EXPECT_EQ(parse(cli, {"--lines", "rivers.shp"}), ParseOutcome::EXIT_ERROR);
}

TEST_F(CommandLineInterfaceTest, DryRunDoesNotNeedInputs) {
    CommandLineInterface cli;
    EXPECT_EQ(parse(cli, {"--dry-run"}), ParseOutcome::RUN);
    EXPECT_TRUE(cli.is_dry_run());
}

TEST_F(CommandLineInterfaceTest, MalformedValuesAreAnError) {
    CommandLineInterface bad_unit;
    EXPECT_EQ(parse(bad_unit, {"-l", "a", "-p", "b", "--segment-length", "4 furlongs"}), ParseOutcome::EXIT_ERROR);

    CommandLineInterface bad_integer;
    EXPECT_EQ(parse(bad_integer, {"-l", "a", "-p", "b", "--threads", "many"}), ParseOutcome::EXIT_ERROR);
}

TEST_F(CommandLineInterfaceTest, LoggingOptions) {
    CommandLineInterface verbose;
    ASSERT_EQ(parse(verbose, {"-l", "a", "-p", "b", "--log-level", "4,SuitabilityAnalyzer=6"}), ParseOutcome::RUN);
    EXPECT_EQ(verbose.get_log_config(), "4,SuitabilityAnalyzer=6");
    EXPECT_EQ(verbose.get_config().log_level, 4);

    CommandLineInterface silent;
    ASSERT_EQ(parse(silent, {"-l", "a", "-p", "b", "--silent"}), ParseOutcome::RUN);
    EXPECT_TRUE(silent.is_silent());
    EXPECT_EQ(silent.get_config().log_level, 1);
}

TEST_F(CommandLineInterfaceTest, EnvironmentSetsLogging) {
    setenv("HABITAT_LOG_LEVEL", "5", 1);
    setenv("HABITAT_LOG_FILE", "/tmp/habitat.log", 1);

    CommandLineInterface cli;
    ASSERT_EQ(parse(cli, {"-l", "a", "-p", "b"}), ParseOutcome::RUN);
    EXPECT_EQ(cli.get_log_config(), "5");
    EXPECT_EQ(cli.get_config().log_level, 5);
    ASSERT_TRUE(cli.get_config().log_file);
    EXPECT_EQ(*cli.get_config().log_file, "/tmp/habitat.log");

    CommandLineInterface overridden;
    ASSERT_EQ(parse(overridden, {"-l", "a", "-p", "b", "--log-level", "2"}), ParseOutcome::RUN);
    EXPECT_EQ(overridden.get_config().log_level, 2);

    unsetenv("HABITAT_LOG_LEVEL");
    unsetenv("HABITAT_LOG_FILE");
}

TEST_F(CommandLineInterfaceTest, ConfigFileIsOverriddenByCommandLine) {
    const auto path = std::filesystem::temp_directory_path() / "habitat_cli_test.json";
    {
        std::ofstream out(path);
        out << R"({"lines": "rivers.shp", "polygons": "forest.shp", "segment_length": "3km",)"
            << R"( "buffer_margin": 15, "output_formats": ["gpkg"], "threads": 2})";
    }

    CommandLineInterface cli;
    ASSERT_EQ(parse(cli, {"-c", path.string(), "--buffer-margin", "25"}), ParseOutcome::RUN);
    std::filesystem::remove(path);

    const auto& config = cli.get_config();
    EXPECT_EQ(config.lines_path, "rivers.shp");
    EXPECT_DOUBLE_EQ(config.segment_length, 3000.0);
    EXPECT_DOUBLE_EQ(config.buffer_margin, 25.0);
    EXPECT_EQ(config.output_formats, std::vector<std::string>{"gpkg"});
    EXPECT_EQ(config.num_threads, 2);
    ASSERT_TRUE(config.config_file);
}

TEST_F(CommandLineInterfaceTest, UnreadableConfigFileIsAnError) {
    CommandLineInterface cli;
    EXPECT_EQ(parse(cli, {"-c", "/nonexistent/habitat.json"}), ParseOutcome::EXIT_ERROR);
}

TEST_F(CommandLineInterfaceTest, ConfigJsonTypeErrorsThrow) {
    CommandLineInterface cli;
    EXPECT_THROW(cli.apply_config_json(json{{"segment_length", "4 leagues"}}), UnitParseError);
    EXPECT_THROW(cli.apply_config_json(json{{"threads", "four"}}), json::exception);
}

TEST_F(CommandLineInterfaceTest, DefaultConfigMatchesDefaults) {
    json defaults = CommandLineInterface::default_config_json();
    EXPECT_DOUBLE_EQ(defaults["segment_length"].get<double>(), 4000.0);
    EXPECT_EQ(defaults["buffer_arc_segments"].get<int>(), 5);

    CommandLineInterface cli;
    cli.apply_config_json(defaults);
    EXPECT_DOUBLE_EQ(cli.get_config().min_coverage_length, 1900.0);
    EXPECT_EQ(cli.get_config().base_name, "river_segments");
}

TEST_F(CommandLineInterfaceTest, FormatListParsing) {
    EXPECT_EQ(CommandLineInterface::parse_formats(" shapefile ,gpkg,,geojson "),
              (std::vector<std::string>{"shapefile", "gpkg", "geojson"}));
    EXPECT_TRUE(CommandLineInterface::parse_formats("").empty());
}
