/**
 * @file test_export_orchestrator.cpp
 * @brief File-based runs from GeoJSON inputs to output datasets and report
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "cli/ExportOrchestrator.hpp"
#include "io/FeatureSource.hpp"
#include "TestFixtures.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace habitat;
using namespace habitat::testing;
using json = nlohmann::json;

namespace {

void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

// river-a: 3 km through the stand, 9 windows
// river-b: 2 km, 200 m north of the stand, 5 windows
const char* kRivers =
    R"({"type":"FeatureCollection","features":[)"
    R"({"type":"Feature","properties":{"name":"river-a"},"geometry":{"type":"LineString",)"
    R"("coordinates":[[0,0],[3000,0]]}},)"
    R"({"type":"Feature","properties":{"name":"river-b"},"geometry":{"type":"LineString",)"
    R"("coordinates":[[0,200],[2000,200]]}}]})";

const char* kForest =
    R"({"type":"FeatureCollection","features":[)"
    R"({"type":"Feature","properties":{},"geometry":{"type":"Polygon",)"
    R"("coordinates":[[[0,-50],[1000,-50],[1000,50],[0,50],[0,-50]]]}}]})";

const char* kNoFeatures = R"({"type":"FeatureCollection","features":[]})";

AnalysisConfig file_config(const ScratchDirectory& dir) {
    AnalysisConfig config;
    config.lines_path = dir.file("rivers.geojson");
    config.polygons_path = dir.file("forest.geojson");
    config.output_directory = dir.file("output");
    config.base_name = "river_segments";
    config.output_formats = {"geojson", "gpkg"};
    config.segment_length = 1000.0;
    config.sample_interval = 250.0;
    config.buffer_margin = 0.0;
    config.min_coverage_length = 400.0;
    config.progress_interval = 0;
    return config;
}

GIntBig feature_count(const std::string& path) {
    OGRLayerReader reader(path, "");
    return reader.layer()->GetFeatureCount();
}

} // namespace

class ExportOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        REQUIRE_GEOMETRY_BACKEND();
    }
};

TEST_F(ExportOrchestratorTest, WritesBothStreamsPerFormatAndSummary) {
    ScratchDirectory dir("habitat_export_run");
    write_text(dir.file("rivers.geojson"), kRivers);
    write_text(dir.file("forest.geojson"), kForest);

    ExportOrchestrator orchestrator(file_config(dir));
    RunSummary summary = orchestrator.run();

    EXPECT_EQ(summary.total_segments, 14u);
    EXPECT_EQ(summary.suitable_segments, 3u);

    for (const std::string format : {"geojson", "gpkg"}) {
        const std::string all_path = orchestrator.output_path(format, "all");
        const std::string suitable_path = orchestrator.output_path(format, "suitable");
        ASSERT_TRUE(std::filesystem::exists(all_path)) << all_path;
        ASSERT_TRUE(std::filesystem::exists(suitable_path)) << suitable_path;
        EXPECT_EQ(feature_count(all_path), 14) << format;
        EXPECT_EQ(feature_count(suitable_path), 3) << format;
    }

    EXPECT_EQ(orchestrator.output_path("geojson", "all"),
              (dir.path() / "output" / "river_segments_all.geojson").string());

    OGRLayerReader suitable(orchestrator.output_path("geojson", "suitable"), "");
    std::vector<GIntBig> ids;
    while (OGRFeatureUniquePtr feature = suitable.next_feature()) {
        EXPECT_STREQ(feature->GetFieldAsString("suitable"), "YES");
        ids.push_back(feature->GetFieldAsInteger64("seg_id"));
    }
    EXPECT_EQ(ids, (std::vector<GIntBig>{1, 2, 3}));

    const std::string report_path = orchestrator.summary_path();
    ASSERT_TRUE(std::filesystem::exists(report_path));
    EXPECT_EQ(std::filesystem::path(report_path).filename().string(), "river_segments_summary.json");
    std::ifstream in(report_path);
    json report = json::parse(in);
    EXPECT_EQ(report["results"]["total_segments"], 14);
    EXPECT_EQ(report["results"]["suitable_segments"], 3);
    EXPECT_EQ(report["outputs"].size(), 4u);
}

TEST_F(ExportOrchestratorTest, EmptyCoverageLeavesNoOutputs) {
    ScratchDirectory dir("habitat_export_empty");
    write_text(dir.file("rivers.geojson"), kRivers);
    write_text(dir.file("forest.geojson"), kNoFeatures);

    ExportOrchestrator orchestrator(file_config(dir));
    EXPECT_THROW(orchestrator.run(), EmptyInputError);

    const auto output = dir.path() / "output";
    if (std::filesystem::exists(output)) {
        for (const auto& entry : std::filesystem::directory_iterator(output)) {
            ADD_FAILURE() << "unexpected output " << entry.path();
        }
    }
    EXPECT_TRUE(orchestrator.get_output_files().empty());
}

TEST(ExportOrchestratorSetupTest, MissingInputPathIsRejected) {
    AnalysisConfig config;
    config.polygons_path = "forest.geojson";
    ExportOrchestrator orchestrator(config);
    EXPECT_THROW(orchestrator.run(), InvalidConfigurationError);
}

TEST(ExportOrchestratorSetupTest, DuplicateFormatFailsBeforeOpeningInputs) {
    AnalysisConfig config;
    config.lines_path = "missing-rivers.geojson";
    config.polygons_path = "missing-forest.geojson";
    config.output_formats = {"geojson", "geojson"};
    ExportOrchestrator orchestrator(config);
    EXPECT_THROW(orchestrator.run(), InvalidConfigurationError);
}
