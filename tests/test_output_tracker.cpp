/**
 * @file test_output_tracker.cpp
 * @brief Tests for pipeline stage and output file tracking
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "core/OutputTracker.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace habitat;

TEST(OutputTrackerTest, StagesReportCompletionAndFailure) {
    OutputTracker tracker;
    tracker.startStage("coverage");
    tracker.addStageData("coverage", "features", "3");
    tracker.completeStage("coverage");
    tracker.startStage("classification");
    tracker.completeStage("classification", false, "writer failed");

    EXPECT_EQ(tracker.getStages().size(), 2u);
    EXPECT_EQ(tracker.getCompletedStageCount(), 2u);
    EXPECT_GE(tracker.stageDuration("coverage").count(), 0);
    EXPECT_NE(tracker.getPipelineStatus().find("writer failed"), std::string::npos);
}

TEST(OutputTrackerTest, UnknownStageHasNoDuration) {
    OutputTracker tracker;
    EXPECT_EQ(tracker.stageDuration("missing").count(), 0);
}

TEST(OutputTrackerTest, TracksWrittenAndMissingFiles) {
    const auto dir = std::filesystem::temp_directory_path() / "habitat_tracker_test";
    std::filesystem::create_directories(dir);
    const auto file = dir / "river_segments_all.geojson";
    {
        std::ofstream out(file);
        out << "{}";
    }

    OutputTracker tracker;
    tracker.trackGeneratedFile(file.string(), "geojson", "all", 12);
    tracker.trackGeneratedFile((dir / "missing.shp").string(), "shapefile", "suitable", 0);

    ASSERT_EQ(tracker.getTrackedFileCount(), 2u);
    const auto& files = tracker.getTrackedFiles();
    EXPECT_TRUE(files[0].generation_successful);
    EXPECT_EQ(files[0].file_size_bytes, 2u);
    EXPECT_EQ(files[0].feature_count, 12u);
    EXPECT_FALSE(files[1].generation_successful);
    EXPECT_EQ(tracker.getOutputFiles().front(), file.string());

    tracker.clear();
    EXPECT_EQ(tracker.getTrackedFileCount(), 0u);
    std::filesystem::remove_all(dir);
}
