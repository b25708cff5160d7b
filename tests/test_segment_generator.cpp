/**
 * @file test_segment_generator.cpp
 * @brief Tests for sliding-window segmentation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "core/SegmentGenerator.hpp"
#include "TestFixtures.hpp"
#include <vector>

using namespace habitat;
using namespace habitat::testing;

TEST(SegmentGeneratorTest, WindowCountOnTwelveKilometres) {
    Polyline line = horizontal_line(0, 12000);
    SegmentGenerator generator(line, 4000.0, 50.0);

    ASSERT_EQ(generator.window_count(), 161u);

    auto first = generator.window(0);
    auto last = generator.window(160);
    ASSERT_TRUE(first);
    ASSERT_TRUE(last);
    EXPECT_DOUBLE_EQ(first->start_m, 0.0);
    EXPECT_DOUBLE_EQ(last->start_m, 8000.0);
    EXPECT_DOUBLE_EQ(last->end_m, 12000.0);
    EXPECT_FALSE(generator.window(161));
}

TEST(SegmentGeneratorTest, WindowsHaveFullLengthAndSampleSpacing) {
    Polyline line = horizontal_line(0, 12000);
    SegmentGenerator generator(line, 4000.0, 50.0);

    for (const auto& segment : generator) {
        EXPECT_DOUBLE_EQ(segment.end_m - segment.start_m, 4000.0);
        EXPECT_NEAR(polyline_length(segment.geometry), 4000.0, 1e-6);
    }

    auto window = generator.window(3);
    ASSERT_TRUE(window);
    ASSERT_EQ(window->geometry.size(), 81u);
    EXPECT_DOUBLE_EQ(window->geometry.points[0].x(), 150.0);
    EXPECT_DOUBLE_EQ(window->geometry.points[1].x(), 200.0);
    EXPECT_DOUBLE_EQ(window->geometry.back().x(), 4150.0);
}

TEST(SegmentGeneratorTest, WindowFollowsBends) {
    Polyline line{Point2D(0, 0), Point2D(100, 0), Point2D(100, 100)};
    SegmentGenerator generator(line, 120.0, 40.0);
    ASSERT_EQ(generator.window_count(), 3u);

    auto window = generator.window(1);
    ASSERT_TRUE(window);
    // Samples at 40, 80, 120 and the end at 160
    ASSERT_EQ(window->geometry.size(), 4u);
    EXPECT_EQ(window->geometry.points[2], Point2D(100, 20));
    EXPECT_EQ(window->geometry.back(), Point2D(100, 60));
}

TEST(SegmentGeneratorTest, LastSampleIsExactEnd) {
    Polyline line = horizontal_line(0, 1000);
    SegmentGenerator generator(line, 130.0, 50.0);

    auto window = generator.window(0);
    ASSERT_TRUE(window);
    ASSERT_EQ(window->geometry.size(), 4u);
    EXPECT_DOUBLE_EQ(window->geometry.points[2].x(), 100.0);
    EXPECT_DOUBLE_EQ(window->geometry.back().x(), 130.0);
}

TEST(SegmentGeneratorTest, ShortLineHasNoWindows) {
    Polyline line = horizontal_line(0, 3999);
    SegmentGenerator generator(line, 4000.0, 50.0);
    EXPECT_EQ(generator.window_count(), 0u);
    EXPECT_TRUE(generator.begin() == generator.end());
}

TEST(SegmentGeneratorTest, ExactLengthHasOneWindow) {
    Polyline line = horizontal_line(0, 4000);
    SegmentGenerator generator(line, 4000.0, 50.0);
    EXPECT_EQ(generator.window_count(), 1u);
}

TEST(SegmentGeneratorTest, DegenerateLinesAreRejected) {
    Polyline single{Point2D(1, 1)};
    Polyline collapsed{Point2D(1, 1), Point2D(1, 1)};
    EXPECT_THROW(SegmentGenerator(single, 100.0, 10.0), DegenerateLineError);
    EXPECT_THROW(SegmentGenerator(collapsed, 100.0, 10.0), DegenerateLineError);
}

TEST(SegmentGeneratorTest, IterationRestartsFromFirstWindow) {
    Polyline line = horizontal_line(0, 1000);
    SegmentGenerator generator(line, 400.0, 100.0);

    std::vector<double> first_pass;
    for (const auto& segment : generator) {
        first_pass.push_back(segment.start_m);
    }
    std::vector<double> second_pass;
    for (const auto& segment : generator) {
        second_pass.push_back(segment.start_m);
    }

    EXPECT_EQ(first_pass, (std::vector<double>{0, 100, 200, 300, 400, 500, 600}));
    EXPECT_EQ(first_pass, second_pass);
}
