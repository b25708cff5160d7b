/**
 * @file test_suitability_classifier.cpp
 * @brief Tests for overlap measurement and threshold classification
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "core/SuitabilityClassifier.hpp"
#include "TestFixtures.hpp"

using namespace habitat;
using namespace habitat::testing;

class SuitabilityClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        REQUIRE_GEOMETRY_BACKEND();
    }
};

TEST_F(SuitabilityClassifierTest, OverlapIsSumOfFragments) {
    CoverageRegion region = build_coverage_region(
        {polygon_feature("a", rectangle(100, -10, 200, 10)),
         polygon_feature("b", rectangle(500, -10, 750, 10)),
         polygon_feature("c", rectangle(1000, -10, 1400, 10))},
        0.0, 5);

    SuitabilityClassifier classifier(700.0);
    auto result = classifier.classify(horizontal_line(0, 2000), region);

    EXPECT_NEAR(result.overlap_m, 750.0, 1e-6);
    EXPECT_TRUE(result.suitable);
}

TEST_F(SuitabilityClassifierTest, DisjointSegmentHasNoOverlap) {
    CoverageRegion region = build_coverage_region(
        {polygon_feature("a", rectangle(0, 0, 100, 100))}, 20.0, 5);

    SuitabilityClassifier classifier(0.0);
    auto result = classifier.classify(horizontal_line(0, 1000, 500), region);
    EXPECT_DOUBLE_EQ(result.overlap_m, 0.0);
    // A zero threshold makes every segment suitable
    EXPECT_TRUE(result.suitable);
}

TEST_F(SuitabilityClassifierTest, BoundaryTouchCountsNothing) {
    CoverageRegion region = build_coverage_region(
        {polygon_feature("a", rectangle(0, 0, 100, 100))}, 0.0, 5);

    SuitabilityClassifier classifier(1.0);
    // Crosses the corner only
    Polyline touching{Point2D(100, 100), Point2D(200, 200)};
    EXPECT_NEAR(classifier.overlap_length(touching, region), 0.0, 1e-9);
}

TEST_F(SuitabilityClassifierTest, MarginExtendsOverlap) {
    std::vector<PolygonFeature> stand{polygon_feature("a", rectangle(1000, -5, 2000, 5))};
    CoverageRegion bare = build_coverage_region(stand, 0.0, 5);
    CoverageRegion buffered = build_coverage_region(stand, 20.0, 5);

    SuitabilityClassifier classifier(1000.0);
    Polyline river = horizontal_line(0, 4000);

    EXPECT_NEAR(classifier.overlap_length(river, bare), 1000.0, 1e-6);
    EXPECT_NEAR(classifier.overlap_length(river, buffered), 1040.0, 1e-6);
}

TEST(SuitabilityThresholdTest, ThresholdIsInclusive) {
    SuitabilityClassifier classifier(1900.0);
    EXPECT_DOUBLE_EQ(classifier.threshold(), 1900.0);
    EXPECT_TRUE(classifier.is_suitable(1900.0));
    EXPECT_FALSE(classifier.is_suitable(1899.9));
}
