/**
 * @file test_vector_io.cpp
 * @brief Tests for the OGR feature sources and the vector segment writer
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "io/FeatureSource.hpp"
#include "export/VectorSegmentWriter.hpp"
#include "TestFixtures.hpp"
#include <filesystem>
#include <fstream>

using namespace habitat;
using namespace habitat::testing;

namespace {

SegmentRecord make_record(std::uint64_t id, double start, double forest, bool suitable) {
    SegmentRecord record;
    record.seg_id = id;
    record.feature_id = "river-a";
    record.start_m = start;
    record.end_m = start + 1000.0;
    record.length_m = 1000.0;
    record.forest_m = forest;
    record.forest_km = forest / 1000.0;
    record.suitable = suitable;
    record.geometry = horizontal_line(start, start + 1000.0);
    record.crs = "EPSG:3067";
    return record;
}

} // namespace

TEST(VectorIOTest, WrittenSegmentsReadBackAsLines) {
    ScratchDirectory dir("habitat_vector_io");
    const std::string path = dir.file("segments.geojson");

    VectorSegmentWriter::Options options;
    options.format = "geojson";
    {
        VectorSegmentWriter writer(path, options);
        writer.write_segment(make_record(1, 0.0, 1000.0, true));
        writer.write_segment(make_record(2, 250.0, 749.96, false));
        EXPECT_EQ(writer.feature_count(), 2u);

        RunSummary summary;
        summary.total_segments = 2;
        writer.close(summary);
        EXPECT_FALSE(writer.is_open());
    }

    OGRLayerReader reader(path, "");
    ASSERT_EQ(reader.layer()->GetFeatureCount(), 2);

    OGRFeatureUniquePtr first = reader.next_feature();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->GetFieldAsInteger64("seg_id"), 1);
    EXPECT_STREQ(first->GetFieldAsString("suitable"), "YES");
    EXPECT_STREQ(first->GetFieldAsString("feature"), "river-a");

    OGRFeatureUniquePtr second = reader.next_feature();
    ASSERT_TRUE(second);
    EXPECT_DOUBLE_EQ(second->GetFieldAsDouble("forest_m"), 750.0);
    EXPECT_DOUBLE_EQ(second->GetFieldAsDouble("forest_km"), 0.75);
    EXPECT_STREQ(second->GetFieldAsString("suitable"), "NO");

    OGRLineSource lines(path);
    size_t count = 0;
    while (auto feature = lines.next()) {
        const auto feature_parts = line_parts(feature->geometry);
        ASSERT_EQ(feature_parts.size(), 1u);
        EXPECT_NEAR(polyline_length(*feature_parts[0]), 1000.0, 1e-9);
        ++count;
    }
    EXPECT_EQ(count, 2u);

    lines.rewind();
    EXPECT_TRUE(lines.next());
}

TEST(VectorIOTest, EmptyOutputStillHasLayer) {
    ScratchDirectory dir("habitat_vector_empty");
    const std::string path = dir.file("suitable.geojson");

    VectorSegmentWriter::Options options;
    options.format = "geojson";
    VectorSegmentWriter writer(path, options);
    writer.close(RunSummary{});

    OGRLayerReader reader(path, "");
    EXPECT_EQ(reader.layer()->GetFeatureCount(), 0);
}

TEST(VectorIOTest, UnsupportedFormatIsRejected) {
    VectorSegmentWriter::Options options;
    options.format = "kml";
    EXPECT_THROW(VectorSegmentWriter("out.kml", options), DatasetError);
    EXPECT_EQ(VectorSegmentWriter::driver_name("gpkg"), "GPKG");
    EXPECT_EQ(VectorSegmentWriter::extension("shapefile"), ".shp");
}

TEST(VectorIOTest, MissingDatasetIsReported) {
    EXPECT_THROW(OGRLineSource("/nonexistent/rivers.shp"), DatasetError);
    EXPECT_THROW(OGRPolygonSource("/nonexistent/forest.gpkg"), DatasetError);
}

TEST(VectorIOTest, PolygonSourceSkipsOtherGeometries) {
    ScratchDirectory dir("habitat_polygon_source");
    const std::string path = dir.file("forest.geojson");
    {
        std::ofstream out(path);
        out << R"({"type":"FeatureCollection","features":[)"
            << R"({"type":"Feature","properties":{},"geometry":{"type":"Polygon",)"
            << R"("coordinates":[[[0,0],[10,0],[10,10],[0,10],[0,0]]]}},)"
            << R"({"type":"Feature","properties":{},"geometry":{"type":"Point","coordinates":[5,5]}},)"
            << R"({"type":"Feature","properties":{},"geometry":{"type":"MultiPolygon",)"
            << R"("coordinates":[[[[20,0],[30,0],[30,10],[20,0]]],[[[40,0],[50,0],[50,10],[40,0]]]]}})"
            << "]}";
    }

    OGRPolygonSource polygons(path);
    auto first = polygons.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(polygon_parts(first->geometry).size(), 1u);

    auto second = polygons.next();
    ASSERT_TRUE(second);
    EXPECT_EQ(polygon_parts(second->geometry).size(), 2u);

    EXPECT_FALSE(polygons.next());
    EXPECT_EQ(polygons.skipped_count(), 1u);
}

TEST(VectorIOTest, LayerNameMustExist) {
    ScratchDirectory dir("habitat_layer_name");
    const std::string path = dir.file("segments.geojson");
    VectorSegmentWriter::Options options;
    options.format = "geojson";
    {
        VectorSegmentWriter writer(path, options);
        writer.write_segment(make_record(1, 0.0, 0.0, false));
    }
    EXPECT_THROW(OGRLineSource(path, "no_such_layer"), DatasetError);
}
