/**
 * @file TestFixtures.hpp
 * @brief Shared geometry builders for the unit tests
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include "core/GeometryKernel.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace habitat::testing {

/// Horizontal two-point line from (x0, y) to (x1, y)
inline Polyline horizontal_line(double x0, double x1, double y = 0.0) {
    return Polyline{Point2D(x0, y), Point2D(x1, y)};
}

/// Axis-aligned rectangle as an open ring
inline PolygonShape rectangle(double min_x, double min_y, double max_x, double max_y) {
    PolygonShape shape;
    shape.rings.push_back({Point2D(min_x, min_y), Point2D(max_x, min_y),
                           Point2D(max_x, max_y), Point2D(min_x, max_y)});
    return shape;
}

inline PolygonFeature polygon_feature(const std::string& id, const PolygonShape& shape) {
    return PolygonFeature{id, shape};
}

inline LineFeature line_feature(const std::string& id, const LineGeometry& geometry) {
    return LineFeature{id, geometry, "EPSG:3067"};
}

/// Empty directory under the system temp path, removed on destruction
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

} // namespace habitat::testing

// Buffer, union and intersection need a GEOS-enabled GDAL
#define REQUIRE_GEOMETRY_BACKEND()                                        \
    do {                                                                  \
        if (!::habitat::geometry_backend_available()) {                   \
            GTEST_SKIP() << "GDAL was built without GEOS";                \
        }                                                                 \
    } while (0)
