/**
 * @file GeometryKernel.hpp
 * @brief Planar geometry primitives used by the suitability pipeline
 *
 * Polyline measurement and interpolation are done directly on Point2D
 * vectors. Buffering, dissolving and intersection are delegated to GDAL/OGR,
 * which requires a GEOS-enabled GDAL build.
 *
 * Every function is safe to call concurrently on distinct or shared
 * read-only inputs. Failures of the geometry backend raise GeometryError.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include <ogr_geometry.h>
#include <optional>
#include <vector>

namespace habitat {

// ============================================================================
// Polyline measurement
// ============================================================================

/**
 * @brief Sum of Euclidean distances between consecutive vertices
 */
double polyline_length(const Polyline& line);

/**
 * @brief Point at arc length @p distance from the first vertex
 *
 * Empty when @p distance lies outside [0, length] or the line has fewer
 * than 2 vertices. Zero-length edges are stepped over.
 */
std::optional<Point2D> interpolate(const Polyline& line, double distance);

/**
 * @brief Cumulative arc-length table for repeated interpolation
 *
 * Built once per line part so that each interpolation is a binary search.
 * Holds a pointer to the polyline, which must outlive the index.
 */
class ArcLengthIndex {
public:
    explicit ArcLengthIndex(const Polyline& line);

    double total_length() const { return cumulative_.empty() ? 0.0 : cumulative_.back(); }

    std::optional<Point2D> interpolate(double distance) const;

    const Polyline& line() const { return *line_; }

private:
    const Polyline* line_;
    std::vector<double> cumulative_;  // cumulative_[i] = arc length at vertex i
};

// ============================================================================
// OGR conversion
// ============================================================================

OGRGeometryUniquePtr to_ogr(const Polyline& line);

/**
 * @brief Polygon with closed rings
 * @throws GeometryError if a ring has fewer than 3 distinct positions
 */
OGRGeometryUniquePtr to_ogr(const PolygonShape& polygon);

OGRGeometryUniquePtr to_ogr(const PolygonGeometry& polygon);

Polyline from_ogr_line(const OGRSimpleCurve& curve);

/**
 * @brief Convert (Multi)LineString geometries, empty for any other type
 */
std::optional<LineGeometry> line_geometry_from_ogr(const OGRGeometry& geometry);

/**
 * @brief Convert (Multi)Polygon geometries, empty for any other type
 */
std::optional<PolygonGeometry> polygon_geometry_from_ogr(const OGRGeometry& geometry);

// ============================================================================
// Backend operations
// ============================================================================

/**
 * @brief True if GDAL was built with GEOS, which the operations below need
 */
bool geometry_backend_available();

/**
 * @brief Outward buffer with round joins
 *
 * A margin of 0 returns an unmodified clone.
 * @param arc_segments Segments per quarter circle at convex corners
 * @throws GeometryError if buffering fails, or for margin 0 if the input
 *         is not a valid geometry
 */
OGRGeometryUniquePtr buffer(const OGRGeometry& geometry, double margin, int arc_segments);

/**
 * @brief Union of areal geometries into a single (multi)polygon
 *
 * Non-areal parts are ignored.
 * @throws GeometryError if nothing areal is given or the union fails
 */
OGRGeometryUniquePtr dissolve(const std::vector<OGRGeometryUniquePtr>& geometries);

OGRGeometryUniquePtr intersect(const OGRGeometry& a, const OGRGeometry& b);

/**
 * @brief Single-part components of a geometry, collections flattened
 *
 * Returned pointers refer into @p geometry.
 */
std::vector<const OGRGeometry*> parts(const OGRGeometry& geometry);

/**
 * @brief Total length of the curve components; points and areas count 0
 */
double linear_length(const OGRGeometry& geometry);

} // namespace habitat
