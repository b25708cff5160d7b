/**
 * @file CoverageMaskBuilder.hpp
 * @brief Buffered and dissolved coverage area built from polygon features
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include "Logger.hpp"
#include <ogr_geometry.h>
#include <vector>

namespace habitat {

/**
 * @brief Union of all buffered coverage polygons
 *
 * Immutable after construction, so it may be shared by concurrent
 * classifiers. Non-copyable; it owns the dissolved OGR geometry.
 */
class CoverageRegion {
public:
    CoverageRegion(OGRGeometryUniquePtr geometry, size_t source_count);

    CoverageRegion(const CoverageRegion&) = delete;
    CoverageRegion& operator=(const CoverageRegion&) = delete;
    CoverageRegion(CoverageRegion&&) = default;
    CoverageRegion& operator=(CoverageRegion&&) = default;

    const OGRGeometry& geometry() const { return *geometry_; }
    const OGREnvelope& envelope() const { return envelope_; }

    /// Number of polygon features that contributed
    size_t source_count() const { return source_count_; }

    /// Total area of the dissolved region
    double area() const;

    /// Number of disjoint polygons after dissolving
    size_t polygon_count() const;

private:
    OGRGeometryUniquePtr geometry_;
    OGREnvelope envelope_;
    size_t source_count_;
};

/**
 * @brief Accumulates buffered polygons and dissolves them into a CoverageRegion
 *
 * Each polygon is buffered as soon as it is added so that a polygon the
 * backend rejects can be reported against its own feature id.
 */
class CoverageMaskBuilder {
public:
    /**
     * @param margin Outward buffer distance (>= 0)
     * @param arc_segments Segments per quarter circle for round joins (>= 1)
     */
    CoverageMaskBuilder(double margin, int arc_segments);

    /**
     * @brief Buffer and keep one polygon feature
     * @throws GeometryError tagged with the feature id if buffering fails
     *         or, for margin 0, if the polygon is not valid
     */
    void add(const PolygonFeature& feature);

    size_t accepted_count() const { return buffered_.size(); }

    /**
     * @brief Dissolve everything added so far
     *
     * The builder is empty afterwards.
     * @throws EmptyInputError if no polygon was accepted
     * @throws GeometryError if the union fails
     */
    CoverageRegion build();

private:
    double margin_;
    int arc_segments_;
    std::vector<OGRGeometryUniquePtr> buffered_;
    Logger logger_;
};

/**
 * @brief Build a coverage region from in-memory polygons in one call
 *
 * Unlike the builder, the first rejected polygon aborts the build.
 */
CoverageRegion build_coverage_region(const std::vector<PolygonFeature>& polygons,
                                     double margin, int arc_segments);

} // namespace habitat
