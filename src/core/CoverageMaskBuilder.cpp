/**
 * @file CoverageMaskBuilder.cpp
 * @brief Implementation of coverage region construction
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CoverageMaskBuilder.hpp"
#include "GeometryKernel.hpp"
#include <sstream>

namespace habitat {

// ============================================================================
// CoverageRegion
// ============================================================================

CoverageRegion::CoverageRegion(OGRGeometryUniquePtr geometry, size_t source_count)
    : geometry_(std::move(geometry)), source_count_(source_count) {
    if (!geometry_) {
        throw GeometryError("coverage region has no geometry");
    }
    geometry_->getEnvelope(&envelope_);
}

double CoverageRegion::area() const {
    double total = 0.0;
    for (const OGRGeometry* part : parts(*geometry_)) {
        if (OGR_GT_IsSurface(wkbFlatten(part->getGeometryType()))) {
            total += part->toSurface()->get_Area();
        }
    }
    return total;
}

size_t CoverageRegion::polygon_count() const {
    size_t count = 0;
    for (const OGRGeometry* part : parts(*geometry_)) {
        if (OGR_GT_IsSurface(wkbFlatten(part->getGeometryType()))) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// CoverageMaskBuilder
// ============================================================================

CoverageMaskBuilder::CoverageMaskBuilder(double margin, int arc_segments)
    : margin_(margin), arc_segments_(arc_segments), logger_("CoverageMaskBuilder") {
}

void CoverageMaskBuilder::add(const PolygonFeature& feature) {
    try {
        OGRGeometryUniquePtr source = to_ogr(feature.geometry);
        buffered_.push_back(buffer(*source, margin_, arc_segments_));
    } catch (const GeometryError& e) {
        throw e.with_feature(feature.feature_id);
    }

    logger_.trace("Buffered polygon '" + feature.feature_id + "' by " + std::to_string(margin_));
}

CoverageRegion CoverageMaskBuilder::build() {
    if (buffered_.empty()) {
        throw EmptyInputError("no coverage polygons available to build the coverage region");
    }

    const size_t source_count = buffered_.size();
    logger_.debug("Dissolving " + std::to_string(source_count) + " buffered polygons");

    OGRGeometryUniquePtr merged = dissolve(buffered_);
    buffered_.clear();

    CoverageRegion region(std::move(merged), source_count);

    std::ostringstream oss;
    oss << "Coverage region: " << region.polygon_count() << " polygons from "
        << source_count << " features, area " << region.area();
    logger_.detailed(oss.str());

    return region;
}

CoverageRegion build_coverage_region(const std::vector<PolygonFeature>& polygons,
                                     double margin, int arc_segments) {
    CoverageMaskBuilder builder(margin, arc_segments);
    for (const auto& polygon : polygons) {
        builder.add(polygon);
    }
    return builder.build();
}

} // namespace habitat
