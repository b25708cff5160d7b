/**
 * @file SuitabilityClassifier.cpp
 * @brief Implementation of segment classification
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SuitabilityClassifier.hpp"
#include "GeometryKernel.hpp"

namespace habitat {

SuitabilityClassifier::SuitabilityClassifier(double min_coverage_length)
    : min_coverage_length_(min_coverage_length) {
}

double SuitabilityClassifier::overlap_length(const Polyline& segment, const CoverageRegion& region) const {
    OGRGeometryUniquePtr line = to_ogr(segment);

    OGREnvelope envelope;
    line->getEnvelope(&envelope);
    if (!envelope.Intersects(region.envelope())) {
        return 0.0;
    }

    if (!line->Intersects(&region.geometry())) {
        return 0.0;
    }

    OGRGeometryUniquePtr inside = intersect(*line, region.geometry());
    return linear_length(*inside);
}

Classification SuitabilityClassifier::classify(const Polyline& segment, const CoverageRegion& region) const {
    Classification result;
    result.overlap_m = overlap_length(segment, region);
    result.suitable = is_suitable(result.overlap_m);
    return result;
}

} // namespace habitat
