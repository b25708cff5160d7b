/**
 * @file SuitabilityClassifier.hpp
 * @brief Overlap measurement and threshold classification of segments
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include "CoverageMaskBuilder.hpp"

namespace habitat {

struct Classification {
    double overlap_m = 0.0;
    bool suitable = false;
};

/**
 * @brief Classifies a segment by how much of it lies inside the coverage region
 *
 * Stateless apart from the threshold, so one instance can be shared by
 * concurrent workers.
 */
class SuitabilityClassifier {
public:
    explicit SuitabilityClassifier(double min_coverage_length);

    double threshold() const { return min_coverage_length_; }

    /**
     * @brief Length of @p segment inside @p region
     *
     * Every linear fragment of the intersection counts; a segment that
     * enters and leaves the region several times gets the sum of its
     * pieces. Point contacts contribute nothing.
     *
     * @throws GeometryError if the intersection fails
     */
    double overlap_length(const Polyline& segment, const CoverageRegion& region) const;

    /**
     * @brief overlap_length() and the threshold test together
     */
    Classification classify(const Polyline& segment, const CoverageRegion& region) const;

    bool is_suitable(double overlap_m) const { return overlap_m >= min_coverage_length_; }

private:
    double min_coverage_length_;
};

} // namespace habitat
