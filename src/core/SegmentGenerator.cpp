/**
 * @file SegmentGenerator.cpp
 * @brief Implementation of sliding-window segmentation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SegmentGenerator.hpp"
#include <cmath>
#include <string>

namespace habitat {

SegmentGenerator::SegmentGenerator(const Polyline& line, double segment_length, double sample_interval)
    : index_(line), segment_length_(segment_length), sample_interval_(sample_interval), window_count_(0) {
    if (line.size() < 2) {
        throw DegenerateLineError("polyline has " + std::to_string(line.size()) + " point(s), at least 2 required");
    }
    if (!std::isfinite(index_.total_length())) {
        throw DegenerateLineError("polyline has non-finite coordinates");
    }
    if (index_.total_length() <= 0.0) {
        throw DegenerateLineError("polyline has zero length");
    }
    window_count_ = compute_window_count();
}

size_t SegmentGenerator::compute_window_count() const {
    const double total = index_.total_length();
    if (total < segment_length_) {
        return 0;
    }

    // Estimate, then correct so the count agrees exactly with window_end()
    size_t count = static_cast<size_t>(std::floor((total - segment_length_) / sample_interval_)) + 1;
    while (count > 0 && window_end(count - 1) > total) {
        --count;
    }
    while (window_end(count) <= total) {
        ++count;
    }
    return count;
}

std::optional<CandidateSegment> SegmentGenerator::window(size_t k) const {
    if (k >= window_count_) {
        return std::nullopt;
    }

    CandidateSegment segment;
    segment.window_index = k;
    segment.start_m = window_start(k);
    segment.end_m = window_end(k);

    for (size_t i = 0;; ++i) {
        const double d = segment.start_m + static_cast<double>(i) * sample_interval_;
        if (d >= segment.end_m) break;
        if (auto point = index_.interpolate(d)) {
            segment.geometry.points.push_back(*point);
        }
    }
    if (auto point = index_.interpolate(segment.end_m)) {
        segment.geometry.points.push_back(*point);
    }

    if (segment.geometry.size() < 2) {
        return std::nullopt;
    }
    return segment;
}

void SegmentGenerator::const_iterator::advance() {
    current_.reset();
    while (generator_ && index_ < generator_->window_count_) {
        current_ = generator_->window(index_);
        if (current_) return;
        ++index_;
    }
}

} // namespace habitat
