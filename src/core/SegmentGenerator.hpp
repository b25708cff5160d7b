/**
 * @file SegmentGenerator.hpp
 * @brief Fixed-length sliding windows along a polyline
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include "GeometryKernel.hpp"
#include <cstddef>
#include <iterator>
#include <optional>

namespace habitat {

/**
 * @brief One window of a polyline before classification
 */
struct CandidateSegment {
    size_t window_index = 0;
    double start_m = 0.0;
    double end_m = 0.0;       ///< Always start_m + segment length
    Polyline geometry;        ///< Vertices every sample interval, plus the exact end point
};

/**
 * @brief Lazy, index-addressable sequence of windows along one polyline
 *
 * Window k covers arc length [k*S, k*S + L] and exists only if it fits
 * entirely on the line, so consecutive windows overlap by L - S and no
 * partial window is produced at the end.
 *
 * The polyline is borrowed and must outlive the generator. Windows are
 * computed on demand; iterating twice yields the same windows.
 */
class SegmentGenerator {
public:
    /**
     * @param line Polyline to segment
     * @param segment_length Window length L (> 0)
     * @param sample_interval Window step S, also the vertex spacing (0 < S <= L)
     * @throws DegenerateLineError if the line has fewer than 2 points or zero length
     */
    SegmentGenerator(const Polyline& line, double segment_length, double sample_interval);

    double total_length() const { return index_.total_length(); }
    double segment_length() const { return segment_length_; }
    double sample_interval() const { return sample_interval_; }

    /**
     * @brief Number of windows k >= 0 with k*S + L <= total length
     */
    size_t window_count() const { return window_count_; }

    /**
     * @brief Build window @p k
     *
     * Empty if @p k is out of range or fewer than 2 samples could be taken.
     */
    std::optional<CandidateSegment> window(size_t k) const;

    /**
     * @brief Input iterator over the non-empty windows in index order
     */
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = CandidateSegment;
        using difference_type = std::ptrdiff_t;
        using pointer = const CandidateSegment*;
        using reference = const CandidateSegment&;

        const_iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        const_iterator& operator++() {
            ++index_;
            advance();
            return *this;
        }

        void operator++(int) { ++*this; }

        bool operator==(const const_iterator& other) const { return index_ == other.index_; }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class SegmentGenerator;

        const_iterator(const SegmentGenerator* generator, size_t index)
            : generator_(generator), index_(index) {
            advance();
        }

        void advance();

        const SegmentGenerator* generator_ = nullptr;
        size_t index_ = 0;
        std::optional<CandidateSegment> current_;
    };

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, window_count_); }

private:
    ArcLengthIndex index_;
    double segment_length_;
    double sample_interval_;
    size_t window_count_;

    double window_start(size_t k) const { return static_cast<double>(k) * sample_interval_; }
    double window_end(size_t k) const { return window_start(k) + segment_length_; }

    size_t compute_window_count() const;
};

} // namespace habitat
