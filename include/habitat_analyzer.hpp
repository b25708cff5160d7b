#pragma once

/**
 * @file habitat_analyzer.hpp
 * @brief Main header for the river habitat suitability segmenter
 *
 * Classifies fixed-length stretches of a line network by how much of their
 * length lies inside a buffered, dissolved coverage area, using GDAL/OGR
 * (GEOS) for the polygon boolean operations.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "AnalysisErrors.hpp"

// Forward declarations
namespace habitat {
    class OutputTracker;
    class CoverageRegion;
    class LineSource;
    class PolygonSource;
    class SegmentSink;
}

namespace habitat {

// ============================================================================
// Geometry value types
// ============================================================================

/**
 * @brief 2D point with x, y coordinates in the source distance unit
 */
struct Point2D {
    double x_, y_;

    Point2D() : x_(0), y_(0) {}
    Point2D(double x, double y) : x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }

    bool operator==(const Point2D& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }
};

/**
 * @brief Open curve through an ordered sequence of points
 *
 * Processable only with at least 2 points and non-zero length.
 */
struct Polyline {
    std::vector<Point2D> points;

    Polyline() = default;
    Polyline(std::vector<Point2D> pts) : points(std::move(pts)) {}
    Polyline(std::initializer_list<Point2D> pts) : points(pts) {}

    size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }
    const Point2D& front() const { return points.front(); }
    const Point2D& back() const { return points.back(); }
};

using MultiPolyline = std::vector<Polyline>;

/**
 * @brief Single or multi-part line geometry
 */
using LineGeometry = std::variant<Polyline, MultiPolyline>;

/**
 * @brief Polygon as coordinate rings
 *
 * First ring is the exterior boundary, subsequent rings are holes.
 * Rings may be given open or closed.
 */
struct PolygonShape {
    std::vector<std::vector<Point2D>> rings;

    bool empty() const { return rings.empty() || rings[0].empty(); }
    const std::vector<Point2D>& exterior() const { return rings[0]; }
    size_t num_holes() const { return rings.empty() ? 0 : rings.size() - 1; }
};

using MultiPolygonShape = std::vector<PolygonShape>;

/**
 * @brief Single or multi-part areal geometry
 */
using PolygonGeometry = std::variant<PolygonShape, MultiPolygonShape>;

/**
 * @brief Decompose a line geometry into its single parts, in order
 */
inline std::vector<const Polyline*> line_parts(const LineGeometry& geometry) {
    std::vector<const Polyline*> parts;
    if (const auto* single = std::get_if<Polyline>(&geometry)) {
        parts.push_back(single);
    } else {
        for (const auto& part : std::get<MultiPolyline>(geometry)) {
            parts.push_back(&part);
        }
    }
    return parts;
}

/**
 * @brief Decompose a polygon geometry into its single parts, in order
 */
inline std::vector<const PolygonShape*> polygon_parts(const PolygonGeometry& geometry) {
    std::vector<const PolygonShape*> parts;
    if (const auto* single = std::get_if<PolygonShape>(&geometry)) {
        parts.push_back(single);
    } else {
        for (const auto& part : std::get<MultiPolygonShape>(geometry)) {
            parts.push_back(&part);
        }
    }
    return parts;
}

// ============================================================================
// Features
// ============================================================================

/**
 * @brief Line feature from the line source (e.g. a river centerline)
 */
struct LineFeature {
    std::string feature_id;
    LineGeometry geometry;
    std::string crs;  ///< Opaque coordinate reference, passed through to outputs
};

/**
 * @brief Areal feature from the polygon source (e.g. a forest stand)
 */
struct PolygonFeature {
    std::string feature_id;
    PolygonGeometry geometry;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for a suitability run, fixed at run start
 *
 * All distances share the linear unit of the input coordinate system.
 */
struct AnalysisConfig {
    // Core parameters (matching the reference analysis defaults)
    double segment_length = 4000.0;       ///< Window length L
    double sample_interval = 50.0;        ///< Window step S, also the vertex spacing inside a window
    double buffer_margin = 20.0;          ///< Outward expansion of every coverage polygon
    double min_coverage_length = 1900.0;  ///< Overlap needed for a segment to be suitable
    int buffer_arc_segments = 5;          ///< Segments per quarter circle at buffered corners

    // Processing options
    bool parallel_processing = false;
    int num_threads = 0;                  ///< 0 = auto-detect
    size_t progress_interval = 25;        ///< Log progress every N segments (0 disables)

    // Input datasets (host side)
    std::string lines_path;
    std::string lines_layer;
    std::string polygons_path;
    std::string polygons_layer;

    // Output configuration
    std::string output_directory = "output";
    std::string base_name = "river_segments";
    std::vector<std::string> output_formats = {"shapefile"};
    bool write_summary = true;

    // Config file support
    std::optional<std::string> config_file;

    // Logging options
    int log_level = 3;  // 1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE
    std::optional<std::string> log_file;
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Classified segment as emitted to the output streams
 *
 * Immutable once emitted.
 */
struct SegmentRecord {
    std::uint64_t seg_id = 0;   ///< Dense run-wide identifier, 1..N
    std::string feature_id;     ///< Parent line feature
    size_t part_index = 0;      ///< Part of the parent feature
    double start_m = 0.0;
    double end_m = 0.0;
    double length_m = 0.0;      ///< Actual sampled length
    double forest_m = 0.0;      ///< Exact overlap length with the coverage region
    double forest_km = 0.0;     ///< forest_m / 1000 rounded to 3 decimals
    bool suitable = false;
    Polyline geometry;
    std::string crs;
};

/**
 * @brief Round @p value to @p decimals places, ties to even
 *
 * Rounds the exact binary value, so 1.2345 (stored as 1.23449999...)
 * becomes 1.234. Non-finite values are returned unchanged.
 */
double round_decimals(double value, int decimals);

/**
 * @brief A feature (or feature part) that was skipped during the run
 */
struct FeatureFailure {
    enum class Source { LINES, POLYGONS };

    Source source = Source::LINES;
    std::string feature_id;
    std::optional<size_t> part_index;  ///< Set when only one part was skipped
    std::string reason;
};

/**
 * @brief Statistics accumulated over one run
 */
struct RunSummary {
    size_t total_segments = 0;
    size_t suitable_segments = 0;
    size_t lines_processed = 0;
    size_t parts_processed = 0;
    size_t parts_too_short = 0;
    size_t coverage_features_used = 0;
    std::vector<FeatureFailure> skipped_features;
    std::chrono::milliseconds coverage_time{0};
    std::chrono::milliseconds classification_time{0};

    /**
     * @brief Percentage of suitable segments; 0 when no segment was produced
     */
    double success_rate() const {
        if (total_segments == 0) return 0.0;
        return 100.0 * static_cast<double>(suitable_segments) / static_cast<double>(total_segments);
    }
};

// ============================================================================
// Pipeline orchestrator
// ============================================================================

/**
 * @brief Main interface for a suitability run
 *
 * Owns the coverage region, the identifier counter and the run statistics.
 * The coverage region is built once and then only read.
 */
class SuitabilityAnalyzer {
public:
    /**
     * @brief Construct and validate the configuration
     * @throws InvalidConfigurationError if the configuration is contradictory
     */
    explicit SuitabilityAnalyzer(const AnalysisConfig& config);
    ~SuitabilityAnalyzer();

    SuitabilityAnalyzer(const SuitabilityAnalyzer&) = delete;
    SuitabilityAnalyzer& operator=(const SuitabilityAnalyzer&) = delete;

    /**
     * @brief Buffer and dissolve every polygon of the source
     *
     * Polygons the geometry backend rejects are skipped and recorded.
     * @throws EmptyInputError if no polygon could be used
     */
    void build_coverage(PolygonSource& polygons);

    /**
     * @brief Run the full pipeline
     *
     * Builds the coverage region from @p polygons, then segments and
     * classifies every line of @p lines. Every record goes to
     * @p all_segments; suitable records also go to @p suitable_segments.
     *
     * @throws EmptyInputError before any segment if @p polygons is empty
     */
    RunSummary run(LineSource& lines, PolygonSource& polygons,
                   SegmentSink& all_segments, SegmentSink* suitable_segments = nullptr);

    /**
     * @brief Segment and classify against an already built coverage region
     */
    RunSummary classify_lines(LineSource& lines,
                              SegmentSink& all_segments, SegmentSink* suitable_segments = nullptr);

    // Accessors
    bool has_coverage() const;
    const CoverageRegion& get_coverage() const;
    const RunSummary& get_summary() const;
    const AnalysisConfig& get_config() const;
    const OutputTracker& get_output_tracker() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace habitat
