/**
 * @file GeometryKernel.cpp
 * @brief Implementation of planar geometry primitives
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GeometryKernel.hpp"
#include <cpl_error.h>
#include <ogr_core.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>

namespace habitat {

namespace {

/**
 * @brief Message for a null result from the OGR/GEOS bridge
 */
std::string backend_failure(const char* operation) {
    std::string message = std::string(operation) + " failed";
    const char* detail = CPLGetLastErrorMsg();
    if (detail && *detail) {
        message += ": ";
        message += detail;
    } else if (!OGRGeometryFactory::haveGEOS()) {
        message += ": GDAL was built without GEOS support";
    }
    return message;
}

void collect_parts(const OGRGeometry& geometry, std::vector<const OGRGeometry*>& out) {
    if (OGR_GT_IsSubClassOf(wkbFlatten(geometry.getGeometryType()), wkbGeometryCollection)) {
        const OGRGeometryCollection* collection = geometry.toGeometryCollection();
        for (int i = 0; i < collection->getNumGeometries(); ++i) {
            collect_parts(*collection->getGeometryRef(i), out);
        }
    } else if (!geometry.IsEmpty()) {
        out.push_back(&geometry);
    }
}

OGRLinearRing* ring_to_ogr(const std::vector<Point2D>& ring) {
    // Count distinct positions, ignoring an explicit closing vertex
    size_t count = ring.size();
    if (count > 1 && ring.front() == ring.back()) {
        --count;
    }
    if (count < 3) {
        throw GeometryError("polygon ring has fewer than 3 vertices");
    }

    auto* ogr_ring = new OGRLinearRing();
    ogr_ring->setNumPoints(static_cast<int>(count + 1));
    for (size_t i = 0; i < count; ++i) {
        ogr_ring->setPoint(static_cast<int>(i), ring[i].x(), ring[i].y());
    }
    ogr_ring->setPoint(static_cast<int>(count), ring[0].x(), ring[0].y());
    return ogr_ring;
}

std::vector<Point2D> ring_from_ogr(const OGRSimpleCurve& ring) {
    std::vector<Point2D> points;
    points.reserve(static_cast<size_t>(ring.getNumPoints()));
    for (int i = 0; i < ring.getNumPoints(); ++i) {
        points.emplace_back(ring.getX(i), ring.getY(i));
    }
    return points;
}

PolygonShape polygon_from_ogr(const OGRPolygon& polygon) {
    PolygonShape shape;
    const OGRLinearRing* exterior = polygon.getExteriorRing();
    if (!exterior) {
        return shape;
    }
    shape.rings.push_back(ring_from_ogr(*exterior));
    for (int i = 0; i < polygon.getNumInteriorRings(); ++i) {
        shape.rings.push_back(ring_from_ogr(*polygon.getInteriorRing(i)));
    }
    return shape;
}

} // namespace

// ============================================================================
// Polyline measurement
// ============================================================================

double polyline_length(const Polyline& line) {
    double total = 0.0;
    for (size_t i = 1; i < line.points.size(); ++i) {
        total += std::hypot(line.points[i].x() - line.points[i - 1].x(),
                            line.points[i].y() - line.points[i - 1].y());
    }
    return total;
}

std::optional<Point2D> interpolate(const Polyline& line, double distance) {
    return ArcLengthIndex(line).interpolate(distance);
}

ArcLengthIndex::ArcLengthIndex(const Polyline& line) : line_(&line) {
    cumulative_.reserve(line.points.size());
    double running = 0.0;
    for (size_t i = 0; i < line.points.size(); ++i) {
        if (i > 0) {
            running += std::hypot(line.points[i].x() - line.points[i - 1].x(),
                                  line.points[i].y() - line.points[i - 1].y());
        }
        cumulative_.push_back(running);
    }
}

std::optional<Point2D> ArcLengthIndex::interpolate(double distance) const {
    if (cumulative_.size() < 2 || !(distance >= 0.0) || distance > total_length()) {
        return std::nullopt;
    }

    const auto& points = line_->points;
    if (distance == total_length()) {
        return points.back();
    }

    // First vertex strictly beyond distance; the edge before it has non-zero length
    auto upper = std::upper_bound(cumulative_.begin(), cumulative_.end(), distance);
    const size_t j = static_cast<size_t>(upper - cumulative_.begin());
    const size_t i = j - 1;

    const double t = (distance - cumulative_[i]) / (cumulative_[j] - cumulative_[i]);
    return Point2D(points[i].x() + t * (points[j].x() - points[i].x()),
                   points[i].y() + t * (points[j].y() - points[i].y()));
}

// ============================================================================
// OGR conversion
// ============================================================================

OGRGeometryUniquePtr to_ogr(const Polyline& line) {
    auto ogr_line = std::make_unique<OGRLineString>();
    ogr_line->setNumPoints(static_cast<int>(line.points.size()));
    for (size_t i = 0; i < line.points.size(); ++i) {
        ogr_line->setPoint(static_cast<int>(i), line.points[i].x(), line.points[i].y());
    }
    return OGRGeometryUniquePtr(ogr_line.release());
}

OGRGeometryUniquePtr to_ogr(const PolygonShape& polygon) {
    if (polygon.empty()) {
        throw GeometryError("polygon has no exterior ring");
    }

    auto ogr_polygon = std::make_unique<OGRPolygon>();
    for (const auto& ring : polygon.rings) {
        ogr_polygon->addRingDirectly(ring_to_ogr(ring));
    }
    return OGRGeometryUniquePtr(ogr_polygon.release());
}

OGRGeometryUniquePtr to_ogr(const PolygonGeometry& polygon) {
    if (const auto* single = std::get_if<PolygonShape>(&polygon)) {
        return to_ogr(*single);
    }

    auto multi = std::make_unique<OGRMultiPolygon>();
    for (const auto& part : std::get<MultiPolygonShape>(polygon)) {
        OGRGeometryUniquePtr ogr_part = to_ogr(part);
        if (multi->addGeometryDirectly(ogr_part.get()) != OGRERR_NONE) {
            throw GeometryError("could not assemble multipolygon");
        }
        ogr_part.release();
    }
    return OGRGeometryUniquePtr(multi.release());
}

Polyline from_ogr_line(const OGRSimpleCurve& curve) {
    return Polyline(ring_from_ogr(curve));
}

std::optional<LineGeometry> line_geometry_from_ogr(const OGRGeometry& geometry) {
    const OGRwkbGeometryType type = wkbFlatten(geometry.getGeometryType());

    if (type == wkbLineString) {
        return LineGeometry(from_ogr_line(*geometry.toLineString()));
    }

    if (type == wkbMultiLineString) {
        const OGRMultiLineString* multi = geometry.toMultiLineString();
        MultiPolyline result;
        for (int i = 0; i < multi->getNumGeometries(); ++i) {
            result.push_back(from_ogr_line(*multi->getGeometryRef(i)->toLineString()));
        }
        return LineGeometry(std::move(result));
    }

    return std::nullopt;
}

std::optional<PolygonGeometry> polygon_geometry_from_ogr(const OGRGeometry& geometry) {
    const OGRwkbGeometryType type = wkbFlatten(geometry.getGeometryType());

    if (type == wkbPolygon) {
        return PolygonGeometry(polygon_from_ogr(*geometry.toPolygon()));
    }

    if (type == wkbMultiPolygon) {
        const OGRMultiPolygon* multi = geometry.toMultiPolygon();
        MultiPolygonShape result;
        for (int i = 0; i < multi->getNumGeometries(); ++i) {
            result.push_back(polygon_from_ogr(*multi->getGeometryRef(i)->toPolygon()));
        }
        return PolygonGeometry(std::move(result));
    }

    return std::nullopt;
}

// ============================================================================
// Backend operations
// ============================================================================

bool geometry_backend_available() {
    return OGRGeometryFactory::haveGEOS();
}

OGRGeometryUniquePtr buffer(const OGRGeometry& geometry, double margin, int arc_segments) {
    if (margin == 0.0) {
        // The clone reaches GEOS only at dissolve time, so reject bad rings here
        CPLErrorReset();
        if (!geometry.IsValid()) {
            std::string message = "geometry is not valid";
            const char* detail = CPLGetLastErrorMsg();
            if (detail && *detail) {
                message += ": ";
                message += detail;
            }
            throw GeometryError(message);
        }
        return OGRGeometryUniquePtr(geometry.clone());
    }

    CPLErrorReset();
    OGRGeometryUniquePtr result(geometry.Buffer(margin, arc_segments));
    if (!result) {
        throw GeometryError(backend_failure("buffer"));
    }
    return result;
}

OGRGeometryUniquePtr dissolve(const std::vector<OGRGeometryUniquePtr>& geometries) {
    OGRMultiPolygon collected;
    for (const auto& geometry : geometries) {
        if (!geometry) continue;
        for (const OGRGeometry* part : parts(*geometry)) {
            if (wkbFlatten(part->getGeometryType()) == wkbPolygon) {
                collected.addGeometry(part);
            }
        }
    }

    if (collected.getNumGeometries() == 0) {
        throw GeometryError("dissolve: no areal geometry to merge");
    }

    CPLErrorReset();
    OGRGeometryUniquePtr result(collected.UnionCascaded());
    if (!result) {
        throw GeometryError(backend_failure("dissolve"));
    }
    return result;
}

OGRGeometryUniquePtr intersect(const OGRGeometry& a, const OGRGeometry& b) {
    CPLErrorReset();
    OGRGeometryUniquePtr result(a.Intersection(&b));
    if (!result) {
        throw GeometryError(backend_failure("intersection"));
    }
    return result;
}

std::vector<const OGRGeometry*> parts(const OGRGeometry& geometry) {
    std::vector<const OGRGeometry*> out;
    collect_parts(geometry, out);
    return out;
}

double linear_length(const OGRGeometry& geometry) {
    double total = 0.0;
    for (const OGRGeometry* part : parts(geometry)) {
        if (OGR_GT_IsCurve(wkbFlatten(part->getGeometryType()))) {
            total += part->toCurve()->get_Length();
        }
    }
    return total;
}

} // namespace habitat
