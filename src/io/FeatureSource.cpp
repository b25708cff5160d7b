/**
 * @file FeatureSource.cpp
 * @brief OGR-backed feature sources
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "FeatureSource.hpp"
#include "../core/GeometryKernel.hpp"
#include <cpl_conv.h>
#include <ogr_spatialref.h>

namespace habitat {

// ============================================================================
// OGRLayerReader
// ============================================================================

OGRLayerReader::OGRLayerReader(const std::string& path, const std::string& layer_name)
    : path_(path) {
    GDALAllRegister();

    dataset_.reset(GDALDataset::Open(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY));
    if (!dataset_) {
        throw DatasetError("cannot open vector dataset '" + path + "': " + CPLGetLastErrorMsg());
    }

    if (layer_name.empty()) {
        if (dataset_->GetLayerCount() == 0) {
            throw DatasetError("dataset '" + path + "' contains no layers");
        }
        layer_ = dataset_->GetLayer(0);
    } else {
        layer_ = dataset_->GetLayerByName(layer_name.c_str());
        if (!layer_) {
            throw DatasetError("dataset '" + path + "' has no layer named '" + layer_name + "'");
        }
    }
    layer_->ResetReading();
}

OGRFeatureUniquePtr OGRLayerReader::next_feature() {
    OGRFeatureUniquePtr feature(layer_->GetNextFeature());
    if (feature) {
        ++position_;
    }
    return feature;
}

void OGRLayerReader::rewind() {
    layer_->ResetReading();
    position_ = 0;
}

std::string OGRLayerReader::feature_id(const OGRFeature& feature) const {
    if (feature.GetFID() != OGRNullFID) {
        return std::to_string(feature.GetFID());
    }
    return std::to_string(position_);
}

std::string OGRLayerReader::crs() const {
    const OGRSpatialReference* srs = layer_->GetSpatialRef();
    if (!srs) {
        return "";
    }

    const char* authority = srs->GetAuthorityName(nullptr);
    const char* code = srs->GetAuthorityCode(nullptr);
    if (authority && code) {
        return std::string(authority) + ":" + code;
    }

    char* wkt = nullptr;
    std::string result;
    if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt) {
        result = wkt;
    }
    CPLFree(wkt);
    return result;
}

std::string OGRLayerReader::description() const {
    return path_ + " [" + layer_->GetName() + "]";
}

// ============================================================================
// OGRLineSource
// ============================================================================

OGRLineSource::OGRLineSource(const std::string& path, const std::string& layer_name)
    : reader_(path, layer_name), logger_("OGRLineSource") {
    crs_ = reader_.crs();
    logger_.debug("Opened " + reader_.description() + (crs_.empty() ? " without CRS" : " with CRS " + crs_.substr(0, 64)));
}

std::optional<LineFeature> OGRLineSource::next() {
    while (OGRFeatureUniquePtr feature = reader_.next_feature()) {
        const std::string id = reader_.feature_id(*feature);
        const OGRGeometry* geometry = feature->GetGeometryRef();

        if (!geometry || geometry->IsEmpty()) {
            logger_.warning("Skipping line feature " + id + ": empty geometry");
            ++skipped_;
            continue;
        }

        auto lines = line_geometry_from_ogr(*geometry);
        if (!lines) {
            logger_.warning("Skipping line feature " + id + ": unsupported geometry type " +
                            OGRGeometryTypeToName(geometry->getGeometryType()));
            ++skipped_;
            continue;
        }

        return LineFeature{id, std::move(*lines), crs_};
    }
    return std::nullopt;
}

void OGRLineSource::rewind() {
    reader_.rewind();
    skipped_ = 0;
}

// ============================================================================
// OGRPolygonSource
// ============================================================================

OGRPolygonSource::OGRPolygonSource(const std::string& path, const std::string& layer_name)
    : reader_(path, layer_name), logger_("OGRPolygonSource") {
    logger_.debug("Opened " + reader_.description());
}

std::optional<PolygonFeature> OGRPolygonSource::next() {
    while (OGRFeatureUniquePtr feature = reader_.next_feature()) {
        const std::string id = reader_.feature_id(*feature);
        const OGRGeometry* geometry = feature->GetGeometryRef();

        if (!geometry || geometry->IsEmpty()) {
            logger_.warning("Skipping polygon feature " + id + ": empty geometry");
            ++skipped_;
            continue;
        }

        auto polygons = polygon_geometry_from_ogr(*geometry);
        if (!polygons) {
            logger_.warning("Skipping polygon feature " + id + ": unsupported geometry type " +
                            OGRGeometryTypeToName(geometry->getGeometryType()));
            ++skipped_;
            continue;
        }

        return PolygonFeature{id, std::move(*polygons)};
    }
    return std::nullopt;
}

void OGRPolygonSource::rewind() {
    reader_.rewind();
    skipped_ = 0;
}

} // namespace habitat
