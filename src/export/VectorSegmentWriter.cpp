/**
 * @file VectorSegmentWriter.cpp
 * @brief Implementation of OGR segment output
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "VectorSegmentWriter.hpp"
#include "../core/GeometryKernel.hpp"
#include <cpl_error.h>
#include <ogr_spatialref.h>
#include <cmath>
#include <filesystem>

namespace habitat {

namespace {

void add_field(OGRLayer* layer, const char* name, OGRFieldType type, int width = 0, int precision = 0) {
    OGRFieldDefn field(name, type);
    if (width > 0) {
        field.SetWidth(width);
        field.SetPrecision(precision);
    }
    if (layer->CreateField(&field) != OGRERR_NONE) {
        throw DatasetError(std::string("failed to create field '") + name + "'");
    }
}

} // namespace

std::string VectorSegmentWriter::driver_name(const std::string& format) {
    if (format == "shapefile") return "ESRI Shapefile";
    if (format == "gpkg") return "GPKG";
    if (format == "geojson") return "GeoJSON";
    return "";
}

std::string VectorSegmentWriter::extension(const std::string& format) {
    if (format == "shapefile") return ".shp";
    if (format == "gpkg") return ".gpkg";
    if (format == "geojson") return ".geojson";
    return "";
}

VectorSegmentWriter::VectorSegmentWriter(const std::string& path, const Options& options)
    : path_(path), options_(options), logger_("VectorSegmentWriter") {
    GDALAllRegister();

    const std::string driver_id = driver_name(options_.format);
    if (driver_id.empty()) {
        throw DatasetError("unsupported output format '" + options_.format + "'");
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_id.c_str());
    if (!driver) {
        throw DatasetError(driver_id + " driver not available");
    }

    if (options_.overwrite && std::filesystem::exists(path_)) {
        if (driver->Delete(path_.c_str()) != CE_None) {
            throw DatasetError("cannot replace existing output '" + path_ + "': " + CPLGetLastErrorMsg());
        }
    }

    dataset_.reset(driver->Create(path_.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset_) {
        throw DatasetError("failed to create " + driver_id + " dataset '" + path_ + "': " + CPLGetLastErrorMsg());
    }

    logger_.debug("Created " + driver_id + " dataset " + path_);
}

VectorSegmentWriter::~VectorSegmentWriter() {
    try {
        finish();
    } catch (const std::exception& e) {
        logger_.error("Failed to finalize " + path_ + ": " + e.what());
    }
}

void VectorSegmentWriter::create_layer(const std::string& crs) {
    OGRSpatialReference srs;
    OGRSpatialReference* srs_ptr = nullptr;
    if (!crs.empty()) {
        if (srs.SetFromUserInput(crs.c_str()) == OGRERR_NONE) {
            srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
            srs_ptr = &srs;
        } else {
            logger_.warning("Unrecognized CRS, writing " + path_ + " without spatial reference");
        }
    }

    layer_ = dataset_->CreateLayer(options_.layer_name.c_str(), srs_ptr, wkbLineString, nullptr);
    if (!layer_) {
        throw DatasetError("failed to create layer in '" + path_ + "': " + CPLGetLastErrorMsg());
    }

    create_attribute_fields();

    in_transaction_ = dataset_->StartTransaction() == OGRERR_NONE;
}

void VectorSegmentWriter::create_attribute_fields() {
    add_field(layer_, "seg_id", OFTInteger64);
    add_field(layer_, "start_m", OFTReal, 12, 1);
    add_field(layer_, "end_m", OFTReal, 12, 1);
    add_field(layer_, "length_m", OFTReal, 12, 1);
    add_field(layer_, "forest_m", OFTReal, 12, 1);
    add_field(layer_, "forest_km", OFTReal, 10, 3);
    add_field(layer_, "suitable", OFTString, 3);
    add_field(layer_, "feature", OFTString, 64);
}

void VectorSegmentWriter::write_segment(const SegmentRecord& record) {
    if (!dataset_) {
        throw DatasetError("write to closed dataset '" + path_ + "'");
    }
    if (!layer_) {
        create_layer(record.crs.empty() ? options_.default_crs : record.crs);
    }

    OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer_->GetLayerDefn()));

    feature->SetField("seg_id", static_cast<GIntBig>(record.seg_id));
    feature->SetField("start_m", round_decimals(record.start_m, 1));
    feature->SetField("end_m", round_decimals(record.end_m, 1));
    feature->SetField("length_m", round_decimals(record.length_m, 1));
    feature->SetField("forest_m", round_decimals(record.forest_m, 1));
    feature->SetField("forest_km", round_decimals(record.forest_km, 3));
    feature->SetField("suitable", record.suitable ? "YES" : "NO");
    feature->SetField("feature", record.feature_id.c_str());

    OGRGeometryUniquePtr geometry = to_ogr(record.geometry);
    if (feature->SetGeometry(geometry.get()) != OGRERR_NONE) {
        throw DatasetError("failed to set geometry of segment " + std::to_string(record.seg_id));
    }

    if (layer_->CreateFeature(feature.get()) != OGRERR_NONE) {
        throw DatasetError("failed to write segment " + std::to_string(record.seg_id) + " to '" + path_ + "': " +
                           CPLGetLastErrorMsg());
    }
    ++feature_count_;
}

void VectorSegmentWriter::close(const RunSummary& summary) {
    finish();
    logger_.info("Wrote " + std::to_string(feature_count_) + " of " + std::to_string(summary.total_segments) +
                 " segments to " + path_);
}

void VectorSegmentWriter::finish() {
    if (!dataset_) {
        return;
    }
    if (!layer_) {
        create_layer(options_.default_crs);
    }
    if (in_transaction_) {
        in_transaction_ = false;
        if (dataset_->CommitTransaction() != OGRERR_NONE) {
            dataset_.reset();
            throw DatasetError("failed to commit '" + path_ + "': " + CPLGetLastErrorMsg());
        }
    }
    layer_ = nullptr;
    dataset_.reset();
}

} // namespace habitat
