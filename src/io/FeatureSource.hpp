/**
 * @file FeatureSource.hpp
 * @brief Pull interfaces for line and polygon features
 *
 * The pipeline reads its inputs through LineSource and PolygonSource, so it
 * never depends on where features come from. In-memory sources serve tests
 * and embedding applications; OGR sources read any GDAL vector dataset.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include "../core/Logger.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <optional>
#include <string>
#include <vector>

namespace habitat {

// ============================================================================
// Abstract sources
// ============================================================================

class LineSource {
public:
    virtual ~LineSource() = default;

    /**
     * @brief Next feature in source order, empty when exhausted
     */
    virtual std::optional<LineFeature> next() = 0;

    /**
     * @brief Restart from the first feature
     */
    virtual void rewind() = 0;

    /// Human-readable origin for log messages
    virtual std::string description() const = 0;

    /// Records dropped by the source itself (wrong or empty geometry)
    virtual size_t skipped_count() const { return 0; }
};

class PolygonSource {
public:
    virtual ~PolygonSource() = default;

    virtual std::optional<PolygonFeature> next() = 0;
    virtual void rewind() = 0;
    virtual std::string description() const = 0;
    virtual size_t skipped_count() const { return 0; }
};

// ============================================================================
// In-memory sources
// ============================================================================

class MemoryLineSource : public LineSource {
public:
    MemoryLineSource() = default;
    explicit MemoryLineSource(std::vector<LineFeature> features) : features_(std::move(features)) {}

    void add(LineFeature feature) { features_.push_back(std::move(feature)); }

    std::optional<LineFeature> next() override {
        if (position_ >= features_.size()) return std::nullopt;
        return features_[position_++];
    }

    void rewind() override { position_ = 0; }
    std::string description() const override { return "memory (" + std::to_string(features_.size()) + " lines)"; }

private:
    std::vector<LineFeature> features_;
    size_t position_ = 0;
};

class MemoryPolygonSource : public PolygonSource {
public:
    MemoryPolygonSource() = default;
    explicit MemoryPolygonSource(std::vector<PolygonFeature> features) : features_(std::move(features)) {}

    void add(PolygonFeature feature) { features_.push_back(std::move(feature)); }

    std::optional<PolygonFeature> next() override {
        if (position_ >= features_.size()) return std::nullopt;
        return features_[position_++];
    }

    void rewind() override { position_ = 0; }
    std::string description() const override { return "memory (" + std::to_string(features_.size()) + " polygons)"; }

private:
    std::vector<PolygonFeature> features_;
    size_t position_ = 0;
};

// ============================================================================
// OGR-backed sources
// ============================================================================

/**
 * @brief One layer of a GDAL vector dataset, opened read-only
 */
class OGRLayerReader {
public:
    /**
     * @param path Dataset path (any OGR-readable format)
     * @param layer_name Layer to read; empty selects the first layer
     * @throws DatasetError if the dataset or layer cannot be opened
     */
    OGRLayerReader(const std::string& path, const std::string& layer_name);

    OGRFeatureUniquePtr next_feature();
    void rewind();

    /// Feature FID as string, or the 1-based read position without FIDs
    std::string feature_id(const OGRFeature& feature) const;

    /// Layer CRS as "AUTH:CODE", WKT if it has no authority, or empty
    std::string crs() const;

    std::string description() const;
    OGRLayer* layer() const { return layer_; }

private:
    std::string path_;
    GDALDatasetUniquePtr dataset_;
    OGRLayer* layer_ = nullptr;  // Owned by dataset_
    size_t position_ = 0;
};

class OGRLineSource : public LineSource {
public:
    OGRLineSource(const std::string& path, const std::string& layer_name = "");

    std::optional<LineFeature> next() override;
    void rewind() override;
    std::string description() const override { return reader_.description(); }
    size_t skipped_count() const override { return skipped_; }

    const std::string& crs() const { return crs_; }

private:
    OGRLayerReader reader_;
    std::string crs_;
    size_t skipped_ = 0;
    Logger logger_;
};

class OGRPolygonSource : public PolygonSource {
public:
    OGRPolygonSource(const std::string& path, const std::string& layer_name = "");

    std::optional<PolygonFeature> next() override;
    void rewind() override;
    std::string description() const override { return reader_.description(); }
    size_t skipped_count() const override { return skipped_; }

private:
    OGRLayerReader reader_;
    size_t skipped_ = 0;
    Logger logger_;
};

} // namespace habitat
