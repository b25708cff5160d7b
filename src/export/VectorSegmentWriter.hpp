/**
 * @file VectorSegmentWriter.hpp
 * @brief Writes segment records to an OGR vector dataset
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "SegmentSink.hpp"
#include "../core/Logger.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <string>

namespace habitat {

/**
 * @brief Segment sink backed by a single-layer OGR dataset
 *
 * The dataset is created by the constructor; the LineString layer is
 * created on the first record so it can take the CRS of the data. Every
 * record becomes one feature with the fields
 * seg_id, start_m, end_m, length_m, forest_m, forest_km, suitable, feature.
 * Distances are rounded to 0.1 and forest_km to 0.001.
 */
class VectorSegmentWriter : public SegmentSink {
public:
    struct Options {
        std::string format = "shapefile";  ///< shapefile, gpkg or geojson
        std::string layer_name = "segments";
        std::string default_crs;           ///< Used when the layer is created without records
        bool overwrite = true;             ///< Delete an existing dataset at the path first
    };

    /**
     * @throws DatasetError if the driver is missing or the dataset cannot be created
     */
    VectorSegmentWriter(const std::string& path, const Options& options);
    ~VectorSegmentWriter() override;

    VectorSegmentWriter(const VectorSegmentWriter&) = delete;
    VectorSegmentWriter& operator=(const VectorSegmentWriter&) = delete;

    /**
     * @throws DatasetError if the feature cannot be written
     */
    void write_segment(const SegmentRecord& record) override;

    /**
     * @brief Create the layer if still missing, commit and close the dataset
     */
    void close(const RunSummary& summary) override;

    const std::string& path() const { return path_; }
    size_t feature_count() const { return feature_count_; }
    bool is_open() const { return dataset_ != nullptr; }

    /// GDAL driver for an output format name, empty if unknown
    static std::string driver_name(const std::string& format);

    /// File extension (with dot) for an output format name
    static std::string extension(const std::string& format);

private:
    std::string path_;
    Options options_;
    GDALDatasetUniquePtr dataset_;
    OGRLayer* layer_ = nullptr;  // Owned by dataset_
    bool in_transaction_ = false;
    size_t feature_count_ = 0;
    Logger logger_;

    void create_layer(const std::string& crs);
    void create_attribute_fields();
    void finish();
};

} // namespace habitat
