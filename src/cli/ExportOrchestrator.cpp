/**
 * @file ExportOrchestrator.cpp
 * @brief Implementation of file-based run orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ExportOrchestrator.hpp"
#include "../io/FeatureSource.hpp"
#include "../export/SegmentSink.hpp"
#include "../export/VectorSegmentWriter.hpp"
#include "../export/RunReportWriter.hpp"
#include <filesystem>
#include <memory>

namespace habitat {

ExportOrchestrator::ExportOrchestrator(const AnalysisConfig& config)
    : config_(config)
    , logger_("ExportOrchestrator")
{
}

ExportOrchestrator::~ExportOrchestrator() = default;

std::string ExportOrchestrator::output_path(const std::string& format, const std::string& stream) const {
    std::filesystem::path path(config_.output_directory);
    path /= config_.base_name + "_" + stream + VectorSegmentWriter::extension(format);
    return path.string();
}

std::string ExportOrchestrator::summary_path() const {
    std::filesystem::path path(config_.output_directory);
    path /= config_.base_name + "_summary.json";
    return path.string();
}

RunSummary ExportOrchestrator::run() {
    output_tracker_.clear();

    if (config_.lines_path.empty()) {
        throw InvalidConfigurationError("no line dataset given (--lines)");
    }
    if (config_.polygons_path.empty()) {
        throw InvalidConfigurationError("no polygon dataset given (--polygons)");
    }

    // Validates the configuration before any dataset is touched
    SuitabilityAnalyzer analyzer(config_);

    OGRLineSource lines(config_.lines_path, config_.lines_layer);
    OGRPolygonSource polygons(config_.polygons_path, config_.polygons_layer);

    analyzer.build_coverage(polygons);
    if (polygons.skipped_count() > 0) {
        logger_.warning(std::to_string(polygons.skipped_count()) + " polygon records had no usable geometry");
    }

    output_tracker_.startStage("export");

    std::error_code ec;
    std::filesystem::create_directories(config_.output_directory, ec);
    if (ec) {
        output_tracker_.completeStage("export", false, ec.message());
        throw DatasetError("cannot create output directory '" + config_.output_directory + "': " + ec.message());
    }

    std::vector<std::unique_ptr<VectorSegmentWriter>> writers;
    SegmentSinkGroup all_segments;
    SegmentSinkGroup suitable_segments;

    for (const auto& format : config_.output_formats) {
        VectorSegmentWriter::Options options;
        options.format = format;
        options.default_crs = lines.crs();

        options.layer_name = config_.base_name + "_all";
        writers.push_back(std::make_unique<VectorSegmentWriter>(output_path(format, "all"), options));
        all_segments.add(*writers.back());

        options.layer_name = config_.base_name + "_suitable";
        writers.push_back(std::make_unique<VectorSegmentWriter>(output_path(format, "suitable"), options));
        suitable_segments.add(*writers.back());
    }

    RunSummary summary = analyzer.classify_lines(lines, all_segments, &suitable_segments);
    if (lines.skipped_count() > 0) {
        logger_.warning(std::to_string(lines.skipped_count()) + " line records had no usable geometry");
    }

    all_segments.close(summary);
    suitable_segments.close(summary);

    for (size_t i = 0; i < writers.size(); ++i) {
        const auto& writer = writers[i];
        const std::string format = config_.output_formats[i / 2];
        output_tracker_.trackGeneratedFile(writer->path(), format, i % 2 == 0 ? "all" : "suitable",
                                           writer->feature_count());
    }

    if (config_.write_summary) {
        RunReportWriter::write(summary_path(), config_, summary, output_tracker_.getOutputFiles());
        output_tracker_.trackGeneratedFile(summary_path(), "json", "summary", 0);
    }

    output_tracker_.completeStage("export");
    logger_.info(output_tracker_.getFileTrackingSummary());
    logger_.detailed(analyzer.get_output_tracker().getTimingReport());

    return summary;
}

} // namespace habitat
