/**
 * @file SuitabilityAnalyzer.cpp
 * @brief Pipeline orchestration: coverage, segmentation, classification, emission
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "habitat_analyzer.hpp"
#include "CoverageMaskBuilder.hpp"
#include "GeometryKernel.hpp"
#include "InputValidator.hpp"
#include "Logger.hpp"
#include "OutputTracker.hpp"
#include "SegmentGenerator.hpp"
#include "SuitabilityClassifier.hpp"
#include "../io/FeatureSource.hpp"
#include "../export/SegmentSink.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace habitat {

double round_decimals(double value, int decimals) {
    if (!std::isfinite(value)) {
        return value;
    }
    // printf converts the exact binary value, rounding ties to even
    char buffer[384];
    const int written = std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    if (written < 0 || written >= static_cast<int>(sizeof(buffer))) {
        return value;
    }
    return std::strtod(buffer, nullptr);
}

// ============================================================================
// SuitabilityAnalyzer::Impl - Private implementation
// ============================================================================

class SuitabilityAnalyzer::Impl {
public:
    explicit Impl(const AnalysisConfig& config)
        : config_(config),
          logger_("SuitabilityAnalyzer"),
          classifier_(config.min_coverage_length) {

        InputValidator validator;
        auto validation_result = validator.validate(config_);
        if (validation_result.has_errors()) {
            throw InvalidConfigurationError(validation_result.format_error_message());
        }
        if (validation_result.has_warnings()) {
            logger_.warning(validation_result.format_warning_message());
        }

        if (config_.parallel_processing) {
            arena_ = std::make_unique<tbb::task_arena>(
                config_.num_threads > 0 ? config_.num_threads : tbb::task_arena::automatic);
        }
    }

    void build_coverage(PolygonSource& polygons) {
        summary_ = {};
        next_seg_id_ = 1;
        coverage_.reset();

        output_tracker_.startStage("coverage");
        logger_.info("Building coverage region from " + polygons.description());

        CoverageMaskBuilder builder(config_.buffer_margin, config_.buffer_arc_segments);
        polygons.rewind();
        while (auto feature = polygons.next()) {
            try {
                builder.add(*feature);
            } catch (const GeometryError& e) {
                logger_.warning(std::string("Skipping coverage polygon: ") + e.what());
                summary_.skipped_features.push_back(
                    FeatureFailure{FeatureFailure::Source::POLYGONS, feature->feature_id, std::nullopt, e.reason()});
            }
        }

        if (builder.accepted_count() == 0) {
            output_tracker_.completeStage("coverage", false, "no usable polygons");
            throw EmptyInputError("polygon source " + polygons.description() + " yielded no usable polygons");
        }

        try {
            coverage_ = std::make_unique<CoverageRegion>(builder.build());
        } catch (const AnalysisError& e) {
            output_tracker_.completeStage("coverage", false, e.what());
            throw;
        }

        summary_.coverage_features_used = coverage_->source_count();
        output_tracker_.addStageData("coverage", "features", std::to_string(coverage_->source_count()));
        output_tracker_.completeStage("coverage");
        summary_.coverage_time = output_tracker_.stageDuration("coverage");

        logger_.info("Coverage region built from " + std::to_string(coverage_->source_count()) +
                     " polygons (" + std::to_string(coverage_->polygon_count()) + " after dissolve)");
    }

    RunSummary classify_lines(LineSource& lines, SegmentSink& all_segments, SegmentSink* suitable_segments) {
        if (!coverage_) {
            throw AnalysisError("coverage region has not been built");
        }

        output_tracker_.startStage("classification");
        logger_.info("Segmenting lines from " + lines.description());

        lines.rewind();
        while (auto feature = lines.next()) {
            process_feature(*feature, all_segments, suitable_segments);
        }

        output_tracker_.addStageData("classification", "segments", std::to_string(summary_.total_segments));
        output_tracker_.completeStage("classification");
        summary_.classification_time += output_tracker_.stageDuration("classification");

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << "Classified " << summary_.total_segments << " segments from "
            << summary_.lines_processed << " lines: " << summary_.suitable_segments
            << " suitable (" << summary_.success_rate() << "%)";
        logger_.info(oss.str());

        if (!summary_.skipped_features.empty()) {
            logger_.warning(std::to_string(summary_.skipped_features.size()) + " features or parts were skipped");
        }

        return summary_;
    }

    RunSummary run(LineSource& lines, PolygonSource& polygons,
                   SegmentSink& all_segments, SegmentSink* suitable_segments) {
        build_coverage(polygons);
        classify_lines(lines, all_segments, suitable_segments);

        all_segments.close(summary_);
        if (suitable_segments) {
            suitable_segments->close(summary_);
        }
        return summary_;
    }

    bool has_coverage() const { return coverage_ != nullptr; }

    const CoverageRegion& get_coverage() const {
        if (!coverage_) {
            throw AnalysisError("coverage region has not been built");
        }
        return *coverage_;
    }

    const RunSummary& get_summary() const { return summary_; }
    const AnalysisConfig& get_config() const { return config_; }
    const OutputTracker& get_output_tracker() const { return output_tracker_; }

private:
    AnalysisConfig config_;
    Logger logger_;
    SuitabilityClassifier classifier_;
    std::unique_ptr<CoverageRegion> coverage_;
    std::unique_ptr<tbb::task_arena> arena_;
    RunSummary summary_;
    OutputTracker output_tracker_;
    std::uint64_t next_seg_id_ = 1;

    /**
     * @brief Classification results of one part, in window order
     *
     * Only the results are kept. Window geometry is rebuilt from the
     * generator when the records are emitted.
     */
    struct ClassifiedPart {
        size_t part_index;
        SegmentGenerator generator;
        std::vector<std::optional<Classification>> results;
    };

    /**
     * @brief Segment and classify every part of one feature
     *
     * Nothing is emitted until the whole feature succeeded, so a
     * GeometryError never leaves a partial feature in the outputs.
     */
    void process_feature(const LineFeature& feature, SegmentSink& all_segments, SegmentSink* suitable_segments) {
        std::vector<ClassifiedPart> classified;
        std::vector<FeatureFailure> part_failures;
        size_t parts_processed = 0;
        size_t parts_too_short = 0;

        const auto parts = line_parts(feature.geometry);
        logger_.debug("Feature '" + feature.feature_id + "': " + std::to_string(parts.size()) + " part(s)");

        try {
            for (size_t p = 0; p < parts.size(); ++p) {
                std::optional<SegmentGenerator> generator;
                try {
                    generator.emplace(*parts[p], config_.segment_length, config_.sample_interval);
                } catch (const DegenerateLineError& e) {
                    logger_.warning("Skipping part " + std::to_string(p) + " of feature '" +
                                    feature.feature_id + "': " + e.what());
                    part_failures.push_back(
                        FeatureFailure{FeatureFailure::Source::LINES, feature.feature_id, p, e.what()});
                    continue;
                }

                ++parts_processed;
                if (generator->window_count() == 0) {
                    ++parts_too_short;
                    logger_.debug("Part " + std::to_string(p) + " of feature '" + feature.feature_id +
                                  "' is shorter than one segment (" + std::to_string(generator->total_length()) + ")");
                    continue;
                }

                auto results = classify_part(*generator);
                classified.push_back(ClassifiedPart{p, std::move(*generator), std::move(results)});
            }
        } catch (const GeometryError& e) {
            logger_.warning(std::string("Skipping line feature: ") + e.with_feature(feature.feature_id).what());
            summary_.skipped_features.push_back(
                FeatureFailure{FeatureFailure::Source::LINES, feature.feature_id, std::nullopt, e.reason()});
            return;
        }

        summary_.skipped_features.insert(summary_.skipped_features.end(), part_failures.begin(), part_failures.end());
        summary_.lines_processed++;
        summary_.parts_processed += parts_processed;
        summary_.parts_too_short += parts_too_short;

        for (const auto& part : classified) {
            emit_part(feature, part, all_segments, suitable_segments);
        }
    }

    std::vector<std::optional<Classification>> classify_part(const SegmentGenerator& generator) {
        const size_t count = generator.window_count();
        std::vector<std::optional<Classification>> results(count);

        // A window's geometry lives only while it is being classified
        auto classify_window = [&](size_t k) {
            if (auto window = generator.window(k)) {
                results[k] = classifier_.classify(window->geometry, *coverage_);
            }
        };

        if (arena_ && count > 1) {
            // Each index writes only its own slot, so the order is unaffected
            arena_->execute([&] {
                tbb::parallel_for(tbb::blocked_range<size_t>(0, count),
                    [&](const tbb::blocked_range<size_t>& range) {
                        for (size_t k = range.begin(); k != range.end(); ++k) {
                            classify_window(k);
                        }
                    });
            });
        } else {
            for (size_t k = 0; k < count; ++k) {
                classify_window(k);
            }
        }
        return results;
    }

    void emit_part(const LineFeature& feature, const ClassifiedPart& part,
                   SegmentSink& all_segments, SegmentSink* suitable_segments) {
        for (size_t k = 0; k < part.results.size(); ++k) {
            if (!part.results[k]) continue;
            std::optional<CandidateSegment> window = part.generator.window(k);
            if (!window) continue;

            const Classification& result = *part.results[k];
            SegmentRecord record;
            record.seg_id = next_seg_id_++;
            record.feature_id = feature.feature_id;
            record.part_index = part.part_index;
            record.start_m = window->start_m;
            record.end_m = window->end_m;
            record.length_m = polyline_length(window->geometry);
            record.forest_m = result.overlap_m;
            record.forest_km = round_decimals(result.overlap_m / 1000.0, 3);
            record.suitable = result.suitable;
            record.geometry = std::move(window->geometry);
            record.crs = feature.crs;

            emit(record, all_segments, suitable_segments);
        }
    }

    void emit(const SegmentRecord& record, SegmentSink& all_segments, SegmentSink* suitable_segments) {
        if (logger_.shouldOutput(LogLevel::TRACE)) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1)
                << "Segment " << record.seg_id << " [" << record.start_m << ", " << record.end_m
                << "] overlap " << record.forest_m << (record.suitable ? " suitable" : "");
            logger_.trace(oss.str());
        }

        all_segments.write_segment(record);
        if (record.suitable && suitable_segments) {
            suitable_segments->write_segment(record);
        }

        summary_.total_segments++;
        if (record.suitable) {
            summary_.suitable_segments++;
        }

        if (config_.progress_interval > 0 && summary_.total_segments % config_.progress_interval == 0) {
            logger_.detailed("Progress: " + std::to_string(summary_.total_segments) + " segments, " +
                             std::to_string(summary_.suitable_segments) + " suitable");
        }
    }
};

// ============================================================================
// SuitabilityAnalyzer - Public interface
// ============================================================================

SuitabilityAnalyzer::SuitabilityAnalyzer(const AnalysisConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

SuitabilityAnalyzer::~SuitabilityAnalyzer() = default;

void SuitabilityAnalyzer::build_coverage(PolygonSource& polygons) {
    impl_->build_coverage(polygons);
}

RunSummary SuitabilityAnalyzer::run(LineSource& lines, PolygonSource& polygons,
                                    SegmentSink& all_segments, SegmentSink* suitable_segments) {
    return impl_->run(lines, polygons, all_segments, suitable_segments);
}

RunSummary SuitabilityAnalyzer::classify_lines(LineSource& lines,
                                               SegmentSink& all_segments, SegmentSink* suitable_segments) {
    return impl_->classify_lines(lines, all_segments, suitable_segments);
}

bool SuitabilityAnalyzer::has_coverage() const {
    return impl_->has_coverage();
}

const CoverageRegion& SuitabilityAnalyzer::get_coverage() const {
    return impl_->get_coverage();
}

const RunSummary& SuitabilityAnalyzer::get_summary() const {
    return impl_->get_summary();
}

const AnalysisConfig& SuitabilityAnalyzer::get_config() const {
    return impl_->get_config();
}

const OutputTracker& SuitabilityAnalyzer::get_output_tracker() const {
    return impl_->get_output_tracker();
}

} // namespace habitat
