/**
 * @file OutputTracker.cpp
 * @brief Implementation of stage and output file tracking
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "OutputTracker.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace habitat {

OutputTracker::OutputTracker() : logger_("OutputTracker") {
}

void OutputTracker::startStage(const std::string& stage_name) {
    stages_.emplace_back(stage_name);
    logger_.detailed("Stage started: " + stage_name);
}

void OutputTracker::completeStage(const std::string& stage_name, bool successful, const std::string& error) {
    PipelineStage* stage = findStage(stage_name);
    if (!stage) {
        logger_.debug("completeStage for unknown stage: " + stage_name);
        return;
    }

    stage->complete(successful, error);

    std::string message = "Stage complete: " + stage_name + " (" + formatDuration(stage->duration()) + ")";
    if (!successful) {
        message += " [FAILED: " + error + "]";
    }
    logger_.detailed(message);
}

void OutputTracker::addStageData(const std::string& stage_name, const std::string& key, const std::string& value) {
    PipelineStage* stage = findStage(stage_name);
    if (stage) {
        stage->stage_data[key] = value;
        logger_.debug(stage_name + ": " + key + " = " + value);
    }
}

std::chrono::milliseconds OutputTracker::stageDuration(const std::string& stage_name) const {
    const PipelineStage* stage = findStage(stage_name);
    return stage ? stage->duration() : std::chrono::milliseconds(0);
}

void OutputTracker::trackGeneratedFile(const OutputFileInfo& file_info) {
    tracked_files_.push_back(file_info);
    logger_.detailed("File written: " + file_info.filename + " (format: " + file_info.format +
                     ", type: " + file_info.type + ", features: " + std::to_string(file_info.feature_count) + ")");
}

void OutputTracker::trackGeneratedFile(const std::string& filename, const std::string& format,
                                       const std::string& type, size_t feature_count) {
    OutputFileInfo info(filename, format, type);
    info.feature_count = feature_count;

    std::error_code ec;
    if (std::filesystem::is_regular_file(filename, ec)) {
        info.file_size_bytes = std::filesystem::file_size(filename, ec);
        info.generation_successful = !ec;
        if (ec) {
            info.error_message = "Could not get file size: " + ec.message();
        }
    } else if (std::filesystem::exists(filename, ec)) {
        // Multi-file datasets (e.g. a shapefile written into a directory)
        info.generation_successful = true;
    } else {
        info.error_message = "File not found after writing";
    }

    trackGeneratedFile(info);
}

std::string OutputTracker::getFileTrackingSummary() const {
    size_t successful = 0;
    size_t total_size = 0;

    for (const auto& file : tracked_files_) {
        if (file.generation_successful) {
            successful++;
            total_size += file.file_size_bytes;
        }
    }

    std::ostringstream oss;
    oss << "Files: " << successful << "/" << tracked_files_.size()
        << " successful, " << formatFileSize(total_size) << " total";
    return oss.str();
}

std::string OutputTracker::getPipelineStatus() const {
    std::ostringstream oss;
    oss << "Pipeline: " << getCompletedStageCount() << "/" << stages_.size() << " stages completed";

    auto failed = std::find_if(stages_.begin(), stages_.end(),
                               [](const PipelineStage& s) { return s.completed && !s.successful; });
    if (failed != stages_.end()) {
        oss << ", failed at '" << failed->stage_name << "': " << failed->error_message;
    }
    return oss.str();
}

std::string OutputTracker::getTimingReport() const {
    std::ostringstream oss;
    oss << "Timing:";
    for (const auto& stage : stages_) {
        oss << " " << stage.stage_name << "=" << (stage.completed ? formatDuration(stage.duration()) : "running");
    }
    return oss.str();
}

size_t OutputTracker::getCompletedStageCount() const {
    return static_cast<size_t>(std::count_if(stages_.begin(), stages_.end(),
                                             [](const PipelineStage& s) { return s.completed; }));
}

std::vector<std::string> OutputTracker::getOutputFiles() const {
    std::vector<std::string> files;
    files.reserve(tracked_files_.size());
    for (const auto& file : tracked_files_) {
        files.push_back(file.filename);
    }
    return files;
}

void OutputTracker::clear() {
    tracked_files_.clear();
    stages_.clear();
}

std::string OutputTracker::formatDuration(std::chrono::milliseconds duration) {
    std::ostringstream oss;
    if (duration.count() < 1000) {
        oss << duration.count() << "ms";
    } else {
        oss << std::fixed << std::setprecision(2) << (duration.count() / 1000.0) << "s";
    }
    return oss.str();
}

std::string OutputTracker::formatFileSize(size_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (bytes / 1024.0) << " KB";
    } else {
        oss << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0)) << " MB";
    }
    return oss.str();
}

PipelineStage* OutputTracker::findStage(const std::string& stage_name) {
    // Latest stage with this name
    auto it = std::find_if(stages_.rbegin(), stages_.rend(),
                           [&](const PipelineStage& s) { return s.stage_name == stage_name; });
    return it != stages_.rend() ? &*it : nullptr;
}

const PipelineStage* OutputTracker::findStage(const std::string& stage_name) const {
    auto it = std::find_if(stages_.rbegin(), stages_.rend(),
                           [&](const PipelineStage& s) { return s.stage_name == stage_name; });
    return it != stages_.rend() ? &*it : nullptr;
}

} // namespace habitat
