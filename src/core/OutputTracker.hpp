/**
 * @file OutputTracker.hpp
 * @brief Pipeline stage timing and output file tracking
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace habitat {

/**
 * @brief Information about a written output file
 */
struct OutputFileInfo {
    std::string filename;
    std::string format;
    std::string type;  // "all", "suitable", "summary"
    size_t file_size_bytes = 0;
    size_t feature_count = 0;
    bool generation_successful = false;
    std::string error_message;

    OutputFileInfo(const std::string& fname, const std::string& fmt, const std::string& t = "unknown")
        : filename(fname), format(fmt), type(t) {}
};

/**
 * @brief One named pipeline stage ("coverage", "classification", "export")
 */
struct PipelineStage {
    std::string stage_name;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::string error_message;
    std::unordered_map<std::string, std::string> stage_data;

    explicit PipelineStage(const std::string& name)
        : stage_name(name), start_time(std::chrono::steady_clock::now()) {}

    void complete(bool success = true, const std::string& error = "") {
        end_time = std::chrono::steady_clock::now();
        completed = true;
        successful = success;
        error_message = error;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

/**
 * @brief Tracks pipeline stages and the files a run produced
 *
 * Stage events are logged at DETAILED level through the "OutputTracker"
 * facility.
 */
class OutputTracker {
public:
    OutputTracker();

    // Stage tracking
    void startStage(const std::string& stage_name);
    void completeStage(const std::string& stage_name, bool successful = true, const std::string& error = "");
    void addStageData(const std::string& stage_name, const std::string& key, const std::string& value);

    /**
     * @brief Duration of a completed stage, zero if unknown or still running
     */
    std::chrono::milliseconds stageDuration(const std::string& stage_name) const;

    // File tracking
    void trackGeneratedFile(const OutputFileInfo& file_info);
    void trackGeneratedFile(const std::string& filename, const std::string& format,
                            const std::string& type, size_t feature_count);

    // State queries for logging
    std::string getFileTrackingSummary() const;
    std::string getPipelineStatus() const;
    std::string getTimingReport() const;

    size_t getTrackedFileCount() const { return tracked_files_.size(); }
    size_t getCompletedStageCount() const;
    std::vector<std::string> getOutputFiles() const;
    const std::vector<OutputFileInfo>& getTrackedFiles() const { return tracked_files_; }
    const std::vector<PipelineStage>& getStages() const { return stages_; }

    void clear();

private:
    std::vector<OutputFileInfo> tracked_files_;
    std::vector<PipelineStage> stages_;
    Logger logger_;

    static std::string formatDuration(std::chrono::milliseconds duration);
    static std::string formatFileSize(size_t bytes);

    PipelineStage* findStage(const std::string& stage_name);
    const PipelineStage* findStage(const std::string& stage_name) const;
};

} // namespace habitat
