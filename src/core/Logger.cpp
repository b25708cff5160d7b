/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace habitat {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::global_file_stream_;
std::mutex Logger::registry_mutex_;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

LogLevel clamp_level(int level) {
    return static_cast<LogLevel>(std::clamp(level, 1, 6));
}

} // namespace

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN ";
        case LogLevel::INFO:     return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
    }
    return "?????";
}

Logger::Logger()
    : current_level_(LogLevel::WARNING), last_level_(LogLevel::INFO),
      repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::WARNING), component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), log_file_path_(log_file),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        file_stream_ = openLogFile(log_file.value());
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (static_cast<int>(level) > static_cast<int>(getEffectiveLevel())) {
        return;
    }

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    emitRepeatSummary();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::emitRepeatSummary() const {
    // Caller holds output_mutex_
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    log_file_path_ = log_file;
    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (log_file.has_value()) {
        file_stream_ = openLogFile(log_file.value());
    }
}

std::shared_ptr<std::ofstream> Logger::openLogFile(const std::string& path) {
    try {
        std::filesystem::path log_path(path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        auto stream = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!stream->is_open()) {
            // Not through outputMessage: the logger is what failed
            std::cerr << "Warning: Failed to open log file: " << path << std::endl;
            return nullptr;
        }
        return stream;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        return nullptr;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] " << log_level_tag(level) << " ";
    if (!component_name_.empty()) {
        line << "[" << component_name_ << "] ";
    }
    line << message;

    std::cout << line.str() << std::endl;

    std::shared_ptr<std::ofstream> file = file_stream_;
    if (!file) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        file = global_file_stream_;
    }
    if (file && file->is_open()) {
        *file << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();

    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Facility registry
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getDefaultLevel() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = facility_levels_.find(facility);
    return it != facility_levels_.end() ? it->second : default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        std::string facility = equals_pos == std::string::npos ? "default" : trim(token.substr(0, equals_pos));
        std::string level_str = equals_pos == std::string::npos ? token : trim(token.substr(equals_pos + 1));

        try {
            LogLevel level = clamp_level(std::stoi(level_str));
            if (facility == "default") {
                default_level_ = level;
            } else {
                facility_levels_[facility] = level;
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
        }
    }
}

void Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    auto stream = log_file.has_value() ? openLogFile(log_file.value()) : nullptr;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    global_file_stream_ = std::move(stream);
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    if (current_level_ != LogLevel::WARNING) {
        return current_level_;
    }

    return default_level_;
}

} // namespace habitat
