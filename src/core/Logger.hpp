/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity control
 *
 * Every component logs through a Logger named after itself (its facility).
 * Output goes through exactly one place, outputMessage(), which performs the
 * verbosity check, collapses repeated messages and writes to the console
 * and the optional log file.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace habitat {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run or feature aborted)
 * Level 2: Warnings (feature skipped, suspicious configuration)
 * Level 3: Information (pipeline stages, run summary)
 * Level 4: Detailed information (progress, per-feature codepaths)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values, per-segment results)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Short tag printed in front of each message
 */
const char* log_level_tag(LogLevel level);

/**
 * @brief Facility-aware logger with a single point of output control
 */
class Logger {
public:
    /**
     * @brief Logger without facility, follows the global default level
     */
    Logger();

    /**
     * @brief Logger for a named facility (component)
     * @param component_name Facility name used for level lookup and message prefix
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Logger with explicit level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    /**
     * @brief Destructor - reports pending repeats and flushes
     */
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * THE SINGLE POINT OF LOGGING CONTROL. Identical consecutive messages
     * are counted and reported once as "occurred N times".
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    /**
     * @brief Set or change the log file
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush console and file output, reporting pending repeats
     */
    void flush() const;

    // ========================================================================
    // Facility registry
    // ========================================================================

    /**
     * @brief Set log level for one facility
     *
     * @example
     * Logger::setFacilityLevel("SuitabilityAnalyzer", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Set the fallback level for facilities without their own level
     */
    static void setDefaultLevel(LogLevel level);

    static LogLevel getDefaultLevel();

    /**
     * @brief Level for a facility, or the default level if none is set
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * - "5" sets the default to DEBUG
     * - "SuitabilityAnalyzer=6,default=3" sets one facility and the default
     * - "4,VectorSegmentWriter=6" mixes both
     *
     * Levels are clamped to 1..6; invalid entries are reported on stderr
     * and ignored.
     */
    static void parseLogConfig(const std::string& config);

    /**
     * @brief Global log file shared by every Logger without its own file
     */
    static void setGlobalLogFile(const std::optional<std::string>& log_file);

    static void clearFacilityLevels();

    /**
     * @brief Facility level if set, then the instance level if changed
     * from WARNING, then the global default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Repeated-message collapsing
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> global_file_stream_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<std::ofstream> openLogFile(const std::string& path);

    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace habitat
