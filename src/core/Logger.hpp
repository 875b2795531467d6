/**
 * @file Logger.hpp
 * @brief Facility-based logging for the keychain pipeline and its front ends
 *
 * Every component owns a Logger named after itself (its "facility").
 * Verbosity is controlled process-wide by a default level plus optional
 * per-facility overrides, e.g. "3,RenderOrchestrator=6".
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

namespace keyforge {

/**
 * @brief Log levels
 *
 * Level 1: Errors (request or startup failed)
 * Level 2: Warnings (degraded behaviour, e.g. cleanup failure)
 * Level 3: Information (one line per request)
 * Level 4: Detailed information (pipeline stages)
 * Level 5: Basic debugging (commands, paths)
 * Level 6: Detailed debugging (variable values, captured streams)
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
 * @brief Convert a level to its short display tag ("ERROR", "WARN", ...)
 */
const char* log_level_tag(LogLevel level);

/**
 * @brief Component logger with a single point of output control
 *
 * All messages pass through outputMessage(), which holds the only verbosity
 * check. Consecutive identical messages are collapsed into a repeat summary.
 * Instances are safe to share between request threads.
 */
class Logger {
public:
    /**
     * @brief Construct a logger for a facility
     * @param facility Component name used for level lookup and output tagging
     */
    explicit Logger(const std::string& facility);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if the facility's effective level allows it
     * @param level Level of this message
     * @param message Message to output
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    /**
     * @brief Highest verbosity; flushes afterwards
     */
    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Emit any pending repeat summary and flush the sinks
     */
    void flush() const;

    const std::string& facility() const { return facility_; }

    /**
     * @brief Effective level: facility override if present, else the default
     */
    LogLevel getEffectiveLevel() const;

    // ========================================================================
    // Process-wide configuration
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);
    static void clearFacilityLevels();

    /**
     * @brief Parse and apply a log configuration string
     *
     * Formats:
     * - "5"                          default level DEBUG
     * - "RenderOrchestrator=6"       one facility at TRACE
     * - "3,HttpService=5,default=2"  mixed
     *
     * Levels outside 1..6 are clamped.
     *
     * @param config Configuration string
     * @return false if any token could not be parsed (valid tokens still apply)
     */
    static bool parseLogConfig(const std::string& config);

    /**
     * @brief Mirror all output to a file (append mode), or stop mirroring
     * @param log_file Path to log file, or nullopt to disable
     * @return false if the file could not be opened
     */
    static bool setLogFile(const std::optional<std::string>& log_file);

private:
    std::string facility_;
    mutable std::mutex output_mutex_;

    // Duplicate suppression state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> file_stream_;

    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace keyforge
