/**
 * @file Logger.cpp
 * @brief Implementation of the facility-based logger
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace keyforge {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::file_stream_;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

std::optional<LogLevel> parse_level(const std::string& text) {
    try {
        size_t consumed = 0;
        const int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<LogLevel>(std::clamp(value, 1, 6));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?";
}

Logger::Logger(const std::string& facility)
    : facility_(facility), last_level_(LogLevel::INFO),
      repeat_count_(0), has_last_message_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::clog.flush();
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
    has_last_message_ = true;
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    emitRepeatSummary();
    std::clog.flush();

    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::emitRepeatSummary() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " +
                 std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] [" << log_level_tag(level) << "] ["
         << facility_ << "] " << message;

    // Log output goes to stderr so stdout stays free for --dry-run scenes
    std::clog << line.str() << std::endl;

    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }
}

LogLevel Logger::getEffectiveLevel() const {
    return getFacilityLevel(facility_);
}

// ============================================================================
// Process-wide configuration
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }
    return default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::parseLogConfig(const std::string& config) {
    bool all_valid = true;
    std::stringstream ss(config);
    std::string token;

    std::lock_guard<std::mutex> lock(registry_mutex_);
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        const size_t equals_pos = token.find('=');
        if (equals_pos == std::string::npos) {
            auto level = parse_level(token);
            if (!level) {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
                all_valid = false;
                continue;
            }
            default_level_ = *level;
            continue;
        }

        const std::string facility = trim(token.substr(0, equals_pos));
        const std::string level_str = trim(token.substr(equals_pos + 1));
        auto level = parse_level(level_str);
        if (facility.empty() || !level) {
            std::cerr << "Warning: Invalid log level '" << level_str
                      << "' for facility '" << facility << "'" << std::endl;
            all_valid = false;
            continue;
        }

        if (facility == "default") {
            default_level_ = *level;
        } else {
            facility_levels_[facility] = *level;
        }
    }
    return all_valid;
}

bool Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (!log_file.has_value()) {
        return true;
    }

    std::error_code ec;
    const std::filesystem::path log_path(*log_file);
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    auto stream = std::make_shared<std::ofstream>(*log_file, std::ios::app);
    if (!stream->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << *log_file << std::endl;
        return false;
    }
    file_stream_ = std::move(stream);
    return true;
}

} // namespace keyforge
