/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 */

#include "hooksync/infra/logger.hpp"

#include "hooksync/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace hooksync::infra {

std::mutex Logger::mutex_;
LogLevel Logger::threshold_ = LogLevel::INFO;
bool Logger::color_ = true;
std::ostream* Logger::sink_ = nullptr;

namespace {

const char* tag_for(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "[TRCE] ";
    case LogLevel::DEBUG:
        return "[DBUG] ";
    case LogLevel::INFO:
        return "[INFO] ";
    case LogLevel::WARN:
        return "[WARN] ";
    case LogLevel::ERROR:
        return "[FAIL] ";
    case LogLevel::FATAL:
        return "[CRIT] ";
    }
    return "[????] ";
}

const char* color_for(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "\033[90m"; // Gray
    case LogLevel::DEBUG:
        return "\033[36m"; // Cyan
    case LogLevel::INFO:
        return "\033[32m"; // Green
    case LogLevel::WARN:
        return "\033[33m"; // Yellow
    case LogLevel::ERROR:
        return "\033[31m"; // Red
    case LogLevel::FATAL:
        return "\033[1;31m"; // Bold Red
    }
    return "";
}

} // namespace

/**
 * @brief Dispatches a formatted log entry to the appropriate stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Entries below the threshold are dropped.
 * 2. **Synchronization**: A `lock_guard` prevents interleaved output.
 * 3. **Stream Selection**: Sink if installed, else stdout/stderr by severity.
 * 4. **Stylization**: ANSI colors only on console output with color enabled.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_)
        return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    const bool console = (sink_ == nullptr);
    std::ostream& stream = !console ? *sink_ : (level >= LogLevel::WARN ? std::cerr : std::cout);
    const bool colored = console && color_;

    // std::localtime uses a static buffer; the mutex covers it.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";
    if (colored)
        stream << color_for(level);
    stream << tag_for(level) << message;
    if (colored)
        stream << "\033[0m";
    stream << std::endl;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::level()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::set_color(bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = enabled;
}

void Logger::set_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

std::optional<LogLevel> Logger::parse_level(const std::string& name)
{
    const std::string lowered = String::to_lower(String::trim(name));
    if (lowered == "trace")
        return LogLevel::TRACE;
    if (lowered == "debug")
        return LogLevel::DEBUG;
    if (lowered == "info")
        return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::WARN;
    if (lowered == "error")
        return LogLevel::ERROR;
    if (lowered == "fatal")
        return LogLevel::FATAL;
    return std::nullopt;
}

} // namespace hooksync::infra
