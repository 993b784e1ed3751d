/*
 * CHRONOID
 * Version 1.0, October 2026
 *
 * Copyright (c) 2026 The chronoid Authors.
 *
 * This source code is licensed under the MIT License.
 * See the LICENSE file in the project root for the full text.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the leveled console logger.
 *
 * @details
 * Formats each entry as `[YYYY-MM-DD HH:MM:SS] [TAG] message` with ANSI colour
 * per severity, and filters entries against a process-wide threshold.
 */

#include "chronoid/infra/logger.hpp"

#include "chronoid/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace chronoid::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::INFO};

void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex also protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

void Logger::set_level(LogLevel level)
{
    threshold_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level()
{
    return threshold_.load(std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level)
{
    return level >= threshold_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(const std::string& name)
{
    const std::string key = String::to_upper(String::trim(name));

    if (key == "TRACE") {
        return LogLevel::TRACE;
    }
    if (key == "DEBUG") {
        return LogLevel::DEBUG;
    }
    if (key == "INFO") {
        return LogLevel::INFO;
    }
    if (key == "WARN" || key == "WARNING") {
        return LogLevel::WARN;
    }
    if (key == "ERROR") {
        return LogLevel::ERROR;
    }
    if (key == "FATAL") {
        return LogLevel::FATAL;
    }
    return std::nullopt;
}

const char* Logger::level_name(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::FATAL:
        return "FATAL";
    }
    return "UNKNOWN";
}

} // namespace chronoid::infra
