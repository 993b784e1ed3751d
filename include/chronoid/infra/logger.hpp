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
 * @file logger.hpp
 * @brief Thread-safe, leveled diagnostic logging for chronoid.
 *
 * @details
 * Declares the `Logger` class used by every subsystem to report initialization
 * outcomes (node resolution, clock sequence claims, configuration loading).
 * Output to `stdout`/`stderr` is serialized so that concurrent generator
 * construction does not interleave log lines.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace chronoid::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-call detail (individual probe attempts).
    DEBUG, ///< Recovered failures and intermediate decisions.
    INFO,  ///< Nominal initialization events.
    WARN,  ///< Degraded operation (e.g. random node identifier).
    ERROR, ///< Failed operations that the caller can recover from.
    FATAL  ///< Failures that terminate the process.
};

/**
 * @class Logger
 * @brief Static, process-wide logging facility.
 *
 * @details
 * Messages below the configured threshold are discarded before the output
 * lock is taken, so disabled levels cost a single atomic load.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * chronoid::infra::Logger::log(LogLevel::INFO, "Node: using hardware address of eth0");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be written.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /// @brief Returns true if a message at @p level would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Parses a level name such as "debug" or "WARN" (case-insensitive).
     *
     * @return The level, or `std::nullopt` for an unknown name.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

    /// @brief Canonical upper-case name of @p level.
    static const char* level_name(LogLevel level);

  private:
    /// @brief Serializes access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum severity written; defaults to INFO.
    static std::atomic<LogLevel> threshold_;
};

} // namespace chronoid::infra
