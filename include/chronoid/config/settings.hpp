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
 * @file settings.hpp
 * @brief Configuration for generator initialization.
 *
 * @details
 * Settings are read once, before the first generator is built, from either the
 * process environment or a JSON document. A malformed value is a fatal
 * configuration error: continuing with a corrupt seed would silently defeat
 * clock sequence collision avoidance.
 */

#pragma once

#include "chronoid/infra/logger.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace chronoid::config {

/**
 * @class ConfigError
 * @brief Raised when a configuration source is unreadable or holds an invalid value.
 */
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct Settings
 * @brief Initialization parameters for `core::Generator`.
 *
 * **Recognized keys:**
 * | Environment              | JSON             | Meaning                              |
 * |--------------------------|------------------|--------------------------------------|
 * | `CHRONOID_UUID_SEQUENCE` | `uuid_sequence`  | Clock sequence seed; 0 means random. |
 * | `CHRONOID_LOG_LEVEL`     | `log_level`      | Minimum logger severity.             |
 */
struct Settings {
    /// @brief Environment variable holding the clock sequence seed.
    static constexpr const char* kSequenceEnv = "CHRONOID_UUID_SEQUENCE";

    /// @brief Environment variable holding the log level name.
    static constexpr const char* kLogLevelEnv = "CHRONOID_LOG_LEVEL";

    /// @brief Clock sequence seed. Only the low 14 bits are used; 0 selects a random seed.
    int64_t uuid_sequence = 0;

    /// @brief Minimum severity written by `infra::Logger`; empty leaves the logger as is.
    std::optional<infra::LogLevel> log_level;

    /**
     * @brief Reads settings from the process environment.
     *
     * Unset or empty variables keep their defaults.
     *
     * @throws ConfigError if `CHRONOID_UUID_SEQUENCE` is not an integer or
     * `CHRONOID_LOG_LEVEL` is not a level name.
     */
    static Settings from_environment();

    /**
     * @brief Reads settings from a JSON object.
     *
     * `uuid_sequence` may be an integral number or a string holding one.
     * Missing keys keep their defaults; unknown keys are ignored.
     *
     * @code
     * auto s = chronoid::config::Settings::from_json(R"({"uuid_sequence": 42})");
     * @endcode
     *
     * @throws ConfigError on invalid JSON, a non-object root, or an invalid value.
     */
    static Settings from_json(const std::string& json);

    /**
     * @brief Reads settings from a JSON file.
     *
     * @throws ConfigError if the file cannot be read, or as `from_json`.
     */
    static Settings from_file(const std::string& path);

    /// @brief Pushes `log_level` into `infra::Logger` when one was configured.
    void apply_logging() const;
};

} // namespace chronoid::config
