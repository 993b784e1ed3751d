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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Static helpers used by the configuration layer and the CLI to sanitize and
 * parse textual values (environment variables, option values, UUID text).
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chronoid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, or an empty string if @p s is
     * empty or consists solely of whitespace.
     *
     * @code
     * std::string clean = chronoid::infra::String::trim("  42 \n"); // "42"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII upper-case copy of @p s.
    static std::string to_upper(const std::string& s);

    /**
     * @brief Strictly parses a signed 64-bit decimal integer.
     *
     * Surrounding whitespace is ignored. An optional leading `+` or `-` is
     * accepted. Any other character, an empty string, or a value outside the
     * range of `int64_t` yields `std::nullopt`.
     *
     * @param s The text to parse.
     * @return The parsed value, or `std::nullopt` if @p s is not an integer.
     */
    static std::optional<int64_t> parse_int64(const std::string& s);
};

} // namespace chronoid::infra
