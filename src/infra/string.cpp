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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "chronoid/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace chronoid::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note `static_cast<unsigned char>` keeps `std::isspace` defined for
 * characters with negative values in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_upper(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

/**
 * @brief Strict decimal parse built on `std::from_chars`.
 *
 * Unlike `std::stoll`, trailing garbage ("12abc") is rejected rather than
 * silently truncated.
 */
std::optional<int64_t> String::parse_int64(const std::string& s)
{
    std::string text = trim(s);
    if (text.empty()) {
        return std::nullopt;
    }

    // from_chars does not accept a leading '+'.
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-') {
            return std::nullopt;
        }
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // namespace chronoid::infra
