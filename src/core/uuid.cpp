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
 * @file uuid.cpp
 * @brief Text conversion and field decomposition for `Uuid`.
 */

#include "chronoid/core/uuid.hpp"

#include "chronoid/core/timestamp.hpp"
#include "chronoid/infra/string.hpp"

#include <iomanip>
#include <sstream>

namespace chronoid::core {

namespace {

int hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

int Uuid::version() const
{
    return static_cast<int>((most_ >> 12) & 0x0f);
}

/**
 * @brief Decodes the variant field from the top bits of the least half.
 *
 * The field is variable length: `0xx` -> 0, `10x` -> 2, `110` -> 6, `111` -> 7.
 */
int Uuid::variant() const
{
    const uint64_t top = least_ >> 61;
    if ((top & 0x4) == 0) {
        return 0;
    }
    if ((top & 0x2) == 0) {
        return 2;
    }
    return static_cast<int>(top);
}

uint64_t Uuid::timestamp() const
{
    return Timestamp::unpack(most_);
}

int64_t Uuid::unix_millis() const
{
    return Timestamp::to_unix_millis(timestamp());
}

uint16_t Uuid::clock_sequence() const
{
    return static_cast<uint16_t>((least_ >> 48) & 0x3fff);
}

uint64_t Uuid::node() const
{
    return least_ & 0xffffffffffffULL;
}

std::string Uuid::to_string() const
{
    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << static_cast<uint32_t>(most_ >> 32) << "-"
       << std::setw(4) << static_cast<uint16_t>((most_ >> 16) & 0xffff) << "-"
       << std::setw(4) << static_cast<uint16_t>(most_ & 0xffff) << "-"
       << std::setw(4) << static_cast<uint16_t>(least_ >> 48) << "-"
       << std::setw(12) << (least_ & 0xffffffffffffULL);
    return ss.str();
}

std::optional<Uuid> Uuid::parse(const std::string& text)
{
    const std::string s = infra::String::trim(text);
    if (s.size() != 36) {
        return std::nullopt;
    }

    uint64_t halves[2] = {0, 0};
    int nibbles = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') {
                return std::nullopt;
            }
            continue;
        }
        int v = hex_value(s[i]);
        if (v < 0) {
            return std::nullopt;
        }
        uint64_t& half = halves[nibbles / 16];
        half = (half << 4) | static_cast<uint64_t>(v);
        ++nibbles;
    }

    return Uuid(halves[0], halves[1]);
}

} // namespace chronoid::core
