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
 * @file uuid.hpp
 * @brief 128-bit identifier value type.
 *
 * @details
 * `Uuid` stores an RFC 4122 identifier as two 64-bit halves, most significant
 * first. Besides text conversion it exposes the fields of a time-based
 * (version 1) identifier so that callers can recover the timestamp, clock
 * sequence and node that produced it.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace chronoid::core {

/**
 * @class Uuid
 * @brief Immutable 128-bit identifier.
 *
 * **Bit layout of a version 1 identifier (most significant half):**
 * - bits 32..63: `time_low` (timestamp bits 0..31)
 * - bits 16..31: `time_mid` (timestamp bits 32..47)
 * - bits 12..15: version
 * - bits 0..11: `time_hi` (timestamp bits 48..59)
 *
 * **Least significant half:**
 * - bits 62..63: variant (`10`)
 * - bits 48..61: clock sequence
 * - bits 0..47: node
 */
class Uuid {
  public:
    /// @brief Constructs the nil identifier (all bits zero).
    constexpr Uuid() = default;

    /// @brief Constructs an identifier from its two 64-bit halves.
    constexpr Uuid(uint64_t most, uint64_t least) : most_(most), least_(least) {}

    /// @brief Most significant 64 bits.
    constexpr uint64_t most_significant_bits() const { return most_; }

    /// @brief Least significant 64 bits.
    constexpr uint64_t least_significant_bits() const { return least_; }

    /// @brief True if every bit is zero.
    constexpr bool is_nil() const { return most_ == 0 && least_ == 0; }

    /// @brief Version nibble (1 for time-based identifiers).
    int version() const;

    /**
     * @brief RFC 4122 variant.
     *
     * @return 0 (NCS backward compatibility), 2 (RFC 4122), 6 (Microsoft)
     * or 7 (reserved).
     */
    int variant() const;

    /**
     * @brief 60-bit count of 100ns intervals since 1582-10-15 00:00:00 UTC.
     *
     * Only meaningful when `version() == 1`.
     */
    uint64_t timestamp() const;

    /// @brief Unix milliseconds encoded in `timestamp()`.
    int64_t unix_millis() const;

    /// @brief 14-bit clock sequence. Only meaningful when `version() == 1`.
    uint16_t clock_sequence() const;

    /// @brief 48-bit node identifier. Only meaningful when `version() == 1`.
    uint64_t node() const;

    /**
     * @brief Canonical lowercase text form.
     *
     * @return std::string e.g. "1b21dd21-3814-1000-8000-000000000001".
     */
    std::string to_string() const;

    /**
     * @brief Parses the canonical 8-4-4-4-12 text form.
     *
     * Hex digits may be upper or lower case; surrounding whitespace is ignored.
     *
     * @param text The candidate identifier.
     * @return The parsed identifier, or `std::nullopt` if @p text is malformed.
     */
    static std::optional<Uuid> parse(const std::string& text);

    friend constexpr bool operator==(const Uuid& a, const Uuid& b)
    {
        return a.most_ == b.most_ && a.least_ == b.least_;
    }

    friend constexpr bool operator!=(const Uuid& a, const Uuid& b) { return !(a == b); }

    friend constexpr bool operator<(const Uuid& a, const Uuid& b)
    {
        return a.most_ < b.most_ || (a.most_ == b.most_ && a.least_ < b.least_);
    }

    friend std::ostream& operator<<(std::ostream& os, const Uuid& uuid)
    {
        return os << uuid.to_string();
    }

  private:
    uint64_t most_ = 0;
    uint64_t least_ = 0;
};

/// @brief Hash functor for unordered containers.
struct UuidHash {
    size_t operator()(const Uuid& uuid) const
    {
        uint64_t h = uuid.most_significant_bits() ^ (uuid.least_significant_bits() * 0x9e3779b97f4a7c15ULL);
        return static_cast<size_t>(h ^ (h >> 32));
    }
};

} // namespace chronoid::core
