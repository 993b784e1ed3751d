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
 * @file timestamp.hpp
 * @brief Type-1 timestamp arithmetic and the wall-clock source.
 *
 * @details
 * A Type-1 timestamp is a 60-bit count of 100-nanosecond intervals since the
 * UUID epoch (1582-10-15 00:00:00 UTC). The wall clock only has millisecond
 * resolution, so the 10,000 sub-millisecond slots are filled from a
 * process-wide tick counter (see `ProcessRegistry::next_tick`).
 */

#pragma once

#include <cstdint>

namespace chronoid::core {

/**
 * @class Timestamp
 * @brief Static helpers for composing, packing and unpacking Type-1 timestamps.
 */
class Timestamp {
  public:
    /// @brief 100ns intervals between the UUID epoch and the Unix epoch.
    static constexpr uint64_t kUuidEpochOffset = 0x01b21dd213814000ULL;

    /// @brief 100ns intervals per millisecond.
    static constexpr uint64_t kIntervalsPerMilli = 10000;

    /// @brief Version 1 marker, placed in bits 12..15 of the most significant half.
    static constexpr uint64_t kVersion1 = 0x1000;

    /// @brief Mask of the 60 bits a timestamp may occupy.
    static constexpr uint64_t kTimestampMask = 0x0fffffffffffffffULL;

    /**
     * @brief Builds a timestamp from wall-clock milliseconds and a tick.
     *
     * `millis * 10,000 + kUuidEpochOffset + tick % 10,000`
     *
     * @param unix_millis Milliseconds since the Unix epoch.
     * @param tick Disambiguating counter value; only `tick % 10,000` is used.
     */
    static uint64_t compose(int64_t unix_millis, uint64_t tick);

    /**
     * @brief Reorders a timestamp into the most significant half of a Type-1 UUID.
     *
     * `((t & 0xffffffff) << 32) | ((t & 0xffff00000000) >> 16) | 0x1000 |
     *  ((t & 0xfff000000000000) >> 48)`
     */
    static constexpr uint64_t pack(uint64_t t)
    {
        return ((t & 0xffffffffULL) << 32) | ((t & 0xffff00000000ULL) >> 16) | kVersion1 |
               ((t & 0x0fff000000000000ULL) >> 48);
    }

    /// @brief Inverse of `pack`: recovers the 60-bit timestamp, dropping the version.
    static constexpr uint64_t unpack(uint64_t most)
    {
        return ((most >> 32) & 0xffffffffULL) | (((most >> 16) & 0xffffULL) << 32) |
               ((most & 0x0fffULL) << 48);
    }

    /// @brief Unix milliseconds represented by timestamp @p t (sub-millisecond part dropped).
    static int64_t to_unix_millis(uint64_t t);

    /**
     * @brief Current wall-clock time in Unix milliseconds.
     *
     * Default clock of the generator, also usable by components that format
     * event times relative to process start.
     */
    static int64_t system_millis();
};

} // namespace chronoid::core
