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
 * @file timestamp.cpp
 * @brief Timestamp composition and the system clock source.
 */

#include "chronoid/core/timestamp.hpp"

#include <chrono>

namespace chronoid::core {

uint64_t Timestamp::compose(int64_t unix_millis, uint64_t tick)
{
    const uint64_t base = static_cast<uint64_t>(unix_millis) * kIntervalsPerMilli;
    return (base + kUuidEpochOffset + (tick % kIntervalsPerMilli)) & kTimestampMask;
}

int64_t Timestamp::to_unix_millis(uint64_t t)
{
    const int64_t since_unix = static_cast<int64_t>(t) - static_cast<int64_t>(kUuidEpochOffset);
    // Floor division so that pre-1970 timestamps round towards the past.
    int64_t millis = since_unix / static_cast<int64_t>(kIntervalsPerMilli);
    if (since_unix % static_cast<int64_t>(kIntervalsPerMilli) < 0) {
        --millis;
    }
    return millis;
}

int64_t Timestamp::system_millis()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace chronoid::core
