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
 * @file process_registry.hpp
 * @brief Process-wide state shared by all generators: claimed clock sequences
 * and the sub-millisecond tick counter.
 *
 * @details
 * Every `Generator` in a process is handed the same `ProcessRegistry`. The
 * registry guarantees that no two generators hold the same 14-bit clock
 * sequence, and provides the atomic counter that disambiguates identifiers
 * produced within the same millisecond.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace chronoid::core {

/**
 * @class SequenceExhaustedError
 * @brief Raised when all 16,384 clock sequences are already claimed.
 */
class SequenceExhaustedError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ProcessRegistry
 * @brief Registry of assigned clock sequences plus the shared tick counter.
 *
 * @details
 * **Concurrency Model:**
 * - `claim_sequence()` performs a read-modify-write of the assigned set under
 *   an internal mutex. It runs once per generator construction.
 * - `next_tick()` is a lock-free atomic increment, called on every `generate()`.
 *
 * Sequences are never released; the registry only grows for the lifetime of
 * the object.
 */
class ProcessRegistry {
  public:
    /// @brief Mask selecting the 14 bits of a clock sequence.
    static constexpr uint16_t kSequenceMask = 0x3fff;

    /// @brief Number of distinct clock sequences.
    static constexpr size_t kSequenceSpace = 16384;

    /**
     * @brief Creates an empty registry.
     *
     * Tests and embedders may build private registries to keep several
     * isolated generator families in one process.
     */
    ProcessRegistry() = default;

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    /**
     * @brief The registry shared by every generator of this process.
     *
     * Constructed on first use. Its claim list lives only in memory, so it is
     * scoped to this process and never inherited by child processes.
     */
    static ProcessRegistry& instance();

    /**
     * @brief Claims a clock sequence distinct from every previous claim.
     *
     * **Algorithm:**
     * 1. Candidate = @p seed if non-zero, else a random 64-bit draw; masked to 14 bits.
     * 2. While the candidate is already assigned, advance it by one modulo 16,384.
     * 3. Record the candidate.
     *
     * @param seed Configured seed, or 0 for a random candidate.
     * @return The claimed sequence in [0, 16383].
     * @throws SequenceExhaustedError if every sequence is already claimed. The
     * registry is left unchanged.
     */
    uint16_t claim_sequence(int64_t seed);

    /**
     * @brief Advances the shared tick counter.
     *
     * @return The post-increment value; the first call returns 1.
     */
    uint64_t next_tick() { return ticks_.fetch_add(1, std::memory_order_relaxed) + 1; }

    /// @brief Assigned sequences in claim order.
    std::vector<uint16_t> assigned() const;

    /// @brief True if @p sequence has been claimed.
    bool contains(uint16_t sequence) const;

    /// @brief Comma-separated claim list, e.g. "812,813,40".
    std::string to_string() const;

  private:
    /// @brief Draws a uniformly random 64-bit value from `std::random_device`.
    static uint64_t random_candidate();

    mutable std::mutex mutex_;
    std::vector<uint16_t> order_;
    std::unordered_set<uint16_t> claimed_;
    std::atomic<uint64_t> ticks_{0};
};

} // namespace chronoid::core
