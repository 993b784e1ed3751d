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
 * @file generator.hpp
 * @brief Time-based (Type 1) identifier generator.
 *
 * @details
 * A `Generator` fixes its node identifier and clock sequence at construction
 * and combines them with a fresh timestamp on every call. Identifiers are
 * unique across generators of one process (distinct clock sequences) and
 * across machines with distinct hardware addresses, until the 60-bit
 * timestamp rolls over around the year 10507.
 */

#pragma once

#include "chronoid/config/settings.hpp"
#include "chronoid/core/node_resolver.hpp"
#include "chronoid/core/process_registry.hpp"
#include "chronoid/core/timestamp.hpp"
#include "chronoid/core/uuid.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace chronoid::core {

/**
 * @class Generator
 * @brief Produces Type 1 identifiers.
 *
 * **Thread Safety:** `generate()` may be called concurrently from any number of
 * threads. It performs a single atomic increment on the shared registry and
 * never blocks.
 *
 * **Uniqueness Bound:** at most 10,000 identifiers per millisecond per process
 * can be guaranteed distinct, one per 100ns slot.
 *
 * @code
 * auto id = chronoid::core::Generator::shared().generate();
 * std::cout << id << std::endl;
 * @endcode
 */
class Generator {
  public:
    /// @brief Wall-clock source returning Unix milliseconds.
    using Clock = std::function<int64_t()>;

    /**
     * @brief Builds a generator whose node comes from the host's network hardware.
     *
     * @param registry Process-wide registry; must outlive the generator.
     * @param settings Provides the clock sequence seed.
     * @param clock Millisecond time source.
     * @throws SequenceExhaustedError if no clock sequence is free.
     */
    Generator(ProcessRegistry& registry, const config::Settings& settings,
              Clock clock = &Timestamp::system_millis);

    /**
     * @brief Builds a generator with an explicit node address.
     *
     * @param registry Process-wide registry; must outlive the generator.
     * @param address Node bytes, laid out as by `NodeResolver::make_node_id`.
     * @param seed Clock sequence seed; 0 selects a random one.
     * @param clock Millisecond time source.
     * @throws SequenceExhaustedError if no clock sequence is free.
     */
    Generator(ProcessRegistry& registry, const HardwareAddress& address, int64_t seed,
              Clock clock = &Timestamp::system_millis);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * @brief The process-wide generator.
     *
     * Built on first use from `ProcessRegistry::instance()` and
     * `Settings::from_environment()`.
     *
     * @throws config::ConfigError if the environment holds a malformed seed.
     * A later call retries construction.
     */
    static Generator& shared();

    /**
     * @brief Produces a new identifier.
     *
     * The most significant half is the packed timestamp of
     * `clock() * 10,000 + epoch offset + tick % 10,000`; the least significant
     * half is fixed for this generator.
     */
    Uuid generate() const;

    /// @brief The 14-bit clock sequence claimed at construction.
    uint16_t clock_sequence() const { return sequence_; }

    /// @brief The node buffer computed at construction.
    const NodeId& node_id() const { return node_; }

    /// @brief The fixed least significant half shared by every identifier.
    uint64_t least_significant_bits() const { return least_; }

  private:
    ProcessRegistry& registry_;
    Clock clock_;
    NodeId node_;
    uint16_t sequence_;
    uint64_t least_;
};

/// @brief Formats a node buffer's six node bytes as "aa:bb:cc:dd:ee:ff".
std::string format_node(const NodeId& node);

} // namespace chronoid::core
