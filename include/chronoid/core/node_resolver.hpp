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
 * @file node_resolver.hpp
 * @brief Derivation of the 48-bit node identifier.
 *
 * @details
 * The node identifier is taken from the host's network hardware address on a
 * best-effort basis. Resolution is an ordered chain of probes; the first probe
 * that yields a non-empty address wins, and cryptographically random bytes are
 * used when every probe fails. Probe failures are logged, never thrown.
 */

#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chronoid::core {

/// @brief Raw address bytes as reported by a probe (MAC, IPv4 or IPv6).
using HardwareAddress = std::vector<uint8_t>;

/**
 * @brief 8-byte node buffer.
 *
 * Byte 0 is the variant marker (0x80), byte 1 is zero, bytes 2..7 hold the
 * node right-justified.
 */
using NodeId = std::array<uint8_t, 8>;

/**
 * @struct NodeProbe
 * @brief One step of the resolution chain.
 */
struct NodeProbe {
    /// @brief Label used in log messages.
    std::string name;

    /// @brief Returns an address, or `std::nullopt` if this source is unavailable.
    std::function<std::optional<HardwareAddress>()> probe;
};

/**
 * @class NodeResolver
 * @brief Static resolver for the node portion of a Type-1 identifier.
 */
class NodeResolver {
  public:
    /// @brief Marker stored in byte 0 of every `NodeId` (variant `10`).
    static constexpr uint8_t kVariantMarker = 0x80;

    /// @brief Number of node bytes carried by an identifier.
    static constexpr size_t kNodeBytes = 6;

    /**
     * @brief Resolves the node identifier using the default probe chain.
     *
     * @code
     * chronoid::core::NodeId node = chronoid::core::NodeResolver::resolve();
     * @endcode
     */
    static NodeId resolve();

    /**
     * @brief Runs @p probes in order and returns the first non-empty address.
     *
     * Probes that return `std::nullopt`, an empty address, or throw are logged
     * and skipped. If none succeeds, `random_address()` is returned.
     */
    static HardwareAddress resolve_address(const std::vector<NodeProbe>& probes);

    /**
     * @brief The default chain, in fallback order:
     * 1. hardware address of the interface bound to the host address,
     * 2. hardware address of the first active non-loopback interface,
     * 3. raw host address bytes.
     */
    static std::vector<NodeProbe> default_probes();

    /// @brief Hardware address of the active, non-loopback interface bound to the host address.
    static std::optional<HardwareAddress> host_interface_address();

    /// @brief Hardware address of the first active, non-loopback interface.
    static std::optional<HardwareAddress> any_interface_address();

    /// @brief Raw bytes of the host's first resolved IP address (4 or 16 bytes).
    static std::optional<HardwareAddress> host_address();

    /// @brief Six bytes from `std::random_device`.
    static HardwareAddress random_address();

    /**
     * @brief Lays @p address out as an 8-byte node buffer.
     *
     * Addresses longer than six bytes contribute their trailing six bytes.
     * Shorter addresses are placed so that they end at the final byte, with
     * the gap zero-filled.
     */
    static NodeId make_node_id(const HardwareAddress& address);

    /// @brief Interprets @p node as a big-endian 64-bit integer.
    static uint64_t to_bits(const NodeId& node);
};

} // namespace chronoid::core
