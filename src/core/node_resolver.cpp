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
 * @file node_resolver.cpp
 * @brief Linux implementation of the node identifier probes.
 *
 * @details
 * Host resolution uses `gethostname` + `getaddrinfo`. Interfaces are listed
 * with `getifaddrs` and hardware addresses are read with the `SIOCGIFHWADDR`
 * ioctl on a throwaway datagram socket.
 */

#include "chronoid/core/node_resolver.hpp"

#include "chronoid/infra/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <memory>
#include <random>
#include <stdexcept>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace chronoid::core {

namespace {

using IfAddrsPtr = std::unique_ptr<ifaddrs, decltype(&freeifaddrs)>;
using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

/// @brief Address bytes of an AF_INET / AF_INET6 sockaddr, empty for other families.
HardwareAddress address_bytes(const sockaddr* sa)
{
    if (sa == nullptr) {
        return {};
    }
    if (sa->sa_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
        const auto* p = reinterpret_cast<const uint8_t*>(&in->sin_addr);
        return HardwareAddress(p, p + sizeof(in->sin_addr));
    }
    if (sa->sa_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
        const auto* p = reinterpret_cast<const uint8_t*>(&in6->sin6_addr);
        return HardwareAddress(p, p + sizeof(in6->sin6_addr));
    }
    return {};
}

bool is_active(const ifaddrs* ifa)
{
    return (ifa->ifa_flags & IFF_UP) != 0 && (ifa->ifa_flags & IFF_LOOPBACK) == 0;
}

/// @brief Reads the hardware address of interface @p name; all-zero counts as absent.
std::optional<HardwareAddress> hardware_address_of(const char* name)
{
    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Node: socket() failed: " + std::string(std::strerror(errno)));
        return std::nullopt;
    }

    struct ifreq ifr;
    std::memset(&ifr, 0, sizeof(ifr));
    std::strncpy(ifr.ifr_name, name, IFNAMSIZ - 1);

    int rc = ioctl(sock, SIOCGIFHWADDR, &ifr);
    int err = errno;
    close(sock);

    if (rc < 0) {
        infra::Logger::log(infra::LogLevel::TRACE, "Node: SIOCGIFHWADDR failed on " +
                                                       std::string(name) + ": " +
                                                       std::strerror(err));
        return std::nullopt;
    }

    const auto* p = reinterpret_cast<const uint8_t*>(ifr.ifr_hwaddr.sa_data);
    HardwareAddress mac(p, p + NodeResolver::kNodeBytes);
    if (std::all_of(mac.begin(), mac.end(), [](uint8_t b) { return b == 0; })) {
        return std::nullopt;
    }
    return mac;
}

IfAddrsPtr list_interfaces()
{
    ifaddrs* head = nullptr;
    if (getifaddrs(&head) != 0) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Node: getifaddrs() failed: " + std::string(std::strerror(errno)));
        return IfAddrsPtr(nullptr, &freeifaddrs);
    }
    return IfAddrsPtr(head, &freeifaddrs);
}

} // namespace

NodeId NodeResolver::resolve()
{
    return make_node_id(resolve_address(default_probes()));
}

HardwareAddress NodeResolver::resolve_address(const std::vector<NodeProbe>& probes)
{
    for (const auto& step : probes) {
        std::optional<HardwareAddress> result;
        try {
            result = step.probe();
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Node: probe '" + step.name + "' raised: " + e.what());
            continue;
        }

        if (result && !result->empty()) {
            infra::Logger::log(infra::LogLevel::DEBUG, "Node: using " + step.name);
            return *result;
        }
        infra::Logger::log(infra::LogLevel::DEBUG, "Node: " + step.name + " unavailable");
    }

    infra::Logger::log(infra::LogLevel::WARN,
                       "Node: no network address available, using a random node identifier");
    return random_address();
}

std::vector<NodeProbe> NodeResolver::default_probes()
{
    return {
        {"host interface hardware address", &NodeResolver::host_interface_address},
        {"first active interface hardware address", &NodeResolver::any_interface_address},
        {"host address", &NodeResolver::host_address},
    };
}

std::optional<HardwareAddress> NodeResolver::host_interface_address()
{
    auto host = host_address();
    if (!host) {
        return std::nullopt;
    }

    auto interfaces = list_interfaces();
    for (const ifaddrs* ifa = interfaces.get(); ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr || address_bytes(ifa->ifa_addr) != *host) {
            continue;
        }
        if (!is_active(ifa)) {
            infra::Logger::log(infra::LogLevel::DEBUG, "Node: host address is bound to " +
                                                           std::string(ifa->ifa_name) +
                                                           ", which is down or loopback");
            return std::nullopt;
        }
        return hardware_address_of(ifa->ifa_name);
    }
    return std::nullopt;
}

std::optional<HardwareAddress> NodeResolver::any_interface_address()
{
    auto interfaces = list_interfaces();
    for (const ifaddrs* ifa = interfaces.get(); ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr || !is_active(ifa)) {
            continue;
        }
        if (auto mac = hardware_address_of(ifa->ifa_name)) {
            return mac;
        }
    }
    return std::nullopt;
}

std::optional<HardwareAddress> NodeResolver::host_address()
{
    char name[256];
    if (gethostname(name, sizeof(name)) != 0) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Node: gethostname() failed: " + std::string(std::strerror(errno)));
        return std::nullopt;
    }
    name[sizeof(name) - 1] = '\0';

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    int rc = getaddrinfo(name, nullptr, &hints, &raw);
    if (rc != 0) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Node: cannot resolve host '" +
                                                       std::string(name) +
                                                       "': " + gai_strerror(rc));
        return std::nullopt;
    }
    AddrInfoPtr results(raw, &freeaddrinfo);

    for (const addrinfo* ai = results.get(); ai != nullptr; ai = ai->ai_next) {
        HardwareAddress bytes = address_bytes(ai->ai_addr);
        if (!bytes.empty()) {
            return bytes;
        }
    }
    return std::nullopt;
}

HardwareAddress NodeResolver::random_address()
{
    std::random_device rd;
    std::uniform_int_distribution<int> dis(0, 255);

    HardwareAddress bytes(kNodeBytes);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dis(rd));
    }
    return bytes;
}

NodeId NodeResolver::make_node_id(const HardwareAddress& address)
{
    NodeId node{};
    node[0] = kVariantMarker;
    node[1] = 0;

    const size_t length = std::min(address.size(), kNodeBytes);
    const size_t source = address.size() - length;
    const size_t target = node.size() - length;
    std::copy(address.begin() + static_cast<std::ptrdiff_t>(source), address.end(),
              node.begin() + static_cast<std::ptrdiff_t>(target));
    return node;
}

uint64_t NodeResolver::to_bits(const NodeId& node)
{
    uint64_t bits = 0;
    for (uint8_t b : node) {
        bits = (bits << 8) | b;
    }
    return bits;
}

} // namespace chronoid::core
