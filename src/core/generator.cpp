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
 * @file generator.cpp
 * @brief Type 1 identifier assembly.
 */

#include "chronoid/core/generator.hpp"

#include "chronoid/core/timestamp.hpp"
#include "chronoid/infra/logger.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace chronoid::core {

Generator::Generator(ProcessRegistry& registry, const config::Settings& settings, Clock clock)
    : Generator(registry, NodeResolver::resolve_address(NodeResolver::default_probes()),
                settings.uuid_sequence, std::move(clock))
{
}

Generator::Generator(ProcessRegistry& registry, const HardwareAddress& address, int64_t seed,
                     Clock clock)
    : registry_(registry), clock_(std::move(clock)), node_(NodeResolver::make_node_id(address)),
      sequence_(registry.claim_sequence(seed)),
      least_(NodeResolver::to_bits(node_) | (static_cast<uint64_t>(sequence_) << 48))
{
    infra::Logger::log(infra::LogLevel::INFO, "Generator: node " + format_node(node_) +
                                                  ", clock sequence " +
                                                  std::to_string(sequence_));
}

Generator& Generator::shared()
{
    static Generator generator(ProcessRegistry::instance(), config::Settings::from_environment());
    return generator;
}

Uuid Generator::generate() const
{
    const uint64_t time = Timestamp::compose(clock_(), registry_.next_tick());
    return Uuid(Timestamp::pack(time), least_);
}

std::string format_node(const NodeId& node)
{
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 2; i < node.size(); ++i) {
        if (i > 2) {
            ss << ':';
        }
        ss << std::setw(2) << static_cast<int>(node[i]);
    }
    return ss.str();
}

} // namespace chronoid::core
