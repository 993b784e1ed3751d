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
 * @file process_registry.cpp
 * @brief Clock sequence allocation.
 */

#include "chronoid/core/process_registry.hpp"

#include "chronoid/infra/logger.hpp"

#include <random>

namespace chronoid::core {

ProcessRegistry& ProcessRegistry::instance()
{
    static ProcessRegistry registry;
    return registry;
}

uint16_t ProcessRegistry::claim_sequence(int64_t seed)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (claimed_.size() >= kSequenceSpace) {
        throw SequenceExhaustedError("Sequence: all " + std::to_string(kSequenceSpace) +
                                     " clock sequences are already assigned");
    }

    const uint64_t raw = (seed != 0) ? static_cast<uint64_t>(seed) : random_candidate();
    const uint16_t initial = static_cast<uint16_t>(raw & kSequenceMask);

    // At least one slot is free, so this terminates within kSequenceSpace steps.
    uint16_t candidate = initial;
    while (claimed_.count(candidate) != 0) {
        candidate = static_cast<uint16_t>((candidate + 1) & kSequenceMask);
    }

    if (candidate != initial) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Sequence: " + std::to_string(initial) +
                                                       " already assigned, advanced to " +
                                                       std::to_string(candidate));
    }

    order_.push_back(candidate);
    claimed_.insert(candidate);

    return candidate;
}

std::vector<uint16_t> ProcessRegistry::assigned() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

bool ProcessRegistry::contains(uint16_t sequence) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.count(sequence) != 0;
}

std::string ProcessRegistry::to_string() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::string out;
    for (size_t i = 0; i < order_.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += std::to_string(order_[i]);
    }
    return out;
}

uint64_t ProcessRegistry::random_candidate()
{
    std::random_device rd;
    std::uniform_int_distribution<uint64_t> dis;
    return dis(rd);
}

} // namespace chronoid::core
