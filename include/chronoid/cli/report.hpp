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
 * @file report.hpp
 * @brief JSON rendering of identifiers for the command-line front end.
 *
 * @details
 * Each identifier is rendered as an object holding its canonical text and its
 * decomposed Type 1 fields:
 *
 * @code
 * {"uuid":"...","version":1,"variant":2,"timestamp":"139...","unix_millis":1760000000000,
 *  "clock_sequence":812,"node":"02:42:ac:11:00:02"}
 * @endcode
 *
 * `timestamp` is emitted as a decimal string because a 60-bit value does not
 * survive the double-precision numbers of most JSON consumers.
 */

#pragma once

#include "chronoid/core/uuid.hpp"

#include <string>
#include <vector>

namespace chronoid::cli {

/**
 * @class Report
 * @brief Static JSON serializers built on cJSON.
 */
class Report {
  public:
    /// @brief Compact JSON object describing @p uuid.
    static std::string describe(const core::Uuid& uuid);

    /// @brief Compact JSON array of `describe` objects, in input order.
    static std::string describe_all(const std::vector<core::Uuid>& uuids);
};

} // namespace chronoid::cli
