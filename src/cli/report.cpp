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
 * @file report.cpp
 * @brief cJSON serialization of identifier reports.
 */

#include "chronoid/cli/report.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace chronoid::cli {

namespace {

std::string format_node(uint64_t node)
{
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int shift = 40; shift >= 0; shift -= 8) {
        ss << std::setw(2) << ((node >> shift) & 0xff);
        if (shift > 0) {
            ss << ':';
        }
    }
    return ss.str();
}

/// @brief Builds the report object. Ownership passes to the caller.
cJSON* build(const core::Uuid& uuid)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "uuid", uuid.to_string().c_str());
    cJSON_AddNumberToObject(obj, "version", uuid.version());
    cJSON_AddNumberToObject(obj, "variant", uuid.variant());

    if (uuid.version() == 1) {
        cJSON_AddStringToObject(obj, "timestamp", std::to_string(uuid.timestamp()).c_str());
        cJSON_AddNumberToObject(obj, "unix_millis", static_cast<double>(uuid.unix_millis()));
        cJSON_AddNumberToObject(obj, "clock_sequence", uuid.clock_sequence());
        cJSON_AddStringToObject(obj, "node", format_node(uuid.node()).c_str());
    }
    return obj;
}

std::string print_and_release(cJSON* root)
{
    char* raw_output = cJSON_PrintUnformatted(root);
    std::string out = raw_output ? std::string(raw_output) : std::string();

    free(raw_output);
    cJSON_Delete(root);
    return out;
}

} // namespace

std::string Report::describe(const core::Uuid& uuid)
{
    return print_and_release(build(uuid));
}

std::string Report::describe_all(const std::vector<core::Uuid>& uuids)
{
    cJSON* array = cJSON_CreateArray();
    for (const auto& uuid : uuids) {
        // Ownership Transfer: each object becomes a child of 'array'.
        cJSON_AddItemToArray(array, build(uuid));
    }
    return print_and_release(array);
}

} // namespace chronoid::cli
