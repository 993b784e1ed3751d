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
 * @file settings.cpp
 * @brief Environment and JSON (cJSON) configuration sources.
 */

#include "chronoid/config/settings.hpp"

#include "chronoid/infra/string.hpp"

#include <cJSON.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace chronoid::config {

namespace {

int64_t parse_sequence(const std::string& text, const std::string& source)
{
    auto value = infra::String::parse_int64(text);
    if (!value) {
        throw ConfigError("Config: " + source + " is not an integer: '" + text + "'");
    }
    return *value;
}

infra::LogLevel parse_level(const std::string& text, const std::string& source)
{
    auto level = infra::Logger::parse_level(text);
    if (!level) {
        throw ConfigError("Config: " + source + " is not a log level: '" + text + "'");
    }
    return *level;
}

/// @brief Reads `uuid_sequence` from a cJSON node (number or numeric string).
int64_t sequence_from_json(const cJSON* item)
{
    if (cJSON_IsString(item) && item->valuestring != nullptr) {
        return parse_sequence(item->valuestring, "uuid_sequence");
    }
    if (cJSON_IsNumber(item)) {
        double d = item->valuedouble;
        if (std::floor(d) != d || d < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
            d >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            throw ConfigError("Config: uuid_sequence must be an integer");
        }
        return static_cast<int64_t>(d);
    }
    throw ConfigError("Config: uuid_sequence must be a number or a numeric string");
}

} // namespace

Settings Settings::from_environment()
{
    Settings settings;

    const char* seq = std::getenv(kSequenceEnv);
    if (seq != nullptr && !infra::String::trim(seq).empty()) {
        settings.uuid_sequence = parse_sequence(seq, kSequenceEnv);
    }

    const char* level = std::getenv(kLogLevelEnv);
    if (level != nullptr && !infra::String::trim(level).empty()) {
        settings.log_level = parse_level(level, kLogLevelEnv);
    }

    return settings;
}

Settings Settings::from_json(const std::string& json)
{
    cJSON* root = cJSON_Parse(json.c_str());
    if (!root) {
        throw ConfigError("Config: invalid JSON syntax");
    }

    Settings settings;
    try {
        if (!cJSON_IsObject(root)) {
            throw ConfigError("Config: root element must be an object");
        }

        const cJSON* seq = cJSON_GetObjectItem(root, "uuid_sequence");
        if (seq && !cJSON_IsNull(seq)) {
            settings.uuid_sequence = sequence_from_json(seq);
        }

        const cJSON* level = cJSON_GetObjectItem(root, "log_level");
        if (level && !cJSON_IsNull(level)) {
            if (!cJSON_IsString(level) || level->valuestring == nullptr) {
                throw ConfigError("Config: log_level must be a string");
            }
            settings.log_level = parse_level(level->valuestring, "log_level");
        }
    } catch (...) {
        cJSON_Delete(root);
        throw;
    }

    cJSON_Delete(root);
    return settings;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Config: cannot open '" + path + "'");
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str());
}

void Settings::apply_logging() const
{
    if (log_level) {
        infra::Logger::set_level(*log_level);
    }
}

} // namespace chronoid::config
