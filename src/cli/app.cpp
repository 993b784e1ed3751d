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
 * @file app.cpp
 * @brief Argument parsing and output for the `chronoid` command.
 */

#include "chronoid/cli/app.hpp"

#include "chronoid/cli/report.hpp"
#include "chronoid/config/settings.hpp"
#include "chronoid/core/generator.hpp"
#include "chronoid/infra/logger.hpp"
#include "chronoid/infra/string.hpp"

#include <optional>
#include <stdexcept>

namespace chronoid::cli {

void App::print_help(const std::string& binary_name, std::ostream& out)
{
    out << "Usage: " << binary_name << " [OPTIONS]\n"
        << "Options:\n"
        << "  --count N        Number of identifiers to generate (Default: 1)\n"
        << "  --json           Emit a JSON array with decomposed fields\n"
        << "  --config FILE    Read settings from a JSON file instead of the environment\n"
        << "  --describe UUID  Print the fields of an existing identifier as JSON\n"
        << "  --help           Show this help message\n"
        << "Environment:\n"
        << "  CHRONOID_UUID_SEQUENCE  Clock sequence seed (0 or unset: random)\n"
        << "  CHRONOID_LOG_LEVEL      trace|debug|info|warn|error|fatal (Default: warn)\n";
}

int App::run(const std::vector<std::string>& args, std::ostream& out,
             core::ProcessRegistry& registry)
{
    // Identifiers share stdout with INFO logs; keep diagnostics quiet unless asked for.
    infra::Logger::set_level(infra::LogLevel::WARN);

    const std::string binary_name = args.empty() ? "chronoid" : args[0];
    long count = 1;
    bool json = false;
    std::optional<std::string> config_path;
    std::optional<std::string> describe;

    try {
        // 1. Parse Command Line Arguments
        for (size_t i = 1; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--help") {
                print_help(binary_name, out);
                return 0;
            }
            if (arg == "--json") {
                json = true;
                continue;
            }
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            const std::string& value = args[++i];
            if (arg == "--count") {
                auto n = infra::String::parse_int64(value);
                if (!n || *n < 1) {
                    throw std::invalid_argument("--count expects a positive integer, got '" +
                                                value + "'");
                }
                count = static_cast<long>(*n);
            } else if (arg == "--config") {
                config_path = value;
            } else if (arg == "--describe") {
                describe = value;
            } else {
                throw std::invalid_argument("Unknown option " + arg);
            }
        }

        // 2. Decomposition only; no generator required
        if (describe) {
            auto uuid = core::Uuid::parse(*describe);
            if (!uuid) {
                infra::Logger::log(infra::LogLevel::ERROR,
                                   "CLI: not a valid UUID: '" + *describe + "'");
                return 1;
            }
            out << Report::describe(*uuid) << std::endl;
            return 0;
        }

        // 3. Configuration; an unset log level leaves the WARN threshold in place
        config::Settings settings = config_path ? config::Settings::from_file(*config_path)
                                                : config::Settings::from_environment();
        settings.apply_logging();

        // 4. Generator bootstrap
        core::Generator generator(registry, settings);

        // 5. Output
        std::vector<core::Uuid> ids;
        ids.reserve(static_cast<size_t>(count));
        for (long i = 0; i < count; ++i) {
            ids.push_back(generator.generate());
        }

        if (json) {
            out << Report::describe_all(ids) << std::endl;
        } else {
            for (const auto& id : ids) {
                out << id << '\n';
            }
            out << std::flush;
        }

    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::FATAL, "System: " + std::string(e.what()));
        return 1;
    }

    return 0;
}

} // namespace chronoid::cli
