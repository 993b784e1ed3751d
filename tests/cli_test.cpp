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
 * @file cli_test.cpp
 * @brief End-to-end tests for the `chronoid` command.
 *
 * @details
 * `App::run` writes to `std::cout` here, as it does in the binary, with both
 * standard streams redirected. Anything the logger prints to stdout therefore
 * lands in the captured output next to the identifiers.
 */

#include "chronoid/cli/app.hpp"
#include "chronoid/config/settings.hpp"
#include "chronoid/core/process_registry.hpp"
#include "chronoid/core/uuid.hpp"
#include "chronoid/infra/logger.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using chronoid::cli::App;
using chronoid::config::Settings;
using chronoid::core::ProcessRegistry;
using chronoid::core::Uuid;
using chronoid::infra::Logger;
using chronoid::infra::LogLevel;

namespace {

struct CliResult {
    int code;
    std::string out;
    std::string err;
};

/**
 * @class StreamCapture
 * @brief Redirects `std::cout` and `std::cerr` for the lifetime of the object.
 */
class StreamCapture {
  public:
    StreamCapture()
        : saved_out_(std::cout.rdbuf(out_.rdbuf())), saved_err_(std::cerr.rdbuf(err_.rdbuf()))
    {
    }

    ~StreamCapture()
    {
        std::cout.rdbuf(saved_out_);
        std::cerr.rdbuf(saved_err_);
    }

    std::string out() const { return out_.str(); }
    std::string err() const { return err_.str(); }

  private:
    std::ostringstream out_;
    std::ostringstream err_;
    std::streambuf* saved_out_;
    std::streambuf* saved_err_;
};

/**
 * @class ScopedEnv
 * @brief Sets or clears an environment variable, restoring it on destruction.
 */
class ScopedEnv {
  public:
    ScopedEnv(const char* key, const char* value) : key_(key)
    {
        const char* old = std::getenv(key_);
        if (old != nullptr) {
            saved_ = std::string(old);
        }
        if (value != nullptr) {
            setenv(key_, value, 1);
        } else {
            unsetenv(key_);
        }
    }

    ~ScopedEnv()
    {
        if (saved_) {
            setenv(key_, saved_->c_str(), 1);
        } else {
            unsetenv(key_);
        }
    }

  private:
    const char* key_;
    std::optional<std::string> saved_;
};

CliResult run_cli(const std::vector<std::string>& args, ProcessRegistry& registry)
{
    const LogLevel saved = Logger::level();
    CliResult result{0, "", ""};
    {
        StreamCapture capture;
        result.code = App::run(args, std::cout, registry);
        result.out = capture.out();
        result.err = capture.err();
    }
    Logger::set_level(saved);
    return result;
}

std::vector<std::string> lines_of(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

void write_file(const std::string& path, const std::string& content)
{
    std::ofstream out(path);
    out << content;
}

} // namespace

/**
 * @brief Plain output is exactly one canonical identifier per line.
 */
void test_cli_prints_identifiers_only()
{
    ScopedEnv level(Settings::kLogLevelEnv, nullptr);
    ScopedEnv seq(Settings::kSequenceEnv, "300");

    ProcessRegistry registry;
    CliResult result = run_cli({"chronoid", "--count", "3"}, registry);

    ASSERT_EQ(result.code, 0);
    auto lines = lines_of(result.out);
    ASSERT_EQ(lines.size(), static_cast<size_t>(3));
    for (const auto& line : lines) {
        auto id = Uuid::parse(line);
        ASSERT_TRUE(id.has_value());
        ASSERT_EQ(id->version(), 1);
        ASSERT_EQ(id->clock_sequence(), 300);
    }
    ASSERT_NE(lines[0], lines[1]);
    ASSERT_NE(lines[1], lines[2]);
}

/**
 * @brief A config file without `log_level` keeps INFO logs off stdout.
 *
 * The file also takes precedence over the environment seed.
 */
void test_cli_config_without_level_keeps_stdout_clean()
{
    const std::string path = "./chronoid_cli_test.json";
    write_file(path, R"({"uuid_sequence": 5})");
    ScopedEnv level(Settings::kLogLevelEnv, nullptr);
    ScopedEnv seq(Settings::kSequenceEnv, "77");

    ProcessRegistry registry;
    CliResult text = run_cli({"chronoid", "--config", path, "--count", "2"}, registry);

    ASSERT_EQ(text.code, 0);
    auto lines = lines_of(text.out);
    ASSERT_EQ(lines.size(), static_cast<size_t>(2));
    for (const auto& line : lines) {
        auto id = Uuid::parse(line);
        ASSERT_TRUE(id.has_value());
        ASSERT_EQ(id->clock_sequence(), 5);
    }

    ProcessRegistry json_registry;
    CliResult json = run_cli({"chronoid", "--config", path, "--json"}, json_registry);
    std::remove(path.c_str());

    ASSERT_EQ(json.code, 0);
    cJSON* root = cJSON_Parse(json.out.c_str());
    ASSERT_NE(root, (cJSON*)nullptr);
    bool is_array = cJSON_IsArray(root);
    int size = cJSON_GetArraySize(root);
    cJSON* sequence = cJSON_GetObjectItem(cJSON_GetArrayItem(root, 0), "clock_sequence");
    int sequence_value = sequence ? sequence->valueint : -1;
    cJSON_Delete(root);

    ASSERT_TRUE(is_array);
    ASSERT_EQ(size, 1);
    ASSERT_EQ(sequence_value, 5);
}

/**
 * @brief An explicit `log_level` in the config file is honoured.
 */
void test_cli_config_level_applies()
{
    const std::string path = "./chronoid_cli_level_test.json";
    write_file(path, R"({"uuid_sequence": 6, "log_level": "info"})");
    ScopedEnv level(Settings::kLogLevelEnv, nullptr);

    ProcessRegistry registry;
    CliResult result = run_cli({"chronoid", "--config", path}, registry);
    std::remove(path.c_str());

    ASSERT_EQ(result.code, 0);
    ASSERT_TRUE(result.out.find("Generator:") != std::string::npos);
}

/**
 * @brief Invalid option values fail with exit code 1 and nothing on stdout.
 */
void test_cli_rejects_bad_arguments()
{
    ProcessRegistry registry;

    CliResult zero = run_cli({"chronoid", "--count", "0"}, registry);
    ASSERT_EQ(zero.code, 1);
    ASSERT_EQ(zero.out, std::string(""));

    CliResult word = run_cli({"chronoid", "--count", "abc"}, registry);
    ASSERT_EQ(word.code, 1);

    CliResult missing = run_cli({"chronoid", "--count"}, registry);
    ASSERT_EQ(missing.code, 1);

    CliResult unknown = run_cli({"chronoid", "--frobnicate", "1"}, registry);
    ASSERT_EQ(unknown.code, 1);
    ASSERT_TRUE(unknown.err.find("Unknown option") != std::string::npos);

    CliResult bad_config = run_cli({"chronoid", "--config", "./missing_chronoid.json"}, registry);
    ASSERT_EQ(bad_config.code, 1);

    ASSERT_TRUE(registry.assigned().size() == 0);
}

void test_cli_describe()
{
    ProcessRegistry registry;

    CliResult bad = run_cli({"chronoid", "--describe", "not-a-uuid"}, registry);
    ASSERT_EQ(bad.code, 1);
    ASSERT_EQ(bad.out, std::string(""));

    const std::string text = "13814005-1dd2-11b2-8000-000000000001";
    CliResult good = run_cli({"chronoid", "--describe", text}, registry);
    ASSERT_EQ(good.code, 0);

    cJSON* root = cJSON_Parse(good.out.c_str());
    ASSERT_NE(root, (cJSON*)nullptr);
    cJSON* uuid = cJSON_GetObjectItem(root, "uuid");
    std::string uuid_value = (uuid && uuid->valuestring) ? uuid->valuestring : "";
    cJSON_Delete(root);

    ASSERT_EQ(uuid_value, text);
    ASSERT_TRUE(registry.assigned().empty());
}

void test_cli_help()
{
    ProcessRegistry registry;
    CliResult result = run_cli({"chronoid", "--help"}, registry);

    ASSERT_EQ(result.code, 0);
    ASSERT_TRUE(result.out.find("Usage: chronoid") != std::string::npos);
    ASSERT_TRUE(result.out.find("--describe UUID") != std::string::npos);
}
