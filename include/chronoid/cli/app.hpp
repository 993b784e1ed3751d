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
 * @file app.hpp
 * @brief The `chronoid` command-line program.
 *
 * @details
 * Startup sequence:
 * 1. Argument parsing.
 * 2. Configuration loading (`--config` file, otherwise the environment).
 * 3. Generator initialization (node resolution, clock sequence claim).
 * 4. Output of the requested identifiers as text or JSON.
 *
 * Identifiers are the only thing written to the output stream unless a log
 * level was configured explicitly.
 */

#pragma once

#include "chronoid/core/process_registry.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace chronoid::cli {

/**
 * @class App
 * @brief Static entry point shared by `main` and the tests.
 */
class App {
  public:
    /**
     * @brief Runs the program.
     *
     * @param args Command line including the program name in `args[0]`.
     * @param out Stream receiving help text, identifiers and reports.
     * @param registry Registry the generator claims its clock sequence from.
     * @return The process exit code: 0 on success, 1 on any error. Errors are
     * logged at FATAL (or ERROR for an unparsable `--describe` argument).
     */
    static int run(const std::vector<std::string>& args, std::ostream& out,
                   core::ProcessRegistry& registry);

    /// @brief Writes the usage text to @p out.
    static void print_help(const std::string& binary_name, std::ostream& out);
};

} // namespace chronoid::cli
