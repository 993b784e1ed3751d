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
 * @file main.cpp
 * @brief Command-line front end for the chronoid generator.
 */

#include "chronoid/cli/app.hpp"
#include "chronoid/core/process_registry.hpp"

#include <iostream>
#include <string>
#include <vector>

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    std::vector<std::string> args(argv, argv + argc);
    return chronoid::cli::App::run(args, std::cout, chronoid::core::ProcessRegistry::instance());
}
