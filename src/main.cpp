/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Command-line entry point of the `cuidkit` tool.
 *
 * @details
 * 1. Configuration from `CUIDKIT_*` environment variables.
 * 2. Argument parsing (overrides the environment).
 * 3. Generation or validation.
 */

#include "cuidkit/core/cuid2.hpp"
#include "cuidkit/encoding/base36.hpp"
#include "cuidkit/infra/config.hpp"
#include "cuidkit/infra/logger.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --length N          Identifier length, 4..32 (Default: 24)\n"
              << "  --count N           Number of identifiers to print (Default: 1)\n"
              << "  --json              Print each identifier as a JSON string\n"
              << "  --backend NAME      Base-36 arithmetic: limb | bignum (Default: limb)\n"
              << "  --validate ID       Check the format of ID (exit 0 valid, 2 invalid)\n"
              << "  --help              Show this help message\n"
              << "Environment:\n"
              << "  CUIDKIT_LENGTH, CUIDKIT_LOG_LEVEL, CUIDKIT_BASE36_BACKEND\n";
}

std::string require_value(int argc, char* argv[], int& i)
{
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("missing value for ") + argv[i]);
    }
    return argv[++i];
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 *
 * @return 0 on success, 1 on error, 2 when `--validate` rejects its input.
 */
int main(int argc, char* argv[])
{
    using cuidkit::infra::LogLevel;
    using cuidkit::infra::Logger;

    cuidkit::infra::Config config = cuidkit::infra::Config::from_environment();
    config.apply();

    int count = 1;
    bool json = false;
    bool length_given = false;
    std::optional<std::string> candidate;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help") {
                print_help(argv[0]);
                return 0;
            } else if (arg == "--length") {
                config.length = std::stoi(require_value(argc, argv, i));
                length_given = true;
            } else if (arg == "--count") {
                count = std::stoi(require_value(argc, argv, i));
                if (count < 0) {
                    throw std::invalid_argument("--count must not be negative");
                }
            } else if (arg == "--json") {
                json = true;
            } else if (arg == "--backend") {
                std::string name = require_value(argc, argv, i);
                auto backend = cuidkit::encoding::parse_backend(name);
                if (!backend) {
                    throw std::invalid_argument("unknown backend '" + name + "'");
                }
                config.backend = *backend;
            } else if (arg == "--validate") {
                candidate = require_value(argc, argv, i);
            } else {
                throw std::invalid_argument("unknown option '" + arg + "'");
            }
        }

        if (candidate) {
            std::optional<int> expected;
            if (length_given) {
                expected = config.length;
            }
            bool valid = cuidkit::core::Cuid2::is_valid(*candidate, expected);
            std::cout << (valid ? "valid" : "invalid") << std::endl;
            return valid ? 0 : 2;
        }

        Logger::log(LogLevel::DEBUG,
                    "CLI: generating " + std::to_string(count) + " identifier(s) of length " +
                        std::to_string(config.length) + " with the " +
                        std::string(cuidkit::encoding::backend_name(config.backend)) + " backend");

        for (int n = 0; n < count; ++n) {
            cuidkit::core::Cuid2 id(config.length);
            if (json) {
                std::cout << id.to_json() << '\n';
            } else {
                std::cout << id.render(config.backend) << '\n';
            }
        }
        std::cout.flush();

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "CLI: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
