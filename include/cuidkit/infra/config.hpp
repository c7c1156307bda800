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
 * @file config.hpp
 * @brief Runtime configuration sourced from `CUIDKIT_*` environment variables.
 *
 * @details
 * | Variable                  | Values                                  | Default |
 * |---------------------------|-----------------------------------------|---------|
 * | `CUIDKIT_LENGTH`          | integer in `[4, 32]`                    | `24`    |
 * | `CUIDKIT_LOG_LEVEL`       | `trace` `debug` `info` `warn` `error` `fatal` | `warn`  |
 * | `CUIDKIT_BASE36_BACKEND`  | `limb` `bignum`                         | `limb`  |
 *
 * Malformed values are reported with a WARN entry and replaced by the default.
 */

#pragma once

#include "cuidkit/encoding/base36.hpp"
#include "cuidkit/infra/logger.hpp"

#include <functional>
#include <optional>
#include <string>

namespace cuidkit::infra {

/// @brief Resolves a variable name to its value, or `std::nullopt` when unset.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

/**
 * @struct Config
 * @brief Effective settings of the library and command-line tool.
 */
struct Config {
    int length = 24;
    LogLevel log_level = LogLevel::WARN;
    encoding::Base36Backend backend = encoding::Base36Backend::Limb;

    /// @brief Reads the process environment.
    static Config from_environment();

    /// @brief Reads settings through @p lookup (used by tests).
    static Config from_lookup(const EnvLookup& lookup);

    /// @brief Pushes process-wide settings (the log threshold) into effect.
    void apply() const;
};

} // namespace cuidkit::infra
