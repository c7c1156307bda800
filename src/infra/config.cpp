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
 * @file config.cpp
 * @brief Environment-driven configuration loading.
 */

#include "cuidkit/infra/config.hpp"

#include "cuidkit/infra/string.hpp"

#include <cstdlib>
#include <stdexcept>

namespace cuidkit::infra {

namespace {

std::optional<std::string> read(const EnvLookup& lookup, const char* name)
{
    auto raw = lookup(name);
    if (!raw) {
        return std::nullopt;
    }
    std::string value = String::trim(*raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

void reject(const char* name, const std::string& value)
{
    Logger::log(LogLevel::WARN,
                std::string("Config: ignoring ") + name + "='" + value + "'; using default.");
}

} // namespace

Config Config::from_environment()
{
    return from_lookup([](const char* name) -> std::optional<std::string> {
        const char* raw = std::getenv(name);
        if (raw == nullptr) {
            return std::nullopt;
        }
        return std::string(raw);
    });
}

/**
 * @brief Builds a configuration from a variable resolver.
 *
 * Implementation Strategy:
 * 1. **Normalization**: Each value is trimmed; blank values count as unset.
 * 2. **Parsing**: `CUIDKIT_LOG_LEVEL` and `CUIDKIT_BASE36_BACKEND` are matched
 *    case-insensitively; `CUIDKIT_LENGTH` must be a whole integer in `[4, 32]`.
 * 3. **Recovery**: A malformed value is logged at WARN and the default is kept.
 *
 * @param lookup Resolver returning `std::nullopt` for unset variables.
 * @return Config The effective settings.
 */
Config Config::from_lookup(const EnvLookup& lookup)
{
    Config config;

    if (auto value = read(lookup, "CUIDKIT_LOG_LEVEL")) {
        if (auto level = Logger::parse_level(*value)) {
            config.log_level = *level;
        } else {
            reject("CUIDKIT_LOG_LEVEL", *value);
        }
    }

    if (auto value = read(lookup, "CUIDKIT_LENGTH")) {
        try {
            std::size_t consumed = 0;
            int length = std::stoi(*value, &consumed);
            if (consumed != value->size() || length < 4 || length > 32) {
                reject("CUIDKIT_LENGTH", *value);
            } else {
                config.length = length;
            }
        } catch (const std::logic_error&) {
            // std::invalid_argument and std::out_of_range from std::stoi.
            reject("CUIDKIT_LENGTH", *value);
        }
    }

    if (auto value = read(lookup, "CUIDKIT_BASE36_BACKEND")) {
        if (auto backend = encoding::parse_backend(*value)) {
            config.backend = *backend;
        } else {
            reject("CUIDKIT_BASE36_BACKEND", *value);
        }
    }

    return config;
}

void Config::apply() const
{
    Logger::set_level(log_level);
}

} // namespace cuidkit::infra
