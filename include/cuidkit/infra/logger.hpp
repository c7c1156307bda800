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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for cuidkit.
 *
 * @details
 * Declares the `Logger` class, the single reporting channel of the library and
 * the command-line tool. Output is serialized across threads and filtered by a
 * process-wide severity threshold, so that identifiers printed on standard
 * output are not interleaved with library diagnostics unless requested.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace cuidkit::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Internal state useful while troubleshooting (seeding, fingerprinting).
    INFO,  ///< Nominal operational events.
    WARN,  ///< Degraded but functional paths (random host fallback, biased sampling).
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Failures that terminate the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured threshold are discarded before the lock is
 * taken. The threshold defaults to `WARN`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * cuidkit::infra::Logger::log(LogLevel::DEBUG, "Counter: seeded.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that reaches the console.
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /// @brief Returns true when a message of @p level would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching is case-insensitive. `warning` is accepted as an alias of `warn`.
     *
     * @return The parsed level, or `std::nullopt` for unknown names.
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Minimum severity; read without the lock on the hot path.
    static std::atomic<LogLevel> threshold_;
};

} // namespace cuidkit::infra
