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
 * @file error.hpp
 * @brief Exception taxonomy of the identifier engine.
 *
 * @details
 * Three failure kinds exist. Only `RangeError` is a caller mistake; the other
 * two signal a broken runtime (missing digest algorithm, dead entropy source)
 * and are never retried.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace cuidkit::core {

/**
 * @class RangeError
 * @brief Raised when a requested identifier length lies outside `[4, 32]`.
 */
class RangeError : public std::out_of_range {
  public:
    explicit RangeError(const std::string& message) : std::out_of_range(message) {}
};

/**
 * @class InvalidOperationError
 * @brief Raised when a required primitive (e.g. SHA3-512) is unavailable at runtime.
 */
class InvalidOperationError : public std::runtime_error {
  public:
    explicit InvalidOperationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class EntropyError
 * @brief Raised when the secure random source cannot deliver bytes.
 */
class EntropyError : public std::runtime_error {
  public:
    explicit EntropyError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace cuidkit::core
