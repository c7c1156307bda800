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
 * @file string.hpp
 * @brief Supplementary string and byte formatting primitives.
 *
 * @details
 * Stateless helpers shared by the hashing pipeline (hex encoding), the
 * configuration layer (trimming) and format validation (character classes).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cuidkit::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content; empty if @p s is blank.
     *
     * @code
     * std::string clean = cuidkit::infra::String::trim("  24\n"); // "24"
     * @endcode
     */
    static std::string trim(std::string_view s);

    /**
     * @brief Encodes a byte buffer as lowercase hexadecimal.
     *
     * Each byte produces exactly two characters, most significant nibble first.
     *
     * @param data Pointer to the first byte; may be null when @p size is 0.
     * @param size Number of bytes to encode.
     * @return std::string A string of length `2 * size` over `[0-9a-f]`.
     */
    static std::string to_hex(const std::uint8_t* data, std::size_t size);

    /// @brief True for `a`-`z` only (locale independent).
    static bool is_lower_alpha(char c);

    /// @brief True for `0`-`9` and `a`-`z` only (the base-36 alphabet).
    static bool is_lower_alnum(char c);
};

} // namespace cuidkit::infra
