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
 * @file base36.hpp
 * @brief Arbitrary-precision hexadecimal to base-36 conversion.
 *
 * @details
 * Identifiers are the base-36 rendering of a 512-bit digest, far beyond any
 * native integer. Two interchangeable backends are provided:
 *
 * - **Limb**: schoolbook arithmetic on base-10^8 limbs held in `uint64_t`,
 *   with no big-integer dependency.
 * - **BigNum**: OpenSSL `BIGNUM` division by 36.
 *
 * Both produce byte-identical output for every input, including malformed
 * input (see `hex_to_base36`).
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cuidkit::encoding {

/// @brief The base-36 alphabet, indexed by digit value.
inline constexpr std::string_view kBase36Alphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

/**
 * @enum Base36Backend
 * @brief Selects the arithmetic used by `hex_to_base36`.
 */
enum class Base36Backend {
    Limb,  ///< Native limb arithmetic (default).
    BigNum ///< OpenSSL BIGNUM arithmetic.
};

/**
 * @brief Converts a hexadecimal string to base 36 using limb arithmetic.
 *
 * **Contract:**
 * - Total: never throws, never rejects input.
 * - Case-insensitive: `0-9`, `a-f` and `A-F` are digits.
 * - Any other character is read as the digit 0.
 * - Empty input or a zero value yields `"0"`; otherwise there are no leading zeros.
 *
 * Inputs of up to 14 digits are converted with a single `uint64_t`.
 *
 * @code
 * cuidkit::encoding::hex_to_base36("ff");               // "73"
 * cuidkit::encoding::hex_to_base36("ffffffffffffffff"); // "3w5e11264sgsf"
 * @endcode
 */
std::string hex_to_base36(std::string_view hex);

/**
 * @brief Same contract as `hex_to_base36`, computed with OpenSSL `BIGNUM`.
 *
 * @throws core::InvalidOperationError if OpenSSL fails to allocate or divide.
 */
std::string hex_to_base36_bignum(std::string_view hex);

/// @brief Dispatches to the backend selected by @p backend.
std::string hex_to_base36(std::string_view hex, Base36Backend backend);

/// @brief Parses `limb` or `bignum` (case-insensitive).
std::optional<Base36Backend> parse_backend(std::string_view name);

/// @brief Returns the canonical name of @p backend.
std::string_view backend_name(Base36Backend backend);

} // namespace cuidkit::encoding
