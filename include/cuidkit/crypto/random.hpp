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
 * @file random.hpp
 * @brief Cryptographically secure random source and bounded integer sampling.
 *
 * @details
 * All entropy consumed by cuidkit (counter seed, identifier prefix, per-identifier
 * random bytes, fingerprint salt and fallbacks) flows through `SecureRandom`,
 * which wraps OpenSSL's `RAND_bytes`. A failing source raises
 * `core::EntropyError`; there is no fallback to a weaker generator.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cuidkit::crypto {

/// @brief A source of uniformly distributed 64-bit words.
using WordSource = std::function<std::uint64_t()>;

/**
 * @class SecureRandom
 * @brief Static facade over the operating system CSPRNG (via OpenSSL).
 */
class SecureRandom {
  public:
    /// @brief Upper bound on rejected draws before falling back to plain modulus.
    static constexpr int kMaxRejectionAttempts = 1000;

    /**
     * @brief Fills @p size bytes at @p out with secure random data.
     * @throws core::EntropyError if the source fails.
     */
    static void fill(std::uint8_t* out, std::size_t size);

    /// @brief Returns @p size fresh random bytes.
    static std::vector<std::uint8_t> bytes(std::size_t size);

    /// @brief Returns one uniformly distributed 64-bit word.
    static std::uint64_t next_word();

    /**
     * @brief Draws an integer in `[0, range)` from @p source.
     *
     * Bias-free rejection sampling: draws at or above the largest multiple of
     * @p range representable in 64 bits are rejected. After
     * `kMaxRejectionAttempts` rejections, or when that multiple covers less than
     * half of the 64-bit space, the last draw is reduced with a plain modulus.
     *
     * @param range Exclusive upper bound; must be non-zero.
     * @param source Word generator. Defaults to `next_word`.
     * @throws std::invalid_argument if @p range is 0.
     */
    static std::uint64_t below(std::uint64_t range, const WordSource& source);
    static std::uint64_t below(std::uint64_t range);

    /**
     * @brief Builds a random string of @p length characters from @p alphabet.
     * @throws std::invalid_argument if @p alphabet is empty.
     */
    static std::string token(std::size_t length, std::string_view alphabet);
};

} // namespace cuidkit::crypto
