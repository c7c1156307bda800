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
 * @file random.cpp
 * @brief OpenSSL-backed implementation of the secure random facade.
 */

#include "cuidkit/crypto/random.hpp"

#include "cuidkit/core/error.hpp"
#include "cuidkit/infra/logger.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace cuidkit::crypto {

void SecureRandom::fill(std::uint8_t* out, std::size_t size)
{
    // RAND_bytes takes an int length; feed large requests in slices.
    while (size > 0) {
        std::size_t slice = size > static_cast<std::size_t>(INT_MAX) ? static_cast<std::size_t>(INT_MAX)
                                                                      : size;
        if (RAND_bytes(out, static_cast<int>(slice)) != 1) {
            unsigned long err = ERR_get_error();
            char buf[256] = {0};
            if (err != 0) {
                ERR_error_string_n(err, buf, sizeof(buf));
            }
            throw core::EntropyError(std::string("Crypto: secure random source failed: ") +
                                     (err != 0 ? buf : "unknown OpenSSL error"));
        }
        out += slice;
        size -= slice;
    }
}

std::vector<std::uint8_t> SecureRandom::bytes(std::size_t size)
{
    std::vector<std::uint8_t> out(size);
    fill(out.data(), out.size());
    return out;
}

std::uint64_t SecureRandom::next_word()
{
    std::uint8_t raw[sizeof(std::uint64_t)];
    fill(raw, sizeof(raw));

    std::uint64_t word = 0;
    std::memcpy(&word, raw, sizeof(word));
    return word;
}

/**
 * @brief Bounded rejection sampling.
 *
 * Implementation Strategy:
 * 1. **Acceptance Window**: `limit` is the largest multiple of `range` not
 *    exceeding 2^64 - 1; draws below it map uniformly onto `[0, range)`.
 * 2. **Narrow Window**: If `limit` is under half of the word space, modulus
 *    bias is already accepted and the first draw is reduced directly.
 *    Unreachable for `uint64_t` words: `(2^64 - 1) / range * range` is at
 *    least half the space for every `range`. Kept for narrower word types.
 * 3. **Attempt Cap**: After `kMaxRejectionAttempts` rejected draws the last
 *    draw is reduced with a plain modulus, bounding worst-case latency.
 */
std::uint64_t SecureRandom::below(std::uint64_t range, const WordSource& source)
{
    if (range == 0) {
        throw std::invalid_argument("Crypto: sampling range must be non-zero");
    }

    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t limit = (kMax / range) * range;

    if (limit < kMax / 2) {
        return source() % range;
    }

    std::uint64_t draw = 0;
    for (int attempt = 0; attempt < kMaxRejectionAttempts; ++attempt) {
        draw = source();
        if (draw < limit) {
            return draw % range;
        }
    }

    infra::Logger::log(infra::LogLevel::WARN,
                       "Crypto: rejection sampling exhausted " +
                           std::to_string(kMaxRejectionAttempts) +
                           " attempts; falling back to modulus reduction.");
    return draw % range;
}

std::uint64_t SecureRandom::below(std::uint64_t range)
{
    return below(range, &SecureRandom::next_word);
}

std::string SecureRandom::token(std::size_t length, std::string_view alphabet)
{
    if (alphabet.empty()) {
        throw std::invalid_argument("Crypto: token alphabet must not be empty");
    }

    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(alphabet[below(alphabet.size())]);
    }
    return out;
}

} // namespace cuidkit::crypto
