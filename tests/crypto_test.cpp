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
 * @file crypto_test.cpp
 * @brief Tests for the SHA3-512 hasher and the secure random facade.
 */

#include "cuidkit/core/error.hpp"
#include "cuidkit/crypto/random.hpp"
#include "cuidkit/crypto/sha3.hpp"
#include "framework.hpp"

#include <cstdint>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>

using cuidkit::crypto::SecureRandom;
using cuidkit::crypto::Sha3_512;

/**
 * @brief FIPS 202 reference digests for the empty string and "abc".
 */
void test_sha3_known_vectors()
{
    ASSERT_EQ(Sha3_512::hex_digest(""),
              std::string("a69f73cca23a9ac5c8b567dc185a756e97c982164fe25859e0d1dcc1475c80a6"
                          "15b2123af1f5f94c11e3e9402c3ac558f500199d95b6d3e301758586281dcd26"));
    ASSERT_EQ(Sha3_512::hex_digest("abc"),
              std::string("b751850b1a57168a5693cd924b6b096e08f621827444f70d884f5d0240d2712e"
                          "10e116e9192af3c91a7ec57647e3934057340b4cf408d5a56592f8274eec53f0"));
}

/**
 * @brief Feeding fragments is equivalent to hashing their concatenation.
 */
void test_sha3_streaming_matches_one_shot()
{
    Sha3_512 hasher;
    hasher.update("a").update("").update("bc");
    ASSERT_EQ(hasher.final_hex(), Sha3_512::hex_digest("abc"));
}

void test_sha3_single_use()
{
    Sha3_512 hasher;
    hasher.update("abc");
    Sha3_512::Digest digest = hasher.final_bytes();
    ASSERT_EQ(digest.size(), static_cast<std::size_t>(64));
    ASSERT_THROWS(hasher.update("more"), cuidkit::core::InvalidOperationError);
    ASSERT_THROWS(hasher.final_bytes(), cuidkit::core::InvalidOperationError);
}

void test_random_bytes()
{
    auto a = SecureRandom::bytes(32);
    auto b = SecureRandom::bytes(32);
    ASSERT_EQ(a.size(), static_cast<std::size_t>(32));
    ASSERT_TRUE(a != b);
    ASSERT_TRUE(SecureRandom::bytes(0).empty());
}

/**
 * @brief Draws inside the acceptance window are reduced directly.
 */
void test_random_below_accepts_in_window()
{
    ASSERT_EQ(SecureRandom::below(26, [] { return std::uint64_t{5}; }), std::uint64_t{5});
    ASSERT_EQ(SecureRandom::below(26, [] { return std::uint64_t{27}; }), std::uint64_t{1});

    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(SecureRandom::below(7) < 7);
    }
}

/**
 * @brief Draws above the window are rejected and the next accepted draw is used.
 */
void test_random_below_rejects_biased_draws()
{
    int calls = 0;
    auto source = [&calls]() -> std::uint64_t {
        ++calls;
        return calls < 3 ? std::numeric_limits<std::uint64_t>::max() : 42;
    };
    ASSERT_EQ(SecureRandom::below(1000, source), std::uint64_t{42});
    ASSERT_EQ(calls, 3);
}

/**
 * @brief Once the attempt cap is reached the last draw is reduced by modulus.
 */
void test_random_below_attempt_cap()
{
    int calls = 0;
    auto source = [&calls]() -> std::uint64_t {
        ++calls;
        return std::numeric_limits<std::uint64_t>::max();
    };
    // 2^64 - 1 lies above the largest multiple of 476782367 below 2^64.
    ASSERT_EQ(SecureRandom::below(476782367, source), std::uint64_t{675672});
    ASSERT_EQ(calls, SecureRandom::kMaxRejectionAttempts);
}

void test_random_below_zero_range()
{
    ASSERT_THROWS(SecureRandom::below(0), std::invalid_argument);
}

void test_random_token()
{
    const std::string alphabet = "abcdefghjkmnpqrstvwxyz0123456789";
    std::string token = SecureRandom::token(32, alphabet);
    ASSERT_EQ(token.size(), static_cast<std::size_t>(32));
    for (char c : token) {
        ASSERT_TRUE(alphabet.find(c) != std::string::npos);
    }
    ASSERT_THROWS(SecureRandom::token(4, ""), std::invalid_argument);
}
