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
 * @file base36.cpp
 * @brief Limb-based and BIGNUM-based hex to base-36 converters.
 */

#include "cuidkit/encoding/base36.hpp"

#include "cuidkit/core/error.hpp"

#include <openssl/bn.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <vector>

namespace cuidkit::encoding {

namespace {

/// Limb base. limb * 16^8 + carry and carry * 10^8 + limb both fit in uint64_t.
constexpr std::uint64_t kLimbBase = 100000000ULL;

/// Hex digits consumed per limb multiplication step.
constexpr std::size_t kChunkDigits = 8;

/// Longest input converted directly in a uint64_t (56 bits).
constexpr std::size_t kFastPathDigits = 14;

std::uint64_t parse_hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return static_cast<std::uint64_t>(c - '0');
    if (c >= 'a' && c <= 'f')
        return static_cast<std::uint64_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F')
        return static_cast<std::uint64_t>(c - 'A' + 10);
    return 0;
}

std::string encode_word(std::uint64_t value)
{
    if (value == 0) {
        return "0";
    }

    std::string out;
    while (value > 0) {
        out.push_back(kBase36Alphabet[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

/**
 * @brief Builds the little-endian limb array of @p hex.
 *
 * Each 8-digit chunk (the leading chunk may be shorter) multiplies the running
 * value by 16^chunk_length and adds the chunk, propagating carries in base 10^8.
 */
std::vector<std::uint64_t> to_limbs(std::string_view hex)
{
    std::vector<std::uint64_t> limbs{0};

    std::size_t pos = 0;
    std::size_t head = hex.size() % kChunkDigits;
    std::size_t chunk_len = head == 0 ? kChunkDigits : head;

    while (pos < hex.size()) {
        std::uint64_t chunk = 0;
        for (std::size_t i = 0; i < chunk_len; ++i) {
            chunk = (chunk << 4) | parse_hex_digit(hex[pos + i]);
        }
        const std::uint64_t multiplier = 1ULL << (4 * chunk_len);

        std::uint64_t carry = chunk;
        for (auto& limb : limbs) {
            std::uint64_t current = limb * multiplier + carry;
            limb = current % kLimbBase;
            carry = current / kLimbBase;
        }
        while (carry > 0) {
            limbs.push_back(carry % kLimbBase);
            carry /= kLimbBase;
        }

        pos += chunk_len;
        chunk_len = kChunkDigits;
    }

    return limbs;
}

/**
 * @brief Repeated long division of the limb array by 36.
 *
 * Each pass walks limbs most-significant first, carrying the remainder into
 * the next limb. The final remainder is the next base-36 digit; leading zero
 * limbs are dropped so the loop stops when a single zero limb remains.
 */
std::string limbs_to_base36(std::vector<std::uint64_t> limbs)
{
    std::string out;

    while (limbs.size() > 1 || limbs[0] != 0) {
        std::uint64_t remainder = 0;
        for (std::size_t i = limbs.size(); i-- > 0;) {
            std::uint64_t current = remainder * kLimbBase + limbs[i];
            limbs[i] = current / 36;
            remainder = current % 36;
        }
        while (limbs.size() > 1 && limbs.back() == 0) {
            limbs.pop_back();
        }
        out.push_back(kBase36Alphabet[remainder]);
    }

    if (out.empty()) {
        return "0";
    }
    std::reverse(out.begin(), out.end());
    return out;
}

struct BignumDeleter {
    void operator()(BIGNUM* bn) const noexcept { BN_free(bn); }
};

using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

} // namespace

std::string hex_to_base36(std::string_view hex)
{
    if (hex.empty()) {
        return "0";
    }

    if (hex.size() <= kFastPathDigits) {
        std::uint64_t value = 0;
        for (char c : hex) {
            value = (value << 4) | parse_hex_digit(c);
        }
        return encode_word(value);
    }

    return limbs_to_base36(to_limbs(hex));
}

/**
 * @brief BIGNUM rendition of the converter.
 *
 * Non-hex characters are first rewritten to '0' so that `BN_hex2bn` consumes
 * the whole string and the zero-folding contract matches the limb backend.
 */
std::string hex_to_base36_bignum(std::string_view hex)
{
    if (hex.empty()) {
        return "0";
    }

    std::string normalized(hex);
    for (char& c : normalized) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            c = '0';
        }
    }

    BIGNUM* raw = nullptr;
    if (BN_hex2bn(&raw, normalized.c_str()) == 0) {
        BN_free(raw);
        throw core::InvalidOperationError("Encoding: BN_hex2bn failed");
    }
    BignumPtr value(raw);

    std::string out;
    while (!BN_is_zero(value.get())) {
        BN_ULONG remainder = BN_div_word(value.get(), 36);
        if (remainder == static_cast<BN_ULONG>(-1)) {
            throw core::InvalidOperationError("Encoding: BN_div_word failed");
        }
        out.push_back(kBase36Alphabet[static_cast<std::size_t>(remainder)]);
    }

    if (out.empty()) {
        return "0";
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string hex_to_base36(std::string_view hex, Base36Backend backend)
{
    switch (backend) {
    case Base36Backend::BigNum:
        return hex_to_base36_bignum(hex);
    case Base36Backend::Limb:
        break;
    }
    return hex_to_base36(hex);
}

std::optional<Base36Backend> parse_backend(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "limb")
        return Base36Backend::Limb;
    if (lowered == "bignum")
        return Base36Backend::BigNum;
    return std::nullopt;
}

std::string_view backend_name(Base36Backend backend)
{
    return backend == Base36Backend::BigNum ? "bignum" : "limb";
}

} // namespace cuidkit::encoding
