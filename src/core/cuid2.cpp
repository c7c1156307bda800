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
 * @file cuid2.cpp
 * @brief Identifier capture, rendering and format validation.
 */

#include "cuidkit/core/cuid2.hpp"

#include "cuidkit/core/error.hpp"
#include "cuidkit/crypto/random.hpp"
#include "cuidkit/crypto/sha3.hpp"
#include "cuidkit/infra/string.hpp"

#include <cJSON.h>
#include <chrono>
#include <new>
#include <stdexcept>
#include <utility>

namespace cuidkit::core {

int Cuid2::checked_length(int length)
{
    if (length < kMinLength || length > kMaxLength) {
        throw RangeError("length: cannot be less than 4 or greater than 32.");
    }
    return length;
}

/**
 * @brief Validates the length, then binds the process-wide Counter and Fingerprint.
 *
 * Arguments of a delegating call are evaluated before the target runs, so the
 * length check gets its own step and a rejected request touches neither singleton.
 */
Cuid2::Cuid2(int length) : Cuid2(CheckedLength{checked_length(length)}) {}

Cuid2::Cuid2(CheckedLength length)
    : Cuid2(length.value, Counter::instance(), Fingerprint::instance())
{
}

Cuid2 Cuid2::generate(int length)
{
    return Cuid2(length);
}

/**
 * @brief Captures the identifier state.
 *
 * The length is validated before the counter is advanced, so a rejected
 * request does not consume a counter value.
 */
Cuid2::Cuid2(int length, Counter& counter, std::shared_ptr<const Fingerprint> fingerprint)
    : length_(checked_length(length)), fingerprint_(std::move(fingerprint))
{
    if (!fingerprint_) {
        throw std::invalid_argument("Cuid2: fingerprint must not be null");
    }

    counter_ = counter.next_value();
    prefix_ = static_cast<char>('a' + crypto::SecureRandom::below(26));
    random_ = crypto::SecureRandom::bytes(static_cast<std::size_t>(length_));
    timestamp_ = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
}

std::string Cuid2::to_string() const
{
    return render(encoding::Base36Backend::Limb);
}

/**
 * @brief Renders the identifier.
 *
 * Implementation Strategy:
 * 1. **Absorb**: decimal timestamp, decimal counter, hex random bytes, hex
 *    fingerprint, in that order, into one SHA3-512 computation.
 * 2. **Re-encode**: the 128-digit hex digest becomes roughly 99 base-36 digits.
 * 3. **Truncate**: the first `length - 1` digits follow the prefix letter.
 */
std::string Cuid2::render(encoding::Base36Backend backend) const
{
    crypto::Sha3_512 hasher;
    hasher.update(std::to_string(timestamp_));
    hasher.update(std::to_string(counter_));
    hasher.update(infra::String::to_hex(random_.data(), random_.size()));
    hasher.update(fingerprint_->hex());

    std::string digits = encoding::hex_to_base36(hasher.final_hex(), backend);

    std::string out;
    out.reserve(static_cast<std::size_t>(length_));
    out.push_back(prefix_);
    out.append(digits, 0, static_cast<std::size_t>(length_ - 1));
    return out;
}

std::string Cuid2::to_json() const
{
    cJSON* node = cJSON_CreateString(to_string().c_str());
    if (!node) {
        throw std::bad_alloc();
    }

    char* printed = cJSON_PrintUnformatted(node);
    cJSON_Delete(node);
    if (!printed) {
        throw std::bad_alloc();
    }

    std::string out(printed);
    cJSON_free(printed);
    return out;
}

bool Cuid2::is_valid(std::string_view candidate, std::optional<int> expected_length) noexcept
{
    const std::size_t size = candidate.size();
    if (size < static_cast<std::size_t>(kMinLength) || size > static_cast<std::size_t>(kMaxLength)) {
        return false;
    }

    if (expected_length) {
        if (*expected_length < kMinLength || *expected_length > kMaxLength) {
            return false;
        }
        if (static_cast<std::size_t>(*expected_length) != size) {
            return false;
        }
    }

    if (!infra::String::is_lower_alpha(candidate[0])) {
        return false;
    }
    for (std::size_t i = 1; i < size; ++i) {
        if (!infra::String::is_lower_alnum(candidate[i])) {
            return false;
        }
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const Cuid2& id)
{
    return os << id.to_string();
}

} // namespace cuidkit::core
