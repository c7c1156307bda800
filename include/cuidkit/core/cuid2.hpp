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
 * @file cuid2.hpp
 * @brief Collision-resistant, URL-safe identifiers in the CUID2 format.
 *
 * @details
 * A `Cuid2` captures everything that makes it unique at construction time
 * (prefix letter, timestamp, counter snapshot, random bytes and the process
 * fingerprint). Rendering is a pure function of that state: the captured
 * fields are hashed with SHA3-512, the digest is re-encoded in base 36 and
 * truncated behind the prefix letter.
 */

#pragma once

#include "cuidkit/core/counter.hpp"
#include "cuidkit/core/fingerprint.hpp"
#include "cuidkit/encoding/base36.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cuidkit::core {

/**
 * @class Cuid2
 * @brief One identifier, immutable after construction.
 *
 * @code
 * cuidkit::core::Cuid2 id;          // 24 characters
 * std::string s = id.to_string();   // e.g. "tz4a98xxat96iws9zmbrgj3a"
 * bool ok = cuidkit::core::Cuid2::is_valid(s, 24);
 * @endcode
 */
class Cuid2 {
  public:
    static constexpr int kMinLength = 4;
    static constexpr int kMaxLength = 32;
    static constexpr int kDefaultLength = 24;

    /**
     * @brief Captures a new identifier using the process-wide Counter and Fingerprint.
     *
     * @param length Rendered length, in `[4, 32]`.
     * @throws RangeError if @p length is out of bounds.
     * @throws InvalidOperationError if SHA3-512 is unavailable.
     * @throws EntropyError if the secure random source fails.
     */
    explicit Cuid2(int length = kDefaultLength);

    /**
     * @brief Static factory, equivalent to `Cuid2(length)`.
     *
     * @code
     * std::string id = cuidkit::core::Cuid2::generate(10).to_string();
     * @endcode
     *
     * @throws RangeError if @p length is out of bounds.
     */
    static Cuid2 generate(int length = kDefaultLength);

    /**
     * @brief Captures a new identifier from explicit collaborators.
     *
     * @throws RangeError if @p length is out of bounds.
     * @throws std::invalid_argument if @p fingerprint is null.
     */
    Cuid2(int length, Counter& counter, std::shared_ptr<const Fingerprint> fingerprint);

    /// @brief Renders the identifier with the limb backend.
    std::string to_string() const;

    /**
     * @brief Renders the identifier with the chosen base-36 backend.
     *
     * Both backends return the same string for the same identifier.
     */
    std::string render(encoding::Base36Backend backend) const;

    /// @brief The identifier as a JSON string literal, quotes included.
    std::string to_json() const;

    char prefix() const { return prefix_; }
    std::int64_t timestamp() const { return timestamp_; }
    std::uint64_t counter() const { return counter_; }
    int length() const { return length_; }

    /**
     * @brief Checks the textual format of a candidate identifier.
     *
     * Rules:
     * - the candidate length lies in `[4, 32]`;
     * - when @p expected_length is given, it lies in `[4, 32]` and equals the
     *   candidate length;
     * - the first character is `a`-`z`, the rest are `0`-`9` or `a`-`z`.
     *
     * Only the format is checked; this says nothing about origin or uniqueness.
     * Never throws.
     */
    static bool is_valid(std::string_view candidate,
                         std::optional<int> expected_length = std::nullopt) noexcept;

  private:
    /// @brief A length already checked against `[4, 32]`.
    struct CheckedLength {
        int value;
    };

    /// @brief Resolves the process-wide collaborators for an already checked length.
    explicit Cuid2(CheckedLength length);

    static int checked_length(int length);

    int length_;
    char prefix_;
    std::int64_t timestamp_;
    std::uint64_t counter_;
    std::vector<std::uint8_t> random_;
    std::shared_ptr<const Fingerprint> fingerprint_;
};

/// @brief Streams `id.to_string()`.
std::ostream& operator<<(std::ostream& os, const Cuid2& id);

} // namespace cuidkit::core
