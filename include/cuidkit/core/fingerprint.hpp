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
 * @file fingerprint.hpp
 * @brief Per-process identity digest mixed into every identifier.
 *
 * @details
 * The fingerprint distinguishes identifiers generated by different machines or
 * processes that happen to share a timestamp and counter value. It is the
 * SHA3-512 digest of a random salt, the host identity, the process id and the
 * serialized environment, computed once per process.
 */

#pragma once

#include "cuidkit/crypto/sha3.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace cuidkit::core {

/**
 * @class Fingerprint
 * @brief Immutable 64-byte process fingerprint behind a lazy singleton.
 *
 * @details
 * `instance()` hands out a shared handle. At most one computation happens per
 * process even when several threads race on first access. `reset()` drops the
 * cached instance; handles already held by callers stay valid.
 */
class Fingerprint {
  public:
    static constexpr std::size_t kSize = crypto::Sha3_512::kDigestSize;
    using Bytes = crypto::Sha3_512::Digest;

    /// @brief Alphabet of the random host fallback; omits `i`, `l`, `o` and `u`.
    static constexpr const char* kFallbackAlphabet = "abcdefghjkmnpqrstvwxyz0123456789";

    /**
     * @brief Returns the process fingerprint, computing it on first access.
     *
     * @throws InvalidOperationError if SHA3-512 is unavailable.
     * @throws EntropyError if the secure random source fails.
     */
    static std::shared_ptr<const Fingerprint> instance();

    /// @brief Discards the cached fingerprint so the next `instance()` recomputes it.
    static void reset();

    /// @brief True once `instance()` has computed the process fingerprint.
    static bool is_initialized();

    /// @brief Computes a fresh fingerprint without touching the singleton.
    static Fingerprint compute();

    /// @brief Wraps precomputed digest bytes.
    explicit Fingerprint(const Bytes& bytes);

    const Bytes& value() const { return bytes_; }

    /// @brief Lowercase hex encoding of `value()` (128 characters).
    std::string hex() const;

    /**
     * @brief Best-effort identity of the host.
     *
     * Resolution order:
     * 1. The first forwarding/CGI environment variable holding a valid IPv4 or
     *    IPv6 address (`HTTP_X_FORWARDED_FOR` ... `REMOTE_ADDR`).
     * 2. `gethostname()`.
     * 3. A random token over `kFallbackAlphabet`, 15 characters on 32-bit
     *    platforms and 32 otherwise.
     */
    static std::string host_identity();

    /// @brief Decimal process id; a random value in `[1, 32768]` if unavailable.
    static std::string process_identity();

    /**
     * @brief The environment as a compact JSON object, serialized once per process.
     *
     * Later changes to the environment are not reflected.
     */
    static const std::string& serialized_environment();

  private:
    Bytes bytes_;

    static std::mutex mutex_;
    static std::shared_ptr<const Fingerprint> instance_;
};

} // namespace cuidkit::core
