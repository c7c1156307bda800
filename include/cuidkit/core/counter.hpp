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
 * @file counter.hpp
 * @brief Process-wide monotonic counter mixed into every identifier.
 *
 * @details
 * The counter separates identifiers created within the same millisecond by the
 * same process. It starts at a uniformly random position so that two processes
 * sharing a fingerprint do not walk the same sequence.
 */

#pragma once

#include "cuidkit/crypto/random.hpp"

#include <cstdint>
#include <mutex>

namespace cuidkit::core {

/**
 * @class Counter
 * @brief Thread-safe wrapping counter over `[0, RANGE)`.
 *
 * @details
 * `instance()` returns the lazily created process singleton. Independent
 * counters can be constructed with an explicit start value.
 *
 * **Concurrency Model:**
 * `next_value()` performs its read-modify-write under a mutex; concurrent
 * callers always receive distinct values until the sequence wraps.
 */
class Counter {
  public:
    /// @brief Modulus of the counter sequence.
    static constexpr std::uint64_t RANGE = 476782367;

    /**
     * @brief Creates a counter positioned at `initial % RANGE`.
     */
    explicit Counter(std::uint64_t initial);

    Counter(const Counter&) = delete;
    Counter& operator=(const Counter&) = delete;

    /**
     * @brief Returns the process-wide counter, seeding it on first access.
     *
     * @throws EntropyError if the secure random source fails during seeding.
     */
    static Counter& instance();

    /**
     * @brief Re-seeds the process-wide counter from fresh entropy.
     *
     * Simulates a new process for tests; references obtained from
     * `instance()` remain valid.
     */
    static void reset();

    /**
     * @brief Draws a uniform seed in `[0, RANGE)` from @p source.
     *
     * @see crypto::SecureRandom::below for the bounded rejection policy.
     */
    static std::uint64_t draw_seed(const crypto::WordSource& source);

    /**
     * @brief Returns the current value and advances to `(value + 1) % RANGE`.
     */
    std::uint64_t next_value();

  private:
    void reseed(std::uint64_t value);

    std::mutex mutex_;
    std::uint64_t value_;
};

} // namespace cuidkit::core
