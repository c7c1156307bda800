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
 * @file counter.cpp
 * @brief Implementation of the process-wide identifier counter.
 */

#include "cuidkit/core/counter.hpp"

#include "cuidkit/infra/logger.hpp"

#include <string>

namespace cuidkit::core {

Counter::Counter(std::uint64_t initial) : value_(initial % RANGE) {}

Counter& Counter::instance()
{
    // Magic static: initialization runs exactly once even under concurrent first access.
    static Counter counter(draw_seed(&crypto::SecureRandom::next_word));
    return counter;
}

void Counter::reset()
{
    instance().reseed(draw_seed(&crypto::SecureRandom::next_word));
}

/**
 * @brief Draws the starting position of a counter.
 *
 * Implementation Strategy:
 * 1. **Uniform Draw**: Delegates to `SecureRandom::below(RANGE, source)`, which
 *    rejects words above the largest multiple of RANGE in 64 bits.
 * 2. **Bounded Latency**: After 1000 rejections the last word is reduced by
 *    plain modulus instead of drawing forever.
 *
 * @param source 64-bit word generator; the secure source in production.
 * @return std::uint64_t A seed in `[0, RANGE)`.
 */
std::uint64_t Counter::draw_seed(const crypto::WordSource& source)
{
    std::uint64_t seed = crypto::SecureRandom::below(RANGE, source);

    if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Counter: seeded at " + std::to_string(seed));
    }
    return seed;
}

/**
 * @brief Hands out the current value and advances the sequence.
 *
 * Operational Logic:
 * 1. **Synchronization**: The read and the store happen under one `lock_guard`,
 *    so no two callers observe the same value.
 * 2. **Wrap**: The successor is computed modulo RANGE; the value never
 *    reaches RANGE and never overflows.
 *
 * @return std::uint64_t The value before advancing, in `[0, RANGE)`.
 */
std::uint64_t Counter::next_value()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t current = value_;
    value_ = (value_ + 1) % RANGE;
    return current;
}

void Counter::reseed(std::uint64_t value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = value % RANGE;
}

} // namespace cuidkit::core
