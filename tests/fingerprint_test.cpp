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
 * @file fingerprint_test.cpp
 * @brief Tests for the process fingerprint singleton and its inputs.
 */

#include "cuidkit/core/fingerprint.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using cuidkit::core::Fingerprint;

void test_fingerprint_singleton_stable()
{
    auto first = Fingerprint::instance();
    auto second = Fingerprint::instance();
    ASSERT_TRUE(first.get() == second.get());
    ASSERT_TRUE(first->value() == second->value());
    ASSERT_EQ(first->hex().size(), static_cast<std::size_t>(128));
}

/**
 * @brief A digest of real process data is neither all zero nor low-entropy.
 */
void test_fingerprint_has_entropy()
{
    auto fingerprint = Fingerprint::instance();
    std::set<std::uint8_t> distinct(fingerprint->value().begin(), fingerprint->value().end());
    ASSERT_TRUE(distinct.size() > 10);
}

/**
 * @brief Resetting simulates a new process; old handles keep their bytes.
 */
void test_fingerprint_reset_recomputes()
{
    auto before = Fingerprint::instance();
    Fingerprint::Bytes snapshot = before->value();

    Fingerprint::reset();
    auto after = Fingerprint::instance();

    ASSERT_TRUE(before.get() != after.get());
    ASSERT_TRUE(before->value() == snapshot);
    // Fresh salt per computation.
    ASSERT_TRUE(before->value() != after->value());
}

/**
 * @brief Threads racing on first access all receive the same instance.
 */
void test_fingerprint_concurrent_first_access()
{
    Fingerprint::reset();

    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<const Fingerprint>> handles(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&handles, t] { handles[t] = Fingerprint::instance(); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& handle : handles) {
        ASSERT_TRUE(handle.get() == handles[0].get());
    }
}

void test_fingerprint_process_identity()
{
    ASSERT_EQ(Fingerprint::process_identity(), std::to_string(getpid()));
}

void test_fingerprint_host_identity()
{
    std::string host = Fingerprint::host_identity();
    ASSERT_FALSE(host.empty());
}

namespace {

void clear_forwarding_variables()
{
    for (const char* name : {"HTTP_X_FORWARDED_FOR", "HTTP_X_FORWARDED", "HTTP_X_COMING_FROM",
                             "HTTP_FORWARDED_FOR", "HTTP_CLIENT_IP", "HTTP_VIA",
                             "HTTP_XROXY_CONNECTION", "HTTP_PROXY_CONNECTION", "REMOTE_ADDR"}) {
        unsetenv(name);
    }
}

} // namespace

/**
 * @brief The first forwarding variable holding a valid IP wins over the host name.
 *
 * Scenarios verified:
 * - `REMOTE_ADDR` alone is used verbatim.
 * - A non-address value in an earlier variable is skipped.
 * - IPv6 addresses are accepted.
 */
void test_fingerprint_host_identity_prefers_forwarded_address()
{
    clear_forwarding_variables();

    try {
        setenv("REMOTE_ADDR", "10.1.2.3", 1);
        ASSERT_EQ(Fingerprint::host_identity(), std::string("10.1.2.3"));

        setenv("HTTP_X_FORWARDED_FOR", "not-an-address", 1);
        ASSERT_EQ(Fingerprint::host_identity(), std::string("10.1.2.3"));

        setenv("HTTP_CLIENT_IP", "2001:db8::1", 1);
        ASSERT_EQ(Fingerprint::host_identity(), std::string("2001:db8::1"));

        setenv("HTTP_X_FORWARDED_FOR", "192.168.0.7", 1);
        ASSERT_EQ(Fingerprint::host_identity(), std::string("192.168.0.7"));
    } catch (...) {
        clear_forwarding_variables();
        throw;
    }

    clear_forwarding_variables();
    ASSERT_NE(Fingerprint::host_identity(), std::string("10.1.2.3"));
}

/**
 * @brief The environment is serialized once, as a JSON object.
 */
void test_fingerprint_environment_serialized_once()
{
    const std::string& first = Fingerprint::serialized_environment();
    const std::string& second = Fingerprint::serialized_environment();
    ASSERT_TRUE(&first == &second);

    cJSON* parsed = cJSON_Parse(first.c_str());
    ASSERT_TRUE(parsed != nullptr);
    bool is_object = cJSON_IsObject(parsed);
    cJSON_Delete(parsed);
    ASSERT_TRUE(is_object);
}
