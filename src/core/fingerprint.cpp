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
 * @file fingerprint.cpp
 * @brief Implementation of the process fingerprint and its input collectors.
 */

#include "cuidkit/core/fingerprint.hpp"

#include "cuidkit/crypto/random.hpp"
#include "cuidkit/infra/logger.hpp"
#include "cuidkit/infra/string.hpp"

#include <arpa/inet.h>
#include <cJSON.h>
#include <climits>
#include <cstdlib>
#include <unistd.h>

extern char** environ;

namespace cuidkit::core {

namespace {

/// Forwarding headers as exposed to CGI programs, most specific first.
constexpr const char* kAddressVariables[] = {
    "HTTP_X_FORWARDED_FOR", "HTTP_X_FORWARDED",      "HTTP_X_COMING_FROM",
    "HTTP_FORWARDED_FOR",   "HTTP_CLIENT_IP",        "HTTP_VIA",
    "HTTP_XROXY_CONNECTION", "HTTP_PROXY_CONNECTION", "REMOTE_ADDR",
};

bool is_ip_address(const std::string& candidate)
{
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, candidate.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, candidate.c_str(), buf) == 1;
}

std::string remote_address()
{
    for (const char* name : kAddressVariables) {
        const char* raw = std::getenv(name);
        if (raw == nullptr || *raw == '\0') {
            continue;
        }
        std::string value = infra::String::trim(raw);
        if (is_ip_address(value)) {
            return value;
        }
    }
    return "";
}

std::string serialize_environment()
{
    cJSON* root = cJSON_CreateObject();
    if (!root) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Fingerprint: cannot allocate environment object; using empty set.");
        return "{}";
    }

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string pair(*entry);
        std::size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        cJSON_AddStringToObject(root, pair.substr(0, eq).c_str(), pair.substr(eq + 1).c_str());
    }

    char* printed = cJSON_PrintUnformatted(root);
    cJSON_Delete(root);
    if (!printed) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Fingerprint: environment serialization failed; using empty set.");
        return "{}";
    }

    std::string out(printed);
    cJSON_free(printed);
    return out;
}

} // namespace

std::mutex Fingerprint::mutex_;
std::shared_ptr<const Fingerprint> Fingerprint::instance_;

Fingerprint::Fingerprint(const Bytes& bytes) : bytes_(bytes) {}

std::shared_ptr<const Fingerprint> Fingerprint::instance()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!instance_) {
        instance_ = std::make_shared<const Fingerprint>(compute());
    }
    return instance_;
}

void Fingerprint::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    instance_.reset();
}

bool Fingerprint::is_initialized()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return instance_ != nullptr;
}

/**
 * @brief Hashes the process identity into a 64-byte digest.
 *
 * Absorption order: salt (8 random bytes, hex), host identity, process id,
 * serialized environment.
 */
Fingerprint Fingerprint::compute()
{
    std::uint8_t salt[8];
    crypto::SecureRandom::fill(salt, sizeof(salt));

    crypto::Sha3_512 hasher;
    hasher.update(infra::String::to_hex(salt, sizeof(salt)));
    hasher.update(host_identity());
    hasher.update(process_identity());
    hasher.update(serialized_environment());

    Fingerprint fingerprint(hasher.final_bytes());
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Fingerprint: computed " + fingerprint.hex().substr(0, 16) + "...");
    return fingerprint;
}

std::string Fingerprint::hex() const
{
    return infra::String::to_hex(bytes_.data(), bytes_.size());
}

std::string Fingerprint::host_identity()
{
    std::string address = remote_address();
    if (!address.empty()) {
        return address;
    }

    char name[HOST_NAME_MAX + 1] = {0};
    if (gethostname(name, sizeof(name) - 1) == 0 && name[0] != '\0') {
        return std::string(name);
    }

    const std::size_t length = sizeof(void*) < 8 ? 15 : 32;
    infra::Logger::log(infra::LogLevel::WARN,
                       "Fingerprint: host name unavailable; using a random host token.");
    return crypto::SecureRandom::token(length, kFallbackAlphabet);
}

std::string Fingerprint::process_identity()
{
    pid_t pid = getpid();
    if (pid > 0) {
        return std::to_string(pid);
    }
    return std::to_string(crypto::SecureRandom::below(32768) + 1);
}

const std::string& Fingerprint::serialized_environment()
{
    static const std::string cached = serialize_environment();
    return cached;
}

} // namespace cuidkit::core
