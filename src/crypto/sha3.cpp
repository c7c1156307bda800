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
 * @file sha3.cpp
 * @brief OpenSSL EVP implementation of the streaming SHA3-512 hasher.
 */

#include "cuidkit/crypto/sha3.hpp"

#include "cuidkit/core/error.hpp"
#include "cuidkit/infra/string.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

namespace cuidkit::crypto {

namespace {

std::string openssl_error(const char* context)
{
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return std::string("Crypto: ") + context + ": unknown OpenSSL error";
    }

    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string("Crypto: ") + context + ": " + buf;
}

} // namespace

void Sha3_512::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept
{
    EVP_MD_CTX_free(ctx);
}

/**
 * @brief Resolves SHA3-512 and initializes a fresh digest context.
 *
 * The algorithm is resolved by name so that an OpenSSL build compiled without
 * Keccak support reports a clean `InvalidOperationError` instead of crashing.
 */
Sha3_512::Sha3_512() : ctx_(EVP_MD_CTX_new())
{
    if (!ctx_) {
        throw core::InvalidOperationError(openssl_error("EVP_MD_CTX_new"));
    }

    const EVP_MD* md = EVP_get_digestbyname("SHA3-512");
    if (md == nullptr) {
        throw core::InvalidOperationError("Crypto: SHA3-512 digest is not available in this OpenSSL build");
    }

    if (EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
        throw core::InvalidOperationError(openssl_error("EVP_DigestInit_ex"));
    }
}

Sha3_512::~Sha3_512() = default;
Sha3_512::Sha3_512(Sha3_512&&) noexcept = default;
Sha3_512& Sha3_512::operator=(Sha3_512&&) noexcept = default;

Sha3_512& Sha3_512::update(std::string_view data)
{
    return update(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

/**
 * @brief Absorbs raw bytes into the running digest.
 *
 * Operational Logic:
 * 1. **State Check**: Refuses input once the digest has been finalized.
 * 2. **Empty Input**: Returns immediately; nothing reaches OpenSSL.
 * 3. **Absorption**: Forwards to `EVP_DigestUpdate`, translating failure into
 *    `InvalidOperationError` with the OpenSSL error text.
 *
 * @return Sha3_512& `*this`, for chaining.
 */
Sha3_512& Sha3_512::update(const std::uint8_t* data, std::size_t size)
{
    if (finalized_ || !ctx_) {
        throw core::InvalidOperationError("Crypto: SHA3-512 update after finalization");
    }
    if (size == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw core::InvalidOperationError(openssl_error("EVP_DigestUpdate"));
    }
    return *this;
}

/**
 * @brief Completes the computation and returns the 64-byte digest.
 *
 * Implementation Strategy:
 * 1. **Single Use**: A second finalization throws; the context is spent.
 * 2. **Extraction**: `EVP_DigestFinal_ex` writes into a fixed 64-byte array.
 * 3. **Length Check**: Any other reported length is treated as a broken
 *    provider and raised as `InvalidOperationError`.
 */
Sha3_512::Digest Sha3_512::final_bytes()
{
    if (finalized_ || !ctx_) {
        throw core::InvalidOperationError("Crypto: SHA3-512 finalized twice");
    }

    Digest digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1) {
        throw core::InvalidOperationError(openssl_error("EVP_DigestFinal_ex"));
    }
    finalized_ = true;

    if (len != kDigestSize) {
        throw core::InvalidOperationError("Crypto: unexpected SHA3-512 digest length " +
                                          std::to_string(len));
    }
    return digest;
}

std::string Sha3_512::final_hex()
{
    Digest digest = final_bytes();
    return infra::String::to_hex(digest.data(), digest.size());
}

std::string Sha3_512::hex_digest(std::string_view data)
{
    Sha3_512 hasher;
    hasher.update(data);
    return hasher.final_hex();
}

} // namespace cuidkit::crypto
