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
 * @file sha3.hpp
 * @brief Streaming SHA3-512 digest backed by OpenSSL EVP.
 *
 * @details
 * Both the process fingerprint and every rendered identifier are derived from
 * a single SHA3-512 computation fed with several string fragments. This header
 * exposes that as an incremental hasher owning its `EVP_MD_CTX`.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace cuidkit::crypto {

/**
 * @class Sha3_512
 * @brief Incremental SHA3-512 hasher.
 *
 * @details
 * The digest algorithm is looked up by name at construction. When the linked
 * OpenSSL build does not provide it, construction throws
 * `core::InvalidOperationError`; no weaker digest is substituted.
 *
 * A hasher is single-use: after `final_bytes()` or `final_hex()` further
 * updates throw `core::InvalidOperationError`.
 */
class Sha3_512 {
  public:
    static constexpr std::size_t kDigestSize = 64;
    using Digest = std::array<std::uint8_t, kDigestSize>;

    Sha3_512();
    ~Sha3_512();

    Sha3_512(const Sha3_512&) = delete;
    Sha3_512& operator=(const Sha3_512&) = delete;
    Sha3_512(Sha3_512&&) noexcept;
    Sha3_512& operator=(Sha3_512&&) noexcept;

    /// @brief Absorbs the bytes of @p data.
    Sha3_512& update(std::string_view data);

    /// @brief Absorbs @p size raw bytes.
    Sha3_512& update(const std::uint8_t* data, std::size_t size);

    /// @brief Finalizes and returns the raw 64-byte digest.
    Digest final_bytes();

    /// @brief Finalizes and returns the 128-character lowercase hex digest.
    std::string final_hex();

    /**
     * @brief One-shot convenience wrapper.
     *
     * @code
     * std::string hex = cuidkit::crypto::Sha3_512::hex_digest("abc");
     * @endcode
     */
    static std::string hex_digest(std::string_view data);

  private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool finalized_ = false;
};

} // namespace cuidkit::crypto
