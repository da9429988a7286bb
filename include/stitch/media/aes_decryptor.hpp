// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stitch/core/error.hpp>
#include <stitch/media/manifest.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

struct evp_cipher_ctx_st;

namespace stitch::media {

// Streaming AES-128-CBC decryption with PKCS#7 padding removal. Feed
// ciphertext in arbitrary chunks with update(), then call finish() once.
class AesDecryptor {
public:
    [[nodiscard]] static std::expected<AesDecryptor, std::error_code>
    create(std::span<const std::uint8_t> key, const AesBlock& iv) noexcept;

    ~AesDecryptor();

    AesDecryptor(const AesDecryptor&) = delete;
    AesDecryptor& operator=(const AesDecryptor&) = delete;
    AesDecryptor(AesDecryptor&&) noexcept = default;
    AesDecryptor& operator=(AesDecryptor&&) noexcept = default;

    // Append the plaintext available so far to out
    [[nodiscard]] std::error_code update(std::span<const std::byte> in,
                                         std::vector<std::byte>& out) noexcept;

    // Verify and strip the padding block; decrypt_failed on bad padding or
    // a ciphertext that is not a whole number of blocks
    [[nodiscard]] std::error_code finish(std::vector<std::byte>& out) noexcept;

private:
    struct CtxDeleter {
        void operator()(evp_cipher_ctx_st* ctx) const noexcept;
    };

    AesDecryptor() = default;

    std::unique_ptr<evp_cipher_ctx_st, CtxDeleter> ctx_;
};

// One-shot decryption of a whole buffer
[[nodiscard]] std::expected<std::vector<std::byte>, std::error_code>
decrypt_aes128(std::span<const std::uint8_t> key, const AesBlock& iv,
               std::span<const std::byte> ciphertext) noexcept;

} // namespace stitch::media
