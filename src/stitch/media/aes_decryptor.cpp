// Copyright (c) 2026 changcheng967. All rights reserved.

#include <stitch/media/aes_decryptor.hpp>
#include <stitch/core/config.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <climits>

namespace stitch::media {

using core::FetchErrc;

void AesDecryptor::CtxDeleter::operator()(evp_cipher_ctx_st* ctx) const noexcept {
    EVP_CIPHER_CTX_free(ctx);
}

AesDecryptor::~AesDecryptor() = default;

std::expected<AesDecryptor, std::error_code>
AesDecryptor::create(std::span<const std::uint8_t> key, const AesBlock& iv) noexcept {
    if (key.size() != core::AES_KEY_SIZE) {
        return std::unexpected(make_error_code(FetchErrc::key_unavailable));
    }

    AesDecryptor dec;
    dec.ctx_.reset(EVP_CIPHER_CTX_new());
    if (!dec.ctx_) {
        return std::unexpected(make_error_code(FetchErrc::decrypt_failed));
    }
    if (EVP_DecryptInit_ex(dec.ctx_.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) != 1) {
        return std::unexpected(make_error_code(FetchErrc::decrypt_failed));
    }
    return dec;
}

std::error_code AesDecryptor::update(std::span<const std::byte> in,
                                     std::vector<std::byte>& out) noexcept {
    if (!ctx_) {
        return make_error_code(FetchErrc::decrypt_failed);
    }

    try {
        while (!in.empty()) {
            // EVP lengths are int
            auto chunk = in.first(std::min<std::size_t>(in.size(), INT_MAX - EVP_MAX_BLOCK_LENGTH));
            auto start = out.size();
            out.resize(start + chunk.size() + EVP_MAX_BLOCK_LENGTH);

            int written = 0;
            if (EVP_DecryptUpdate(ctx_.get(),
                                  reinterpret_cast<unsigned char*>(out.data() + start), &written,
                                  reinterpret_cast<const unsigned char*>(chunk.data()),
                                  static_cast<int>(chunk.size())) != 1) {
                out.resize(start);
                return make_error_code(FetchErrc::decrypt_failed);
            }
            out.resize(start + static_cast<std::size_t>(written));
            in = in.subspan(chunk.size());
        }
    } catch (const std::bad_alloc&) {
        return make_error_code(FetchErrc::write_failed);
    }
    return {};
}

std::error_code AesDecryptor::finish(std::vector<std::byte>& out) noexcept {
    if (!ctx_) {
        return make_error_code(FetchErrc::decrypt_failed);
    }

    try {
        auto start = out.size();
        out.resize(start + EVP_MAX_BLOCK_LENGTH);

        int written = 0;
        if (EVP_DecryptFinal_ex(ctx_.get(),
                                reinterpret_cast<unsigned char*>(out.data() + start),
                                &written) != 1) {
            out.resize(start);
            ctx_.reset();
            return make_error_code(FetchErrc::decrypt_failed);
        }
        out.resize(start + static_cast<std::size_t>(written));
    } catch (const std::bad_alloc&) {
        return make_error_code(FetchErrc::write_failed);
    }
    ctx_.reset();
    return {};
}

std::expected<std::vector<std::byte>, std::error_code>
decrypt_aes128(std::span<const std::uint8_t> key, const AesBlock& iv,
               std::span<const std::byte> ciphertext) noexcept {
    auto dec = AesDecryptor::create(key, iv);
    if (!dec) {
        return std::unexpected(dec.error());
    }

    std::vector<std::byte> plain;
    if (auto ec = dec->update(ciphertext, plain)) {
        return std::unexpected(ec);
    }
    if (auto ec = dec->finish(plain)) {
        return std::unexpected(ec);
    }
    return plain;
}

} // namespace stitch::media
