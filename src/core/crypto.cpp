/*
 * Copyright 2025 Weft Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Weft Token Cipher - Implementation

#include "crypto.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace weft::core {

namespace {

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

[[nodiscard]] CipherCtxPtr new_cipher_ctx() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

constexpr size_t kHeaderSize = 1 + TokenCipher::kNonceSize;
constexpr size_t kMinTokenSize = kHeaderSize + TokenCipher::kTagSize;

}  // namespace

// ============================================================================
// Base64url encoding/decoding
// ============================================================================

std::string base64url_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, bmem);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(b64, input.data(), static_cast<int>(input.size()));
    (void)BIO_flush(b64);

    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64, &bptr);

    std::string result(bptr->data, bptr->length);
    BIO_free_all(b64);

    // '+' -> '-', '/' -> '_', strip '='
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::optional<std::string> base64url_decode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    // BIO silently skips characters outside the alphabet, so reject them up front
    for (char c : input) {
        bool valid = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                     c == '-' || c == '_';
        if (!valid) {
            return std::nullopt;
        }
    }
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string base64(input);
    std::replace(base64.begin(), base64.end(), '-', '+');
    std::replace(base64.begin(), base64.end(), '_', '/');

    size_t padding = (4 - (base64.size() % 4)) % 4;
    base64.append(padding, '=');

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new_mem_buf(base64.data(), static_cast<int>(base64.size()));
    bmem = BIO_push(b64, bmem);
    BIO_set_flags(bmem, BIO_FLAGS_BASE64_NO_NL);

    std::vector<char> buffer(base64.size());
    int decoded_size = BIO_read(bmem, buffer.data(), static_cast<int>(buffer.size()));
    BIO_free_all(bmem);

    if (decoded_size <= 0) {
        return std::nullopt;
    }

    return std::string(buffer.data(), static_cast<size_t>(decoded_size));
}

std::string random_bytes(size_t count) {
    std::string bytes(count, '\0');
    if (count == 0) {
        return bytes;
    }
    if (RAND_bytes(reinterpret_cast<unsigned char*>(bytes.data()), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes;
}

std::string generate_token(size_t num_bytes) {
    return base64url_encode(random_bytes(num_bytes));
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// TokenCipher
// ============================================================================

std::string_view to_string(DecryptError error) noexcept {
    switch (error) {
        case DecryptError::Malformed:
            return "malformed token";
        case DecryptError::Truncated:
            return "truncated token";
        case DecryptError::UnsupportedVersion:
            return "unsupported token version";
        case DecryptError::AuthenticationFailed:
            return "token authentication failed";
    }
    return "unknown";
}

TokenCipher::TokenCipher(std::string_view secret) {
    if (secret.empty()) {
        throw std::invalid_argument("TokenCipher secret must not be empty");
    }

    unsigned int digest_len = 0;
    if (EVP_Digest(secret.data(), secret.size(), key_.data(), &digest_len, EVP_sha256(),
                   nullptr) != 1 ||
        digest_len != kKeySize) {
        throw std::runtime_error("SHA-256 key derivation failed");
    }
}

TokenCipher TokenCipher::with_random_key() {
    TokenCipher cipher;
    if (RAND_bytes(cipher.key_.data(), static_cast<int>(cipher.key_.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return cipher;
}

std::string TokenCipher::encrypt(std::string_view plaintext) const {
    const unsigned char version = kFormatVersion;
    std::string nonce = random_bytes(kNonceSize);

    auto ctx = new_cipher_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(),
                           reinterpret_cast<const unsigned char*>(nonce.data())) != 1) {
        throw std::runtime_error("AES-256-GCM encrypt init failed");
    }

    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, &version, 1) != 1) {
        throw std::runtime_error("AES-256-GCM AAD failed");
    }

    std::string sealed;
    sealed.resize(kHeaderSize + plaintext.size() + kTagSize);
    sealed[0] = static_cast<char>(version);
    std::copy(nonce.begin(), nonce.end(), sealed.begin() + 1);

    auto* out = reinterpret_cast<unsigned char*>(sealed.data()) + kHeaderSize;
    int written = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out, &len,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            throw std::runtime_error("AES-256-GCM encrypt failed");
        }
        written = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), out + written, &len) != 1) {
        throw std::runtime_error("AES-256-GCM finalize failed");
    }
    written += len;

    auto* tag = out + written;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag) !=
        1) {
        throw std::runtime_error("AES-256-GCM tag extraction failed");
    }

    sealed.resize(kHeaderSize + static_cast<size_t>(written) + kTagSize);
    return base64url_encode(sealed);
}

DecryptResult TokenCipher::decrypt(std::string_view token) const {
    auto decoded = base64url_decode(token);
    if (!decoded) {
        return DecryptResult::failure(DecryptError::Malformed);
    }

    const std::string& sealed = *decoded;
    if (sealed.size() < kMinTokenSize) {
        return DecryptResult::failure(DecryptError::Truncated);
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(sealed.data());
    if (bytes[0] != kFormatVersion) {
        return DecryptResult::failure(DecryptError::UnsupportedVersion);
    }

    const unsigned char* nonce = bytes + 1;
    const unsigned char* ciphertext = bytes + kHeaderSize;
    const size_t ciphertext_len = sealed.size() - kMinTokenSize;
    const unsigned char* tag = ciphertext + ciphertext_len;

    // Any OpenSSL failure below is reported as AuthenticationFailed
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        return DecryptResult::failure(DecryptError::AuthenticationFailed);
    }

    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, bytes, 1) != 1) {
        return DecryptResult::failure(DecryptError::AuthenticationFailed);
    }

    std::string plaintext(ciphertext_len, '\0');
    int written = 0;
    if (ciphertext_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len,
                              ciphertext, static_cast<int>(ciphertext_len)) != 1) {
            return DecryptResult::failure(DecryptError::AuthenticationFailed);
        }
        written = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize),
                            const_cast<unsigned char*>(tag)) != 1) {
        return DecryptResult::failure(DecryptError::AuthenticationFailed);
    }

    // Tag verification happens here
    if (EVP_DecryptFinal_ex(ctx.get(),
                            reinterpret_cast<unsigned char*>(plaintext.data()) + written,
                            &len) != 1) {
        return DecryptResult::failure(DecryptError::AuthenticationFailed);
    }
    written += len;

    plaintext.resize(static_cast<size_t>(written));
    return DecryptResult::success(std::move(plaintext));
}

}  // namespace weft::core
