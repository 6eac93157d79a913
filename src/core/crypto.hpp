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

// Weft Token Cipher - Header
// Authenticated symmetric encryption of opaque tokens (AES-256-GCM via OpenSSL EVP)

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace weft::core {

// ============================================================================
// Encoding and random helpers
// ============================================================================

/// Base64url encode (RFC 4648, no padding)
[[nodiscard]] std::string base64url_encode(std::string_view input);

/// Base64url decode; nullopt on invalid input
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

/// Cryptographically secure random bytes (throws std::runtime_error if the CSPRNG fails)
[[nodiscard]] std::string random_bytes(size_t count);

/// Random URL-safe token carrying `num_bytes` bytes of entropy
[[nodiscard]] std::string generate_token(size_t num_bytes = 32);

/// Constant-time string comparison (length is not secret)
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

// ============================================================================
// Token cipher
// ============================================================================

/// Why a token failed to decrypt
enum class DecryptError : uint8_t {
    Malformed,             // Not base64url
    Truncated,             // Shorter than version + nonce + tag
    UnsupportedVersion,    // Unknown format version byte
    AuthenticationFailed,  // Tampered, or sealed under another key
};

[[nodiscard]] std::string_view to_string(DecryptError error) noexcept;

/// Decryption result
struct DecryptResult {
    bool ok = false;
    std::string plaintext;
    DecryptError error = DecryptError::Malformed;

    [[nodiscard]] static DecryptResult success(std::string plaintext) {
        return {true, std::move(plaintext), DecryptError::Malformed};
    }

    [[nodiscard]] static DecryptResult failure(DecryptError error) { return {false, {}, error}; }

    [[nodiscard]] explicit operator bool() const noexcept { return ok; }
};

/// Seals strings into opaque URL-safe tokens and opens them again.
///
/// Token layout (before base64url):
///   version (1 byte, 0x01) | nonce (12 bytes) | ciphertext | GCM tag (16 bytes)
///
/// The version byte is bound as additional authenticated data, so any
/// modification of the token is reported as AuthenticationFailed.
/// Instances are immutable after construction and safe to share across threads.
class TokenCipher {
public:
    static constexpr uint8_t kFormatVersion = 0x01;
    static constexpr size_t kKeySize = 32;
    static constexpr size_t kNonceSize = 12;
    static constexpr size_t kTagSize = 16;

    /// Derive the key as SHA-256(secret). Throws std::invalid_argument if secret is empty.
    explicit TokenCipher(std::string_view secret);

    /// Cipher keyed with fresh random bytes (tokens do not survive a restart)
    [[nodiscard]] static TokenCipher with_random_key();

    /// Encrypt plaintext. Throws std::runtime_error on an OpenSSL failure.
    [[nodiscard]] std::string encrypt(std::string_view plaintext) const;

    /// Decrypt a token produced by encrypt() under the same key
    [[nodiscard]] DecryptResult decrypt(std::string_view token) const;

private:
    TokenCipher() = default;

    std::array<unsigned char, kKeySize> key_{};
};

}  // namespace weft::core
