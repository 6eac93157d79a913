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

// Weft CSRF Middleware - Header

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/crypto.hpp"
#include "pipeline.hpp"

namespace weft::gateway {

/// Stateless CSRF protection with session-bound encrypted tokens
///
/// A token is encrypt("nonce::session_key::issued_at"). State-changing
/// requests must carry the same token in the form field and the header; it
/// must decrypt, name the current session and be younger than `expiry`.
/// Requires SessionMiddleware earlier in the chain.
class CsrfMiddleware : public Middleware {
public:
    static constexpr std::string_view kInvalidTokenBody = "CSRF token is invalid";
    static constexpr std::string_view kFieldSeparator = "::";

    struct Config {
        int64_t expiry = 60 * 60;                  // seconds (negative: every token expired)
        std::vector<std::string> trusted_origins;  // "https://example.com" or bare "example.com"
        std::string form_field = "csrf_token";
        std::string header = "X-CSRF-Token";
    };

    CsrfMiddleware(Config config, std::shared_ptr<const core::TokenCipher> cipher);
    ~CsrfMiddleware() override = default;

    /// Process request phase (install token minter, validate unsafe methods)
    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;

    /// Require SessionMiddleware before this middleware
    void check_startup(const std::vector<const Middleware*>& chain, size_t position,
                       std::vector<StartupIssue>& issues) const override;

    [[nodiscard]] std::string_view name() const override { return "CsrfMiddleware"; }
    [[nodiscard]] std::string_view type() const override { return "csrf"; }

    /// Mint a token bound to `session_key`, issued now
    [[nodiscard]] std::string mint_token(std::string_view session_key) const;

    /// Empty if `token` is valid for `session_key` at `now`, else the reason
    [[nodiscard]] std::string check_token(std::string_view token, std::string_view session_key,
                                          int64_t now) const;

    /// Is `origin` listed in trusted_origins (with or without scheme)?
    [[nodiscard]] bool is_trusted_origin(std::string_view origin) const;

    /// Change the token lifetime at runtime
    void set_expiry(int64_t seconds) noexcept { expiry_.store(seconds); }
    [[nodiscard]] int64_t expiry() const noexcept { return expiry_.load(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    /// Replace the response with 403 "CSRF token is invalid"
    [[nodiscard]] MiddlewareResult reject(RequestContext& ctx, std::string_view reason) const;

    Config config_;
    std::shared_ptr<const core::TokenCipher> cipher_;
    std::atomic<int64_t> expiry_;
};

/// `<input type="hidden" ...>` carrying a fresh token for the current request
[[nodiscard]] std::string csrf_hidden_input(const RequestContext& ctx,
                                            std::string_view field = "csrf_token");

}  // namespace weft::gateway
