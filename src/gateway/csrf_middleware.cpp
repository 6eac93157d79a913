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

// Weft CSRF Middleware - Implementation

#include "csrf_middleware.hpp"

#include <charconv>
#include <stdexcept>

#include "../core/clock.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "router.hpp"

namespace weft::gateway {

namespace {

/// Host part of an origin ("https://example.com" -> "example.com")
std::string_view strip_scheme(std::string_view origin) {
    auto pos = origin.find("://");
    return pos == std::string_view::npos ? origin : origin.substr(pos + 3);
}

}  // namespace

CsrfMiddleware::CsrfMiddleware(Config config, std::shared_ptr<const core::TokenCipher> cipher)
    : config_(std::move(config)), cipher_(std::move(cipher)), expiry_(config_.expiry) {
    if (!cipher_) {
        throw std::invalid_argument("CsrfMiddleware requires a token cipher");
    }
}

std::string CsrfMiddleware::mint_token(std::string_view session_key) const {
    std::string plaintext = core::generate_token(16);
    plaintext += kFieldSeparator;
    plaintext += session_key;
    plaintext += kFieldSeparator;
    plaintext += std::to_string(core::unix_now());
    return cipher_->encrypt(plaintext);
}

std::string CsrfMiddleware::check_token(std::string_view token, std::string_view session_key,
                                        int64_t now) const {
    auto decrypted = cipher_->decrypt(token);
    if (!decrypted) {
        return std::string("decryption failed: ") + std::string(core::to_string(decrypted.error));
    }

    auto parts = core::split(decrypted.plaintext, kFieldSeparator);
    if (parts.size() != 3) {
        return "malformed token payload";
    }

    if (!core::constant_time_equals(parts[1], session_key)) {
        return "token bound to another session";
    }

    int64_t issued_at = 0;
    const auto& issued = parts[2];
    auto [ptr, ec] = std::from_chars(issued.data(), issued.data() + issued.size(), issued_at);
    if (ec != std::errc{} || ptr != issued.data() + issued.size()) {
        return "malformed issue time";
    }

    if (now - issued_at >= expiry_.load()) {
        return "token expired";
    }

    return "";
}

bool CsrfMiddleware::is_trusted_origin(std::string_view origin) const {
    if (origin.empty()) {
        return false;
    }

    for (const auto& trusted : config_.trusted_origins) {
        if (origin == trusted) {
            return true;
        }
        // Bare host entries also match the scheme-qualified origin
        if (trusted.find("://") == std::string::npos && strip_scheme(origin) == trusted) {
            return true;
        }
    }
    return false;
}

MiddlewareResult CsrfMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    // Views mint tokens through the context
    ctx.csrf_token_minter = [this](const RequestContext& c) -> std::string {
        if (!c.session) {
            return {};
        }
        return mint_token(c.session->key());
    };

    if (ctx.route && ctx.route->csrf_exempt) {
        return MiddlewareResult::Continue;
    }

    if (http::is_safe_method(ctx.request->method)) {
        return MiddlewareResult::Continue;
    }

    if (is_trusted_origin(ctx.request->get_header("Origin"))) {
        return MiddlewareResult::Continue;
    }

    if (!ctx.session) {
        return reject(ctx, "no session attached to request");
    }

    const auto& form = ctx.form();
    auto field = form.find(config_.form_field);
    if (field == form.end() || field->second.empty()) {
        return reject(ctx, "missing form token");
    }

    std::string_view header_token = ctx.request->get_header(config_.header);
    if (header_token.empty()) {
        return reject(ctx, "missing header token");
    }

    if (!core::constant_time_equals(field->second, header_token)) {
        return reject(ctx, "form and header tokens differ");
    }

    std::string reason = check_token(field->second, ctx.session->key(), core::unix_now());
    if (!reason.empty()) {
        return reject(ctx, reason);
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult CsrfMiddleware::reject(RequestContext& ctx, std::string_view reason) const {
    LOG_WARNING(logging::get_current_logger(),
                "CSRF validation failed: reason={}, method={}, path={}, correlation_id={}",
                reason, http::to_string(ctx.request->method), ctx.request->path,
                ctx.correlation_id);

    *ctx.response = http::Response(http::StatusCode::Forbidden, std::string(kInvalidTokenBody));
    return MiddlewareResult::Stop;
}

void CsrfMiddleware::check_startup(const std::vector<const Middleware*>& chain, size_t position,
                                   std::vector<StartupIssue>& issues) const {
    for (size_t i = 0; i < chain.size(); ++i) {
        if (chain[i]->type() != "session") {
            continue;
        }
        if (i > position) {
            issues.push_back({StartupErrorCode::SessionMiddlewareBelowCsrf, std::string(name()),
                              "SessionMiddleware must be listed before CsrfMiddleware"});
        }
        return;
    }

    issues.push_back({StartupErrorCode::SessionMiddlewareNotFound, std::string(name()),
                      "CsrfMiddleware requires SessionMiddleware"});
}

std::string csrf_hidden_input(const RequestContext& ctx, std::string_view field) {
    std::string html = "<input type=\"hidden\" name=\"";
    html += core::html_escape(field);
    html += "\" value=\"";
    html += core::html_escape(ctx.csrf_token());
    html += "\">";
    return html;
}

}  // namespace weft::gateway
