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

// Weft Session Middleware - Header

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "../http/cookie.hpp"
#include "../session/session_store.hpp"
#include "pipeline.hpp"

namespace weft::gateway {

/// Cookie-keyed server-side sessions
///
/// Request phase: load the session named by the cookie, or issue a new one when
/// the cookie is missing, unknown or expired. Response phase: persist the
/// session and refresh the cookie.
class SessionMiddleware : public Middleware {
public:
    struct Config {
        std::string cookie_name = "swsession";
        std::string cookie_path = "/";
        int64_t max_age = 60 * 60 * 24 * 14;  // seconds, from creation
        bool secure = false;
        bool http_only = true;
        http::SameSite same_site = http::SameSite::Lax;
    };

    SessionMiddleware(Config config, std::shared_ptr<session::SessionStore> store);
    ~SessionMiddleware() override = default;

    /// Process request phase (attach session)
    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;

    /// Process response phase (save session, set cookie)
    [[nodiscard]] MiddlewareResult process_response(RequestContext& ctx) override;

    [[nodiscard]] std::string_view name() const override { return "SessionMiddleware"; }
    [[nodiscard]] std::string_view type() const override { return "session"; }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    /// Session named by the request cookie, if it exists and is still valid
    [[nodiscard]] std::shared_ptr<session::Session> load(const RequestContext& ctx);

    Config config_;
    std::shared_ptr<session::SessionStore> store_;
};

}  // namespace weft::gateway
