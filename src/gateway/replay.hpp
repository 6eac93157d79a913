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

// Weft Request Replay - Header
// Turns a JSON list of requests into Application calls, carrying cookies and
// the last rendered CSRF token between them

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../http/cookie.hpp"
#include "../http/http.hpp"

namespace weft::gateway {

/// Placeholder replaced by the most recently rendered CSRF token
inline constexpr std::string_view kReplayTokenPlaceholder = "{{csrf_token}}";

/// Replace every placeholder in `value` with `token`
[[nodiscard]] std::string substitute_token(std::string value, std::string_view token);

/// Value of the `field` hidden input in a rendered page
[[nodiscard]] std::optional<std::string> extract_form_token(std::string_view body,
                                                            std::string_view field = "csrf_token");

/// Client side of a replay: a cookie jar plus the last form token
class ReplayClient {
public:
    /// Build the request described by one replay entry
    /// ({"method", "path", "headers", "body"}; all optional).
    /// Returns nullopt and sets `error` when the entry is malformed.
    [[nodiscard]] std::optional<http::Request> build_request(const nlohmann::json& entry,
                                                             std::string& error) const;

    /// Remember Set-Cookie values and any rendered CSRF token
    void observe(const http::Response& response);

    [[nodiscard]] const std::string& last_token() const noexcept { return last_token_; }
    [[nodiscard]] const http::CookieMap& cookies() const noexcept { return cookie_jar_; }

private:
    http::CookieMap cookie_jar_;
    std::string last_token_;
};

}  // namespace weft::gateway
