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

// Weft HTTP Cookies - Header
// Cookie request header parsing and Set-Cookie serialization (RFC 6265)

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/containers.hpp"
#include "http.hpp"

namespace weft::http {

/// SameSite attribute
enum class SameSite : uint8_t { None, Lax, Strict };

[[nodiscard]] std::string_view to_string(SameSite same_site) noexcept;

/// Parse "Lax" / "Strict" / "None" (case-insensitive)
[[nodiscard]] std::optional<SameSite> parse_same_site(std::string_view value) noexcept;

/// Cookie to send in a Set-Cookie header
struct SetCookie {
    std::string name;
    std::string value;
    std::string path = "/";
    std::optional<int64_t> max_age;  // seconds
    bool secure = false;
    bool http_only = true;
    SameSite same_site = SameSite::Lax;

    /// Serialize to a Set-Cookie header value
    [[nodiscard]] std::string to_header_value() const;
};

/// Cookies sent by the client (name -> value)
using CookieMap = core::fast_map<std::string, std::string>;

/// Parse a Cookie header value ("a=1; b=2"). Malformed pairs are skipped;
/// the first occurrence of a name wins.
[[nodiscard]] CookieMap parse_cookie_header(std::string_view header);

/// Look up one cookie across all Cookie headers of a request
[[nodiscard]] std::optional<std::string> get_cookie(const Request& request, std::string_view name);

}  // namespace weft::http
