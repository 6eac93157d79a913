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

// Weft HTTP Cookies - Implementation

#include "cookie.hpp"

#include <fmt/format.h>

#include "core/string_utils.hpp"

namespace weft::http {

std::string_view to_string(SameSite same_site) noexcept {
    switch (same_site) {
        case SameSite::None:
            return "None";
        case SameSite::Lax:
            return "Lax";
        case SameSite::Strict:
            return "Strict";
    }
    return "Lax";
}

std::optional<SameSite> parse_same_site(std::string_view value) noexcept {
    if (header_name_equals(value, "lax")) {
        return SameSite::Lax;
    }
    if (header_name_equals(value, "strict")) {
        return SameSite::Strict;
    }
    if (header_name_equals(value, "none")) {
        return SameSite::None;
    }
    return std::nullopt;
}

std::string SetCookie::to_header_value() const {
    std::string header = fmt::format("{}={}", name, value);

    if (!path.empty()) {
        header += fmt::format("; Path={}", path);
    }
    if (max_age) {
        header += fmt::format("; Max-Age={}", *max_age);
    }
    // Browsers reject SameSite=None without Secure
    if (secure || same_site == SameSite::None) {
        header += "; Secure";
    }
    if (http_only) {
        header += "; HttpOnly";
    }
    header += fmt::format("; SameSite={}", to_string(same_site));

    return header;
}

CookieMap parse_cookie_header(std::string_view header) {
    CookieMap cookies;

    for (auto pair : core::split(header, ";")) {
        pair = core::trim(pair);
        size_t eq = pair.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            continue;
        }

        auto name = core::trim(pair.substr(0, eq));
        auto value = core::trim(pair.substr(eq + 1));
        if (name.empty()) {
            continue;
        }
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        cookies.try_emplace(std::string(name), std::string(value));
    }

    return cookies;
}

std::optional<std::string> get_cookie(const Request& request, std::string_view name) {
    for (const auto& header : request.headers) {
        if (!header_name_equals(header.name, "Cookie")) {
            continue;
        }
        auto cookies = parse_cookie_header(header.value);
        auto it = cookies.find(std::string(name));
        if (it != cookies.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

}  // namespace weft::http
