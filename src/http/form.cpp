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

// Weft HTTP Forms - Implementation

#include "form.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

#include "core/string_utils.hpp"

namespace weft::http {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string url_decode(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }

    return out;
}

std::string url_encode(std::string_view input) {
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(input.size() * 3);
    for (char c : input) {
        auto uc = static_cast<unsigned char>(c);
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out += c;
        } else {
            out += '%';
            out += kHex[uc >> 4];
            out += kHex[uc & 0x0F];
        }
    }
    return out;
}

FormData parse_urlencoded(std::string_view body) {
    FormData form;
    if (body.empty()) {
        return form;
    }

    for (auto pair : core::split(body, "&")) {
        if (pair.empty()) {
            continue;
        }
        size_t eq = pair.find('=');
        std::string_view name = pair.substr(0, eq);
        std::string_view value =
            (eq == std::string_view::npos) ? std::string_view{} : pair.substr(eq + 1);

        std::string key = url_decode(name);
        if (key.empty()) {
            continue;
        }
        form.insert_or_assign(std::move(key), url_decode(value));
    }

    return form;
}

FormData parse_json_object(std::string_view body) {
    FormData form;

    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        return form;
    }

    for (const auto& [key, value] : j.items()) {
        if (value.is_string()) {
            form.insert_or_assign(key, value.get<std::string>());
        } else {
            form.insert_or_assign(key, value.dump());
        }
    }

    return form;
}

FormData parse_form(const Request& request) {
    std::string media_type = request.media_type();

    // Bytes past Content-Length are not part of this request
    std::string_view body = request.body;
    body = body.substr(0, std::min(body.size(), request.content_length()));

    if (media_type == "application/x-www-form-urlencoded") {
        return parse_urlencoded(body);
    }
    if (media_type == "application/json") {
        return parse_json_object(body);
    }
    return {};
}

}  // namespace weft::http
