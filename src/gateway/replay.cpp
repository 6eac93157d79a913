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

// Weft Request Replay - Implementation

#include "replay.hpp"

namespace weft::gateway {

std::string substitute_token(std::string value, std::string_view token) {
    for (auto pos = value.find(kReplayTokenPlaceholder); pos != std::string::npos;
         pos = value.find(kReplayTokenPlaceholder, pos + token.size())) {
        value.replace(pos, kReplayTokenPlaceholder.size(), token);
    }
    return value;
}

std::optional<std::string> extract_form_token(std::string_view body, std::string_view field) {
    std::string marker = "name=\"" + std::string(field) + "\" value=\"";
    auto start = body.find(marker);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }
    start += marker.size();
    auto end = body.find('"', start);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(body.substr(start, end - start));
}

std::optional<http::Request> ReplayClient::build_request(const nlohmann::json& entry,
                                                         std::string& error) const {
    if (!entry.is_object()) {
        error = "request must be a JSON object";
        return std::nullopt;
    }

    http::Request request;
    try {
        std::string method = entry.value("method", std::string("GET"));
        request.method = http::parse_method(method);
        if (request.method == http::Method::UNKNOWN) {
            error = "unknown method '" + method + "'";
            return std::nullopt;
        }
        request.path = entry.value("path", std::string("/"));
        request.body = substitute_token(entry.value("body", std::string()), last_token_);

        if (entry.contains("headers")) {
            const auto& headers = entry.at("headers");
            if (!headers.is_object()) {
                error = "headers must be a JSON object";
                return std::nullopt;
            }
            for (const auto& [name, value] : headers.items()) {
                request.add_header(name,
                                   substitute_token(value.get<std::string>(), last_token_));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return std::nullopt;
    }

    if (!cookie_jar_.empty()) {
        std::string cookie_header;
        for (const auto& [name, value] : cookie_jar_) {
            if (!cookie_header.empty()) {
                cookie_header += "; ";
            }
            cookie_header += name + "=" + value;
        }
        request.add_header("Cookie", cookie_header);
    }

    return request;
}

void ReplayClient::observe(const http::Response& response) {
    for (auto set_cookie : response.get_all_headers("Set-Cookie")) {
        auto pair = set_cookie.substr(0, set_cookie.find(';'));
        auto eq = pair.find('=');
        if (eq != std::string_view::npos) {
            cookie_jar_.insert_or_assign(std::string(pair.substr(0, eq)),
                                         std::string(pair.substr(eq + 1)));
        }
    }
    if (auto token = extract_form_token(response.body)) {
        last_token_ = std::move(*token);
    }
}

}  // namespace weft::gateway
