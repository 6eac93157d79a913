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

// Weft HTTP - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace weft::http {

namespace {

const Header* find_in(const std::vector<Header>& headers, std::string_view name) noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

bool remove_from(std::vector<Header>& headers, std::string_view name) {
    auto it = std::remove_if(headers.begin(), headers.end(),
                             [name](const Header& h) { return header_name_equals(h.name, name); });
    if (it == headers.end()) {
        return false;
    }
    headers.erase(it, headers.end());
    return true;
}

}  // namespace

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Request::add_header(std::string_view name, std::string_view value) {
    headers.push_back(Header{std::string(name), std::string(value)});
}

void Request::set_header(std::string_view name, std::string_view value) {
    remove_from(headers, name);
    add_header(name, value);
}

size_t Request::content_length() const noexcept {
    auto value = get_header("Content-Length");
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
        return body.size();
    }
    return length;
}

std::string Request::media_type() const {
    std::string_view content_type = get_header("Content-Type");
    size_t semi = content_type.find(';');
    if (semi != std::string_view::npos) {
        content_type = content_type.substr(0, semi);
    }
    while (!content_type.empty() && content_type.back() == ' ') {
        content_type.remove_suffix(1);
    }

    std::string result(content_type);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Response helper methods

const Header* Response::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

std::vector<std::string_view> Response::get_all_headers(std::string_view name) const {
    std::vector<std::string_view> values;
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            values.emplace_back(header.value);
        }
    }
    return values;
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.push_back(Header{std::string(name), std::string(value)});
}

void Response::set_header(std::string_view name, std::string_view value) {
    remove_from(headers, name);
    add_header(name, value);
}

bool Response::remove_header(std::string_view name) {
    return remove_from(headers, name);
}

void Response::set_content_type(std::string_view content_type) {
    set_header("Content-Type", content_type);
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::Created:
            return "Created";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::Found:
            return "Found";
        case StatusCode::SeeOther:
            return "See Other";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
    }
    return "Unknown";
}

bool is_safe_method(Method method) noexcept {
    switch (method) {
        case Method::GET:
        case Method::HEAD:
        case Method::OPTIONS:
        case Method::TRACE:
            return true;
        default:
            return false;
    }
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

}  // namespace weft::http
