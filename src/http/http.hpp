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

// Weft HTTP - Header
// Request/response value types exchanged with the gateway boundary

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace weft::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP status codes
enum class StatusCode : uint16_t {
    // 2xx Success
    OK = 200,
    Created = 201,
    NoContent = 204,

    // 3xx Redirection
    Found = 302,
    SeeOther = 303,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    PayloadTooLarge = 413,

    // 5xx Server Error
    InternalServerError = 500,
    ServiceUnavailable = 503,
};

/// HTTP header (name-value pair, owned)
struct Header {
    std::string name;
    std::string value;
};

/// HTTP request as delivered by the gateway
struct Request {
    Method method = Method::GET;
    std::string path = "/";  // URI without query string
    std::string query;       // Query string (without '?')
    std::vector<Header> headers;
    std::string body;

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Helper: Append a header (duplicates allowed)
    void add_header(std::string_view name, std::string_view value);

    // Helper: Replace every header with this name by a single one
    void set_header(std::string_view name, std::string_view value);

    /// Content-Length header, falling back to body size when absent or invalid
    [[nodiscard]] size_t content_length() const noexcept;

    /// Media type of Content-Type, lowercased and without parameters
    [[nodiscard]] std::string media_type() const;
};

/// HTTP response returned to the gateway
struct Response {
    StatusCode status = StatusCode::OK;
    std::vector<Header> headers;
    std::string body;

    Response() = default;
    Response(StatusCode code, std::string content, std::string_view content_type = "text/plain")
        : status(code), body(std::move(content)) {
        set_content_type(content_type);
    }

    // Helper: Find header by name (case-insensitive, first match)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Helper: All values of a repeatable header (e.g. Set-Cookie)
    [[nodiscard]] std::vector<std::string_view> get_all_headers(std::string_view name) const;

    // Helper: Append a header (duplicates allowed)
    void add_header(std::string_view name, std::string_view value);

    // Helper: Replace every header with this name by a single one
    void set_header(std::string_view name, std::string_view value);

    // Helper: Remove header by name (case-insensitive)
    // Returns true if header was found and removed
    bool remove_header(std::string_view name);

    // Helper: Set content type
    void set_content_type(std::string_view content_type);

    [[nodiscard]] uint16_t status_code() const noexcept { return static_cast<uint16_t>(status); }
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Safe methods (RFC 9110 section 9.2.1) never change server state
[[nodiscard]] bool is_safe_method(Method method) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace weft::http
