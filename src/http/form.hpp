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

// Weft HTTP Forms - Header
// Submitted form fields from urlencoded or JSON request bodies

#pragma once

#include <string>
#include <string_view>

#include "core/containers.hpp"
#include "http.hpp"

namespace weft::http {

/// Submitted fields (name -> value). Repeated names keep the last value.
using FormData = core::fast_map<std::string, std::string>;

/// Percent-decode; '+' becomes a space. Invalid escapes are kept literally.
[[nodiscard]] std::string url_decode(std::string_view input);

/// Percent-encode everything outside the RFC 3986 unreserved set
[[nodiscard]] std::string url_encode(std::string_view input);

/// Parse an application/x-www-form-urlencoded body or query string
[[nodiscard]] FormData parse_urlencoded(std::string_view body);

/// Parse a JSON object body. String members are taken verbatim, other
/// members in their JSON text form. Anything but an object yields no fields.
[[nodiscard]] FormData parse_json_object(std::string_view body);

/// Parse the request body according to its Content-Type
/// (application/x-www-form-urlencoded or application/json).
/// Only the first Content-Length bytes of the body are read.
[[nodiscard]] FormData parse_form(const Request& request);

}  // namespace weft::http
