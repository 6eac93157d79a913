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

// Weft Router - Implementation

#include "router.hpp"

#include <algorithm>

namespace weft::gateway {

bool Route::allows(http::Method method) const noexcept {
    if (methods.empty()) {
        return true;
    }
    // HEAD is served by GET views
    if (method == http::Method::HEAD) {
        return std::find(methods.begin(), methods.end(), http::Method::GET) != methods.end() ||
               std::find(methods.begin(), methods.end(), http::Method::HEAD) != methods.end();
    }
    return std::find(methods.begin(), methods.end(), method) != methods.end();
}

void Router::add_route(Route route) {
    if (route.name.empty()) {
        route.name = route.path;
    }
    std::string key = route.path;
    routes_.insert_or_assign(std::move(key), std::move(route));
}

RouteMatch Router::match(http::Method method, std::string_view path) const {
    auto it = routes_.find(std::string(path));
    if (it == routes_.end()) {
        return {nullptr, http::StatusCode::NotFound};
    }

    if (!it->second.allows(method)) {
        return {&it->second, http::StatusCode::MethodNotAllowed};
    }

    return {&it->second, http::StatusCode::OK};
}

std::string allow_header_value(const Route& route) {
    std::string value;
    for (auto method : route.methods) {
        if (!value.empty()) {
            value += ", ";
        }
        value += http::to_string(method);
    }
    return value;
}

}  // namespace weft::gateway
