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

// Weft Router - Header
// Exact-path route table with per-route method lists and CSRF exemption

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "../http/http.hpp"
#include "core/containers.hpp"

namespace weft::gateway {

struct RequestContext;

/// View handler: builds the response for a matched route
using Handler = std::function<http::Response(RequestContext&)>;

/// Route definition
struct Route {
    std::string path;                   // Exact request path (e.g., "/form")
    std::vector<http::Method> methods;  // Allowed methods (empty = any)
    Handler handler;
    bool csrf_exempt = false;  // Skip CSRF validation for this route
    std::string name;          // For logs (defaults to path)

    [[nodiscard]] bool allows(http::Method method) const noexcept;
};

/// Match result from router
struct RouteMatch {
    const Route* route = nullptr;
    http::StatusCode status = http::StatusCode::NotFound;  // OK, NotFound or MethodNotAllowed

    [[nodiscard]] bool matched() const noexcept { return route != nullptr && status == http::StatusCode::OK; }
};

/// Router with exact path matching
class Router {
public:
    Router() = default;
    ~Router() = default;

    // Non-copyable, movable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
    Router(Router&&) noexcept = default;
    Router& operator=(Router&&) noexcept = default;

    /// Add a route (replaces an existing route with the same path)
    void add_route(Route route);

    /// Find the route for a method and path.
    /// A known path with a disallowed method reports MethodNotAllowed and
    /// still carries the route so the caller can build an Allow header.
    [[nodiscard]] RouteMatch match(http::Method method, std::string_view path) const;

    [[nodiscard]] size_t size() const noexcept { return routes_.size(); }

    /// Clear all routes
    void clear() { routes_.clear(); }

private:
    weft::core::fast_map<std::string, Route> routes_;
};

/// Route builder (fluent API)
class RouteBuilder {
public:
    explicit RouteBuilder(std::string path) { route_.path = std::move(path); }

    RouteBuilder& method(http::Method m) {
        route_.methods.push_back(m);
        return *this;
    }

    RouteBuilder& handler(Handler h) {
        route_.handler = std::move(h);
        return *this;
    }

    RouteBuilder& csrf_exempt(bool exempt = true) {
        route_.csrf_exempt = exempt;
        return *this;
    }

    RouteBuilder& name(std::string n) {
        route_.name = std::move(n);
        return *this;
    }

    Route build() && { return std::move(route_); }

private:
    Route route_;
};

/// Comma-separated method list for an Allow header
[[nodiscard]] std::string allow_header_value(const Route& route);

}  // namespace weft::gateway
