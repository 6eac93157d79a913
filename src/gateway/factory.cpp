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

// Gateway Component Factory - Implementation

#include "factory.hpp"

#include <algorithm>
#include <stdexcept>

namespace weft::gateway {

void MiddlewareRegistry::register_factory(std::string name, Factory factory) {
    factories_.insert_or_assign(std::move(name), std::move(factory));
}

std::unique_ptr<Middleware> MiddlewareRegistry::create(std::string_view name,
                                                       const BuildContext& ctx) const {
    auto it = factories_.find(std::string(name));
    if (it == factories_.end()) {
        return nullptr;
    }
    return it->second(ctx);
}

bool MiddlewareRegistry::contains(std::string_view name) const {
    return factories_.contains(std::string(name));
}

std::vector<std::string> MiddlewareRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

MiddlewareRegistry MiddlewareRegistry::with_defaults() {
    MiddlewareRegistry registry;

    Factory session_factory = [](const BuildContext& ctx) -> std::unique_ptr<Middleware> {
        return std::make_unique<SessionMiddleware>(build_session_config(ctx.config.session),
                                                   ctx.store);
    };
    Factory csrf_factory = [](const BuildContext& ctx) -> std::unique_ptr<Middleware> {
        return std::make_unique<CsrfMiddleware>(build_csrf_config(ctx.config.csrf), ctx.cipher);
    };

    // Short ids plus dotted aliases
    registry.register_factory("session", session_factory);
    registry.register_factory("weft.middleware.SessionMiddleware", session_factory);
    registry.register_factory("csrf", csrf_factory);
    registry.register_factory("weft.middleware.CsrfMiddleware", csrf_factory);

    return registry;
}

SessionMiddleware::Config build_session_config(const control::SessionConfig& config) {
    SessionMiddleware::Config result;
    result.cookie_name = config.cookie_name;
    result.cookie_path = config.cookie_path;
    result.max_age = config.max_age;
    result.secure = config.secure;
    result.http_only = config.http_only;
    // ConfigLoader::validate rejects unknown values; fall back to the default here
    result.same_site = http::parse_same_site(config.same_site).value_or(http::SameSite::Lax);
    return result;
}

CsrfMiddleware::Config build_csrf_config(const control::CsrfConfig& config) {
    CsrfMiddleware::Config result;
    result.expiry = config.expiry;
    result.trusted_origins = config.trusted_origins;
    result.form_field = config.form_field;
    result.header = config.header;
    return result;
}

std::unique_ptr<Pipeline> build_pipeline(const control::Config& config,
                                         const MiddlewareRegistry& registry,
                                         const BuildContext& ctx) {
    auto pipeline = std::make_unique<Pipeline>();

    // Order matters: request hooks run in configured order, response hooks in reverse
    for (const auto& name : config.middleware) {
        auto middleware = registry.create(name, ctx);
        if (!middleware) {
            throw std::invalid_argument("Unknown middleware: " + name);
        }
        pipeline->use(std::move(middleware));
    }

    return pipeline;
}

}  // namespace weft::gateway
