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

// Weft Session Middleware - Implementation

#include "session_middleware.hpp"

#include <stdexcept>

#include "../core/clock.hpp"
#include "../core/logging.hpp"

namespace weft::gateway {

SessionMiddleware::SessionMiddleware(Config config, std::shared_ptr<session::SessionStore> store)
    : config_(std::move(config)), store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("SessionMiddleware requires a session store");
    }
}

std::shared_ptr<session::Session> SessionMiddleware::load(const RequestContext& ctx) {
    auto key = http::get_cookie(*ctx.request, config_.cookie_name);
    if (!key || key->empty()) {
        return nullptr;
    }

    auto existing = store_->get(*key);
    if (!existing) {
        return nullptr;
    }

    if (existing->is_expired(core::unix_now(), config_.max_age)) {
        LOG_DEBUG(logging::get_current_logger(),
                  "Session expired: created_at={}, max_age={}, correlation_id={}",
                  existing->created_at(), config_.max_age, ctx.correlation_id);
        return nullptr;
    }

    return existing;
}

MiddlewareResult SessionMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request) {
        return MiddlewareResult::Error;
    }

    auto current = load(ctx);
    if (!current) {
        current = store_->create();
        LOG_DEBUG(logging::get_current_logger(), "Session created: store={}, correlation_id={}",
                  store_->name(), ctx.correlation_id);
    }

    ctx.session = std::move(current);
    return MiddlewareResult::Continue;
}

MiddlewareResult SessionMiddleware::process_response(RequestContext& ctx) {
    if (!ctx.session || !ctx.response) {
        return MiddlewareResult::Continue;
    }

    // Unchanged sessions are already stored as-is
    if (ctx.session->is_new() || ctx.session->is_modified()) {
        store_->save(*ctx.session);
        ctx.session->mark_saved();
    }

    http::SetCookie cookie;
    cookie.name = config_.cookie_name;
    cookie.value = ctx.session->key();
    cookie.path = config_.cookie_path;
    cookie.max_age = config_.max_age;
    cookie.secure = config_.secure;
    cookie.http_only = config_.http_only;
    cookie.same_site = config_.same_site;

    ctx.response->add_header("Set-Cookie", cookie.to_header_value());
    return MiddlewareResult::Continue;
}

}  // namespace weft::gateway
