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

// Weft Pipeline - Implementation

#include "pipeline.hpp"

#include "../core/logging.hpp"

namespace weft::gateway {

std::string_view to_string(Phase phase) noexcept {
    switch (phase) {
        case Phase::Pending:
            return "pending";
        case Phase::Request:
            return "request";
        case Phase::Dispatch:
            return "dispatch";
        case Phase::Response:
            return "response";
        case Phase::Done:
            return "done";
    }
    return "unknown";
}

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    entries_.push_back(std::make_unique<Entry>(std::move(middleware)));
    live_count_.fetch_add(1);
}

void Pipeline::use(MiddlewareFunc func, std::string_view name) {
    use(std::make_unique<FunctionMiddleware>(std::move(func), std::string(name)));
}

void Pipeline::evict(Entry& entry, const RequestContext& ctx, std::string_view reason) {
    std::lock_guard lock(eviction_mutex_);

    // Another request may have evicted it first
    if (!entry.alive.exchange(false)) {
        return;
    }
    live_count_.fetch_sub(1);

    LOG_ERROR(logging::get_current_logger(),
              "Middleware evicted: middleware={}, phase={}, error={}, correlation_id={}, "
              "remaining={}",
              entry.middleware->name(), to_string(ctx.phase), reason, ctx.correlation_id,
              live_count_.load());
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) {
    for (auto& entry : entries_) {
        if (!entry->alive.load()) {
            continue;
        }

        MiddlewareResult result = MiddlewareResult::Continue;
        try {
            result = entry->middleware->process_request(ctx);
        } catch (const std::exception& e) {
            evict(*entry, ctx, e.what());
            continue;
        } catch (...) {
            evict(*entry, ctx, "unknown exception");
            continue;
        }

        if (result == MiddlewareResult::Stop || result == MiddlewareResult::Error) {
            return result;
        }
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult Pipeline::execute_response(RequestContext& ctx) {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        Entry& entry = **it;
        if (!entry.alive.load()) {
            continue;
        }

        MiddlewareResult result = MiddlewareResult::Continue;
        try {
            result = entry.middleware->process_response(ctx);
        } catch (const std::exception& e) {
            evict(entry, ctx, e.what());
            continue;
        } catch (...) {
            evict(entry, ctx, "unknown exception");
            continue;
        }

        if (result == MiddlewareResult::Stop || result == MiddlewareResult::Error) {
            return result;
        }
    }

    return MiddlewareResult::Continue;
}

std::vector<StartupIssue> Pipeline::check_startup() const {
    std::vector<const Middleware*> chain;
    chain.reserve(entries_.size());
    for (const auto& entry : entries_) {
        chain.push_back(entry->middleware.get());
    }

    std::vector<StartupIssue> issues;
    for (size_t i = 0; i < chain.size(); ++i) {
        chain[i]->check_startup(chain, i, issues);
    }
    return issues;
}

std::vector<std::string> Pipeline::live_names() const {
    std::vector<std::string> names;
    for (const auto& entry : entries_) {
        if (entry->alive.load()) {
            names.emplace_back(entry->middleware->name());
        }
    }
    return names;
}

Middleware* Pipeline::find_by_type(std::string_view type) const noexcept {
    for (const auto& entry : entries_) {
        if (entry->alive.load() && entry->middleware->type() == type) {
            return entry->middleware.get();
        }
    }
    return nullptr;
}

}  // namespace weft::gateway
