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

// Weft Pipeline - Header
// Ordered two-phase middleware chain with eviction of failing middleware

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../http/form.hpp"
#include "../http/http.hpp"
#include "../session/session.hpp"
#include "core/containers.hpp"
#include "errors.hpp"

namespace weft::gateway {

struct Route;

/// Per-request lifecycle
enum class Phase : uint8_t {
    Pending,   // Not started
    Request,   // Request hooks, configured order
    Dispatch,  // Route handler
    Response,  // Response hooks, reverse order
    Done       // Response handed back to the gateway
};

[[nodiscard]] std::string_view to_string(Phase phase) noexcept;

/// Request context (passed through middleware chain and to handlers)
struct RequestContext {
    // Request/Response
    http::Request* request = nullptr;
    http::Response* response = nullptr;

    std::string correlation_id;

    // Routing (nullptr when no route matched the path)
    const Route* route = nullptr;

    Phase phase = Phase::Pending;

    // Attached by session middleware
    std::shared_ptr<session::Session> session;

    // Installed by CSRF middleware; mints a token bound to the current session
    std::function<std::string(const RequestContext&)> csrf_token_minter;

    // Metadata (for middleware communication)
    weft::core::fast_map<std::string, std::string> metadata;

    // Timing
    std::chrono::steady_clock::time_point start_time;

    [[nodiscard]] bool has_session() const noexcept { return session != nullptr; }

    /// Fresh CSRF token for embedding in a form (empty if CSRF middleware is not active)
    [[nodiscard]] std::string csrf_token() const {
        return csrf_token_minter ? csrf_token_minter(*this) : std::string{};
    }

    /// Submitted form fields (parsed from the body on first use)
    [[nodiscard]] const http::FormData& form() {
        if (!form_) {
            form_ = request ? http::parse_form(*request) : http::FormData{};
        }
        return *form_;
    }

    /// Helper: Get metadata
    [[nodiscard]] std::string_view get_metadata(std::string_view key) const {
        auto it = metadata.find(std::string(key));
        return (it != metadata.end()) ? std::string_view(it->second) : std::string_view{};
    }

    /// Helper: Set metadata
    void set_metadata(std::string key, std::string value) {
        metadata[std::move(key)] = std::move(value);
    }

private:
    std::optional<http::FormData> form_;
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Stop pipeline execution (response already set)
    Error      // Error occurred
};

/// Middleware function signature (request phase only)
using MiddlewareFunc = std::function<MiddlewareResult(RequestContext&)>;

/// Middleware base class (Two-Phase: Request + Response)
///
/// Hooks may throw anything; the pipeline then evicts the middleware for the
/// rest of the application's lifetime and carries on with the request.
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase (before dispatch)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_request(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Process response phase (after dispatch, reverse order)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_response(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Inspect the configured chain before any request is served.
    /// `position` is this middleware's index in `chain`.
    virtual void check_startup(const std::vector<const Middleware*>& chain, size_t position,
                               std::vector<StartupIssue>& issues) const {
        (void)chain;
        (void)position;
        (void)issues;
    }

    /// Get middleware name (for logs)
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Middleware type (e.g. "session", "csrf"); empty for custom middleware
    [[nodiscard]] virtual std::string_view type() const { return ""; }
};

/// Middleware pipeline
///
/// Entries are never removed structurally: eviction flips an alive flag under
/// a lock and dead entries are skipped, so concurrent requests can iterate
/// while another request evicts. use() is for setup only and must not race
/// with execution.
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, non-movable (entries hold atomics, shared across requests)
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Add middleware function to pipeline
    void use(MiddlewareFunc func, std::string_view name = "CustomMiddleware");

    /// Execute request phase (configured order)
    [[nodiscard]] MiddlewareResult execute_request(RequestContext& ctx);

    /// Execute response phase (reverse order)
    [[nodiscard]] MiddlewareResult execute_response(RequestContext& ctx);

    /// Run every middleware's startup check against the configured chain
    [[nodiscard]] std::vector<StartupIssue> check_startup() const;

    /// Live (non-evicted) middleware count
    [[nodiscard]] size_t size() const noexcept { return live_count_.load(); }

    /// Configured middleware count, evicted entries included
    [[nodiscard]] size_t configured_size() const noexcept { return entries_.size(); }

    /// Names of live middleware in configured order
    [[nodiscard]] std::vector<std::string> live_names() const;

    /// First live middleware of the given type (nullptr if none)
    [[nodiscard]] Middleware* find_by_type(std::string_view type) const noexcept;

    /// First live middleware of class T (nullptr if none)
    template <typename T>
    [[nodiscard]] T* find() const noexcept {
        for (const auto& entry : entries_) {
            if (!entry->alive.load()) {
                continue;
            }
            if (auto* middleware = dynamic_cast<T*>(entry->middleware.get())) {
                return middleware;
            }
        }
        return nullptr;
    }

private:
    struct Entry {
        explicit Entry(std::unique_ptr<Middleware> mw) : middleware(std::move(mw)) {}

        std::unique_ptr<Middleware> middleware;
        std::atomic<bool> alive{true};
    };

    /// Mark an entry dead (first caller wins) and log why
    void evict(Entry& entry, const RequestContext& ctx, std::string_view reason);

    std::vector<std::unique_ptr<Entry>> entries_;
    std::mutex eviction_mutex_;
    std::atomic<size_t> live_count_{0};
};

/// Function middleware wrapper
class FunctionMiddleware : public Middleware {
public:
    explicit FunctionMiddleware(MiddlewareFunc func, std::string name)
        : func_(std::move(func)), name_(std::move(name)) {}

    MiddlewareResult process_request(RequestContext& ctx) override { return func_(ctx); }

    std::string_view name() const override { return name_; }

private:
    MiddlewareFunc func_;
    std::string name_;
};

}  // namespace weft::gateway
