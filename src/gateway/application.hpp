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

// Weft Application - Header
// Gateway-facing entry point: routing, middleware pipeline, token helpers

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "../control/config.hpp"
#include "../core/crypto.hpp"
#include "../http/http.hpp"
#include "../session/session_store.hpp"
#include "errors.hpp"
#include "factory.hpp"
#include "pipeline.hpp"
#include "router.hpp"

namespace weft::gateway {

/// One configured application
///
/// Construction validates the configuration, builds the token cipher, the
/// session store and the middleware chain, and throws StartupErrors with every
/// problem found. handle() is thread-safe and never throws for a request.
class Application {
public:
    Application(control::Config config, Router router,
                MiddlewareRegistry registry = MiddlewareRegistry::with_defaults());
    ~Application() = default;

    // Non-copyable, non-movable (contexts point into the router)
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /// Run one request through the pipeline and the matching view
    [[nodiscard]] http::Response handle(http::Request request);

    /// Encrypt with the application secret
    [[nodiscard]] std::string encrypt(std::string_view plaintext) const;

    /// Decrypt a token produced by encrypt()
    [[nodiscard]] core::DecryptResult decrypt(std::string_view token) const;

    /// Live middleware count
    [[nodiscard]] size_t middleware_count() const noexcept { return pipeline_->size(); }

    /// First live middleware of type T (nullptr if none or evicted)
    template <typename T>
    [[nodiscard]] T* find_middleware() const noexcept {
        return pipeline_->find<T>();
    }

    [[nodiscard]] Pipeline& pipeline() noexcept { return *pipeline_; }
    [[nodiscard]] const std::shared_ptr<session::SessionStore>& session_store() const noexcept {
        return store_;
    }
    [[nodiscard]] const Router& router() const noexcept { return router_; }
    [[nodiscard]] const control::Config& config() const noexcept { return config_; }

private:
    /// Invoke the matched view (404/405 when there is none)
    void dispatch(RequestContext& ctx, const RouteMatch& match);

    control::Config config_;
    Router router_;
    MiddlewareRegistry registry_;
    std::shared_ptr<const core::TokenCipher> cipher_;
    std::shared_ptr<session::SessionStore> store_;
    std::unique_ptr<Pipeline> pipeline_;
};

}  // namespace weft::gateway
