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

// Gateway Component Factory - Header
// Middleware registry and pipeline construction from configuration

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../core/crypto.hpp"
#include "../session/session_store.hpp"
#include "core/containers.hpp"
#include "csrf_middleware.hpp"
#include "pipeline.hpp"
#include "session_middleware.hpp"

namespace weft::gateway {

/// Shared components handed to middleware factories
struct BuildContext {
    const control::Config& config;
    std::shared_ptr<session::SessionStore> store;
    std::shared_ptr<const core::TokenCipher> cipher;
};

/// Maps configuration names to middleware factories
class MiddlewareRegistry {
public:
    using Factory = std::function<std::unique_ptr<Middleware>(const BuildContext&)>;

    /// Register (or replace) a factory under `name`
    void register_factory(std::string name, Factory factory);

    /// Build the middleware registered under `name` (nullptr if unknown)
    [[nodiscard]] std::unique_ptr<Middleware> create(std::string_view name,
                                                     const BuildContext& ctx) const;

    [[nodiscard]] bool contains(std::string_view name) const;

    /// Registered names, sorted
    [[nodiscard]] std::vector<std::string> names() const;

    /// Registry with the built-in session and CSRF middleware and their aliases
    [[nodiscard]] static MiddlewareRegistry with_defaults();

private:
    weft::core::fast_map<std::string, Factory> factories_;
};

/// Build session middleware settings from configuration
[[nodiscard]] SessionMiddleware::Config build_session_config(const control::SessionConfig& config);

/// Build CSRF middleware settings from configuration
[[nodiscard]] CsrfMiddleware::Config build_csrf_config(const control::CsrfConfig& config);

/// Build middleware pipeline from configuration
/// Throws std::invalid_argument for a name the registry does not know
[[nodiscard]] std::unique_ptr<Pipeline> build_pipeline(const control::Config& config,
                                                       const MiddlewareRegistry& registry,
                                                       const BuildContext& ctx);

}  // namespace weft::gateway
