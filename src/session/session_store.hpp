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

// Weft Session Store - Header
// Persistence interface for sessions (key -> payload + creation time)

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "session.hpp"

namespace weft::control {
struct SessionConfig;
}

namespace weft::session {

/// Backend failure (I/O, corrupt database, ...)
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Session persistence.
///
/// Implementations must be safe for concurrent use. Operations on different
/// keys must not corrupt each other; concurrent saves of the same key are
/// last-writer-wins. Expiry is the caller's decision: get() returns expired
/// sessions as stored.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    /// Load a session by key (nullptr if unknown)
    [[nodiscard]] virtual std::shared_ptr<Session> get(const std::string& key) = 0;

    /// Issue and persist a fresh session (new random key, created_at = now)
    [[nodiscard]] virtual std::shared_ptr<Session> create() = 0;

    /// Persist payload and creation time (insert or replace)
    virtual void save(const Session& session) = 0;

    /// Number of stored sessions
    [[nodiscard]] virtual size_t size() const = 0;

    /// Backend name (for logs)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// New unguessable session key (256 bits, base64url)
[[nodiscard]] std::string generate_session_key();

/// Build the store selected by configuration ("memory" or "sqlite").
/// Throws StoreError if the backend cannot be opened, std::invalid_argument
/// for an unknown backend name.
[[nodiscard]] std::shared_ptr<SessionStore> make_session_store(const control::SessionConfig& config);

}  // namespace weft::session
