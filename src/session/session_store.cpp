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

// Weft Session Store - Factory

#include "session_store.hpp"

#include "control/config.hpp"
#include "core/crypto.hpp"
#include "memory_session_store.hpp"
#include "sqlite_session_store.hpp"

namespace weft::session {

std::string generate_session_key() {
    return core::generate_token(32);
}

std::shared_ptr<SessionStore> make_session_store(const control::SessionConfig& config) {
    if (config.store == "memory") {
        return std::make_shared<MemorySessionStore>();
    }
    if (config.store == "sqlite") {
        return std::make_shared<SqliteSessionStore>(config.database, config.pool_size);
    }
    throw std::invalid_argument("Unknown session store '" + config.store + "'");
}

}  // namespace weft::session
