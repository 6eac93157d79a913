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

// Weft In-Memory Session Store - Header
// Lock-striped map; sessions on different shards never contend

#pragma once

#include <array>
#include <mutex>
#include <string>

#include "core/containers.hpp"
#include "session_store.hpp"

namespace weft::session {

class MemorySessionStore : public SessionStore {
public:
    static constexpr size_t kShardCount = 16;

    MemorySessionStore() = default;
    ~MemorySessionStore() override = default;

    // Non-copyable, non-movable (owns mutexes)
    MemorySessionStore(const MemorySessionStore&) = delete;
    MemorySessionStore& operator=(const MemorySessionStore&) = delete;

    [[nodiscard]] std::shared_ptr<Session> get(const std::string& key) override;
    [[nodiscard]] std::shared_ptr<Session> create() override;
    void save(const Session& session) override;
    [[nodiscard]] size_t size() const override;
    [[nodiscard]] std::string_view name() const override { return "memory"; }

private:
    struct Record {
        nlohmann::json data;
        int64_t created_at = 0;
    };

    struct Shard {
        mutable std::mutex mutex;
        core::fast_map<std::string, Record> records;
    };

    [[nodiscard]] Shard& shard_for(const std::string& key);

    std::array<Shard, kShardCount> shards_;
};

}  // namespace weft::session
