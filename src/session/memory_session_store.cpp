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

// Weft In-Memory Session Store - Implementation

#include "memory_session_store.hpp"

#include <functional>

#include "core/clock.hpp"

namespace weft::session {

MemorySessionStore::Shard& MemorySessionStore::shard_for(const std::string& key) {
    return shards_[std::hash<std::string>{}(key) % kShardCount];
}

std::shared_ptr<Session> MemorySessionStore::get(const std::string& key) {
    Shard& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);

    auto it = shard.records.find(key);
    if (it == shard.records.end()) {
        return nullptr;
    }
    // Callers get a private copy; mutations reach the store only through save()
    return std::make_shared<Session>(key, it->second.created_at, it->second.data);
}

std::shared_ptr<Session> MemorySessionStore::create() {
    const int64_t now = core::unix_now();

    while (true) {
        std::string key = generate_session_key();
        Shard& shard = shard_for(key);
        std::lock_guard lock(shard.mutex);

        bool inserted =
            shard.records.try_emplace(key, Record{nlohmann::json::object(), now}).second;
        if (inserted) {
            return std::make_shared<Session>(std::move(key), now, nlohmann::json::object(),
                                             /*is_new=*/true);
        }
        // 256-bit collision: draw again
    }
}

void MemorySessionStore::save(const Session& session) {
    Shard& shard = shard_for(session.key());
    std::lock_guard lock(shard.mutex);

    shard.records.insert_or_assign(session.key(), Record{session.data(), session.created_at()});
}

size_t MemorySessionStore::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard.mutex);
        total += shard.records.size();
    }
    return total;
}

}  // namespace weft::session
