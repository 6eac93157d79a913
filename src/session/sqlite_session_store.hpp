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

// Weft SQLite Session Store - Header
// Sessions persisted in a SQLite table, served from a small connection pool
//
// Schema:
//   sessions(session_key TEXT PRIMARY KEY, data TEXT, created_at INTEGER)

#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "session_store.hpp"

namespace weft::session {

class SqliteSessionStore : public SessionStore {
public:
    /// Open (or create) the database at `path` and ensure the schema exists.
    /// ":memory:" databases are per-connection, so they always use one connection.
    /// Throws StoreError on failure.
    explicit SqliteSessionStore(std::string path, size_t pool_size = 4);
    ~SqliteSessionStore() override = default;

    // Non-copyable, non-movable (owns connections)
    SqliteSessionStore(const SqliteSessionStore&) = delete;
    SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;

    [[nodiscard]] std::shared_ptr<Session> get(const std::string& key) override;
    [[nodiscard]] std::shared_ptr<Session> create() override;
    void save(const Session& session) override;
    [[nodiscard]] size_t size() const override;
    [[nodiscard]] std::string_view name() const override { return "sqlite"; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] size_t pool_size() const noexcept { return pool_size_; }

private:
    using Connection = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;

    /// Borrowed connection, returned to the pool on destruction
    class Lease {
    public:
        Lease(const SqliteSessionStore& store, Connection connection);
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] sqlite3* get() const noexcept { return connection_.get(); }

    private:
        const SqliteSessionStore& store_;
        Connection connection_;
    };

    [[nodiscard]] Lease acquire() const;
    void release(Connection connection) const;
    [[nodiscard]] Connection open_connection() const;

    std::string path_;
    size_t pool_size_;

    mutable std::mutex pool_mutex_;
    mutable std::condition_variable pool_cv_;
    mutable std::vector<Connection> idle_;
    mutable size_t opened_ = 0;
};

}  // namespace weft::session
