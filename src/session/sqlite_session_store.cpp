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

// Weft SQLite Session Store - Implementation

#include "sqlite_session_store.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "core/clock.hpp"
#include "core/logging.hpp"

namespace weft::session {

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS sessions ("
    "session_key TEXT PRIMARY KEY NOT NULL, "
    "data TEXT NOT NULL DEFAULT '{}', "
    "created_at INTEGER NOT NULL)";

constexpr const char* kSelectSql = "SELECT data, created_at FROM sessions WHERE session_key = ?1";

constexpr const char* kInsertSql =
    "INSERT INTO sessions (session_key, data, created_at) VALUES (?1, '{}', ?2) "
    "ON CONFLICT(session_key) DO NOTHING";

constexpr const char* kUpsertSql =
    "INSERT INTO sessions (session_key, data, created_at) VALUES (?1, ?2, ?3) "
    "ON CONFLICT(session_key) DO UPDATE SET data = excluded.data, "
    "created_at = excluded.created_at";

constexpr const char* kCountSql = "SELECT COUNT(*) FROM sessions";

[[noreturn]] void fail(sqlite3* db, std::string_view what) {
    std::string message =
        fmt::format("{}: {}", what, db ? sqlite3_errmsg(db) : "unknown error");
    LOG_ERROR(logging::get_current_logger(), "Session store error: {}", message);
    throw StoreError(message);
}

void execute(sqlite3* db, const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = fmt::format("SQL failed ({}): {}", sql, error ? error : "unknown");
        sqlite3_free(error);
        LOG_ERROR(logging::get_current_logger(), "Session store error: {}", message);
        throw StoreError(message);
    }
}

[[nodiscard]] Statement prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        fail(db, "Failed to prepare statement");
    }
    return Statement(raw, &sqlite3_finalize);
}

void bind_text(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view value) {
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        fail(db, "Failed to bind text parameter");
    }
}

void bind_int64(sqlite3* db, sqlite3_stmt* stmt, int index, int64_t value) {
    if (sqlite3_bind_int64(stmt, index, value) != SQLITE_OK) {
        fail(db, "Failed to bind int64 parameter");
    }
}

[[nodiscard]] bool is_memory_database(std::string_view path) {
    return path.empty() || path == ":memory:";
}

}  // namespace

// ============================================================================
// Connection pool
// ============================================================================

SqliteSessionStore::Lease::Lease(const SqliteSessionStore& store, Connection connection)
    : store_(store), connection_(std::move(connection)) {}

SqliteSessionStore::Lease::~Lease() {
    store_.release(std::move(connection_));
}

SqliteSessionStore::SqliteSessionStore(std::string path, size_t pool_size)
    : path_(std::move(path)),
      pool_size_(is_memory_database(path_) ? 1 : std::max<size_t>(pool_size, 1)) {
    Connection first = open_connection();
    execute(first.get(), kCreateTableSql);

    {
        std::lock_guard lock(pool_mutex_);
        opened_ = 1;
        idle_.push_back(std::move(first));
    }

    LOG_INFO(logging::get_current_logger(), "SQLite session store opened: path={}, pool_size={}",
             path_.empty() ? ":memory:" : path_, pool_size_);
}

SqliteSessionStore::Connection SqliteSessionStore::open_connection() const {
    const std::string target = is_memory_database(path_) ? ":memory:" : path_;

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(target.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    Connection connection(raw, &sqlite3_close);
    if (rc != SQLITE_OK) {
        fail(raw, fmt::format("Can't open database '{}'", target));
    }

    sqlite3_busy_timeout(connection.get(), kBusyTimeoutMs);
    if (!is_memory_database(path_)) {
        execute(connection.get(), "PRAGMA journal_mode = WAL;");
        execute(connection.get(), "PRAGMA synchronous = NORMAL;");
    }

    return connection;
}

SqliteSessionStore::Lease SqliteSessionStore::acquire() const {
    std::unique_lock lock(pool_mutex_);
    pool_cv_.wait(lock, [this] { return !idle_.empty() || opened_ < pool_size_; });

    if (!idle_.empty()) {
        Connection connection = std::move(idle_.back());
        idle_.pop_back();
        return Lease(*this, std::move(connection));
    }

    // Grow the pool; open outside the lock
    ++opened_;
    lock.unlock();
    try {
        return Lease(*this, open_connection());
    } catch (const StoreError&) {
        lock.lock();
        --opened_;
        pool_cv_.notify_one();
        throw;
    }
}

void SqliteSessionStore::release(Connection connection) const {
    if (!connection) {
        return;
    }
    {
        std::lock_guard lock(pool_mutex_);
        idle_.push_back(std::move(connection));
    }
    pool_cv_.notify_one();
}

// ============================================================================
// SessionStore operations
// ============================================================================

std::shared_ptr<Session> SqliteSessionStore::get(const std::string& key) {
    Lease lease = acquire();
    sqlite3* db = lease.get();

    Statement stmt = prepare(db, kSelectSql);
    bind_text(db, stmt.get(), 1, key);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return nullptr;
    }
    if (rc != SQLITE_ROW) {
        fail(db, "Failed to load session");
    }

    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
    const int text_len = sqlite3_column_bytes(stmt.get(), 0);
    const int64_t created_at = sqlite3_column_int64(stmt.get(), 1);

    std::string_view raw = text ? std::string_view(text, static_cast<size_t>(text_len))
                                : std::string_view("{}");
    auto data = nlohmann::json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (data.is_discarded()) {
        LOG_WARNING(logging::get_current_logger(),
                    "Discarding unreadable session payload: session_key_prefix={}",
                    key.substr(0, 8));
        data = nlohmann::json::object();
    }

    return std::make_shared<Session>(key, created_at, std::move(data));
}

std::shared_ptr<Session> SqliteSessionStore::create() {
    Lease lease = acquire();
    sqlite3* db = lease.get();
    const int64_t now = core::unix_now();

    while (true) {
        std::string key = generate_session_key();

        Statement stmt = prepare(db, kInsertSql);
        bind_text(db, stmt.get(), 1, key);
        bind_int64(db, stmt.get(), 2, now);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            fail(db, "Failed to create session");
        }
        if (sqlite3_changes(db) == 1) {
            return std::make_shared<Session>(std::move(key), now, nlohmann::json::object(),
                                             /*is_new=*/true);
        }
        // Key already taken: draw again
    }
}

void SqliteSessionStore::save(const Session& session) {
    Lease lease = acquire();
    sqlite3* db = lease.get();

    Statement stmt = prepare(db, kUpsertSql);
    bind_text(db, stmt.get(), 1, session.key());
    bind_text(db, stmt.get(), 2, session.data().dump());
    bind_int64(db, stmt.get(), 3, session.created_at());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail(db, "Failed to save session");
    }
}

size_t SqliteSessionStore::size() const {
    Lease lease = acquire();
    sqlite3* db = lease.get();

    Statement stmt = prepare(db, kCountSql);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        fail(db, "Failed to count sessions");
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace weft::session
