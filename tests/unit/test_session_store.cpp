// Weft Session Store Unit Tests

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "../../src/control/config.hpp"
#include "../../src/core/clock.hpp"
#include "../../src/session/memory_session_store.hpp"
#include "../../src/session/session_store.hpp"
#include "../../src/session/sqlite_session_store.hpp"

using namespace weft::session;

namespace {

std::string temp_db_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("weft_" + name + ".db");
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
    return path.string();
}

/// Behaviour every backend must share
void check_store_contract(SessionStore& store) {
    const int64_t before = weft::core::unix_now();

    auto created = store.create();
    REQUIRE(created);
    REQUIRE(created->is_new());
    REQUIRE(created->key().size() >= 32);
    REQUIRE(created->created_at() >= before);
    REQUIRE(created->data().empty());

    // Created sessions are immediately visible
    auto loaded = store.get(created->key());
    REQUIRE(loaded);
    REQUIRE_FALSE(loaded->is_new());
    REQUIRE(loaded->created_at() == created->created_at());

    // Saved data round-trips, creation time is preserved
    loaded->set("visits", 2);
    loaded->set("user", "bob");
    store.save(*loaded);

    auto reloaded = store.get(created->key());
    REQUIRE(reloaded);
    REQUIRE(reloaded->get<int>("visits") == 2);
    REQUIRE(reloaded->get<std::string>("user") == "bob");
    REQUIRE(reloaded->created_at() == created->created_at());

    // Loaded sessions are private copies
    reloaded->set("visits", 99);
    REQUIRE(store.get(created->key())->get<int>("visits") == 2);

    REQUIRE_FALSE(store.get("no-such-key"));

    // Keys are unique
    auto other = store.create();
    REQUIRE(other->key() != created->key());
    REQUIRE(store.size() == 2);
}

}  // namespace

TEST_CASE("Memory session store", "[session][store]") {
    MemorySessionStore store;
    REQUIRE(store.name() == "memory");
    check_store_contract(store);
}

TEST_CASE("SQLite session store", "[session][store][sqlite]") {
    SECTION("in-memory database") {
        SqliteSessionStore store(":memory:");
        REQUIRE(store.name() == "sqlite");
        check_store_contract(store);
    }

    SECTION("file database survives reopening") {
        std::string path = temp_db_path("reopen");
        std::string key;
        {
            SqliteSessionStore store(path, 2);
            auto session = store.create();
            session->set("visits", 5);
            store.save(*session);
            key = session->key();
        }

        SqliteSessionStore reopened(path, 2);
        auto session = reopened.get(key);
        REQUIRE(session);
        REQUIRE(session->get<int>("visits") == 5);
    }

    SECTION("backdated creation time is persisted") {
        SqliteSessionStore store(":memory:");
        auto session = store.create();
        session->set_created_at(session->created_at() - 3600);
        store.save(*session);

        REQUIRE(store.get(session->key())->created_at() == session->created_at());
    }

    SECTION("unopenable database reports StoreError") {
        REQUIRE_THROWS_AS(SqliteSessionStore("/nonexistent-dir/weft/sessions.db"), StoreError);
    }
}

TEST_CASE("Session store factory", "[session][store]") {
    weft::control::SessionConfig config;

    SECTION("memory by default") {
        auto store = make_session_store(config);
        REQUIRE(store);
        REQUIRE(store->name() == "memory");
    }

    SECTION("sqlite when configured") {
        config.store = "sqlite";
        config.database = ":memory:";
        auto store = make_session_store(config);
        REQUIRE(store);
        REQUIRE(store->name() == "sqlite");
    }

    SECTION("unknown backend is rejected") {
        config.store = "redis";
        REQUIRE_THROWS_AS(make_session_store(config), std::invalid_argument);
    }
}

TEST_CASE("Concurrent store access keeps sessions isolated", "[session][store][race]") {
    auto run = [](SessionStore& store) {
        constexpr int num_threads = 8;
        constexpr int iterations = 50;

        std::vector<std::string> keys;
        for (int i = 0; i < num_threads; ++i) {
            keys.push_back(store.create()->key());
        }

        std::vector<std::thread> threads;
        std::atomic<int> failures{0};
        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i < iterations; ++i) {
                    auto session = store.get(keys[t]);
                    if (!session) {
                        failures.fetch_add(1);
                        continue;
                    }
                    session->set("owner", t);
                    session->set("count", session->get_or<int>("count", 0) + 1);
                    store.save(*session);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures == 0);
        for (int t = 0; t < num_threads; ++t) {
            auto session = store.get(keys[t]);
            REQUIRE(session);
            // One writer per key: no lost updates and no cross-talk
            REQUIRE(session->get<int>("owner") == t);
            REQUIRE(session->get<int>("count") == iterations);
        }
    };

    SECTION("memory") {
        MemorySessionStore store;
        run(store);
    }

    SECTION("sqlite with a connection pool") {
        SqliteSessionStore store(temp_db_path("concurrent"), 4);
        run(store);
    }
}

TEST_CASE("Concurrent creation yields unique keys", "[session][store][race]") {
    MemorySessionStore store;

    constexpr int num_threads = 8;
    constexpr int per_thread = 100;
    std::vector<std::vector<std::string>> keys(num_threads);
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < per_thread; ++i) {
                keys[t].push_back(store.create()->key());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> unique;
    for (const auto& list : keys) {
        unique.insert(list.begin(), list.end());
    }
    REQUIRE(unique.size() == static_cast<size_t>(num_threads * per_thread));
    REQUIRE(store.size() == unique.size());
}
