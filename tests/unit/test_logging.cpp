// Weft Logging Unit Tests

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <set>
#include <thread>
#include <vector>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

using namespace weft::logging;

TEST_CASE("Correlation ID generation", "[logging][correlation_id]") {
    SECTION("has a UUID v4 base and a numeric counter") {
        std::string correlation_id = generate_correlation_id();

        REQUIRE(std::count(correlation_id.begin(), correlation_id.end(), '#') == 1);
        REQUIRE(is_valid_uuid(correlation_id));

        size_t hash_pos = correlation_id.find('#');
        std::string uuid_part = correlation_id.substr(0, hash_pos);
        REQUIRE(uuid_part.length() == 36);
        REQUIRE(uuid_part[14] == '4');

        std::string counter_part = correlation_id.substr(hash_pos + 1);
        REQUIRE_FALSE(counter_part.empty());
        REQUIRE(std::all_of(counter_part.begin(), counter_part.end(),
                            [](char c) { return c >= '0' && c <= '9'; }));
    }

    SECTION("same thread shares the base, counter advances") {
        std::string id1 = generate_correlation_id();
        std::string id2 = generate_correlation_id();

        REQUIRE(id1 != id2);
        REQUIRE(id1.substr(0, id1.find('#')) == id2.substr(0, id2.find('#')));
    }

    SECTION("ids from different threads never collide") {
        constexpr int num_threads = 8;
        constexpr int ids_per_thread = 200;

        std::vector<std::vector<std::string>> per_thread(num_threads);
        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([&per_thread, i]() {
                for (int j = 0; j < ids_per_thread; ++j) {
                    per_thread[i].push_back(generate_correlation_id());
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        std::set<std::string> unique;
        for (const auto& ids : per_thread) {
            unique.insert(ids.begin(), ids.end());
        }
        REQUIRE(unique.size() == static_cast<size_t>(num_threads * ids_per_thread));
    }
}

TEST_CASE("UUID validation", "[logging][validation]") {
    SECTION("accepts valid correlation IDs") {
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#999999"));
        REQUIRE(is_valid_uuid("ABCDEF12-3456-4789-ABCD-EF0123456789#42"));
    }

    SECTION("rejects invalid formats") {
        REQUIRE_FALSE(is_valid_uuid(""));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#12a"));
        REQUIRE_FALSE(is_valid_uuid("550e8400e29b41d4a716446655440000#0"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-31d4-a716-446655440000#0"));  // version 3
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-c716-446655440000#0"));  // variant c
        REQUIRE_FALSE(is_valid_uuid("550g8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#42#56"));
    }
}

TEST_CASE("Logger access", "[logging][logger]") {
    SECTION("current logger is available on any thread") {
        REQUIRE(get_current_logger() != nullptr);

        quill::Logger* from_thread = nullptr;
        std::thread worker([&from_thread]() { from_thread = get_current_logger(); });
        worker.join();

        REQUIRE(from_thread != nullptr);
    }

    SECTION("thread override applies only to the calling thread") {
        weft::control::LogConfig config;
        config.level = "debug";
        config.format = "text";
        config.output = "/tmp/weft_tests";
        quill::Logger* audit = init_logger(config, "weft_audit");
        REQUIRE(audit != nullptr);

        // Restore the suite logger as the process default
        quill::Logger* suite = init_logger(config);
        REQUIRE(suite != audit);

        quill::Logger* with_override = nullptr;
        quill::Logger* after_reset = nullptr;
        std::thread worker([&]() {
            set_thread_logger(audit);
            with_override = get_current_logger();
            set_thread_logger(nullptr);
            after_reset = get_current_logger();
        });
        worker.join();

        REQUIRE(with_override == audit);
        REQUIRE(after_reset == suite);
        REQUIRE(get_current_logger() == suite);
    }
}
