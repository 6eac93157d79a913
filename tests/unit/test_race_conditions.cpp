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

// Race Condition Tests
// Concurrent requests, shared sessions storage, eviction and token checks

#include <atomic>
#include <barrier>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../src/control/config.hpp"
#include "../../src/control/config_validator.hpp"
#include "../../src/core/clock.hpp"
#include "../../src/gateway/application.hpp"
#include "../../src/gateway/csrf_middleware.hpp"
#include "test_helpers.hpp"

using namespace weft::control;
using namespace weft::gateway;
using weft::test::extract_token;
using weft::test::make_test_config;
using weft::test::make_test_router;
using weft::test::TestClient;

namespace {

/// Request hook that throws every time it runs
class ThrowingMiddleware : public Middleware {
public:
    MiddlewareResult process_request(RequestContext& ctx) override {
        (void)ctx;
        throw std::runtime_error("always fails");
    }

    std::string_view name() const override { return "ThrowingMiddleware"; }
};

}  // namespace

// ============================================================================
// Test 1: Concurrent Validation (Read-Only)
// ============================================================================

TEST_CASE("Concurrent validation of same config (read-only)", "[race][security]") {
    Config config;
    config.middleware = {"session", "csrf", "sesion"};
    const std::vector<std::string> known = MiddlewareRegistry::with_defaults().names();

    constexpr int num_threads = 10;
    constexpr int iterations_per_thread = 100;

    std::vector<std::thread> threads;
    std::atomic<int> expected_count{0};

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < iterations_per_thread; ++j) {
                auto result = ConfigValidator::validate(config, known);
                if (!result.valid && result.errors.size() == 1 &&
                    result.errors[0].find("Did you mean: session") != std::string::npos) {
                    expected_count.fetch_add(1);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(expected_count.load() == num_threads * iterations_per_thread);
}

// ============================================================================
// Test 2: Concurrent Sessions
// ============================================================================

TEST_CASE("Concurrent clients keep independent session counters", "[race][session]") {
    Application app(make_test_config(), make_test_router());

    constexpr int num_threads = 8;
    constexpr int requests_per_thread = 50;

    std::vector<std::thread> threads;
    std::atomic<int> out_of_order{0};
    std::barrier start(num_threads);

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            TestClient client(app);
            start.arrive_and_wait();
            for (int j = 0; j < requests_per_thread; ++j) {
                auto response = client.get("/");
                if (response.body != std::to_string(j)) {
                    out_of_order.fetch_add(1);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(out_of_order.load() == 0);
    REQUIRE(app.session_store()->size() == static_cast<size_t>(num_threads));
}

// ============================================================================
// Test 3: Concurrent Eviction
// ============================================================================

TEST_CASE("Failing middleware is evicted once under concurrent requests", "[race][eviction]") {
    auto registry = MiddlewareRegistry::with_defaults();
    registry.register_factory("throwing", [](const BuildContext&) {
        return std::unique_ptr<Middleware>(new ThrowingMiddleware());
    });

    auto config = make_test_config();
    config.middleware = {"session", "throwing", "csrf"};
    Application app(config, make_test_router(), std::move(registry));
    REQUIRE(app.middleware_count() == 3);

    constexpr int num_threads = 8;
    constexpr int requests_per_thread = 25;

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    std::barrier start(num_threads);

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            TestClient client(app);
            start.arrive_and_wait();
            for (int j = 0; j < requests_per_thread; ++j) {
                auto response = client.get("/");
                if (response.status != weft::http::StatusCode::OK) {
                    failures.fetch_add(1);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(app.middleware_count() == 2);
    REQUIRE(app.pipeline().configured_size() == 3);
    REQUIRE(app.pipeline().live_names() ==
            std::vector<std::string>{"SessionMiddleware", "CsrfMiddleware"});
}

// ============================================================================
// Test 4: Concurrent CSRF Tokens
// ============================================================================

TEST_CASE("Concurrent CSRF token minting and checking", "[race][csrf]") {
    auto cipher = std::make_shared<const weft::core::TokenCipher>("race-secret");
    CsrfMiddleware csrf(CsrfMiddleware::Config{}, cipher);

    constexpr int num_threads = 8;
    constexpr int tokens_per_thread = 100;

    std::vector<std::thread> threads;
    std::atomic<int> accepted{0};
    std::atomic<int> cross_session_rejected{0};

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            std::string own_key = "session-" + std::to_string(i);
            std::string other_key = "session-" + std::to_string((i + 1) % num_threads);
            for (int j = 0; j < tokens_per_thread; ++j) {
                std::string token = csrf.mint_token(own_key);
                int64_t now = weft::core::unix_now();
                if (csrf.check_token(token, own_key, now).empty()) {
                    accepted.fetch_add(1);
                }
                if (csrf.check_token(token, other_key, now) == "token bound to another session") {
                    cross_session_rejected.fetch_add(1);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(accepted.load() == num_threads * tokens_per_thread);
    REQUIRE(cross_session_rejected.load() == num_threads * tokens_per_thread);
}

TEST_CASE("Concurrent CSRF form submissions", "[race][csrf]") {
    Application app(make_test_config(), make_test_router());

    constexpr int num_threads = 8;
    constexpr int posts_per_thread = 20;

    std::vector<std::thread> threads;
    std::atomic<int> greeted{0};

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            TestClient client(app);
            std::string name = "user" + std::to_string(i);
            for (int j = 0; j < posts_per_thread; ++j) {
                std::string token = extract_token(client.get("/form").body);
                auto response = client.post("/form", "name=" + name + "&csrf_token=" + token,
                                            {{"X-CSRF-Token", token}});
                if (response.body == "Hello " + name) {
                    greeted.fetch_add(1);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(greeted.load() == num_threads * posts_per_thread);
}
