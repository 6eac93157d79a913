// Weft Application Integration Tests
// Full request flow: routing, session and CSRF middleware, eviction, startup errors

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "../../src/core/clock.hpp"
#include "../../src/gateway/application.hpp"
#include "../../src/gateway/csrf_middleware.hpp"
#include "../../src/session/memory_session_store.hpp"
#include "../../src/session/session_store.hpp"
#include "test_helpers.hpp"

using namespace weft::gateway;
using namespace weft::http;
using weft::test::extract_token;
using weft::test::make_test_config;
using weft::test::make_test_router;
using weft::test::TestClient;

namespace {

std::optional<StartupErrors> startup_errors(weft::control::Config config,
                                            MiddlewareRegistry registry =
                                                MiddlewareRegistry::with_defaults()) {
    try {
        Application app(std::move(config), make_test_router(), std::move(registry));
    } catch (const StartupErrors& e) {
        return e;
    }
    return std::nullopt;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

/// Middleware whose hook for one phase always throws
class ExplodingMiddleware : public Middleware {
public:
    explicit ExplodingMiddleware(bool on_request) : on_request_(on_request) {}

    MiddlewareResult process_request(RequestContext& ctx) override {
        (void)ctx;
        if (on_request_) {
            throw std::runtime_error("exploding request hook");
        }
        return MiddlewareResult::Continue;
    }

    MiddlewareResult process_response(RequestContext& ctx) override {
        (void)ctx;
        if (!on_request_) {
            throw std::runtime_error("exploding response hook");
        }
        return MiddlewareResult::Continue;
    }

    std::string_view name() const override {
        return on_request_ ? "ExplodingRequestMiddleware" : "ExplodingResponseMiddleware";
    }

private:
    bool on_request_;
};

/// Store whose writes always fail
class FailingSaveStore : public weft::session::SessionStore {
public:
    std::shared_ptr<weft::session::Session> get(const std::string&) override { return nullptr; }

    std::shared_ptr<weft::session::Session> create() override {
        return std::make_shared<weft::session::Session>(weft::session::generate_session_key(),
                                                        weft::core::unix_now(),
                                                        nlohmann::json::object(), true);
    }

    void save(const weft::session::Session&) override {
        throw weft::session::StoreError("disk full");
    }

    size_t size() const override { return 0; }
    std::string_view name() const override { return "failing"; }
};

/// Memory store that counts writes
class CountingStore : public weft::session::MemorySessionStore {
public:
    void save(const weft::session::Session& session) override {
        saves.fetch_add(1);
        MemorySessionStore::save(session);
    }

    std::atomic<int> saves{0};
};

}  // namespace

// ============================================================================
// Sessions
// ============================================================================

TEST_CASE("Session counter persists across requests", "[application][session]") {
    Application app(make_test_config(), make_test_router());
    TestClient client(app);

    REQUIRE(client.get("/").body == "0");
    REQUIRE(client.get("/").body == "1");
    REQUIRE(client.get("/").body == "2");

    REQUIRE_FALSE(client.cookie("swsession").empty());
    REQUIRE(app.session_store()->size() == 1);
}

TEST_CASE("Session cookie attributes", "[application][session]") {
    auto config = make_test_config();
    config.session.cookie_name = "sid";
    config.session.max_age = 600;
    config.session.secure = true;
    config.session.same_site = "Strict";

    Application app(config, make_test_router());
    TestClient client(app);

    auto response = client.get("/");
    auto cookies = response.get_all_headers("Set-Cookie");
    REQUIRE(cookies.size() == 1);

    std::string header(cookies[0]);
    REQUIRE(header.rfind("sid=" + client.cookie("sid"), 0) == 0);
    REQUIRE(contains(header, "Path=/"));
    REQUIRE(contains(header, "Max-Age=600"));
    REQUIRE(contains(header, "Secure"));
    REQUIRE(contains(header, "HttpOnly"));
    REQUIRE(contains(header, "SameSite=Strict"));
}

TEST_CASE("Expired session is replaced", "[application][session][expiry]") {
    auto config = make_test_config();
    Application app(config, make_test_router());
    TestClient client(app);

    REQUIRE(client.get("/").body == "0");
    REQUIRE(client.get("/").body == "1");
    std::string old_key = client.cookie("swsession");

    // Backdate the stored session by a full lifetime
    auto stored = app.session_store()->get(old_key);
    REQUIRE(stored);
    stored->set_created_at(stored->created_at() - config.session.max_age);
    app.session_store()->save(*stored);

    REQUIRE(client.get("/").body == "0");
    REQUIRE(client.cookie("swsession") != old_key);
}

TEST_CASE("Unknown session key starts a new session", "[application][session]") {
    Application app(make_test_config(), make_test_router());

    Request request;
    request.path = "/";
    request.add_header("Cookie", "swsession=forged-key");
    auto response = app.handle(std::move(request));

    REQUIRE(response.body == "0");
    auto cookies = response.get_all_headers("Set-Cookie");
    REQUIRE(cookies.size() == 1);
    REQUIRE_FALSE(contains(std::string(cookies[0]), "forged-key"));
}

TEST_CASE("Only new or changed sessions are written back", "[application][session]") {
    auto registry = MiddlewareRegistry::with_defaults();
    auto store = std::make_shared<CountingStore>();
    registry.register_factory("session", [store](const BuildContext& ctx) {
        return std::unique_ptr<Middleware>(
            new SessionMiddleware(build_session_config(ctx.config.session), store));
    });

    Application app(make_test_config(), make_test_router(), std::move(registry));
    TestClient client(app);

    // New session: stored once
    client.get("/form");
    REQUIRE(store->saves.load() == 1);
    std::string key = client.cookie("swsession");

    // Untouched session: no write, cookie still refreshed
    auto response = client.get("/form");
    REQUIRE(store->saves.load() == 1);
    REQUIRE(response.get_all_headers("Set-Cookie").size() == 1);
    REQUIRE(client.cookie("swsession") == key);

    // Counter view mutates the session
    REQUIRE(client.get("/").body == "0");
    REQUIRE(store->saves.load() == 2);
    REQUIRE(client.get("/").body == "1");
    REQUIRE(store->saves.load() == 3);
}

TEST_CASE("SQLite-backed sessions", "[application][session][sqlite]") {
    auto config = make_test_config();
    config.session.store = "sqlite";
    config.session.database = ":memory:";

    Application app(config, make_test_router());
    REQUIRE(app.session_store()->name() == "sqlite");

    TestClient client(app);
    REQUIRE(client.get("/").body == "0");
    REQUIRE(client.get("/").body == "1");
}

// ============================================================================
// Eviction
// ============================================================================

TEST_CASE("Exploding middleware is evicted and requests still complete",
          "[application][eviction]") {
    auto registry = MiddlewareRegistry::with_defaults();
    registry.register_factory("explode_request", [](const BuildContext&) {
        return std::unique_ptr<Middleware>(new ExplodingMiddleware(true));
    });
    registry.register_factory("explode_response", [](const BuildContext&) {
        return std::unique_ptr<Middleware>(new ExplodingMiddleware(false));
    });

    auto config = make_test_config();
    config.middleware = {"explode_request", "explode_response"};

    Application app(config, make_test_router(), std::move(registry));
    REQUIRE(app.middleware_count() == 2);

    TestClient client(app);
    REQUIRE(client.get("/").body == "0");
    REQUIRE(app.middleware_count() == 0);

    REQUIRE(client.get("/").body == "0");
    REQUIRE(app.middleware_count() == 0);
}

TEST_CASE("Non-standard exceptions never escape handle()", "[application][eviction]") {
    auto registry = MiddlewareRegistry::with_defaults();
    registry.register_factory("throw_int", [](const BuildContext&) {
        return std::unique_ptr<Middleware>(new FunctionMiddleware(
            [](RequestContext&) -> MiddlewareResult { throw 42; }, "IntThrowMiddleware"));
    });

    auto router = make_test_router();
    router.add_route(RouteBuilder("/raw")
                         .handler([](RequestContext&) -> Response { throw 7; })
                         .build());

    auto config = make_test_config();
    config.middleware = {"session", "throw_int", "csrf"};
    Application app(config, std::move(router), std::move(registry));
    REQUIRE(app.middleware_count() == 3);

    TestClient client(app);
    REQUIRE(client.get("/").body == "0");
    REQUIRE(app.middleware_count() == 2);
    REQUIRE(client.get("/").body == "1");

    auto response = client.get("/raw");
    REQUIRE(response.status == StatusCode::InternalServerError);
    REQUIRE(app.middleware_count() == 2);
}

TEST_CASE("CSRF fails closed once session middleware is evicted", "[application][eviction][csrf]") {
    auto registry = MiddlewareRegistry::with_defaults();
    auto failing_store = std::make_shared<FailingSaveStore>();
    registry.register_factory("session", [failing_store](const BuildContext& ctx) {
        return std::unique_ptr<Middleware>(new SessionMiddleware(
            build_session_config(ctx.config.session), failing_store));
    });

    Application app(make_test_config(), make_test_router(), std::move(registry));
    TestClient client(app);

    // The save in the response phase fails: session middleware is evicted
    auto page = client.get("/form");
    std::string token = extract_token(page.body);
    REQUIRE_FALSE(token.empty());
    REQUIRE(app.middleware_count() == 1);
    REQUIRE(app.find_middleware<SessionMiddleware>() == nullptr);
    REQUIRE(app.find_middleware<CsrfMiddleware>() != nullptr);

    auto response = client.post("/form", "name=bob&csrf_token=" + token, {{"X-CSRF-Token", token}});
    REQUIRE(response.status == StatusCode::Forbidden);
    REQUIRE(contains(response.body, "CSRF token is invalid"));
}

// ============================================================================
// CSRF
// ============================================================================

TEST_CASE("CSRF form round trip", "[application][csrf]") {
    Application app(make_test_config(), make_test_router());
    TestClient client(app);

    auto page = client.get("/form");
    REQUIRE(page.status == StatusCode::OK);
    REQUIRE(contains(page.body, "<form"));
    REQUIRE(contains(page.body, R"(<input type="hidden" name="csrf_token" value=")"));

    std::string token = extract_token(page.body);
    REQUIRE_FALSE(token.empty());

    SECTION("valid token in form and header") {
        auto response =
            client.post("/form", "name=bob&csrf_token=" + token, {{"X-CSRF-Token", token}});
        REQUIRE(response.status == StatusCode::OK);
        REQUIRE(contains(response.body, "bob"));
    }

    SECTION("token is reusable until it expires") {
        REQUIRE(client.post("/form", "name=a&csrf_token=" + token, {{"X-CSRF-Token", token}})
                    .status == StatusCode::OK);
        REQUIRE(client.post("/form", "name=b&csrf_token=" + token, {{"X-CSRF-Token", token}})
                    .status == StatusCode::OK);
    }

    SECTION("garbage token") {
        auto response =
            client.post("/form", "name=bob&csrf_token=bad", {{"X-CSRF-Token", "bad"}});
        REQUIRE(response.status == StatusCode::Forbidden);
        REQUIRE(contains(response.body, "CSRF token is invalid"));
        REQUIRE_FALSE(contains(response.body, "bob"));
    }

    SECTION("well-formed ciphertext with a foreign payload") {
        std::string forged = app.encrypt("nonce::badsession");
        auto response =
            client.post("/form", "name=bob&csrf_token=" + forged, {{"X-CSRF-Token", forged}});
        REQUIRE(contains(response.body, "CSRF token is invalid"));
    }

    SECTION("token from another session") {
        TestClient other(app);
        auto response =
            other.post("/form", "name=bob&csrf_token=" + token, {{"X-CSRF-Token", token}});
        REQUIRE(response.status == StatusCode::Forbidden);
    }

    SECTION("response to a rejected request still carries the session cookie") {
        auto response = client.post("/form", "name=bob");
        REQUIRE(response.status == StatusCode::Forbidden);
        REQUIRE(response.has_header("Set-Cookie"));
    }
}

TEST_CASE("CSRF expiry", "[application][csrf][expiry]") {
    SECTION("negative expiry from configuration") {
        auto config = make_test_config();
        config.csrf.expiry = -1;
        Application app(config, make_test_router());
        TestClient client(app);

        std::string token = extract_token(client.get("/form").body);
        auto response =
            client.post("/form", "name=bob&csrf_token=" + token, {{"X-CSRF-Token", token}});
        REQUIRE(contains(response.body, "CSRF token is invalid"));
    }

    SECTION("expiry changed at runtime") {
        Application app(make_test_config(), make_test_router());
        TestClient client(app);
        std::string token = extract_token(client.get("/form").body);

        auto* csrf = app.find_middleware<CsrfMiddleware>();
        REQUIRE(csrf != nullptr);
        csrf->set_expiry(-1);

        auto response =
            client.post("/form", "name=bob&csrf_token=" + token, {{"X-CSRF-Token", token}});
        REQUIRE(response.status == StatusCode::Forbidden);
    }
}

TEST_CASE("CSRF exempt views", "[application][csrf]") {
    Application app(make_test_config(), make_test_router());
    TestClient client(app);

    REQUIRE(client.post("/exempt", "").status == StatusCode::OK);
    REQUIRE(client.post("/form", "name=bob").status == StatusCode::Forbidden);
}

TEST_CASE("CSRF trusted origins", "[application][csrf][origin]") {
    auto config = make_test_config();
    config.csrf.trusted_origins = {"example.com"};
    Application app(config, make_test_router());
    TestClient client(app);

    auto rejected = client.post("/api", R"({"name": "bob"})", {{"Origin", "notvalid.com"}},
                                "application/json");
    REQUIRE(rejected.status == StatusCode::Forbidden);
    REQUIRE(contains(rejected.body, "CSRF token is invalid"));

    auto accepted = client.post("/api", R"({"name": "bob"})", {{"Origin", "example.com"}},
                                "application/json");
    REQUIRE(accepted.status == StatusCode::OK);
    REQUIRE(accepted.body == R"({"name":"bob"})");
}

TEST_CASE("CSRF token in a JSON body", "[application][csrf]") {
    Application app(make_test_config(), make_test_router());
    TestClient client(app);

    std::string token = extract_token(client.get("/form").body);
    nlohmann::json body = {{"name", "bob"}, {"csrf_token", token}};

    auto response =
        client.post("/api", body.dump(), {{"X-CSRF-Token", token}}, "application/json");
    REQUIRE(response.status == StatusCode::OK);
    REQUIRE(response.body == R"({"name":"bob"})");
}

// ============================================================================
// Startup errors
// ============================================================================

TEST_CASE("Startup errors are grouped and raised at construction", "[application][startup]") {
    SECTION("csrf without session") {
        auto config = make_test_config();
        config.middleware = {"csrf"};

        auto errors = startup_errors(config);
        REQUIRE(errors.has_value());
        REQUIRE(errors->contains(StartupErrorCode::SessionMiddlewareNotFound));
        REQUIRE(contains(errors->what(), "SESSION_MIDDLEWARE_NOT_FOUND"));
    }

    SECTION("csrf above session") {
        auto config = make_test_config();
        config.middleware = {"csrf", "session"};

        auto errors = startup_errors(config);
        REQUIRE(errors.has_value());
        REQUIRE(errors->contains(StartupErrorCode::SessionMiddlewareBelowCsrf));
        REQUIRE(contains(errors->what(), "SESSION_MIDDLEWARE_BELOW_CSRF"));
    }

    SECTION("unknown middleware with suggestion") {
        auto config = make_test_config();
        config.middleware = {"sesion", "csrf"};

        auto errors = startup_errors(config);
        REQUIRE(errors.has_value());
        REQUIRE(errors->contains(StartupErrorCode::UnknownMiddleware));
        REQUIRE(contains(errors->what(), "Did you mean: session"));
    }

    SECTION("every configuration problem is reported together") {
        auto config = make_test_config();
        config.session.max_age = 0;
        config.csrf.form_field = "";

        auto errors = startup_errors(config);
        REQUIRE(errors.has_value());
        REQUIRE(errors->issues().size() >= 2);
        REQUIRE(errors->contains(StartupErrorCode::InvalidConfiguration));
    }

    SECTION("unopenable session database") {
        auto config = make_test_config();
        config.session.store = "sqlite";
        config.session.database = "/nonexistent-dir/weft/sessions.db";

        auto errors = startup_errors(config);
        REQUIRE(errors.has_value());
        REQUIRE(errors->contains(StartupErrorCode::StoreUnavailable));
    }

    SECTION("valid chain with dotted aliases") {
        auto config = make_test_config();
        config.middleware = {"weft.middleware.SessionMiddleware", "weft.middleware.CsrfMiddleware"};
        REQUIRE_FALSE(startup_errors(config).has_value());
    }
}

// ============================================================================
// Routing and dispatch
// ============================================================================

TEST_CASE("Routing outcomes", "[application][router]") {
    Application app(make_test_config(), make_test_router());
    TestClient client(app);

    SECTION("unknown path is 404 and still gets a session") {
        auto response = client.get("/missing");
        REQUIRE(response.status == StatusCode::NotFound);
        REQUIRE(response.has_header("Set-Cookie"));
    }

    SECTION("disallowed method is 405 with Allow") {
        Request request;
        request.method = Method::GET;
        request.path = "/exempt";
        auto response = client.send(std::move(request));
        REQUIRE(response.status == StatusCode::MethodNotAllowed);
        REQUIRE(response.get_header("Allow") == "POST");
    }

    SECTION("throwing view is 500, pipeline still completes") {
        auto response = client.get("/boom");
        REQUIRE(response.status == StatusCode::InternalServerError);
        REQUIRE(response.has_header("Set-Cookie"));
        REQUIRE(app.middleware_count() == 2);
    }
}

TEST_CASE("Application token helpers", "[application][crypto]") {
    Application app(make_test_config(), make_test_router());

    auto result = app.decrypt(app.encrypt("hello"));
    REQUIRE(result);
    REQUIRE(result.plaintext == "hello");

    // Same secret, new application: tokens remain valid
    Application second(make_test_config(), make_test_router());
    REQUIRE(second.decrypt(app.encrypt("hello")));

    REQUIRE_FALSE(app.decrypt("tampered"));
}
