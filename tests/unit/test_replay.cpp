// Weft Request Replay Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../../src/gateway/replay.hpp"
#include "test_helpers.hpp"

using namespace weft::gateway;
using weft::http::Method;
using weft::http::Response;
using weft::http::StatusCode;

TEST_CASE("Replay token helpers", "[replay]") {
    SECTION("every placeholder is substituted") {
        REQUIRE(substitute_token("a={{csrf_token}}&b={{csrf_token}}", "T") == "a=T&b=T");
        REQUIRE(substitute_token("no placeholder", "T") == "no placeholder");
        REQUIRE(substitute_token("{{csrf_token}}", "") == "");
    }

    SECTION("token is read from the hidden input") {
        auto token = extract_form_token(R"(<input type="hidden" name="csrf_token" value="abc">)");
        REQUIRE(token == "abc");
        REQUIRE_FALSE(extract_form_token("<p>no form</p>").has_value());
        REQUIRE_FALSE(extract_form_token(R"(name="csrf_token" value="unterminated)").has_value());
    }
}

TEST_CASE("Replay entries are validated", "[replay]") {
    ReplayClient client;
    std::string error;

    SECTION("defaults to GET /") {
        auto request = client.build_request(nlohmann::json::object(), error);
        REQUIRE(request.has_value());
        REQUIRE(request->method == Method::GET);
        REQUIRE(request->path == "/");
        REQUIRE(request->body.empty());
    }

    SECTION("non-object entries are rejected") {
        REQUIRE_FALSE(client.build_request(nlohmann::json("GET /"), error).has_value());
        REQUIRE(error == "request must be a JSON object");
        REQUIRE_FALSE(client.build_request(nlohmann::json::array({1, 2}), error).has_value());
    }

    SECTION("fields of the wrong type are rejected") {
        REQUIRE_FALSE(client.build_request({{"method", 5}}, error).has_value());
        REQUIRE_FALSE(error.empty());

        error.clear();
        REQUIRE_FALSE(client.build_request({{"path", nlohmann::json::array()}}, error).has_value());
        REQUIRE_FALSE(error.empty());

        error.clear();
        REQUIRE_FALSE(client.build_request({{"headers", {{"X-Count", 3}}}}, error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("headers must be an object") {
        REQUIRE_FALSE(client.build_request({{"headers", "Accept: */*"}}, error).has_value());
        REQUIRE(error == "headers must be a JSON object");
    }

    SECTION("unknown method") {
        REQUIRE_FALSE(client.build_request({{"method", "BREW"}}, error).has_value());
        REQUIRE(error == "unknown method 'BREW'");
    }
}

TEST_CASE("Replay client carries cookies and tokens", "[replay]") {
    ReplayClient client;

    Response page(StatusCode::OK, R"(<input type="hidden" name="csrf_token" value="tok">)",
                  "text/html");
    page.add_header("Set-Cookie", "swsession=key1; Path=/; HttpOnly");
    page.add_header("Set-Cookie", "theme=dark");
    client.observe(page);

    REQUIRE(client.last_token() == "tok");
    REQUIRE(client.cookies().size() == 2);

    std::string error;
    auto request = client.build_request(
        {{"method", "POST"},
         {"path", "/form"},
         {"headers", {{"X-CSRF-Token", "{{csrf_token}}"}}},
         {"body", "csrf_token={{csrf_token}}"}},
        error);
    REQUIRE(request.has_value());
    REQUIRE(request->method == Method::POST);
    REQUIRE(request->body == "csrf_token=tok");
    REQUIRE(request->get_header("X-CSRF-Token") == "tok");

    std::string cookie(request->get_header("Cookie"));
    REQUIRE(cookie.find("swsession=key1") != std::string::npos);
    REQUIRE(cookie.find("theme=dark") != std::string::npos);

    // A response without a form keeps the previous token
    client.observe(Response(StatusCode::OK, "done"));
    REQUIRE(client.last_token() == "tok");
}

TEST_CASE("Replay through an application", "[replay][application]") {
    Application app(weft::test::make_test_config(), weft::test::make_test_router());
    ReplayClient client;
    std::string error;

    auto get = client.build_request({{"path", "/form"}}, error);
    REQUIRE(get.has_value());
    client.observe(app.handle(std::move(*get)));
    REQUIRE_FALSE(client.last_token().empty());

    auto post = client.build_request(
        {{"method", "POST"},
         {"path", "/form"},
         {"headers",
          {{"Content-Type", "application/x-www-form-urlencoded"},
           {"X-CSRF-Token", "{{csrf_token}}"}}},
         {"body", "name=bob&csrf_token={{csrf_token}}"}},
        error);
    REQUIRE(post.has_value());

    auto response = app.handle(std::move(*post));
    REQUIRE(response.status == StatusCode::OK);
    REQUIRE(response.body == "Hello bob");
}
