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

// Weft - Main Entry Point
// Validates a configuration by building the application and optionally
// replays a list of requests through the demo views.

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/string_utils.hpp"
#include "gateway/application.hpp"
#include "gateway/csrf_middleware.hpp"
#include "gateway/replay.hpp"

namespace {

weft::gateway::Router build_demo_router() {
    using weft::gateway::RequestContext;
    using weft::gateway::RouteBuilder;
    using weft::http::Method;
    using weft::http::Response;
    using weft::http::StatusCode;

    weft::gateway::Router router;

    // Visit counter kept in the session
    router.add_route(RouteBuilder("/")
                         .method(Method::GET)
                         .handler([](RequestContext& ctx) {
                             if (!ctx.session) {
                                 return Response(StatusCode::OK, "0");
                             }
                             int64_t visits = ctx.session->get_or<int64_t>("visits", 0);
                             ctx.session->set("visits", visits + 1);
                             return Response(StatusCode::OK, std::to_string(visits));
                         })
                         .build());

    // Form round trip protected by CSRF
    router.add_route(
        RouteBuilder("/form")
            .method(Method::GET)
            .method(Method::POST)
            .handler([](RequestContext& ctx) {
                if (ctx.request->method == Method::POST) {
                    auto name = ctx.form().find("name");
                    std::string value = name != ctx.form().end() ? name->second : "";
                    return Response(StatusCode::OK, "Hello, " + weft::core::html_escape(value),
                                    "text/html");
                }
                std::string html = "<form method=\"post\" action=\"/form\">";
                html += "<input type=\"text\" name=\"name\">";
                html += weft::gateway::csrf_hidden_input(ctx);
                html += "</form>";
                return Response(StatusCode::OK, std::move(html), "text/html");
            })
            .build());

    // JSON echo without CSRF protection
    router.add_route(RouteBuilder("/api/echo")
                         .method(Method::POST)
                         .csrf_exempt()
                         .handler([](RequestContext& ctx) {
                             nlohmann::json body = nlohmann::json::object();
                             for (const auto& [key, value] : ctx.form()) {
                                 body[key] = value;
                             }
                             return Response(StatusCode::OK, body.dump(), "application/json");
                         })
                         .build());

    return router;
}

/// Replay a JSON array of requests, carrying cookies and the last form token forward
int replay(weft::gateway::Application& app, const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        fprintf(stderr, "Cannot open replay file %s\n", path.c_str());
        return EXIT_FAILURE;
    }

    nlohmann::json requests = nlohmann::json::parse(file, nullptr, false);
    if (requests.is_discarded() || !requests.is_array()) {
        fprintf(stderr, "Replay file must contain a JSON array of requests\n");
        return EXIT_FAILURE;
    }

    weft::gateway::ReplayClient client;

    for (size_t i = 0; i < requests.size(); ++i) {
        std::string error;
        auto request = client.build_request(requests[i], error);
        if (!request) {
            fprintf(stderr, "Request #%zu: %s\n", i, error.c_str());
            return EXIT_FAILURE;
        }

        std::string method(weft::http::to_string(request->method));
        std::string target = request->path;

        auto response = app.handle(std::move(*request));
        client.observe(response);

        printf("#%zu %s %s -> %u\n%s\n\n", i, method.c_str(), target.c_str(),
               response.status_code(), response.body.c_str());
    }

    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    printf("Weft v0.1.0\n\n");

    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json> [--replay <requests.json>]\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    std::optional<std::string> replay_path;

    for (int i = 3; i < argc; ++i) {
        if (std::string(argv[i]) == "--replay" && i + 1 < argc) {
            replay_path = argv[++i];
        } else {
            fprintf(stderr, "Unknown argument: %s\n", argv[i]);
            return EXIT_FAILURE;
        }
    }

    printf("Loading configuration from %s...\n", config_path.c_str());
    auto config = weft::control::ConfigLoader::load_from_file(config_path);
    if (!config) {
        fprintf(stderr, "Failed to load configuration\n");
        return EXIT_FAILURE;
    }

    weft::logging::init_logging_system();
    weft::logging::init_logger(config->logging);

    int exit_code = EXIT_SUCCESS;
    try {
        weft::gateway::Application app(*config, build_demo_router());
        printf("Configuration OK: %zu middleware\n", app.middleware_count());

        if (replay_path) {
            exit_code = replay(app, *replay_path);
        }
    } catch (const weft::gateway::StartupErrors& e) {
        fprintf(stderr, "Application failed to start:\n");
        for (const auto& issue : e.issues()) {
            fprintf(stderr, "  - [%s] %s: %s\n", std::string(to_string(issue.code)).c_str(),
                    issue.source.c_str(), issue.message.c_str());
        }
        exit_code = EXIT_FAILURE;
    }

    weft::logging::shutdown_logging();
    return exit_code;
}
