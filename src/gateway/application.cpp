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

// Weft Application - Implementation

#include "application.hpp"

#include <chrono>
#include <stdexcept>

#include "../control/config_validator.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace weft::gateway {

namespace {

http::Response make_status_response(http::StatusCode code) {
    return http::Response(code, std::string(http::to_reason_phrase(code)));
}

}  // namespace

Application::Application(control::Config config, Router router, MiddlewareRegistry registry)
    : config_(std::move(config)), router_(std::move(router)), registry_(std::move(registry)) {
    auto* logger = logging::get_current_logger();
    std::vector<StartupIssue> issues;

    // STEP 1: Configuration values
    auto config_result = control::ConfigLoader::validate(config_);
    for (const auto& error : config_result.errors) {
        issues.push_back({StartupErrorCode::InvalidConfiguration, "config", error});
    }
    for (const auto& warning : config_result.warnings) {
        LOG_WARNING(logger, "Configuration warning: {}", warning);
    }

    // STEP 2: Middleware names resolve against the registry
    auto chain_result = control::ConfigValidator::validate(config_, registry_.names());
    for (const auto& error : chain_result.errors) {
        issues.push_back({StartupErrorCode::UnknownMiddleware, "middleware", error});
    }
    for (const auto& warning : chain_result.warnings) {
        LOG_WARNING(logger, "Middleware warning: {}", warning);
    }

    // STEP 3: Token cipher
    try {
        if (config_.secret_key.empty()) {
            cipher_ = std::make_shared<const core::TokenCipher>(core::TokenCipher::with_random_key());
        } else {
            cipher_ = std::make_shared<const core::TokenCipher>(config_.secret_key);
        }
    } catch (const std::exception& e) {
        issues.push_back({StartupErrorCode::InvalidConfiguration, "secret_key", e.what()});
    }

    // STEP 4: Session store (skipped when its settings are already known to be bad)
    if (!config_result.has_errors()) {
        try {
            store_ = session::make_session_store(config_.session);
        } catch (const session::StoreError& e) {
            issues.push_back({StartupErrorCode::StoreUnavailable, "session.store", e.what()});
        } catch (const std::invalid_argument& e) {
            issues.push_back({StartupErrorCode::StoreUnavailable, "session.store", e.what()});
        }
    }

    // STEP 5: Middleware chain and per-middleware startup checks
    if (issues.empty()) {
        BuildContext ctx{config_, store_, cipher_};
        try {
            pipeline_ = build_pipeline(config_, registry_, ctx);
        } catch (const std::invalid_argument& e) {
            issues.push_back({StartupErrorCode::InvalidConfiguration, "middleware", e.what()});
        }

        if (pipeline_) {
            auto startup_issues = pipeline_->check_startup();
            issues.insert(issues.end(), startup_issues.begin(), startup_issues.end());
        }
    }

    if (!issues.empty()) {
        for (const auto& issue : issues) {
            LOG_ERROR(logger, "Startup error: code={}, source={}, message={}",
                      to_string(issue.code), issue.source, issue.message);
        }
        throw StartupErrors(std::move(issues));
    }

    LOG_INFO(logger, "Application ready: middleware=[{}], store={}, routes={}",
             core::join(pipeline_->live_names(), ", "), store_->name(), router_.size());
}

http::Response Application::handle(http::Request request) {
    http::Response response;

    RequestContext ctx;
    ctx.request = &request;
    ctx.response = &response;
    ctx.correlation_id = logging::generate_correlation_id();
    ctx.start_time = std::chrono::steady_clock::now();

    RouteMatch match = router_.match(request.method, request.path);
    ctx.route = match.route;

    // Request phase: configured order
    ctx.phase = Phase::Request;
    MiddlewareResult result = pipeline_->execute_request(ctx);

    if (result == MiddlewareResult::Continue) {
        ctx.phase = Phase::Dispatch;
        dispatch(ctx, match);
    } else if (result == MiddlewareResult::Error && response.status_code() < 400) {
        response = make_status_response(http::StatusCode::InternalServerError);
    }

    // Response phase: reverse order, runs after a Stop as well
    ctx.phase = Phase::Response;
    if (pipeline_->execute_response(ctx) == MiddlewareResult::Error) {
        LOG_WARNING(logging::get_current_logger(),
                    "Response phase reported an error: correlation_id={}", ctx.correlation_id);
    }
    ctx.phase = Phase::Done;

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - ctx.start_time);
    LOG_REQUEST(logging::get_current_logger(), http::to_string(request.method), request.path,
                response.status_code(), duration.count(), ctx.correlation_id);

    return response;
}

void Application::dispatch(RequestContext& ctx, const RouteMatch& match) {
    if (match.status == http::StatusCode::NotFound || !match.route) {
        *ctx.response = make_status_response(http::StatusCode::NotFound);
        return;
    }

    if (match.status == http::StatusCode::MethodNotAllowed) {
        *ctx.response = make_status_response(http::StatusCode::MethodNotAllowed);
        ctx.response->set_header("Allow", allow_header_value(*match.route));
        return;
    }

    if (!match.route->handler) {
        LOG_ERROR_CTX(logging::get_current_logger(), "Route has no handler", ctx.correlation_id,
                      "no_handler", match.route->name);
        *ctx.response = make_status_response(http::StatusCode::InternalServerError);
        return;
    }

    try {
        *ctx.response = match.route->handler(ctx);
    } catch (const std::exception& e) {
        LOG_ERROR_CTX(logging::get_current_logger(), "View failed", ctx.correlation_id,
                      "handler_exception", e.what());
        *ctx.response = make_status_response(http::StatusCode::InternalServerError);
    } catch (...) {
        LOG_ERROR_CTX(logging::get_current_logger(), "View failed", ctx.correlation_id,
                      "handler_exception", "unknown exception");
        *ctx.response = make_status_response(http::StatusCode::InternalServerError);
    }
}

std::string Application::encrypt(std::string_view plaintext) const {
    return cipher_->encrypt(plaintext);
}

core::DecryptResult Application::decrypt(std::string_view token) const {
    return cipher_->decrypt(token);
}

}  // namespace weft::gateway
