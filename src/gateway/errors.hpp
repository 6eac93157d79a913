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

// Weft Startup Errors
// Configuration problems collected while building an Application

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace weft::gateway {

enum class StartupErrorCode : uint8_t {
    SessionMiddlewareNotFound,   // CSRF configured without session middleware
    SessionMiddlewareBelowCsrf,  // Session middleware listed after CSRF middleware
    UnknownMiddleware,           // Name not in the middleware registry
    InvalidConfiguration,        // Value rejected by config validation
    StoreUnavailable,            // Session store could not be opened
};

[[nodiscard]] constexpr std::string_view to_string(StartupErrorCode code) noexcept {
    switch (code) {
        case StartupErrorCode::SessionMiddlewareNotFound:
            return "SESSION_MIDDLEWARE_NOT_FOUND";
        case StartupErrorCode::SessionMiddlewareBelowCsrf:
            return "SESSION_MIDDLEWARE_BELOW_CSRF";
        case StartupErrorCode::UnknownMiddleware:
            return "UNKNOWN_MIDDLEWARE";
        case StartupErrorCode::InvalidConfiguration:
            return "INVALID_CONFIGURATION";
        case StartupErrorCode::StoreUnavailable:
            return "STORE_UNAVAILABLE";
    }
    return "UNKNOWN";
}

/// One problem found at startup
struct StartupIssue {
    StartupErrorCode code;
    std::string source;  // Middleware or config section that reported it
    std::string message;
};

/// Thrown by the Application constructor; carries every issue found
class StartupErrors : public std::runtime_error {
public:
    explicit StartupErrors(std::vector<StartupIssue> issues)
        : std::runtime_error(format(issues)), issues_(std::move(issues)) {}

    [[nodiscard]] const std::vector<StartupIssue>& issues() const noexcept { return issues_; }

    [[nodiscard]] bool contains(StartupErrorCode code) const noexcept {
        for (const auto& issue : issues_) {
            if (issue.code == code) {
                return true;
            }
        }
        return false;
    }

private:
    static std::string format(const std::vector<StartupIssue>& issues) {
        std::string message = "Application failed to start:";
        for (const auto& issue : issues) {
            message += "\n  [";
            message += to_string(issue.code);
            message += "] ";
            message += issue.source;
            message += ": ";
            message += issue.message;
        }
        return message;
    }

    std::vector<StartupIssue> issues_;
};

}  // namespace weft::gateway
