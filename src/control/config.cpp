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

// Weft Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "../http/cookie.hpp"

namespace weft::control {

namespace {

/// Cookie names are RFC 6265 tokens
[[nodiscard]] bool is_cookie_token(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc >= 0x7F) {
            return false;
        }
        if (std::string_view("()<>@,;:\\\"/[]?={}").find(c) != std::string_view::npos) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool has_control_chars(std::string_view value) {
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);

    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Session settings
    const auto& session = config.session;
    if (!is_cookie_token(session.cookie_name)) {
        result.add_error("Session cookie_name '" + session.cookie_name +
                         "' is not a valid cookie name");
    }

    if (session.cookie_path.empty() || session.cookie_path.front() != '/' ||
        has_control_chars(session.cookie_path) ||
        session.cookie_path.find(';') != std::string::npos) {
        result.add_error("Session cookie_path must start with '/' and contain no ';'");
    }

    if (session.max_age <= 0) {
        result.add_error("Session max_age must be > 0");
    }

    auto same_site = http::parse_same_site(session.same_site);
    if (!same_site) {
        result.add_error("Session same_site must be one of Lax, Strict, None (got '" +
                         session.same_site + "')");
    } else if (*same_site == http::SameSite::None && !session.secure) {
        result.add_warning("Session same_site=None forces the Secure cookie attribute");
    }

    if (session.store != "memory" && session.store != "sqlite") {
        result.add_error("Session store must be 'memory' or 'sqlite' (got '" + session.store +
                         "')");
    }

    if (session.store == "sqlite") {
        if (session.database.empty()) {
            result.add_error("Session database path cannot be empty for the sqlite store");
        }
        if (session.pool_size == 0) {
            result.add_error("Session pool_size must be > 0");
        }
    }

    // CSRF settings
    const auto& csrf = config.csrf;
    if (csrf.form_field.empty()) {
        result.add_error("CSRF form_field cannot be empty");
    }

    if (csrf.header.empty() || !is_cookie_token(csrf.header)) {
        result.add_error("CSRF header '" + csrf.header + "' is not a valid header name");
    }

    if (csrf.expiry < 0) {
        result.add_warning("CSRF expiry is negative: every token will be rejected");
    }

    for (const auto& origin : csrf.trusted_origins) {
        if (origin.empty()) {
            result.add_error("CSRF trusted_origins cannot contain empty entries");
        } else if (origin == "*") {
            result.add_error("CSRF trusted_origins does not support '*'");
        } else if (has_control_chars(origin)) {
            result.add_error("CSRF trusted origin contains control characters");
        }
    }

    // Secret
    if (config.secret_key.empty()) {
        result.add_warning(
            "No secret_key configured: a random key is used and CSRF tokens do not survive a "
            "restart");
    }

    // Logging
    const auto& logging = config.logging;
    if (logging.format != "json" && logging.format != "text" && logging.format != "console") {
        result.add_error("Logging format must be 'json', 'text' or 'console' (got '" +
                         logging.format + "')");
    }

    if (logging.format != "console" && logging.output.empty()) {
        result.add_error("Logging output directory cannot be empty");
    }

    if (logging.level != "debug" && logging.level != "info" && logging.level != "warning" &&
        logging.level != "warn" && logging.level != "error") {
        result.add_warning("Unknown logging level '" + logging.level + "', using info");
    }

    // Middleware chain shape (names are checked by ConfigValidator)
    if (config.middleware.empty()) {
        result.add_warning("No middleware configured");
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

}  // namespace weft::control
