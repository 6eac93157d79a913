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

// Weft Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace weft::control {

// Validation limits
constexpr size_t MAX_MIDDLEWARE_NAME_LENGTH = 64;
constexpr size_t MAX_MIDDLEWARE_CHAIN_LENGTH = 20;
constexpr size_t MAX_LEVENSHTEIN_DISTANCE = 2;
constexpr size_t MAX_FUZZY_MATCH_CANDIDATES = 3;

// Defaults
constexpr int64_t DEFAULT_SESSION_MAX_AGE = 60 * 60 * 24 * 14;  // 14 days
constexpr int64_t DEFAULT_CSRF_EXPIRY = 60 * 60;                 // 1 hour

/// Session cookie and storage
struct SessionConfig {
    std::string cookie_name = "swsession";
    std::string cookie_path = "/";
    int64_t max_age = DEFAULT_SESSION_MAX_AGE;  // seconds, from creation
    bool secure = false;
    bool http_only = true;
    std::string same_site = "Lax";  // Lax, Strict, None

    std::string store = "memory";                  // memory, sqlite
    std::string database = "weft-sessions.db";     // sqlite only
    uint32_t pool_size = 4;                        // sqlite only
};

/// CSRF protection
struct CsrfConfig {
    int64_t expiry = DEFAULT_CSRF_EXPIRY;       // token lifetime in seconds (negative: always expired)
    std::vector<std::string> trusted_origins;  // Origin values that skip validation
    std::string form_field = "csrf_token";
    std::string header = "X-CSRF-Token";
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";            // debug, info, warning, error
    std::string format = "json";           // json, text, console
    std::string output = "/var/log/weft";  // Log directory ({name}.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Weft configuration
struct Config {
    // Ordered middleware chain (registry names)
    std::vector<std::string> middleware;

    // Token encryption secret (empty: random per process)
    std::string secret_key;

    SessionConfig session;
    CsrfConfig csrf;
    LogConfig logging;

    std::string version = "1.0";
    std::string description;
};

// ============================================================================
// JSON Serialization
// ============================================================================

// Custom from_json functions to handle missing fields with defaults
inline void from_json(const nlohmann::json& j, SessionConfig& s) {
    s.cookie_name = j.value("cookie_name", std::string("swsession"));
    s.cookie_path = j.value("cookie_path", std::string("/"));
    s.max_age = j.value("max_age", DEFAULT_SESSION_MAX_AGE);
    s.secure = j.value("secure", false);
    s.http_only = j.value("http_only", true);
    s.same_site = j.value("same_site", std::string("Lax"));
    s.store = j.value("store", std::string("memory"));
    s.database = j.value("database", std::string("weft-sessions.db"));
    s.pool_size = j.value("pool_size", 4u);
}

inline void to_json(nlohmann::json& j, const SessionConfig& s) {
    j = nlohmann::json{{"cookie_name", s.cookie_name}, {"cookie_path", s.cookie_path},
                       {"max_age", s.max_age},         {"secure", s.secure},
                       {"http_only", s.http_only},     {"same_site", s.same_site},
                       {"store", s.store},             {"database", s.database},
                       {"pool_size", s.pool_size}};
}

inline void from_json(const nlohmann::json& j, CsrfConfig& c) {
    c.expiry = j.value("expiry", DEFAULT_CSRF_EXPIRY);
    c.trusted_origins = j.value("trusted_origins", std::vector<std::string>());
    c.form_field = j.value("form_field", std::string("csrf_token"));
    c.header = j.value("header", std::string("X-CSRF-Token"));
}

inline void to_json(nlohmann::json& j, const CsrfConfig& c) {
    j = nlohmann::json{{"expiry", c.expiry},
                       {"trusted_origins", c.trusted_origins},
                       {"form_field", c.form_field},
                       {"header", c.header}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/weft"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // contains() + get_to() keeps struct defaults for missing sections
    if (j.contains("middleware")) {
        j.at("middleware").get_to(c.middleware);
    }
    c.secret_key = j.value("secret_key", std::string());
    if (j.contains("session")) {
        j.at("session").get_to(c.session);
    }
    if (j.contains("csrf")) {
        j.at("csrf").get_to(c.csrf);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
    c.description = j.value("description", std::string());
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["middleware"] = c.middleware;
    j["secret_key"] = c.secret_key;
    j["session"] = c.session;
    j["csrf"] = c.csrf;
    j["logging"] = c.logging;
    j["version"] = c.version;
    j["description"] = c.description;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    /// Append another result's findings
    void merge(const ValidationResult& other) {
        for (const auto& error : other.errors) {
            add_error(error);
        }
        for (const auto& warning : other.warnings) {
            add_warning(warning);
        }
    }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate value ranges and settings (middleware names are checked by ConfigValidator)
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace weft::control
