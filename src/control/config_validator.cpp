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

// Config Validator - Implementation

#include "config_validator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "../core/containers.hpp"
#include "../core/string_utils.hpp"

namespace weft::control {

std::string ConfigValidator::check_middleware_name(std::string_view name) {
    // Length check (prevent DoS via long names)
    if (name.empty()) {
        return "Middleware name cannot be empty";
    }
    if (name.length() > MAX_MIDDLEWARE_NAME_LENGTH) {
        std::ostringstream msg;
        msg << "Middleware name too long (" << name.length() << " > " << MAX_MIDDLEWARE_NAME_LENGTH
            << " chars)";
        return msg.str();
    }

    // Null byte check (prevent null byte injection)
    if (name.find('\0') != std::string_view::npos) {
        return "Null byte detected";
    }

    // CRLF check (prevent CRLF injection)
    if (name.find('\r') != std::string_view::npos || name.find('\n') != std::string_view::npos) {
        return "Line breaks not allowed (CRLF injection prevention)";
    }

    // Path traversal prevention
    if (name.find("..") != std::string_view::npos) {
        return "Path traversal detected (..)";
    }
    if (name.find("./") != std::string_view::npos || name.find(".\\") != std::string_view::npos) {
        return "Path traversal detected (./)";
    }
    if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) {
        return "Path separators not allowed";
    }

    // Character whitelist: [a-zA-Z0-9_-] plus '.' between segments of a dotted name
    for (size_t i = 0; i < name.length(); ++i) {
        char c = name[i];
        if (c == '.') {
            if (i == 0 || i + 1 == name.length()) {
                return "Dotted names cannot start or end with '.'";
            }
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            std::ostringstream msg;
            msg << "Invalid character '" << c << "' at position " << i
                << " (only alphanumeric, underscore, hyphen and dot allowed)";
            return msg.str();
        }
    }

    return "";
}

ValidationResult ConfigValidator::validate(const Config& config,
                                           const std::vector<std::string>& known_middleware) {
    ValidationResult result;

    validate_middleware_references(config, known_middleware, result);
    validate_middleware_duplicates(config, result);

    return result;
}

void ConfigValidator::validate_middleware_references(
    const Config& config, const std::vector<std::string>& known_middleware,
    ValidationResult& result) {
    // Chain length limit (DoS prevention)
    if (config.middleware.size() > MAX_MIDDLEWARE_CHAIN_LENGTH) {
        std::ostringstream msg;
        msg << "Middleware chain too long (" << config.middleware.size() << " > "
            << MAX_MIDDLEWARE_CHAIN_LENGTH << ")";
        result.add_error(msg.str());
        return;
    }

    for (size_t i = 0; i < config.middleware.size(); ++i) {
        const auto& middleware_name = config.middleware[i];

        std::string security_error = check_middleware_name(middleware_name);
        if (!security_error.empty()) {
            std::ostringstream msg;
            msg << "Middleware #" << i << ": Invalid middleware name '" << middleware_name
                << "': " << security_error;
            result.add_error(msg.str());
            continue;  // Skip existence check if name is invalid
        }

        bool exists = std::find(known_middleware.begin(), known_middleware.end(),
                                middleware_name) != known_middleware.end();
        if (!exists) {
            std::string suggestion = suggest_similar_middleware(known_middleware, middleware_name);

            std::ostringstream msg;
            msg << "Middleware #" << i << ": Unknown middleware '" << middleware_name << "'";

            if (!suggestion.empty()) {
                msg << ". Did you mean: " << suggestion;
            }

            result.add_error(msg.str());
        }
    }
}

void ConfigValidator::validate_middleware_duplicates(const Config& config,
                                                     ValidationResult& result) {
    weft::core::fast_set<std::string> seen;

    for (const auto& middleware_name : config.middleware) {
        if (!seen.insert(middleware_name).second) {
            std::ostringstream msg;
            msg << "Middleware '" << middleware_name
                << "' is listed more than once; each entry runs as a separate instance";
            result.add_warning(msg.str());
        }
    }
}

std::string ConfigValidator::suggest_similar_middleware(
    const std::vector<std::string>& known_middleware, const std::string& typo) {
    // Limit typo length to bound fuzzy matching cost
    if (typo.length() > MAX_MIDDLEWARE_NAME_LENGTH) {
        return "";
    }

    std::vector<std::string> similar =
        weft::core::find_similar_strings(typo, known_middleware, MAX_LEVENSHTEIN_DISTANCE);

    if (similar.size() > MAX_FUZZY_MATCH_CANDIDATES) {
        similar.resize(MAX_FUZZY_MATCH_CANDIDATES);
    }

    return weft::core::join(similar, ", ");
}

}  // namespace weft::control
