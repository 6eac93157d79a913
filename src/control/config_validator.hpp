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

// Configuration Validator - Middleware Chain Security & Typo Detection

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace weft::control {

/// Validates the configured middleware chain against the names a registry knows
class ConfigValidator {
public:
    /// Validate configuration; `known_middleware` lists every resolvable name
    [[nodiscard]] static ValidationResult validate(const Config& config,
                                                   const std::vector<std::string>& known_middleware);

    /// Empty if `name` is an acceptable middleware identifier, else the reason
    [[nodiscard]] static std::string check_middleware_name(std::string_view name);

private:
    /// Validate middleware references (security checks, detect typos)
    static void validate_middleware_references(const Config& config,
                                               const std::vector<std::string>& known_middleware,
                                               ValidationResult& result);

    /// Warn when the same middleware appears more than once
    static void validate_middleware_duplicates(const Config& config, ValidationResult& result);

    /// Suggest similar middleware names for typos
    [[nodiscard]] static std::string suggest_similar_middleware(
        const std::vector<std::string>& known_middleware, const std::string& typo);
};

}  // namespace weft::control
