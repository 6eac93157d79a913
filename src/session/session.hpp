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

// Weft Session - Header
// Per-client key/value state identified by an opaque session key

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace weft::session {

/// One client session.
///
/// The payload is a JSON object. `created_at` is fixed when the session is
/// issued and is not touched by mutations; expiry is measured from it.
class Session {
public:
    Session(std::string key, int64_t created_at, nlohmann::json data = nlohmann::json::object(),
            bool is_new = false);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] int64_t created_at() const noexcept { return created_at_; }
    [[nodiscard]] const nlohmann::json& data() const noexcept { return data_; }

    /// Issued during the current request
    [[nodiscard]] bool is_new() const noexcept { return is_new_; }

    /// Payload changed since load or last save
    [[nodiscard]] bool is_modified() const noexcept { return modified_; }

    /// Expired iff now - created_at >= max_age
    [[nodiscard]] bool is_expired(int64_t now, int64_t max_age) const noexcept {
        return now - created_at_ >= max_age;
    }

    /// Typed read; nullopt when absent or of another type
    template <typename T>
    [[nodiscard]] std::optional<T> get(const std::string& name) const {
        auto it = data_.find(name);
        if (it == data_.end()) {
            return std::nullopt;
        }
        try {
            return it->template get<T>();
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    template <typename T>
    [[nodiscard]] T get_or(const std::string& name, T default_value) const {
        return get<T>(name).value_or(std::move(default_value));
    }

    void set(const std::string& name, nlohmann::json value);

    [[nodiscard]] bool contains(const std::string& name) const;

    /// Returns true if the entry existed
    bool erase(const std::string& name);

    void clear();

    [[nodiscard]] std::vector<std::string> names() const;

    /// Persistence layers only: rewrite the creation time of a stored row
    void set_created_at(int64_t created_at) noexcept { created_at_ = created_at; }

    /// Called once the session has been persisted (SessionMiddleware response phase)
    void mark_saved() noexcept {
        modified_ = false;
        is_new_ = false;
    }

private:
    std::string key_;
    int64_t created_at_;
    nlohmann::json data_;
    bool is_new_;
    bool modified_ = false;
};

}  // namespace weft::session
