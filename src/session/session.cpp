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

// Weft Session - Implementation

#include "session.hpp"

namespace weft::session {

Session::Session(std::string key, int64_t created_at, nlohmann::json data, bool is_new)
    : key_(std::move(key)), created_at_(created_at), data_(std::move(data)), is_new_(is_new) {
    // Stored payloads that are not objects (corrupt rows) start empty
    if (!data_.is_object()) {
        data_ = nlohmann::json::object();
    }
}

void Session::set(const std::string& name, nlohmann::json value) {
    data_[name] = std::move(value);
    modified_ = true;
}

bool Session::contains(const std::string& name) const {
    return data_.contains(name);
}

bool Session::erase(const std::string& name) {
    if (data_.erase(name) == 0) {
        return false;
    }
    modified_ = true;
    return true;
}

void Session::clear() {
    if (data_.empty()) {
        return;
    }
    data_ = nlohmann::json::object();
    modified_ = true;
}

std::vector<std::string> Session::names() const {
    std::vector<std::string> result;
    result.reserve(data_.size());
    for (const auto& [name, _] : data_.items()) {
        result.push_back(name);
    }
    return result;
}

}  // namespace weft::session
