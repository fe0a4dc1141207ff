/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


/**
 * @file event.hpp
 * @brief Normalized event handed to the event sink
 */

#ifndef WFMON_MONITOR_EVENT_HPP
#define WFMON_MONITOR_EVENT_HPP

#include <concepts>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace wfmon::monitor {

/**
 * Named event with flat string fields
 *
 * Fields are kept sorted by key so that two projections of the same
 * transition compare equal.
 */
struct Event final {
    std::string name;                          //!< Event name, e.g. "job_inst.main.end"
    std::map<std::string, std::string> fields; //!< Field name to value

    Event() = default;
    explicit Event(std::string event_name) : name{std::move(event_name)} {}

    /**
     * Set a string field
     *
     * @param[in] key Field name
     * @param[in] value Field value
     * @return Reference to this event for chaining
     */
    Event &set(const std::string &key, std::string value) {
        fields.insert_or_assign(key, std::move(value));
        return *this;
    }

    /**
     * Set an integral field
     */
    template <std::integral T> Event &set(const std::string &key, const T value) {
        return set(key, std::to_string(value));
    }

    /**
     * Set a floating point field using the shortest round-trip form
     */
    Event &set(const std::string &key, const double value) {
        return set(key, std::format("{}", value));
    }

    /**
     * Set a field only when a value is present
     */
    template <typename T> Event &set_if(const std::string &key, const std::optional<T> &value) {
        if (value.has_value()) {
            set(key, *value);
        }
        return *this;
    }

    /**
     * Look up a field
     *
     * @param[in] key Field name
     * @return Field value, or nullopt if absent
     */
    [[nodiscard]] std::optional<std::string_view> get(const std::string &key) const {
        const auto it = fields.find(key);
        if (it == fields.end()) {
            return std::nullopt;
        }
        return std::string_view{it->second};
    }

    [[nodiscard]] bool has(const std::string &key) const { return fields.contains(key); }

    bool operator==(const Event &other) const = default;
};

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_EVENT_HPP
