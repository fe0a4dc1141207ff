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
 * @file components.hpp
 * @brief Log levels and per-component level filtering
 *
 * A component is a wise_enum enumeration naming the parts of a library
 * that log. Each enumeration gets its own level table, so the monitor can
 * raise the verbosity of one area (say, persistence) without flooding the
 * log with per-signal traces from the rest.
 */

#ifndef WFMON_LOG_COMPONENTS_HPP
#define WFMON_LOG_COMPONENTS_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <string_view>
#include <unordered_map>

#include <wise_enum.h>

namespace wfmon::log {

/**
 * Severity levels, from most verbose to most severe
 */
enum class LogLevel {
    Trace,   //!< Per-signal tracing
    Debug,   //!< Debug messages
    Info,    //!< Informational messages
    Notice,  //!< Notable but expected conditions
    Warn,    //!< Input anomalies and degraded collaborators
    Error,   //!< Failed operations
    Critical //!< Conditions that stop a workflow
};

} // namespace wfmon::log

// Adapted at global scope so wise_enum finds it through ADL
WISE_ENUM_ADAPT(wfmon::log::LogLevel, Trace, Debug, Info, Notice, Warn, Error, Critical)

namespace wfmon::log {

/**
 * Level a component starts with before it is registered
 */
LogLevel get_logger_default_level();

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * Declare a log component enumeration
 *
 * Enumerators must be contiguous from zero, which WISE_ENUM_CLASS
 * guarantees when no explicit values are given.
 *
 * @param ComponentType Name of the enumeration
 * @param ... Component names
 */
#define DECLARE_LOG_COMPONENT(ComponentType, ...) WISE_ENUM_CLASS(ComponentType, __VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)

namespace detail {

/**
 * Level table of one component enumeration
 *
 * Built on first use. Entries are atomics so a level can be changed
 * from a control thread while other threads log.
 */
template <typename ComponentType> class ComponentLevelTable final {
public:
    static constexpr std::size_t SIZE = ::wise_enum::size<ComponentType>;

    static ComponentLevelTable &instance() {
        static ComponentLevelTable table;
        return table;
    }

    [[nodiscard]] LogLevel level(const ComponentType component) const noexcept {
        const auto slot = index(component);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return slot < SIZE ? levels_[slot].load(std::memory_order_relaxed) : fallback_;
    }

    void set(const ComponentType component, const LogLevel level) noexcept {
        if (const auto slot = index(component); slot < SIZE) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
            levels_[slot].store(level, std::memory_order_relaxed);
        }
    }

    void set_all(const LogLevel level) noexcept {
        for (auto &entry : levels_) {
            entry.store(level, std::memory_order_relaxed);
        }
    }

    ~ComponentLevelTable() = default;
    ComponentLevelTable(const ComponentLevelTable &) = delete;
    ComponentLevelTable &operator=(const ComponentLevelTable &) = delete;
    ComponentLevelTable(ComponentLevelTable &&) = delete;
    ComponentLevelTable &operator=(ComponentLevelTable &&) = delete;

private:
    ComponentLevelTable() : fallback_{get_logger_default_level()} { set_all(fallback_); }

    static constexpr std::size_t index(const ComponentType component) noexcept {
        return static_cast<std::size_t>(component);
    }

    std::array<std::atomic<LogLevel>, SIZE> levels_{};
    LogLevel fallback_;
};

} // namespace detail

/**
 * Whether a message of the given level passes the component's filter
 */
template <typename ComponentType>
[[nodiscard]] bool component_enabled(const ComponentType component, const LogLevel message_level) {
    return message_level >= detail::ComponentLevelTable<ComponentType>::instance().level(component);
}

/**
 * Display name of a component, "UNKNOWN" for values outside the enumeration
 */
template <typename ComponentType>
constexpr std::string_view component_name(const ComponentType component) {
    const auto name = ::wise_enum::to_string(component);
    return name.empty() ? std::string_view{"UNKNOWN"} : std::string_view{name.data(), name.size()};
}

/**
 * Register components with individual levels
 *
 * Components missing from the map keep their current level.
 *
 * @tparam ComponentType Component enumeration
 * @param[in] component_levels Level per component
 */
template <typename ComponentType>
void register_component(const std::unordered_map<ComponentType, LogLevel> &component_levels) {
    auto &table = detail::ComponentLevelTable<ComponentType>::instance();
    for (const auto &[component, level] : component_levels) {
        table.set(component, level);
    }
}

/**
 * Register every component of an enumeration at one level
 *
 * @tparam ComponentType Component enumeration
 * @param[in] level Level for all components
 */
template <typename ComponentType> void register_component(const LogLevel level) {
    detail::ComponentLevelTable<ComponentType>::instance().set_all(level);
}

template <typename ComponentType>
[[nodiscard]] LogLevel get_component_level(const ComponentType component) {
    return detail::ComponentLevelTable<ComponentType>::instance().level(component);
}

} // namespace wfmon::log

#endif // WFMON_LOG_COMPONENTS_HPP
