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
 * @file log_macros.hpp
 * @brief Logging macros for the wfmon libraries
 *
 * Two families: WFMON_LOG_* writes to the process logger unconditionally
 * (subject to the logger level), WFMON_LOGC_* first checks the level of a
 * log component and prefixes the message with the component name.
 *
 * @code
 * WFMON_LOGC_WARN(MonitorLog::JobState, "Dropping signal for unknown job {}", name);
 * @endcode
 */

#ifndef WFMON_LOG_LOG_MACROS_HPP
#define WFMON_LOG_LOG_MACROS_HPP

#include <quill/LogMacros.h>

#include "log/components.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#endif

#define WFMON_GET_LOGGER() ::wfmon::log::detail::get_quill_logger()

// Filtered messages cost one relaxed load; arguments are not evaluated
#define WFMON_DETAIL_LOGC(level, quill_macro, component, message, ...)                             \
    do {                                                                                           \
        if (::wfmon::log::component_enabled((component), ::wfmon::log::LogLevel::level)) {         \
            quill_macro(                                                                           \
                    WFMON_GET_LOGGER(),                                                            \
                    "[{}] " message,                                                               \
                    ::wfmon::log::component_name(component),                                       \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

/**
 * Make a value type loggable, formatted on the backend thread
 *
 * The object is copied into the queue, so it must own all of its data.
 * Inside the format arguments the object is named obj.
 *
 * @param type Type to make loggable
 * @param format_str Format string for the members
 * @param ... Format arguments
 */
#define WFMON_LOGGABLE_DEFERRED_FORMAT(type, format_str, ...)                                      \
    template <> struct fmtquill::formatter<type> {                                                 \
        constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {                 \
            return ctx.begin();                                                                    \
        }                                                                                          \
        template <typename FormatContext>                                                          \
        auto format(const type &obj, FormatContext &ctx) const -> decltype(ctx.out()) {            \
            return fmtquill::format_to(ctx.out(), #type "(" format_str ")", __VA_ARGS__);          \
        }                                                                                          \
    };                                                                                             \
    template <> struct quill::Codec<type> : quill::DeferredFormatCodec<type> {};

// Process logger
#define WFMON_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(WFMON_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define WFMON_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(WFMON_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define WFMON_LOG_INFO(fmt, ...) QUILL_LOG_INFO(WFMON_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define WFMON_LOG_NOTICE(fmt, ...) QUILL_LOG_NOTICE(WFMON_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define WFMON_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(WFMON_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define WFMON_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(WFMON_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define WFMON_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(WFMON_GET_LOGGER(), fmt, ##__VA_ARGS__)

// Component logger
#define WFMON_LOGC_TRACE(c, m, ...) WFMON_DETAIL_LOGC(Trace, QUILL_LOG_TRACE_L1, c, m, ##__VA_ARGS__)
#define WFMON_LOGC_DEBUG(c, m, ...) WFMON_DETAIL_LOGC(Debug, QUILL_LOG_DEBUG, c, m, ##__VA_ARGS__)
#define WFMON_LOGC_INFO(c, m, ...) WFMON_DETAIL_LOGC(Info, QUILL_LOG_INFO, c, m, ##__VA_ARGS__)
#define WFMON_LOGC_NOTICE(c, m, ...) WFMON_DETAIL_LOGC(Notice, QUILL_LOG_NOTICE, c, m, ##__VA_ARGS__)
#define WFMON_LOGC_WARN(c, m, ...) WFMON_DETAIL_LOGC(Warn, QUILL_LOG_WARNING, c, m, ##__VA_ARGS__)
#define WFMON_LOGC_ERROR(c, m, ...) WFMON_DETAIL_LOGC(Error, QUILL_LOG_ERROR, c, m, ##__VA_ARGS__)
#define WFMON_LOGC_CRITICAL(c, m, ...)                                                             \
    WFMON_DETAIL_LOGC(Critical, QUILL_LOG_CRITICAL, c, m, ##__VA_ARGS__)

#ifdef __clang__
#pragma clang diagnostic pop
#endif

// NOLINTEND(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)

#endif // WFMON_LOG_LOG_MACROS_HPP
