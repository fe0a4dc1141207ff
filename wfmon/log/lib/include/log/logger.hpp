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
 * @file logger.hpp
 * @brief Process logger for the wfmon libraries
 *
 * A single quill logger serves the whole process. It starts as a console
 * logger at Info and is replaced by Logger::configure(), typically once
 * from main() after the command line has been parsed.
 */

#ifndef WFMON_LOG_LOGGER_HPP
#define WFMON_LOG_LOGGER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Only the QUILL_ prefixed macros are used
#define QUILL_DISABLE_NON_PREFIXED_MACROS

#include <quill/Backend.h>
#include <quill/DeferredFormatCodec.h>
#include <quill/DirectFormatCodec.h>
#include <quill/Frontend.h>
#include <quill/HelperMacros.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/Sink.h>
#include <quill/std/Optional.h>
#include <quill/std/Vector.h>

#include <wise_enum.h>

#include "log/components.hpp"

namespace wfmon::log {

/**
 * Queue policy of the monitor frontend
 *
 * Diagnostics must not be dropped: the queue grows up to a cap and then
 * blocks the logging thread.
 */
struct MonitorFrontendOptions final {
    // NOLINTBEGIN(readability-identifier-naming)
    static constexpr quill::QueueType queue_type = quill::QueueType::UnboundedBlocking;
    static constexpr std::uint32_t initial_queue_capacity = 64U * 1024U;
    static constexpr std::uint32_t blocking_queue_retry_interval_ns = 1000;
    static constexpr std::size_t unbounded_queue_max_capacity = 16U * 1024U * 1024U;
    static constexpr quill::HugePagesPolicy huge_pages_policy = quill::HugePagesPolicy::Never;
    // NOLINTEND(readability-identifier-naming)
};

using MonitorFrontend = quill::FrontendImpl<MonitorFrontendOptions>;
using MonitorLogger = quill::LoggerImpl<MonitorFrontendOptions>;

/**
 * Log destinations
 */
enum class SinkType {
    Console,      //!< Standard output
    File,         //!< One plain text file
    RotatingFile, //!< Text file rotated by size and at midnight
    JsonFile      //!< One JSON object per line
};

} // namespace wfmon::log

WISE_ENUM_ADAPT(wfmon::log::SinkType, Console, File, RotatingFile, JsonFile)

namespace wfmon::log {

/**
 * Logger settings
 *
 * Start from one of the factories, then adjust with the with_* setters:
 * @code
 * Logger::configure(LoggerConfig::file("monitor.log", LogLevel::Debug).with_file_line());
 * @endcode
 */
struct LoggerConfig final {
    static constexpr std::chrono::microseconds DEFAULT_BACKEND_SLEEP{500};
    static constexpr std::size_t DEFAULT_ROTATION_BYTES = 32U * 1024U * 1024U;

    SinkType sink_type{SinkType::Console};   //!< Destination
    std::string log_file;                    //!< Path for the file based sinks
    LogLevel min_level{LogLevel::Info};      //!< Messages below are discarded
    bool enable_colors{true};                //!< Console colours
    bool enable_file_line{false};            //!< Prefix with source file and line
    bool enable_timestamps{true};            //!< Prefix with wall clock time
    bool enable_log_level{true};             //!< Prefix with the level name
    bool append{true};                       //!< Keep existing file contents
    std::chrono::microseconds backend_sleep_duration{DEFAULT_BACKEND_SLEEP}; //!< Idle backend sleep
    std::size_t rotation_max_bytes{DEFAULT_ROTATION_BYTES}; //!< RotatingFile size limit

    static LoggerConfig console(LogLevel level = LogLevel::Info, bool colors = true);
    static LoggerConfig file(std::string path, LogLevel level = LogLevel::Info);
    static LoggerConfig rotating_file(std::string path, LogLevel level = LogLevel::Info);
    static LoggerConfig json_file(std::string path, LogLevel level = LogLevel::Info);

    LoggerConfig &with_file_line(bool enable = true);
    LoggerConfig &with_timestamps(bool enable = true);
    LoggerConfig &with_log_level(bool enable = true);
    LoggerConfig &with_colors(bool enable = true);
    LoggerConfig &with_append(bool enable = true);
    LoggerConfig &with_rotation_max_bytes(std::size_t bytes);
    LoggerConfig &with_backend_sleep_duration(std::chrono::microseconds duration);
};

namespace detail {
/// Quill logger behind the WFMON_LOG macros
MonitorLogger *get_quill_logger();
} // namespace detail

/**
 * Owner of the process logger and the quill backend thread
 */
class Logger final {
public:
    /**
     * Replace the process logger
     *
     * Call from start-up code before other threads log.
     *
     * @param[in] config New settings
     * @throws std::invalid_argument if a file sink has no path
     */
    static void configure(const LoggerConfig &config);

    static void set_level(LogLevel level);

    /**
     * Block until every queued message has been written
     */
    static void flush();

    [[nodiscard]] static SinkType sink_type();
    [[nodiscard]] static LogLevel level();

    /**
     * File being written, empty for the console sink
     */
    [[nodiscard]] static std::string log_file();

    ~Logger() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

private:
    explicit Logger(LoggerConfig config);

    [[nodiscard]] static std::unique_ptr<Logger> &current();

    LoggerConfig config_;
    std::string log_file_;
    MonitorLogger *quill_logger_{nullptr};

    friend MonitorLogger *detail::get_quill_logger();
};

} // namespace wfmon::log

#endif // WFMON_LOG_LOGGER_HPP
