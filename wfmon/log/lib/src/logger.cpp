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


#include <algorithm> // for find_if
#include <array>     // for array
#include <atomic>    // for atomic
#include <memory>    // for shared_ptr, unique_ptr, make_shared
#include <mutex>     // for mutex, lock_guard
#include <stdexcept> // for invalid_argument
#include <string>    // for string, to_string
#include <utility>   // for move, pair

#include <quill/Backend.h>                      // for Backend
#include <quill/LogMacros.h>                    // for QUILL_LOG_DEBUG
#include <quill/backend/BackendOptions.h>       // for BackendOptions
#include <quill/core/Common.h>                  // for Timezone, ClockSourceType
#include <quill/core/LogLevel.h>                // for LogLevel
#include <quill/core/PatternFormatterOptions.h> // for PatternFormatterOptions
#include <quill/sinks/ConsoleSink.h>            // for ConsoleSink
#include <quill/sinks/FileSink.h>               // for FileSink
#include <quill/sinks/JsonSink.h>               // for JsonFileSink
#include <quill/sinks/RotatingFileSink.h>       // for RotatingFileSink
#include <quill/sinks/StreamSink.h>             // for FileEventNotifier

#include <wise_enum.h> // for to_string

#include "log/components.hpp"
#include "log/logger.hpp"

namespace wfmon::log {

namespace {

constexpr std::array<std::pair<LogLevel, quill::LogLevel>, 7> LEVEL_MAP{{
        {LogLevel::Trace, quill::LogLevel::TraceL1},
        {LogLevel::Debug, quill::LogLevel::Debug},
        {LogLevel::Info, quill::LogLevel::Info},
        {LogLevel::Notice, quill::LogLevel::Notice},
        {LogLevel::Warn, quill::LogLevel::Warning},
        {LogLevel::Error, quill::LogLevel::Error},
        {LogLevel::Critical, quill::LogLevel::Critical},
}};

constexpr const char *TIME_FORMAT = "%Y-%m-%d %H:%M:%S.%Qms";

quill::LogLevel to_quill(const LogLevel level) {
    const auto it = std::find_if(
            LEVEL_MAP.begin(), LEVEL_MAP.end(), [level](const auto &p) { return p.first == level; });
    return it == LEVEL_MAP.end() ? quill::LogLevel::Info : it->second;
}

LogLevel from_quill(const quill::LogLevel level) {
    // TraceL2 and TraceL3 have no wfmon counterpart
    if (level == quill::LogLevel::TraceL2 || level == quill::LogLevel::TraceL3) {
        return LogLevel::Trace;
    }
    const auto it = std::find_if(
            LEVEL_MAP.begin(), LEVEL_MAP.end(), [level](const auto &p) { return p.second == level; });
    return it == LEVEL_MAP.end() ? LogLevel::Info : it->first;
}

LoggerConfig make_config(const SinkType type, const LogLevel level, std::string path) {
    LoggerConfig config{};
    config.sink_type = type;
    config.min_level = level;
    config.log_file = std::move(path);
    config.enable_colors = type == SinkType::Console;
    return config;
}

std::string pattern_for(const LoggerConfig &config) {
    std::string pattern;
    pattern.append(config.enable_timestamps ? "%(time) " : "")
            .append(config.enable_log_level ? "[%(log_level)] " : "")
            .append(config.enable_file_line ? "[%(short_source_location)] " : "")
            .append("%(message)");
    return pattern;
}

/**
 * A created sink and the file it writes, empty for the console
 */
struct SinkHandle final {
    std::shared_ptr<quill::Sink> sink;
    std::string file;
};

SinkHandle console_sink(const LoggerConfig &config) {
    quill::ConsoleSinkConfig sink_config;
    sink_config.set_colour_mode(
            config.enable_colors ? quill::ConsoleSinkConfig::ColourMode::Automatic
                                 : quill::ConsoleSinkConfig::ColourMode::Never);
    return {std::make_shared<quill::ConsoleSink>(sink_config), {}};
}

template <typename FileSinkType, typename SinkConfig, typename... Extra>
SinkHandle file_sink(const LoggerConfig &config, SinkConfig sink_config, Extra &&...extra) {
    if (config.log_file.empty()) {
        throw std::invalid_argument(
                std::string{::wise_enum::to_string(config.sink_type)} + " sink needs a log file path");
    }
    sink_config.set_open_mode(config.append ? 'a' : 'w');
    auto sink = std::make_shared<FileSinkType>(
            config.log_file, sink_config, std::forward<Extra>(extra)...);
    std::string file = sink->get_filename().string();
    return {std::move(sink), std::move(file)};
}

SinkHandle make_sink(const LoggerConfig &config) {
    switch (config.sink_type) {
    case SinkType::Console:
        return console_sink(config);
    case SinkType::File:
        return file_sink<quill::FileSink>(
                config, quill::FileSinkConfig{}, quill::FileEventNotifier{});
    case SinkType::RotatingFile: {
        quill::RotatingFileSinkConfig rotating;
        rotating.set_rotation_time_daily("00:00");
        rotating.set_rotation_max_file_size(config.rotation_max_bytes);
        return file_sink<quill::RotatingFileSink>(config, rotating);
    }
    case SinkType::JsonFile:
        return file_sink<quill::JsonFileSink>(config, quill::FileSinkConfig{});
    }
    throw std::invalid_argument("unsupported sink type");
}

void restart_backend(const LoggerConfig &config) {
    if (quill::Backend::is_running()) {
        quill::Backend::stop();
    }
    quill::BackendOptions options;
    options.thread_name = "wfmon_log";
    options.enable_yield_when_idle = false;
    options.sleep_duration = config.backend_sleep_duration;
    quill::Backend::start(options);
}

} // anonymous namespace

LoggerConfig LoggerConfig::console(const LogLevel level, const bool colors) {
    return make_config(SinkType::Console, level, {}).with_colors(colors);
}

LoggerConfig LoggerConfig::file(std::string path, const LogLevel level) {
    return make_config(SinkType::File, level, std::move(path));
}

LoggerConfig LoggerConfig::rotating_file(std::string path, const LogLevel level) {
    return make_config(SinkType::RotatingFile, level, std::move(path));
}

LoggerConfig LoggerConfig::json_file(std::string path, const LogLevel level) {
    return make_config(SinkType::JsonFile, level, std::move(path));
}

LoggerConfig &LoggerConfig::with_file_line(const bool enable) {
    enable_file_line = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_timestamps(const bool enable) {
    enable_timestamps = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_log_level(const bool enable) {
    enable_log_level = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_colors(const bool enable) {
    enable_colors = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_append(const bool enable) {
    append = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_rotation_max_bytes(const std::size_t bytes) {
    rotation_max_bytes = bytes;
    return *this;
}

LoggerConfig &LoggerConfig::with_backend_sleep_duration(const std::chrono::microseconds duration) {
    backend_sleep_duration = duration;
    return *this;
}

Logger::Logger(LoggerConfig config) : config_{std::move(config)} {
    // Sink first: a bad path must throw before the backend is touched
    auto [sink, file] = make_sink(config_);
    log_file_ = std::move(file);
    restart_backend(config_);

    // Quill caches loggers by name, each configuration gets a new one
    static std::atomic<unsigned> generation{0};
    const std::string name = "wfmon." + std::to_string(generation++);

    const std::string pattern = pattern_for(config_);
    quill_logger_ = MonitorFrontend::create_or_get_logger(
            name,
            std::move(sink),
            quill::PatternFormatterOptions{pattern, TIME_FORMAT, quill::Timezone::LocalTime},
            quill::ClockSourceType::System);
    quill_logger_->set_log_level(to_quill(config_.min_level));

    QUILL_LOG_DEBUG(
            quill_logger_,
            "Logging to {} at {} ({})",
            log_file_.empty() ? std::string{"console"} : log_file_,
            ::wise_enum::to_string(config_.min_level),
            pattern);
}

Logger::~Logger() noexcept {
    if (quill_logger_ != nullptr && quill::Backend::is_running()) {
        quill_logger_->flush_log();
        MonitorFrontend::remove_logger(quill_logger_);
    }
}

std::unique_ptr<Logger> &Logger::current() {
    static std::unique_ptr<Logger> instance{new Logger(LoggerConfig::console())};
    return instance;
}

void Logger::configure(const LoggerConfig &config) {
    static std::mutex mutex;
    const std::lock_guard<std::mutex> lock(mutex);
    auto &instance = current();
    instance->quill_logger_->flush_log();
    // A bad configuration throws here and leaves the old logger in place
    std::unique_ptr<Logger> replacement{new Logger(config)};
    instance.swap(replacement);
}

void Logger::set_level(const LogLevel level) {
    current()->quill_logger_->set_log_level(to_quill(level));
}

void Logger::flush() { current()->quill_logger_->flush_log(); }

SinkType Logger::sink_type() { return current()->config_.sink_type; }

LogLevel Logger::level() { return from_quill(current()->quill_logger_->get_log_level()); }

std::string Logger::log_file() { return current()->log_file_; }

LogLevel get_logger_default_level() { return LogLevel::Info; }

namespace detail {
MonitorLogger *get_quill_logger() { return Logger::current()->quill_logger_; }
} // namespace detail

} // namespace wfmon::log
