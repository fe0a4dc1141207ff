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
 * @file monitor_replay_utils.cpp
 * @brief Implementation of utility functions for the replay tool
 */

#include <charconv>
#include <format>
#include <fstream>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <quill/LogMacros.h>
#include <tl/expected.hpp>

#include <CLI/CLI.hpp>

#include "internal_use_only/config.hpp"
#include "log/components.hpp"
#include "log/log_macros.hpp"
#include "log/logger.hpp"
#include "monitor/monitor_errors.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/signal.hpp"
#include "monitor_replay_utils.hpp"

namespace wfmon::monitor::samples {

namespace {

constexpr std::string_view DAGMAN_STARTED = "DAGMAN_STARTED";
constexpr std::string_view DAGMAN_FINISHED = "DAGMAN_FINISHED";
constexpr std::string_view LOG_FORMAT_TEXT = "text";
constexpr std::string_view LOG_FORMAT_JSON = "json";

std::string_view after_keyword(std::string_view message, std::string_view keyword) {
    message.remove_prefix(keyword.size());
    while (!message.empty() && message.front() == ' ') {
        message.remove_prefix(1);
    }
    return message;
}

Signal to_signal(const JobStateRecord &record) {
    Signal signal{};
    signal.job_name = record.job_name;
    signal.kind = record.state;
    signal.sched_id = record.sched_id;
    signal.timestamp = record.timestamp;
    signal.status = record.status;
    signal.walltime = record.walltime;
    return signal;
}

void count(ReplayStats &stats, const ApplyStatus status) {
    switch (status) {
    case ApplyStatus::Applied:
        ++stats.applied;
        break;
    case ApplyStatus::Suppressed:
        ++stats.suppressed;
        break;
    case ApplyStatus::Ignored:
        ++stats.ignored;
        break;
    case ApplyStatus::Dropped:
        ++stats.dropped;
        break;
    case ApplyStatus::Refused:
        ++stats.refused;
        break;
    }
}

std::error_code handle_internal(Workflow &workflow, const InternalRecord &record) {
    const std::string_view message{record.message};
    if (message.starts_with(DAGMAN_STARTED)) {
        return workflow.controller_started(
                record.timestamp, std::string{after_keyword(message, DAGMAN_STARTED)});
    }
    if (message.starts_with(DAGMAN_FINISHED)) {
        const auto code_text = after_keyword(message, DAGMAN_FINISHED);
        int exit_code{0};
        const auto [ptr, ec] =
                std::from_chars(code_text.data(), code_text.data() + code_text.size(), exit_code);
        if (ec != std::errc{}) {
            WFMON_LOGC_WARN(
                    ReplayApp::Input, "Controller exit code '{}' is not a number", code_text);
            exit_code = 0;
        }
        return workflow.controller_finished(record.timestamp, exit_code);
    }
    // Monitor start and finish markers carry no job state
    return {};
}

} // namespace

wfmon::log::LoggerConfig make_logger_config(const AppArguments &args) {
    using wfmon::log::LoggerConfig;
    const auto level = args.verbose ? wfmon::log::LogLevel::Debug : wfmon::log::LogLevel::Info;
    if (!args.log_file.has_value()) {
        return LoggerConfig::console(level);
    }
    std::string path = args.log_file->string();
    if (args.log_format == LOG_FORMAT_JSON) {
        return LoggerConfig::json_file(std::move(path), level);
    }
    if (args.log_rotate_bytes > 0) {
        return LoggerConfig::rotating_file(std::move(path), level)
                .with_rotation_max_bytes(args.log_rotate_bytes);
    }
    return LoggerConfig::file(std::move(path), level);
}

void setup_logging(const AppArguments &args) {
    const auto config = make_logger_config(args);
    const auto level = config.min_level;
    wfmon::log::Logger::configure(config);
    wfmon::log::Logger::set_level(level);
    wfmon::log::register_component<MonitorLog>(level);
    wfmon::log::register_component<ReplayApp>(level);
}

tl::expected<AppArguments, std::string> parse_arguments(const int argc, const char **argv) {

    AppArguments args{};

    CLI::App app{std::format(
            "Job State Log Replay - {} version {}",
            wfmon::cmake::project_name,
            wfmon::cmake::project_version)};

    app.add_option("-r,--run-dir", args.run_dir, "Workflow run directory")->required();
    app.add_option("-i,--input", args.input_file, "Job state log to replay")->required();
    app.add_option("-e,--events", args.events_file, "BP file receiving the derived events");
    app.add_option("-o,--output-dir", args.output_dir, "Directory for state files");
    auto *log_file = app.add_option("--log-file", args.log_file, "Diagnostic log file (default: console)");
    app.add_option("--log-format", args.log_format, "Diagnostic log file format (default: text)")
            ->check(CLI::IsMember({std::string{LOG_FORMAT_TEXT}, std::string{LOG_FORMAT_JSON}}))
            ->needs(log_file);
    app.add_option(
               "--log-rotate",
               args.log_rotate_bytes,
               "Rotate the text log file at this many bytes (default: never)")
            ->needs(log_file);
    app.add_option(
            "--replay-log-name",
            args.replay_log_name,
            "Replay log file name (default: jobstate.log)");
    app.add_option(
            "--max-output",
            args.max_output_length,
            std::format("stdout/stderr text limit (default: {})", DEFAULT_MAX_OUTPUT_LENGTH));
    app.add_option(
            "--checkpoint-every",
            args.checkpoint_interval,
            std::format(
                    "Input lines between recovery markers, 0 disables (default: {})",
                    DEFAULT_CHECKPOINT_INTERVAL));

    app.add_flag("--replay", args.replay_mode, "Ignore prior state and replay from the start");
    app.add_flag("--no-stdout", args.no_stdout_stderr, "Do not forward captured stdout/stderr");
    app.add_flag("--no-static", args.no_static_events, "Do not send planner static events");
    app.add_flag("--sync", args.sync, "Sync the replay log after every line");
    app.add_flag("-v,--verbose", args.verbose, "Enable debug logging");

    app.set_version_flag(
            "--version", std::string{wfmon::cmake::project_version}, "Show version information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        const int exit_code = app.exit(e); // Print help or error message
        if (exit_code == 0) {
            // Success codes (--help or --version) - return empty error string
            return tl::unexpected("");
        }
        const std::string error_msg = std::format("Argument parsing failed: {}", e.what());
        return tl::unexpected(error_msg);
    }

    if (!std::filesystem::is_directory(args.run_dir)) {
        return tl::unexpected(
                std::format("Run directory does not exist: {}", args.run_dir.string()));
    }

    return args;
}

WorkflowConfig make_workflow_config(const AppArguments &args) {
    auto config = WorkflowConfig::for_run_dir(args.run_dir);
    config.with_replay_log_name(args.replay_log_name)
            .with_replay_mode(args.replay_mode)
            .with_store_stdout_stderr(!args.no_stdout_stderr)
            .with_max_output_length(args.max_output_length)
            .with_sync_replay_log(args.sync)
            .with_static_events(!args.no_static_events);
    if (args.output_dir.has_value()) {
        config.with_output_dir(*args.output_dir);
    }
    return config;
}

tl::expected<std::vector<InputLine>, std::error_code>
read_input(const std::filesystem::path &file) {
    std::ifstream in{file, std::ios::binary};
    if (!in) {
        WFMON_LOGC_ERROR(ReplayApp::Input, "Cannot open input {}", file.string());
        return tl::unexpected(make_error_code(MonitorErrc::FileOpenFailed));
    }

    std::vector<InputLine> lines;
    std::uint64_t offset{0};
    std::size_t line_no{0};
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        offset += line.size() + 1;
        if (line.empty()) {
            continue;
        }
        auto record = parse_replay_line(line);
        if (!record) {
            WFMON_LOGC_WARN(
                    ReplayApp::Input,
                    "{}:{}: skipping malformed line: {}",
                    file.string(),
                    line_no,
                    record.error());
            continue;
        }
        lines.push_back(InputLine{std::move(*record), offset});
    }
    WFMON_LOGC_DEBUG(ReplayApp::Input, "Read {} records from {}", lines.size(), file.string());
    return lines;
}

tl::expected<ReplayStats, std::error_code> replay_lines(
        Workflow &workflow, const std::vector<InputLine> &lines, const std::size_t checkpoint_interval) {
    ReplayStats stats{};
    const auto resume_from = workflow.resume_offset();

    for (const auto &line : lines) {
        if (workflow.is_finished()) {
            break;
        }
        ++stats.lines;
        if (line.end_offset <= resume_from) {
            ++stats.skipped;
            continue;
        }
        workflow.set_input_offset(line.end_offset);

        const auto ec = std::visit(
                [&workflow, &stats](const auto &record) -> std::error_code {
                    using T = std::decay_t<decltype(record)>;
                    if constexpr (std::is_same_v<T, JobStateRecord>) {
                        count(stats, workflow.apply_signal(to_signal(record)).status);
                        return {};
                    } else {
                        return handle_internal(workflow, record);
                    }
                },
                line.record);
        if (ec) {
            WFMON_LOGC_ERROR(ReplayApp::App, "Replay stopped: {}", ec.message());
            return tl::unexpected(ec);
        }

        if (checkpoint_interval != 0 && stats.lines % checkpoint_interval == 0 &&
            !workflow.is_finished()) {
            if (const auto marker_ec = workflow.checkpoint_progress(); marker_ec) {
                return tl::unexpected(marker_ec);
            }
        }
    }

    WFMON_LOGC_INFO(
            ReplayApp::Stats,
            "lines={} skipped={} applied={} suppressed={} ignored={} dropped={} refused={}",
            stats.lines,
            stats.skipped,
            stats.applied,
            stats.suppressed,
            stats.ignored,
            stats.dropped,
            stats.refused);
    return stats;
}

} // namespace wfmon::monitor::samples
