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


#include <charconv>     // for from_chars
#include <cstdint>      // for uint64_t, uint32_t, int64_t
#include <filesystem>   // for path, rename, remove, exists
#include <format>       // for format
#include <fstream>      // for ifstream, ofstream
#include <istream>      // for istream, getline
#include <optional>     // for optional, nullopt
#include <sstream>      // for istringstream
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move

#include <unistd.h> // for getpid

#include <gsl-lite/gsl-lite.hpp>
#include <tl/expected.hpp> // for expected, unexpected

#include "log/log_macros.hpp"
#include "monitor/monitor_errors.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/persistence.hpp"
#include "monitor/timestamp.hpp"
#include "text.hpp"

namespace wfmon::monitor {

namespace {

constexpr std::string_view KEY_JOB_SEQUENCE = "monitord_job_sequence";
constexpr std::string_view KEY_OFFSET = "monitord_dagman_out_sequence";
constexpr std::string_view KEY_RESTARTS = "monitord_workflow_restart_count";
constexpr std::string_view KEY_LINE_PROCESSED = "line_processed";
constexpr int MAX_ROTATIONS = 1000;

template <typename T> std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    const auto *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::filesystem::path state_file(
        const std::filesystem::path &run_dir,
        const std::optional<std::filesystem::path> &output_dir,
        const std::string &wf_uuid,
        const std::string &name) {
    if (output_dir.has_value()) {
        return *output_dir / std::format("{}-{}", wf_uuid, name);
    }
    return run_dir / name;
}

void remove_if_present(const std::filesystem::path &file) {
    std::error_code ec;
    std::filesystem::remove(file, ec);
    if (ec) {
        WFMON_LOGC_WARN(
                MonitorLog::Persistence, "Cannot remove {}: {}", file.string(), ec.message());
    }
}

} // anonymous namespace

FileLayout FileLayout::make(
        const std::filesystem::path &run_dir,
        const std::optional<std::filesystem::path> &output_dir,
        const std::string &wf_uuid,
        const std::string &replay_log_name) {
    return FileLayout{
            .checkpoint = state_file(run_dir, output_dir, wf_uuid, "monitord.info"),
            .recovery_marker = state_file(run_dir, output_dir, wf_uuid, "monitord.recover"),
            .started = state_file(run_dir, output_dir, wf_uuid, "monitord.started"),
            .done = state_file(run_dir, output_dir, wf_uuid, "monitord.done"),
            .replay_log = state_file(run_dir, output_dir, wf_uuid, replay_log_name)};
}

tl::expected<Checkpoint, std::error_code> parse_checkpoint(std::istream &input) {
    Checkpoint checkpoint{};
    std::string line;
    while (std::getline(input, line)) {
        const auto tokens = detail::split_whitespace(line);
        if (tokens.empty()) {
            continue;
        }
        const auto value = tokens.size() == 2 ? parse_number<std::uint64_t>(tokens[1]) : std::nullopt;
        if (!value.has_value()) {
            WFMON_LOGC_WARN(MonitorLog::Persistence, "Malformed checkpoint line '{}'", line);
            return tl::unexpected(make_error_code(MonitorErrc::ParseFailed));
        }
        if (tokens[0] == KEY_JOB_SEQUENCE) {
            checkpoint.next_submit_seq = *value;
        } else if (tokens[0] == KEY_OFFSET) {
            checkpoint.last_processed_offset = *value;
        } else if (tokens[0] == KEY_RESTARTS) {
            checkpoint.restart_count = gsl_lite::narrow_cast<std::uint32_t>(*value);
        } else {
            checkpoint.job_counters.insert_or_assign(
                    std::string{tokens[0]}, gsl_lite::narrow_cast<std::uint32_t>(*value));
        }
    }
    return checkpoint;
}

std::string format_checkpoint(const Checkpoint &checkpoint) {
    std::string out = std::format(
            "{} {}\n{} {}\n{} {}\n",
            KEY_JOB_SEQUENCE,
            checkpoint.next_submit_seq,
            KEY_OFFSET,
            checkpoint.last_processed_offset,
            KEY_RESTARTS,
            checkpoint.restart_count);
    // std::map keeps the counters sorted by job name
    for (const auto &[job, count] : checkpoint.job_counters) {
        out += std::format("{} {}\n", job, count);
    }
    return out;
}

tl::expected<std::uint64_t, std::error_code>
read_recovery_marker(const std::filesystem::path &file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        return tl::unexpected(make_error_code(MonitorErrc::FileOpenFailed));
    }
    std::string line;
    while (std::getline(input, line)) {
        const auto tokens = detail::split_whitespace(line);
        if (tokens.size() == 2 && tokens[0] == KEY_LINE_PROCESSED) {
            if (const auto offset = parse_number<std::uint64_t>(tokens[1]); offset.has_value()) {
                return *offset;
            }
        }
    }
    return tl::unexpected(make_error_code(MonitorErrc::ParseFailed));
}

std::error_code write_file_atomic(const std::filesystem::path &file, const std::string &content) {
    std::filesystem::path temp{file};
    temp += ".tmp";
    bool committed = false;
    const auto cleanup = gsl_lite::finally([&temp, &committed] {
        if (!committed) {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
        }
    });

    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output.is_open()) {
            WFMON_LOGC_ERROR(MonitorLog::Persistence, "Cannot create {}", temp.string());
            return make_error_code(MonitorErrc::FileOpenFailed);
        }
        output << content;
        output.flush();
        if (!output) {
            WFMON_LOGC_ERROR(MonitorLog::Persistence, "Cannot write {}", temp.string());
            return make_error_code(MonitorErrc::FileWriteFailed);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, file, ec);
    if (ec) {
        WFMON_LOGC_ERROR(
                MonitorLog::Persistence,
                "Cannot rename {} to {}: {}",
                temp.string(),
                file.string(),
                ec.message());
        return make_error_code(MonitorErrc::FileRenameFailed);
    }
    committed = true;
    return {};
}

tl::expected<std::optional<std::filesystem::path>, std::error_code>
rotate_file(const std::filesystem::path &file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return std::optional<std::filesystem::path>{};
    }
    for (int i = 0; i < MAX_ROTATIONS; ++i) {
        const std::filesystem::path candidate{std::format("{}.{:03d}", file.string(), i)};
        if (std::filesystem::exists(candidate, ec)) {
            continue;
        }
        std::filesystem::rename(file, candidate, ec);
        if (ec) {
            WFMON_LOGC_ERROR(
                    MonitorLog::Persistence,
                    "Cannot rotate {} to {}: {}",
                    file.string(),
                    candidate.string(),
                    ec.message());
            return tl::unexpected(make_error_code(MonitorErrc::FileRenameFailed));
        }
        WFMON_LOGC_INFO(
                MonitorLog::Persistence, "Rotated {} to {}", file.string(), candidate.string());
        return std::optional<std::filesystem::path>{candidate};
    }
    WFMON_LOGC_ERROR(MonitorLog::Persistence, "No free rotation slot for {}", file.string());
    return tl::unexpected(make_error_code(MonitorErrc::FileRenameFailed));
}

Persistence::Persistence(FileLayout layout) : layout_{std::move(layout)} {}

LoadedState Persistence::load(const bool replay_mode) {
    previous_marker_.reset();
    if (replay_mode) {
        WFMON_LOGC_INFO(MonitorLog::Persistence, "Replay mode, ignoring prior state");
        return LoadedState{};
    }

    LoadedState state{};
    if (std::ifstream input(layout_.checkpoint); input.is_open()) {
        auto checkpoint = parse_checkpoint(input);
        if (checkpoint) {
            state.checkpoint = std::move(*checkpoint);
        } else {
            WFMON_LOGC_WARN(
                    MonitorLog::Persistence,
                    "Ignoring unreadable checkpoint {}: {}",
                    layout_.checkpoint.string(),
                    checkpoint.error().message());
        }
    }

    const auto marker = read_recovery_marker(layout_.recovery_marker);
    if (marker) {
        WFMON_LOGC_WARN(
                MonitorLog::Persistence,
                "Recovering, last processed offset {}",
                *marker);
        previous_marker_ = *marker;
        state.recovery_offset = *marker;
        state.checkpoint = Checkpoint{};
    } else if (marker.error() != MonitorErrc::FileOpenFailed) {
        WFMON_LOGC_WARN(
                MonitorLog::Persistence,
                "Ignoring unreadable recovery marker {}",
                layout_.recovery_marker.string());
    }
    return state;
}

std::error_code Persistence::save(const Checkpoint &checkpoint) {
    if (const auto ec = write_file_atomic(layout_.checkpoint, format_checkpoint(checkpoint)); ec) {
        return ec;
    }
    remove_if_present(layout_.recovery_marker);
    previous_marker_.reset();
    WFMON_LOGC_DEBUG(
            MonitorLog::Persistence,
            "Saved checkpoint, next sequence {}",
            checkpoint.next_submit_seq);
    return {};
}

std::error_code Persistence::checkpoint_progress(const std::uint64_t offset) {
    if (previous_marker_.has_value() && offset < *previous_marker_) {
        return {};
    }
    return write_file_atomic(
            layout_.recovery_marker, std::format("{} {}\n", KEY_LINE_PROCESSED, offset));
}

std::error_code Persistence::write_started(const std::int64_t now) {
    return write_file_atomic(
            layout_.started, std::format("pid {}\nstart {}\n", ::getpid(), format_iso_timestamp(now)));
}

std::error_code Persistence::write_done(const std::int64_t now, const double elapsed) {
    if (const auto ec = write_file_atomic(
                layout_.done, std::format("{} {:.3f}\n", format_iso_timestamp(now), elapsed));
        ec) {
        return ec;
    }
    remove_if_present(layout_.started);
    return {};
}

void Persistence::remove_stale_done() {
    std::error_code ec;
    if (std::filesystem::exists(layout_.done, ec)) {
        WFMON_LOGC_INFO(
                MonitorLog::Persistence, "Removing stale {}", layout_.done.string());
        remove_if_present(layout_.done);
    }
}

} // namespace wfmon::monitor
