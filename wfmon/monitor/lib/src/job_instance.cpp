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


#include <cstddef>     // for size_t
#include <cstdint>     // for int64_t
#include <filesystem>  // for path, exists
#include <format>      // for format
#include <fstream>     // for ifstream
#include <iterator>    // for istreambuf_iterator
#include <optional>    // for optional, nullopt
#include <string>      // for string
#include <string_view> // for string_view
#include <system_error> // for error_code
#include <utility>     // for move

#include "log/log_macros.hpp"
#include "monitor/job_instance.hpp"
#include "monitor/job_state.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/output_extractor.hpp"
#include "monitor/submit_file.hpp"

namespace wfmon::monitor {

namespace {

int default_exitcode(const JobState state, const std::optional<int> status) noexcept {
    if (status.has_value()) {
        return *status;
    }
    return is_failure_state(state) ? 1 : 0;
}

std::optional<std::string> relative_to_submit_dir(
        const std::optional<std::string> &file, const std::optional<std::string> &submit_dir) {
    if (!file.has_value() || !submit_dir.has_value() || submit_dir->empty()) {
        return file;
    }
    const std::string prefix = *submit_dir + "/";
    if (file->starts_with(prefix)) {
        return file->substr(prefix.size());
    }
    return file;
}

std::optional<std::string> read_limited(const std::filesystem::path &file, const std::size_t limit) {
    std::ifstream stream(file, std::ios::binary);
    if (!stream.is_open()) {
        return std::nullopt;
    }
    std::string text(limit + 1, '\0');
    stream.read(text.data(), static_cast<std::streamsize>(text.size()));
    text.resize(static_cast<std::size_t>(stream.gcount()));
    return text;
}

std::optional<std::string> read_captured(
        const std::filesystem::path &run_dir,
        const std::optional<std::string> &file,
        const std::uint32_t counter,
        const std::size_t limit) {
    if (!file.has_value() || file->empty()) {
        return std::nullopt;
    }
    std::filesystem::path base{*file};
    if (base.is_relative()) {
        base = run_dir / base;
    }
    std::error_code ec;
    const std::filesystem::path rotated{std::format("{}.{:03d}", base.string(), counter)};
    if (std::filesystem::exists(rotated, ec)) {
        return read_limited(rotated, limit);
    }
    if (std::filesystem::exists(base, ec)) {
        return read_limited(base, limit);
    }
    WFMON_LOGC_DEBUG(MonitorLog::Extractor, "No captured output at {}", base.string());
    return std::nullopt;
}

} // anonymous namespace

JobInstance::JobInstance(std::string name, const std::uint64_t submit_seq)
        : name_{std::move(name)}, submit_seq_{submit_seq} {}

void JobInstance::apply(
        const JobState state, const std::int64_t timestamp, const std::optional<int> status) {
    state_ = state;
    state_timestamp_ = timestamp;
    ++state_seq_;

    switch (state) {
    case JobState::PRE_SCRIPT_STARTED:
        pre_script_.start = timestamp;
        break;
    case JobState::PRE_SCRIPT_SUCCESS:
    case JobState::PRE_SCRIPT_FAILURE:
        pre_script_.end = timestamp;
        pre_script_.exitcode = default_exitcode(state, status);
        break;
    case JobState::EXECUTE:
        // Re-execution after eviction keeps the first start
        if (!main_job_.start.has_value()) {
            main_job_.start = timestamp;
        }
        break;
    case JobState::JOB_SUCCESS:
    case JobState::JOB_FAILURE:
        main_job_.end = timestamp;
        main_job_.exitcode = default_exitcode(state, status);
        break;
    case JobState::POST_SCRIPT_STARTED:
        post_script_.start = timestamp;
        break;
    case JobState::POST_SCRIPT_SUCCESS:
    case JobState::POST_SCRIPT_FAILURE:
        post_script_.end = timestamp;
        post_script_.exitcode = default_exitcode(state, status);
        break;
    default:
        break;
    }
}

bool JobInstance::is_terminal(const bool has_post_script) const noexcept {
    return state_.has_value() && is_terminal_state(*state_, has_post_script);
}

void JobInstance::apply_submit_file(
        const SubmitFileInfo &info, const std::optional<std::string> &original_submit_dir) {
    run_info_.site = info.site;
    run_info_.stdin_file = relative_to_submit_dir(info.input, original_submit_dir);
    run_info_.stdout_file = relative_to_submit_dir(info.output, original_submit_dir);
    run_info_.stderr_file = relative_to_submit_dir(info.error, original_submit_dir);
    run_info_.executable = info.executable;
    run_info_.arguments = info.arguments;
    run_info_.transformation = info.transformation;
    run_info_.derivation = info.derivation;
    run_info_.multiplier_factor = info.multiplier_factor;
    run_info_.dagman_out = info.dagman_out;
    submit_file_parsed_ = true;
}

void JobInstance::absorb_output(const ExtractedOutput &output) {
    if (output.remote_user.has_value()) {
        run_info_.remote_user = output.remote_user;
    }
    if (output.remote_work_dir.has_value()) {
        run_info_.remote_work_dir = output.remote_work_dir;
    }
    if (output.cluster_start.has_value()) {
        run_info_.cluster_start = output.cluster_start;
    }
    if (output.cluster_duration.has_value()) {
        run_info_.cluster_duration = output.cluster_duration;
    }
    if (output.stdout_text.has_value()) {
        run_info_.stdout_text = output.stdout_text;
    }
    if (output.stderr_text.has_value()) {
        run_info_.stderr_text = output.stderr_text;
    }
    run_info_.output_parsed = !output.empty();
}

void JobInstance::read_captured_output(
        const std::filesystem::path &run_dir, const std::size_t limit) {
    run_info_.stdout_text =
            read_captured(run_dir, run_info_.stdout_file, run_info_.output_counter, limit);
    run_info_.stderr_text =
            read_captured(run_dir, run_info_.stderr_file, run_info_.output_counter, limit);
}

void JobInstance::release_output() noexcept {
    run_info_.stdout_text.reset();
    run_info_.stderr_text.reset();
}

} // namespace wfmon::monitor
