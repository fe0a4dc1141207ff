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


#include <cerrno>       // for errno, EINTR
#include <charconv>     // for from_chars
#include <cstddef>      // for size_t
#include <cstdint>      // for int64_t, uint64_t
#include <filesystem>   // for path
#include <format>       // for format
#include <optional>     // for optional, nullopt
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code, generic_category
#include <utility>      // for exchange, move

#include <fcntl.h>  // for open, O_APPEND
#include <unistd.h> // for write, close, fdatasync

#include <gsl-lite/gsl-lite.hpp>
#include <tl/expected.hpp> // for expected, unexpected

#include "log/log_macros.hpp"
#include "monitor/job_state.hpp"
#include "monitor/monitor_errors.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/replay_log.hpp"
#include "text.hpp"

namespace wfmon::monitor {

namespace {

constexpr std::string_view ABSENT = "-";
constexpr std::string_view INTERNAL_TAG = "INTERNAL";
constexpr std::string_view INTERNAL_MARK = "***";
constexpr std::size_t JOB_STATE_FIELDS = 7;
constexpr mode_t LOG_FILE_MODE = 0644;

template <typename T> std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    const auto *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> optional_token(std::string_view token) {
    if (token == ABSENT) {
        return std::nullopt;
    }
    return std::string{token};
}

tl::expected<ReplayRecord, std::string>
parse_internal(const std::int64_t timestamp, std::string_view rest) {
    rest = detail::trim(rest);
    if (!rest.starts_with(INTERNAL_MARK) || !rest.ends_with(INTERNAL_MARK) ||
        rest.size() < 2 * INTERNAL_MARK.size()) {
        return tl::unexpected(std::format("malformed INTERNAL line '{}'", rest));
    }
    rest.remove_prefix(INTERNAL_MARK.size());
    rest.remove_suffix(INTERNAL_MARK.size());
    return InternalRecord{timestamp, std::string{detail::trim(rest)}};
}

} // anonymous namespace

std::string format_replay_line(const JobStateRecord &record) {
    std::string fourth{ABSENT};
    if (record.status.has_value()) {
        fourth = std::to_string(*record.status);
    } else if (record.sched_id.has_value()) {
        fourth = *record.sched_id;
    }
    return std::format(
            "{} {} {} {} {} {} {}",
            record.timestamp,
            record.job_name,
            to_token(record.state),
            fourth,
            record.site.value_or(std::string{ABSENT}),
            record.walltime.value_or(std::string{ABSENT}),
            record.submit_seq);
}

std::string format_internal_line(const std::int64_t timestamp, std::string_view message) {
    return std::format("{} {} {} {} {}", timestamp, INTERNAL_TAG, INTERNAL_MARK, message, INTERNAL_MARK);
}

tl::expected<ReplayRecord, std::string> parse_replay_line(std::string_view line) {
    const auto tokens = detail::split_whitespace(line);
    if (tokens.size() < 2) {
        return tl::unexpected(std::format("too few fields in '{}'", line));
    }
    const auto timestamp = parse_number<std::int64_t>(tokens[0]);
    if (!timestamp.has_value()) {
        return tl::unexpected(std::format("bad timestamp '{}'", tokens[0]));
    }
    if (tokens[1] == INTERNAL_TAG) {
        return parse_internal(*timestamp, detail::remainder_after(line, 2));
    }
    if (tokens.size() != JOB_STATE_FIELDS) {
        return tl::unexpected(
                std::format("expected {} fields, got {}", JOB_STATE_FIELDS, tokens.size()));
    }
    const auto state = parse_job_state(tokens[2]);
    if (!state.has_value()) {
        return tl::unexpected(std::format("unknown state '{}'", tokens[2]));
    }
    const auto submit_seq = parse_number<std::uint64_t>(tokens[6]);
    if (!submit_seq.has_value()) {
        return tl::unexpected(std::format("bad submit sequence '{}'", tokens[6]));
    }

    JobStateRecord record{};
    record.timestamp = *timestamp;
    record.job_name = std::string{tokens[1]};
    record.state = *state;
    record.submit_seq = *submit_seq;
    record.site = optional_token(tokens[4]);
    record.walltime = optional_token(tokens[5]);
    if (tokens[3] != ABSENT) {
        const auto status = parse_number<int>(tokens[3]);
        if (status.has_value() && (is_success_state(*state) || is_failure_state(*state))) {
            record.status = status;
        } else {
            record.sched_id = std::string{tokens[3]};
        }
    }
    return record;
}

ReplayLog::~ReplayLog() { close(); }

ReplayLog::ReplayLog(ReplayLog &&other) noexcept
        : fd_{std::exchange(other.fd_, -1)}, sync_{other.sync_}, file_{std::move(other.file_)},
          lines_written_{other.lines_written_} {}

ReplayLog &ReplayLog::operator=(ReplayLog &&other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        sync_ = other.sync_;
        file_ = std::move(other.file_);
        lines_written_ = other.lines_written_;
    }
    return *this;
}

std::error_code ReplayLog::open(
        const std::filesystem::path &file, const ReplayOpenMode mode, const bool sync) {
    close();
    const int flags =
            O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC | (mode == ReplayOpenMode::Truncate ? O_TRUNC : 0);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    const int fd = ::open(file.c_str(), flags, LOG_FILE_MODE);
    if (fd < 0) {
        const std::error_code ec(errno, std::generic_category());
        WFMON_LOGC_ERROR(
                MonitorLog::ReplayLog, "Cannot open replay log {}: {}", file.string(), ec.message());
        return make_error_code(MonitorErrc::ReplayLogOpenFailed);
    }
    fd_ = fd;
    sync_ = sync;
    file_ = file;
    lines_written_ = 0;
    WFMON_LOGC_DEBUG(
            MonitorLog::ReplayLog,
            "Opened replay log {} ({})",
            file_.string(),
            ::wise_enum::to_string(mode));
    return {};
}

std::error_code ReplayLog::append(const JobStateRecord &record) {
    return write_line(format_replay_line(record));
}

std::error_code
ReplayLog::write_internal(const std::int64_t timestamp, std::string_view message) {
    return write_line(format_internal_line(timestamp, message));
}

std::error_code ReplayLog::write_line(std::string line) {
    if (fd_ < 0) {
        return make_error_code(MonitorErrc::ReplayLogWriteFailed);
    }
    line.push_back('\n');
    std::size_t offset = 0;
    while (offset < line.size()) {
        const auto written = ::write(fd_, line.data() + offset, line.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::error_code ec(errno, std::generic_category());
            WFMON_LOGC_ERROR(
                    MonitorLog::ReplayLog,
                    "Write to replay log {} failed: {}",
                    file_.string(),
                    ec.message());
            return make_error_code(MonitorErrc::ReplayLogWriteFailed);
        }
        offset += gsl_lite::narrow_cast<std::size_t>(written);
    }
    if (sync_ && ::fdatasync(fd_) != 0) {
        const std::error_code ec(errno, std::generic_category());
        WFMON_LOGC_ERROR(
                MonitorLog::ReplayLog, "fdatasync of {} failed: {}", file_.string(), ec.message());
        return make_error_code(MonitorErrc::ReplayLogWriteFailed);
    }
    ++lines_written_;
    return {};
}

void ReplayLog::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace wfmon::monitor
