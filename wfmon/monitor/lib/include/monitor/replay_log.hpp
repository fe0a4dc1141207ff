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
 * @file replay_log.hpp
 * @brief Append-only job state log
 *
 * Every applied transition is written as one line before any event is
 * derived from it:
 *
 *     <ts> <job> <state> <status|sched_id|-> <site|-> <walltime|-> <submit_seq>
 *
 * Monitor lifecycle markers are written as "<ts> INTERNAL *** ... ***".
 */

#ifndef WFMON_MONITOR_REPLAY_LOG_HPP
#define WFMON_MONITOR_REPLAY_LOG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include <tl/expected.hpp>
#include <wise_enum.h>

#include "monitor/job_state.hpp"

namespace wfmon::monitor {

/**
 * How an existing replay log is treated on open
 */
enum class ReplayOpenMode : std::uint8_t {
    Append,  //!< Keep existing lines
    Truncate //!< Start an empty file
};

/**
 * One job state line
 */
struct JobStateRecord final {
    std::int64_t timestamp{};             //!< Epoch seconds
    std::string job_name;                 //!< Job name
    JobState state{JobState::SUBMIT};     //!< New state
    std::optional<int> status;            //!< Exit status, preferred over the scheduler id
    std::optional<std::string> sched_id;  //!< Scheduler id
    std::optional<std::string> site;      //!< Execution site
    std::optional<std::string> walltime;  //!< Wall time, passed through as written
    std::uint64_t submit_seq{};           //!< Submit sequence of the instance
};

/**
 * One monitor lifecycle line
 */
struct InternalRecord final {
    std::int64_t timestamp{}; //!< Epoch seconds
    std::string message;      //!< Text between the "***" markers
};

using ReplayRecord = std::variant<JobStateRecord, InternalRecord>;

[[nodiscard]] std::string format_replay_line(const JobStateRecord &record);
[[nodiscard]] std::string format_internal_line(std::int64_t timestamp, std::string_view message);

/**
 * Parse one replay log line
 *
 * The fourth column is read as an exit status for completion states
 * when it is an integer, and as a scheduler id otherwise.
 *
 * @param[in] line Line without the trailing newline
 * @return Parsed record or an error message
 */
[[nodiscard]] tl::expected<ReplayRecord, std::string> parse_replay_line(std::string_view line);

/**
 * Writer for the job state log
 *
 * Lines are written with a single write(2) on a file opened with
 * O_APPEND, optionally followed by fdatasync(2).
 */
class ReplayLog final {
public:
    ReplayLog() = default;
    ~ReplayLog();

    ReplayLog(const ReplayLog &) = delete;
    ReplayLog &operator=(const ReplayLog &) = delete;
    ReplayLog(ReplayLog &&other) noexcept;
    ReplayLog &operator=(ReplayLog &&other) noexcept;

    /**
     * Open the log file
     *
     * @param[in] file Log file path
     * @param[in] mode Append to or truncate an existing file
     * @param[in] sync Call fdatasync after every line
     * @return Empty error code on success, ReplayLogOpenFailed otherwise
     */
    [[nodiscard]] std::error_code
    open(const std::filesystem::path &file, ReplayOpenMode mode, bool sync = false);

    /**
     * Append a job state line
     *
     * @return Empty error code once the line is written, ReplayLogWriteFailed otherwise
     */
    [[nodiscard]] std::error_code append(const JobStateRecord &record);

    /**
     * Append an INTERNAL line
     */
    [[nodiscard]] std::error_code write_internal(std::int64_t timestamp, std::string_view message);

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path &file() const noexcept { return file_; }
    [[nodiscard]] std::size_t lines_written() const noexcept { return lines_written_; }

private:
    std::error_code write_line(std::string line);

    int fd_{-1};
    bool sync_{false};
    std::filesystem::path file_;
    std::size_t lines_written_{0};
};

} // namespace wfmon::monitor

WISE_ENUM_ADAPT(wfmon::monitor::ReplayOpenMode, Append, Truncate)

#endif // WFMON_MONITOR_REPLAY_LOG_HPP
