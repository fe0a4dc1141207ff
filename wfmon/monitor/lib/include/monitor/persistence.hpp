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
 * @file persistence.hpp
 * @brief Checkpoint, recovery marker and sentinel files of a workflow
 */

#ifndef WFMON_MONITOR_PERSISTENCE_HPP
#define WFMON_MONITOR_PERSISTENCE_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <system_error>

#include <tl/expected.hpp>

namespace wfmon::monitor {

/**
 * State persisted on clean termination
 */
struct Checkpoint final {
    std::uint64_t next_submit_seq{1};                   //!< Next submit sequence to hand out
    std::uint64_t last_processed_offset{0};             //!< Last input offset processed
    std::uint32_t restart_count{0};                     //!< Controller starts seen so far
    std::map<std::string, std::uint32_t> job_counters; //!< Resubmission counter per job name

    bool operator==(const Checkpoint &other) const = default;
};

/**
 * Locations of the per-workflow state files
 */
struct FileLayout final {
    std::filesystem::path checkpoint;      //!< monitord.info
    std::filesystem::path recovery_marker; //!< monitord.recover
    std::filesystem::path started;         //!< monitord.started
    std::filesystem::path done;            //!< monitord.done
    std::filesystem::path replay_log;      //!< jobstate.log

    /**
     * Build the layout of a workflow
     *
     * Files live in the run directory, or in the output directory with
     * the workflow id as prefix ("<wf_uuid>-monitord.info").
     *
     * @param[in] run_dir Workflow run directory
     * @param[in] output_dir Optional directory overriding the run directory
     * @param[in] wf_uuid Workflow id
     * @param[in] replay_log_name Replay log file name
     * @return Layout with absolute or run-dir relative paths
     */
    [[nodiscard]] static FileLayout make(
            const std::filesystem::path &run_dir,
            const std::optional<std::filesystem::path> &output_dir,
            const std::string &wf_uuid,
            const std::string &replay_log_name = "jobstate.log");
};

/**
 * Parse checkpoint content
 *
 * @param[in] input Stream with "key value" lines
 * @return Checkpoint, or ParseFailed on a malformed line
 */
[[nodiscard]] tl::expected<Checkpoint, std::error_code> parse_checkpoint(std::istream &input);

/**
 * Render a checkpoint, job counters sorted by job name
 */
[[nodiscard]] std::string format_checkpoint(const Checkpoint &checkpoint);

/**
 * Read a recovery marker file
 *
 * @param[in] file Marker path
 * @return Last processed offset, FileOpenFailed if absent, ParseFailed if malformed
 */
[[nodiscard]] tl::expected<std::uint64_t, std::error_code>
read_recovery_marker(const std::filesystem::path &file);

/**
 * Replace a file's content through a temporary file and a rename
 *
 * @param[in] file Destination
 * @param[in] content New content
 * @return Empty error code on success
 */
[[nodiscard]] std::error_code
write_file_atomic(const std::filesystem::path &file, const std::string &content);

/**
 * Move an existing file aside to the first free "<file>.NNN" name
 *
 * @param[in] file File to rotate
 * @return Rotated name, nullopt if the file did not exist, or FileRenameFailed
 */
[[nodiscard]] tl::expected<std::optional<std::filesystem::path>, std::error_code>
rotate_file(const std::filesystem::path &file);

/**
 * Prior state found when a workflow starts
 */
struct LoadedState final {
    Checkpoint checkpoint;                      //!< State to continue from
    std::optional<std::uint64_t> recovery_offset; //!< Offset processed by a crashed daemon

    [[nodiscard]] bool recovering() const noexcept { return recovery_offset.has_value(); }

    /**
     * Input offset processing resumes from
     */
    [[nodiscard]] std::uint64_t resume_offset() const noexcept {
        return recovering() ? 0 : checkpoint.last_processed_offset;
    }
};

/**
 * Reader and writer of one workflow's state files
 */
class Persistence final {
public:
    explicit Persistence(FileLayout layout);

    /**
     * Read prior state
     *
     * A recovery marker puts the workflow in recovery mode: checkpoint
     * counters are discarded so that a re-scan from offset 0 reproduces
     * the original numbering. Unreadable files are logged and treated as
     * absent.
     *
     * @param[in] replay_mode Ignore all prior state
     * @return State to start from
     */
    [[nodiscard]] LoadedState load(bool replay_mode);

    /**
     * Persist the checkpoint and delete the recovery marker
     *
     * @param[in] checkpoint State to persist
     * @return Empty error code on success
     */
    [[nodiscard]] std::error_code save(const Checkpoint &checkpoint);

    /**
     * Record progress in the recovery marker
     *
     * Ignored until the offset has caught up with the marker found at
     * load time.
     *
     * @param[in] offset Input offset fully processed
     * @return Empty error code when written or skipped
     */
    [[nodiscard]] std::error_code checkpoint_progress(std::uint64_t offset);

    /**
     * Write the start sentinel with the process id and start time
     */
    [[nodiscard]] std::error_code write_started(std::int64_t now);

    /**
     * Write the done sentinel and remove the start sentinel
     *
     * @param[in] now Completion time, epoch seconds
     * @param[in] elapsed Seconds since the monitor started
     */
    [[nodiscard]] std::error_code write_done(std::int64_t now, double elapsed);

    /**
     * Remove a done sentinel left by an earlier run
     */
    void remove_stale_done();

    [[nodiscard]] const FileLayout &layout() const noexcept { return layout_; }
    [[nodiscard]] std::optional<std::uint64_t> previous_marker() const noexcept {
        return previous_marker_;
    }

private:
    FileLayout layout_;
    std::optional<std::uint64_t> previous_marker_;
};

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_PERSISTENCE_HPP
