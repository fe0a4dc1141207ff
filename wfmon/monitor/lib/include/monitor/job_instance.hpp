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
 * @file job_instance.hpp
 * @brief One submission of a job and its lifecycle data
 */

#ifndef WFMON_MONITOR_JOB_INSTANCE_HPP
#define WFMON_MONITOR_JOB_INSTANCE_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "log/log_macros.hpp"
#include "monitor/job_state.hpp"
#include "monitor/output_extractor.hpp"
#include "monitor/submit_file.hpp"

namespace wfmon::monitor {

/**
 * Identity of a job instance
 */
struct JobKey final {
    std::string name;         //!< Job name
    std::uint64_t submit_seq{}; //!< Workflow-wide submit sequence

    auto operator<=>(const JobKey &) const = default;
};

/**
 * Timing and exit code of one phase (pre-script, main job or post-script)
 */
struct PhaseTiming final {
    std::optional<std::int64_t> start; //!< Phase start, epoch seconds
    std::optional<std::int64_t> end;   //!< Phase end, epoch seconds
    std::optional<int> exitcode;       //!< Exit code once the phase ended
};

/**
 * Facts learned about an instance from its submit file and its output
 */
struct JobRunInfo final {
    std::optional<std::string> site;              //!< Execution site
    std::optional<std::string> stdin_file;        //!< Standard input, relative to the submit dir
    std::optional<std::string> stdout_file;       //!< Standard output, relative to the submit dir
    std::optional<std::string> stderr_file;       //!< Standard error, relative to the submit dir
    std::optional<std::string> stdout_text;       //!< Captured standard output
    std::optional<std::string> stderr_text;       //!< Captured standard error
    std::optional<std::string> executable;        //!< Executable from the submit file
    std::optional<std::string> arguments;         //!< Arguments from the submit file
    std::optional<std::string> transformation;    //!< Logical transformation
    std::optional<std::string> derivation;        //!< Abstract job id
    std::optional<std::string> multiplier_factor; //!< Accounting multiplier
    std::optional<std::string> dagman_out;        //!< Nested controller log
    std::optional<std::string> remote_user;       //!< User the job ran as
    std::optional<std::string> remote_work_dir;   //!< Remote working directory
    std::optional<std::int64_t> cluster_start;    //!< Clustered job start
    std::optional<double> cluster_duration;       //!< Clustered job duration
    std::uint32_t output_counter{0};              //!< Resubmission counter for output rotation
    bool output_parsed{false};                    //!< Task records were found in the output
};

/**
 * A single submission of a job
 *
 * Created on the first instance-creating signal for a job name; every
 * later resubmission is a new instance with a fresh submit sequence.
 */
class JobInstance final {
public:
    JobInstance(std::string name, std::uint64_t submit_seq);

    [[nodiscard]] const std::string &name() const noexcept { return name_; }
    [[nodiscard]] std::uint64_t submit_seq() const noexcept { return submit_seq_; }
    [[nodiscard]] JobKey key() const { return JobKey{name_, submit_seq_}; }

    /**
     * Current state, or nullopt before the first transition
     */
    [[nodiscard]] std::optional<JobState> state() const noexcept { return state_; }
    [[nodiscard]] std::int64_t state_timestamp() const noexcept { return state_timestamp_; }

    /**
     * Number of transitions applied to this instance
     */
    [[nodiscard]] std::uint32_t state_seq() const noexcept { return state_seq_; }

    [[nodiscard]] const std::optional<std::string> &sched_id() const noexcept { return sched_id_; }
    void set_sched_id(std::string sched_id) { sched_id_ = std::move(sched_id); }

    /**
     * Apply a transition
     *
     * Overwrites state and timestamp, increments the state sequence and
     * records phase timing. A missing status defaults to 0 for success
     * states and 1 for failure states.
     *
     * @param[in] state New state
     * @param[in] timestamp Epoch seconds of the transition
     * @param[in] status Exit status reported with the transition
     */
    void apply(JobState state, std::int64_t timestamp, std::optional<int> status);

    /**
     * Check whether the instance has reached a terminal state
     *
     * @param[in] has_post_script Whether the job has a post-script
     */
    [[nodiscard]] bool is_terminal(bool has_post_script) const noexcept;

    [[nodiscard]] const PhaseTiming &pre_script() const noexcept { return pre_script_; }
    [[nodiscard]] const PhaseTiming &main_job() const noexcept { return main_job_; }
    [[nodiscard]] const PhaseTiming &post_script() const noexcept { return post_script_; }

    [[nodiscard]] JobRunInfo &run_info() noexcept { return run_info_; }
    [[nodiscard]] const JobRunInfo &run_info() const noexcept { return run_info_; }

    [[nodiscard]] bool submit_file_parsed() const noexcept { return submit_file_parsed_; }

    /**
     * Record submit file facts
     *
     * File names under the original submit directory are made relative
     * to it.
     *
     * @param[in] info Parsed submit file
     * @param[in] original_submit_dir Submit directory at planning time
     */
    void apply_submit_file(
            const SubmitFileInfo &info, const std::optional<std::string> &original_submit_dir);

    /**
     * Mark the submit file as handled without parsing one
     */
    void mark_submit_file_parsed() noexcept { submit_file_parsed_ = true; }

    [[nodiscard]] bool submit_reported() const noexcept { return submit_reported_; }
    void mark_submit_reported() noexcept { submit_reported_ = true; }

    /// Whether submit.end has been sent (or withheld during recovery)
    [[nodiscard]] bool submit_closed() const noexcept { return submit_closed_; }
    void mark_submit_closed() noexcept { submit_closed_ = true; }

    /**
     * Record remote facts found by the output extractor
     */
    void absorb_output(const ExtractedOutput &output);

    /**
     * Read the captured stdout and stderr files
     *
     * Looks for the rotated "<file>.NNN" name first. At most limit + 1
     * bytes are kept so that callers can detect truncation.
     *
     * @param[in] run_dir Workflow run directory
     * @param[in] limit Maximum bytes callers will forward
     */
    void read_captured_output(const std::filesystem::path &run_dir, std::size_t limit);

    /**
     * Drop captured stdout and stderr text
     */
    void release_output() noexcept;

private:
    std::string name_;
    std::uint64_t submit_seq_{};
    std::optional<JobState> state_;
    std::int64_t state_timestamp_{};
    std::uint32_t state_seq_{};
    std::optional<std::string> sched_id_;
    PhaseTiming pre_script_;
    PhaseTiming main_job_;
    PhaseTiming post_script_;
    JobRunInfo run_info_;
    bool submit_file_parsed_{false};
    bool submit_reported_{false};
    bool submit_closed_{false};
};

} // namespace wfmon::monitor

WFMON_LOGGABLE_DEFERRED_FORMAT(
        wfmon::monitor::JobKey, "name: {}, seq: {}", obj.name, obj.submit_seq)

#endif // WFMON_MONITOR_JOB_INSTANCE_HPP
