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
 * @file event_projection.hpp
 * @brief Mapping of job transitions and workflow milestones to events
 *
 * Projection functions are pure: they read a snapshot of the instance
 * and the workflow context and return the events in emission order.
 * Field names use the dotted schema keys ("xwf.id", "job_inst.id").
 */

#ifndef WFMON_MONITOR_EVENT_PROJECTION_HPP
#define WFMON_MONITOR_EVENT_PROJECTION_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "monitor/braindump.hpp"
#include "monitor/event.hpp"
#include "monitor/job_instance.hpp"
#include "monitor/job_state.hpp"
#include "monitor/output_extractor.hpp"
#include "monitor/static_info.hpp"

namespace wfmon::monitor {

inline constexpr std::size_t DEFAULT_MAX_OUTPUT_LENGTH = 65535;
inline constexpr int PRE_SCRIPT_TASK_ID = -1;
inline constexpr int POST_SCRIPT_TASK_ID = -2;

/**
 * Workflow-wide values shared by all job projections
 */
struct ProjectionContext final {
    std::string wf_uuid;                            //!< Workflow id
    std::optional<std::string> user;                //!< Submitting user
    std::optional<std::string> original_submit_dir; //!< Submit directory at plan time
    std::size_t max_output_length{DEFAULT_MAX_OUTPUT_LENGTH}; //!< stdout/stderr text limit
    bool store_stdout_stderr{true};                 //!< Forward captured stdout/stderr text
    std::int64_t current_timestamp{};               //!< Timestamp of the signal being applied
    HostInfo local_host;                            //!< Host the monitor runs on
    std::string dagman_executable{"condor_dagman"}; //!< Executable reported for sub-workflows
};

/**
 * Project one applied transition
 *
 * For JOB_SUCCESS and JOB_FAILURE the caller has already merged the
 * extracted output into the instance; output holds the task records.
 *
 * @param[in] job Instance after the transition
 * @param[in] info Static info of the job
 * @param[in] state Applied state
 * @param[in] output Extracted task records, empty when none were found
 * @param[in] ctx Workflow context
 * @param[in] emit_submit_start Prepend a submit.start for a late scheduler id
 * @return Events in emission order
 */
[[nodiscard]] std::vector<Event> project_transition(
        const JobInstance &job,
        const JobStaticInfo &info,
        JobState state,
        const ExtractedOutput &output,
        const ProjectionContext &ctx,
        bool emit_submit_start);

/**
 * Build a job_inst.* event with the common identity fields
 *
 * @param[in] job Instance
 * @param[in] ctx Workflow context
 * @param[in] suffix Event name after "job_inst."
 * @param[in] status Status, adding level=Error when non-zero
 */
[[nodiscard]] Event make_job_event(
        const JobInstance &job,
        const ProjectionContext &ctx,
        std::string_view suffix,
        std::optional<int> status = std::nullopt);

/**
 * Limit captured text to max_length bytes, logging a warning when cut
 *
 * @param[in] text Captured text
 * @param[in] max_length Maximum length in bytes
 * @param[in] job_name Job used in the warning
 * @param[in] stream "stdout" or "stderr"
 * @return Text of at most max_length bytes
 */
[[nodiscard]] std::string truncate_output(
        std::string_view text,
        std::size_t max_length,
        std::string_view job_name,
        std::string_view stream);

/**
 * Build wf.plan from the planner properties
 */
[[nodiscard]] Event project_workflow_plan(
        const WorkflowProperties &properties,
        const std::optional<std::string> &parent_wf_uuid,
        const std::optional<std::string> &root_wf_uuid);

/**
 * Build xwf.start or xwf.end
 *
 * @param[in] wf_uuid Workflow id
 * @param[in] timestamp Epoch seconds
 * @param[in] restart_count Controller starts seen, including this one
 * @param[in] exit_code Controller exit code for xwf.end, nullopt for xwf.start
 * @param[in] is_end Build xwf.end instead of xwf.start
 */
[[nodiscard]] Event project_workflow_state(
        const std::string &wf_uuid,
        std::int64_t timestamp,
        std::uint32_t restart_count,
        std::optional<int> exit_code,
        bool is_end);

/**
 * Build xwf.map.subwf_job linking a child workflow to its parent job
 */
[[nodiscard]] Event project_subworkflow_map(
        const std::string &parent_wf_uuid,
        const std::string &child_wf_uuid,
        const std::string &parent_job_name,
        std::uint64_t parent_job_seq,
        std::int64_t timestamp);

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_EVENT_PROJECTION_HPP
