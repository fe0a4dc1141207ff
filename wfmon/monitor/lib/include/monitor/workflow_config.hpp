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
 * @file workflow_config.hpp
 * @brief Run-time options of a workflow orchestrator
 */

#ifndef WFMON_MONITOR_WORKFLOW_CONFIG_HPP
#define WFMON_MONITOR_WORKFLOW_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "monitor/event_projection.hpp"

namespace wfmon::monitor {

/**
 * Configuration of one workflow orchestrator
 *
 * Use the static factory and the fluent with_* setters.
 */
struct WorkflowConfig final {
    std::filesystem::path run_dir;                    //!< Directory the workflow runs in
    std::string braindump_file{"braindump.txt"};      //!< Planner properties file name
    std::optional<std::filesystem::path> output_dir;  //!< Directory for state files, if not the run dir
    std::string replay_log_name{"jobstate.log"};      //!< Replay log file name
    bool replay_mode{false};                          //!< Ignore prior state and replay everything
    bool store_stdout_stderr{true};                   //!< Forward captured stdout/stderr text
    std::size_t max_output_length{DEFAULT_MAX_OUTPUT_LENGTH}; //!< stdout/stderr text limit
    bool sync_replay_log{false};                      //!< fdatasync after every replay log line
    bool emit_static_events{true};                    //!< Send the planner's static BP events
    std::optional<std::string> root_wf_uuid;          //!< Root workflow id override
    std::optional<std::string> parent_wf_uuid;        //!< Parent workflow id, when nested
    std::optional<std::string> parent_job_name;       //!< Parent job running this workflow
    std::optional<std::uint64_t> parent_job_seq;      //!< Submit sequence of the parent job

    /**
     * Create a configuration for a run directory with default options
     *
     * @param[in] run_dir Workflow run directory
     * @return Configuration
     */
    static WorkflowConfig for_run_dir(std::filesystem::path run_dir);

    WorkflowConfig &with_braindump_file(std::string name);
    WorkflowConfig &with_output_dir(std::filesystem::path dir);
    WorkflowConfig &with_replay_log_name(std::string name);
    WorkflowConfig &with_replay_mode(bool enable = true);
    WorkflowConfig &with_store_stdout_stderr(bool enable = true);
    WorkflowConfig &with_max_output_length(std::size_t bytes);
    WorkflowConfig &with_sync_replay_log(bool enable = true);
    WorkflowConfig &with_static_events(bool enable = true);

    /**
     * Attach the workflow to a parent job
     *
     * @param[in] parent_wf_uuid Parent workflow id
     * @param[in] job_name Parent job name
     * @param[in] job_seq Parent job submit sequence
     * @return Reference to this configuration
     */
    WorkflowConfig &
    with_parent(std::string parent_wf_uuid, std::string job_name, std::uint64_t job_seq);

    WorkflowConfig &with_root_wf_uuid(std::string root_wf_uuid);
};

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_WORKFLOW_CONFIG_HPP
