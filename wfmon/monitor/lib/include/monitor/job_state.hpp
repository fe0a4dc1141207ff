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
 * @file job_state.hpp
 * @brief Job states reported by the execution controller and their phases
 */

#ifndef WFMON_MONITOR_JOB_STATE_HPP
#define WFMON_MONITOR_JOB_STATE_HPP

#include <cstdint>
#include <optional>
#include <string_view>

#include <wise_enum.h>

namespace wfmon::monitor {

/**
 * Job state as written to and read from the replay log
 *
 * Enumerator names are the replay log tokens, so they follow the
 * controller's spelling rather than the project's naming convention.
 */
// NOLINTBEGIN(readability-identifier-naming)
enum class JobState : std::uint8_t {
    PRE_SCRIPT_STARTED,     //!< Pre-script launched
    PRE_SCRIPT_SUCCESS,     //!< Pre-script exited with zero
    PRE_SCRIPT_FAILURE,     //!< Pre-script exited with non-zero
    PRE_SCRIPT_TERMINATED,  //!< Pre-script terminated
    SUBMIT,                 //!< Job handed to the scheduler
    SUBMIT_FAILED,          //!< Scheduler rejected the job
    GRID_SUBMIT,            //!< Job forwarded to a grid resource
    GRID_SUBMIT_FAILED,     //!< Grid resource rejected the job
    GLOBUS_SUBMIT,          //!< Job forwarded through Globus
    GLOBUS_SUBMIT_FAILED,   //!< Globus rejected the job
    EXECUTE,                //!< Job started executing
    IMAGE_SIZE,             //!< Job reported its memory image size
    REMOTE_ERROR,           //!< Remote side reported an error
    JOB_HELD,               //!< Job held by the scheduler
    JOB_RELEASED,           //!< Held job released
    JOB_EVICTED,            //!< Job evicted from its execution slot
    JOB_TERMINATED,         //!< Job process terminated
    JOB_SUCCESS,            //!< Main job succeeded
    JOB_FAILURE,            //!< Main job failed
    POST_SCRIPT_STARTED,    //!< Post-script launched
    POST_SCRIPT_TERMINATED, //!< Post-script terminated
    POST_SCRIPT_SUCCESS,    //!< Post-script exited with zero
    POST_SCRIPT_FAILURE,    //!< Post-script exited with non-zero
    DAGMAN_SUBMIT           //!< Controller submitted a nested workflow
};
// NOLINTEND(readability-identifier-naming)

/**
 * Lifecycle phase of a job instance, ordered by execution
 */
enum class JobPhase : std::uint8_t {
    PreScript,  //!< Before submission
    Submit,     //!< Submission and scheduler hand-off
    Main,       //!< Execution of the main job
    PostScript  //!< After the main job
};

} // namespace wfmon::monitor

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        wfmon::monitor::JobState,
        PRE_SCRIPT_STARTED,
        PRE_SCRIPT_SUCCESS,
        PRE_SCRIPT_FAILURE,
        PRE_SCRIPT_TERMINATED,
        SUBMIT,
        SUBMIT_FAILED,
        GRID_SUBMIT,
        GRID_SUBMIT_FAILED,
        GLOBUS_SUBMIT,
        GLOBUS_SUBMIT_FAILED,
        EXECUTE,
        IMAGE_SIZE,
        REMOTE_ERROR,
        JOB_HELD,
        JOB_RELEASED,
        JOB_EVICTED,
        JOB_TERMINATED,
        JOB_SUCCESS,
        JOB_FAILURE,
        POST_SCRIPT_STARTED,
        POST_SCRIPT_TERMINATED,
        POST_SCRIPT_SUCCESS,
        POST_SCRIPT_FAILURE,
        DAGMAN_SUBMIT)

WISE_ENUM_ADAPT(wfmon::monitor::JobPhase, PreScript, Submit, Main, PostScript)

namespace wfmon::monitor {

/**
 * Get the phase a state belongs to
 *
 * @param[in] state Job state
 * @return Phase of the state
 */
[[nodiscard]] JobPhase phase_of(JobState state) noexcept;

/**
 * Check whether a state may open a new job instance
 *
 * PRE_SCRIPT_STARTED, DAGMAN_SUBMIT, SUBMIT and SUBMIT_FAILED are the
 * only states that create instances; every other state targets the
 * latest instance of its job.
 *
 * @param[in] state Job state
 * @return true for instance-creating states
 */
[[nodiscard]] bool is_submit_class(JobState state) noexcept;

/**
 * Check whether a state closes a phase with a successful exit
 */
[[nodiscard]] bool is_success_state(JobState state) noexcept;

/**
 * Check whether a state closes a phase with a failed exit
 */
[[nodiscard]] bool is_failure_state(JobState state) noexcept;

/**
 * Check whether a state is terminal for its instance
 *
 * @param[in] state Job state
 * @param[in] has_post_script Whether the job has a post-script
 * @return true if no further transitions are expected
 */
[[nodiscard]] bool is_terminal_state(JobState state, bool has_post_script) noexcept;

/**
 * Parse a replay log state token
 *
 * @param[in] token State name, e.g. "JOB_SUCCESS"
 * @return Parsed state, or nullopt for unknown tokens
 */
[[nodiscard]] std::optional<JobState> parse_job_state(std::string_view token) noexcept;

/**
 * Get the replay log token for a state
 */
[[nodiscard]] std::string_view to_token(JobState state) noexcept;

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_JOB_STATE_HPP
