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


#include <optional>    // for optional, nullopt
#include <string_view> // for string_view

#include <wise_enum.h> // for from_string, to_string

#include "monitor/job_state.hpp"

namespace wfmon::monitor {

JobPhase phase_of(const JobState state) noexcept {
    switch (state) {
    case JobState::PRE_SCRIPT_STARTED:
    case JobState::PRE_SCRIPT_SUCCESS:
    case JobState::PRE_SCRIPT_FAILURE:
    case JobState::PRE_SCRIPT_TERMINATED:
        return JobPhase::PreScript;
    case JobState::SUBMIT:
    case JobState::SUBMIT_FAILED:
    case JobState::GRID_SUBMIT:
    case JobState::GRID_SUBMIT_FAILED:
    case JobState::GLOBUS_SUBMIT:
    case JobState::GLOBUS_SUBMIT_FAILED:
    case JobState::DAGMAN_SUBMIT:
        return JobPhase::Submit;
    case JobState::EXECUTE:
    case JobState::IMAGE_SIZE:
    case JobState::REMOTE_ERROR:
    case JobState::JOB_HELD:
    case JobState::JOB_RELEASED:
    case JobState::JOB_EVICTED:
    case JobState::JOB_TERMINATED:
    case JobState::JOB_SUCCESS:
    case JobState::JOB_FAILURE:
        return JobPhase::Main;
    case JobState::POST_SCRIPT_STARTED:
    case JobState::POST_SCRIPT_TERMINATED:
    case JobState::POST_SCRIPT_SUCCESS:
    case JobState::POST_SCRIPT_FAILURE:
        return JobPhase::PostScript;
    }
    return JobPhase::Main;
}

bool is_submit_class(const JobState state) noexcept {
    return state == JobState::PRE_SCRIPT_STARTED || state == JobState::DAGMAN_SUBMIT ||
           state == JobState::SUBMIT || state == JobState::SUBMIT_FAILED;
}

bool is_success_state(const JobState state) noexcept {
    return state == JobState::PRE_SCRIPT_SUCCESS || state == JobState::JOB_SUCCESS ||
           state == JobState::POST_SCRIPT_SUCCESS;
}

bool is_failure_state(const JobState state) noexcept {
    return state == JobState::PRE_SCRIPT_FAILURE || state == JobState::JOB_FAILURE ||
           state == JobState::POST_SCRIPT_FAILURE;
}

bool is_terminal_state(const JobState state, const bool has_post_script) noexcept {
    if (state == JobState::POST_SCRIPT_SUCCESS || state == JobState::POST_SCRIPT_FAILURE) {
        return true;
    }
    return !has_post_script && (state == JobState::JOB_SUCCESS || state == JobState::JOB_FAILURE);
}

std::optional<JobState> parse_job_state(const std::string_view token) noexcept {
    const auto parsed = ::wise_enum::from_string<JobState>(token);
    if (!parsed) {
        return std::nullopt;
    }
    return *parsed;
}

std::string_view to_token(const JobState state) noexcept {
    const auto name = ::wise_enum::to_string(state);
    return {name.data(), name.size()};
}

} // namespace wfmon::monitor
