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
 * @file signal.hpp
 * @brief State-transition signal delivered by the controller log tokenizer
 */

#ifndef WFMON_MONITOR_SIGNAL_HPP
#define WFMON_MONITOR_SIGNAL_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "log/log_macros.hpp"
#include "monitor/job_state.hpp"

namespace wfmon::monitor {

/**
 * One job state transition observed in the controller log
 */
struct Signal final {
    std::string job_name;                //!< Job name as written in the DAG file
    JobState kind{JobState::SUBMIT};     //!< Reported state
    std::optional<std::string> sched_id; //!< Scheduler id, when the line carried one
    std::int64_t timestamp{};            //!< Epoch seconds
    std::optional<int> status;           //!< Exit status for completion states
    std::optional<std::string> walltime; //!< Wall time token, when reported
};

} // namespace wfmon::monitor

WFMON_LOGGABLE_DEFERRED_FORMAT(
        wfmon::monitor::Signal,
        "job: {}, kind: {}, sched_id: {}, ts: {}, status: {}",
        obj.job_name,
        wfmon::monitor::to_token(obj.kind),
        obj.sched_id.value_or("-"),
        obj.timestamp,
        obj.status.has_value() ? std::to_string(*obj.status) : std::string{"-"})

#endif // WFMON_MONITOR_SIGNAL_HPP
