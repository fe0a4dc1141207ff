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


#include <cstddef>    // for size_t
#include <cstdint>    // for uint64_t
#include <filesystem> // for path
#include <string>     // for string
#include <utility>    // for move

#include "monitor/workflow_config.hpp"

namespace wfmon::monitor {

WorkflowConfig WorkflowConfig::for_run_dir(std::filesystem::path run_dir) {
    WorkflowConfig config{};
    config.run_dir = std::move(run_dir);
    return config;
}

WorkflowConfig &WorkflowConfig::with_braindump_file(std::string name) {
    braindump_file = std::move(name);
    return *this;
}

WorkflowConfig &WorkflowConfig::with_output_dir(std::filesystem::path dir) {
    output_dir = std::move(dir);
    return *this;
}

WorkflowConfig &WorkflowConfig::with_replay_log_name(std::string name) {
    replay_log_name = std::move(name);
    return *this;
}

WorkflowConfig &WorkflowConfig::with_replay_mode(const bool enable) {
    replay_mode = enable;
    return *this;
}

WorkflowConfig &WorkflowConfig::with_store_stdout_stderr(const bool enable) {
    store_stdout_stderr = enable;
    return *this;
}

WorkflowConfig &WorkflowConfig::with_max_output_length(const std::size_t bytes) {
    max_output_length = bytes;
    return *this;
}

WorkflowConfig &WorkflowConfig::with_sync_replay_log(const bool enable) {
    sync_replay_log = enable;
    return *this;
}

WorkflowConfig &WorkflowConfig::with_static_events(const bool enable) {
    emit_static_events = enable;
    return *this;
}

WorkflowConfig &WorkflowConfig::with_parent(
        std::string parent_wf_uuid, std::string job_name, const std::uint64_t job_seq) {
    this->parent_wf_uuid = std::move(parent_wf_uuid);
    parent_job_name = std::move(job_name);
    parent_job_seq = job_seq;
    return *this;
}

WorkflowConfig &WorkflowConfig::with_root_wf_uuid(std::string root_wf_uuid) {
    this->root_wf_uuid = std::move(root_wf_uuid);
    return *this;
}

} // namespace wfmon::monitor
