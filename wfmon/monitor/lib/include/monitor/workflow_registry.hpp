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
 * @file workflow_registry.hpp
 * @brief Process-owned map from run directory to workflow identity
 */

#ifndef WFMON_MONITOR_WORKFLOW_REGISTRY_HPP
#define WFMON_MONITOR_WORKFLOW_REGISTRY_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace wfmon::monitor {

/**
 * Identity of a workflow and its position in the hierarchy
 */
struct WorkflowLink final {
    std::string wf_uuid;                       //!< Workflow id
    std::optional<std::string> parent_wf_uuid; //!< Parent workflow id, when nested
    std::optional<std::string> root_wf_uuid;   //!< Root workflow id

    bool operator==(const WorkflowLink &other) const = default;
};

/**
 * Registry of workflows seen by this process
 *
 * A workflow re-entering the same run directory (replanning or a
 * resumed rescue DAG) keeps its first registration.
 */
class WorkflowRegistry final {
public:
    /**
     * Register a workflow under its run directory
     *
     * @param[in] run_dir Run directory
     * @param[in] link Workflow identity
     * @return true if the directory was not registered before
     */
    bool register_workflow(const std::filesystem::path &run_dir, WorkflowLink link);

    /**
     * Look up the workflow of a run directory
     */
    [[nodiscard]] std::optional<WorkflowLink> find(const std::filesystem::path &run_dir) const;

    [[nodiscard]] std::size_t size() const noexcept { return workflows_.size(); }

private:
    std::map<std::string, WorkflowLink> workflows_;
};

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_WORKFLOW_REGISTRY_HPP
