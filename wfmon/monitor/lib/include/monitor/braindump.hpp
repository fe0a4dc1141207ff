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
 * @file braindump.hpp
 * @brief Workflow properties written by the planner
 *
 * The planner describes each workflow in a "braindump" file of
 * whitespace separated key/value lines. Only the workflow id and the
 * DAG file name are mandatory.
 */

#ifndef WFMON_MONITOR_BRAINDUMP_HPP
#define WFMON_MONITOR_BRAINDUMP_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <system_error>

#include <tl/expected.hpp>

namespace wfmon::monitor {

/**
 * Planner-provided properties of one workflow
 */
struct WorkflowProperties final {
    std::string wf_uuid;                              //!< Globally unique workflow id
    std::string dag_file;                             //!< DAG file name, relative to the run dir
    std::optional<std::string> root_wf_uuid;          //!< Root workflow id, when nested
    std::optional<std::string> dax_label;             //!< Abstract workflow label
    std::optional<std::string> dax_index;             //!< Abstract workflow index
    std::optional<std::string> dax_version;           //!< Abstract workflow schema version
    std::optional<std::string> dax_file;              //!< Abstract workflow file
    std::int64_t timestamp{};                         //!< Planning time, epoch seconds
    std::optional<std::string> submit_dir;            //!< Submit directory as written
    std::optional<std::string> original_submit_dir;   //!< Normalized submit directory at plan time
    std::optional<std::string> planner_version;       //!< Planner version
    std::optional<std::string> planner_arguments;     //!< Planner command line
    std::optional<std::string> submit_hostname;       //!< Host the workflow was planned on
    std::optional<std::string> user;                  //!< Submitting user
    std::optional<std::string> grid_dn;               //!< Grid certificate subject
    std::optional<std::string> notify_file;           //!< Notification file name

    /**
     * Human readable label used in diagnostics ("<label>-<index>")
     */
    [[nodiscard]] std::string display_label() const;
};

/**
 * Parse braindump content
 *
 * @param[in] input Stream positioned at the first line
 * @param[in] now Epoch seconds used when no usable planning time is present
 * @return Parsed properties, or MissingWorkflowId / MissingDagFile
 */
[[nodiscard]] tl::expected<WorkflowProperties, std::error_code>
parse_braindump(std::istream &input, std::int64_t now);

/**
 * Load a braindump file
 *
 * @param[in] file Path of the braindump file
 * @return Parsed properties, FileOpenFailed, or a parse error
 */
[[nodiscard]] tl::expected<WorkflowProperties, std::error_code>
load_braindump(const std::filesystem::path &file);

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_BRAINDUMP_HPP
