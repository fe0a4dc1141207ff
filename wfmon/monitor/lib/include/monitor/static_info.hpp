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
 * @file static_info.hpp
 * @brief Per-job information planned ahead of execution
 *
 * Parsed once from the workflow's DAG file before any signal is
 * applied and shared read-only afterwards.
 */

#ifndef WFMON_MONITOR_STATIC_INFO_HPP
#define WFMON_MONITOR_STATIC_INFO_HPP

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>

#include <tl/expected.hpp>

namespace wfmon::monitor {

/**
 * Static description of one job in the DAG
 */
struct JobStaticInfo final {
    std::optional<std::filesystem::path> submit_file;  //!< Submit file, absent for DONE jobs
    std::optional<std::string> pre_script_executable;  //!< SCRIPT PRE executable
    std::optional<std::string> pre_script_arguments;   //!< SCRIPT PRE arguments
    std::optional<std::string> post_script_executable; //!< SCRIPT POST executable
    std::optional<std::string> post_script_arguments;  //!< SCRIPT POST arguments
    bool is_subworkflow{false};                        //!< Job is a SUBDAG EXTERNAL
    std::optional<std::string> subdag_file;            //!< Nested DAG file
    std::optional<std::string> subdag_dir;             //!< Directory the nested DAG runs in

    [[nodiscard]] bool has_post_script() const noexcept {
        return post_script_executable.has_value();
    }
};

/**
 * Static information keyed by job name
 */
using StaticInfoTable = std::unordered_map<std::string, JobStaticInfo>;

/**
 * Parse DAG content
 *
 * Recognizes JOB, SCRIPT PRE, SCRIPT POST and SUBDAG EXTERNAL lines;
 * everything else is ignored. Keywords are case-insensitive. Submit
 * files of jobs marked DONE are not recorded.
 *
 * @param[in] input Stream with the DAG content
 * @param[in] run_dir Directory relative submit file names are resolved against
 * @return Table of parsed jobs
 */
[[nodiscard]] StaticInfoTable parse_dag(std::istream &input, const std::filesystem::path &run_dir);

/**
 * Parse a DAG file
 *
 * @param[in] dag_file DAG file path
 * @param[in] run_dir Directory relative submit file names are resolved against
 * @return Table of parsed jobs, or an error message if the file cannot be read
 */
[[nodiscard]] tl::expected<StaticInfoTable, std::string>
parse_dag_file(const std::filesystem::path &dag_file, const std::filesystem::path &run_dir);

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_STATIC_INFO_HPP
