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
 * @file submit_file.hpp
 * @brief Scheduler submit file fields used by the monitor
 */

#ifndef WFMON_MONITOR_SUBMIT_FILE_HPP
#define WFMON_MONITOR_SUBMIT_FILE_HPP

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <system_error>

#include <tl/expected.hpp>

namespace wfmon::monitor {

/**
 * Fields extracted from a job's submit file
 */
struct SubmitFileInfo final {
    std::optional<std::string> site;              //!< +pegasus_site
    std::optional<std::string> input;             //!< input
    std::optional<std::string> output;            //!< output
    std::optional<std::string> error;             //!< error
    std::optional<std::string> executable;        //!< executable
    std::optional<std::string> arguments;         //!< arguments
    std::optional<std::string> transformation;    //!< +pegasus_wf_xformation
    std::optional<std::string> derivation;        //!< +pegasus_wf_dax_job_id
    std::optional<std::string> multiplier_factor; //!< +pegasus_job_multiplier_factor
    std::optional<std::string> dagman_out;        //!< Nested controller log, from "-Dag <file>"
};

/**
 * Parse submit file content
 *
 * Lines are "key = value"; keys are case-insensitive and surrounding
 * double quotes are removed from values.
 *
 * @param[in] input Stream with the submit file content
 * @return Extracted fields
 */
[[nodiscard]] SubmitFileInfo parse_submit(std::istream &input);

/**
 * Parse a submit file
 *
 * @param[in] file Submit file path
 * @return Extracted fields, or FileOpenFailed
 */
[[nodiscard]] tl::expected<SubmitFileInfo, std::error_code>
parse_submit_file(const std::filesystem::path &file);

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_SUBMIT_FILE_HPP
