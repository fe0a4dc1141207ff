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
 * @file output_extractor.hpp
 * @brief Interface to the collaborator that parses a job's captured output
 */

#ifndef WFMON_MONITOR_OUTPUT_EXTRACTOR_HPP
#define WFMON_MONITOR_OUTPUT_EXTRACTOR_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wfmon::monitor {

class JobInstance;

/**
 * Host a task ran on
 */
struct HostInfo final {
    std::string hostname{"unknown"};         //!< Fully qualified host name
    std::string ip{"unknown"};               //!< Host address
    std::string site{"unknown"};             //!< Site (resource) name
    std::optional<std::string> total_memory; //!< Total memory as reported
    std::optional<std::string> uname;        //!< "<system>-<release>-<machine>"
};

/**
 * One task invocation found in a job's output
 */
struct TaskRecord final {
    std::optional<std::string> transformation;  //!< Logical transformation name
    std::optional<std::string> derivation;      //!< Abstract job id
    std::optional<std::string> executable;      //!< Executable that ran
    std::optional<std::string> argv;            //!< Argument vector
    std::optional<std::string> exitcode;        //!< Raw exit code
    std::optional<std::int64_t> start;          //!< Start time, epoch seconds
    std::optional<double> duration;             //!< Duration in seconds
    std::optional<double> remote_cpu_time;      //!< User plus system CPU seconds
    std::optional<HostInfo> host;               //!< Host, when the record carries one
};

/**
 * Everything an extractor learned from a job's output
 */
struct ExtractedOutput final {
    std::vector<TaskRecord> tasks;              //!< Task records in output order
    std::optional<std::string> remote_user;     //!< User the job ran as
    std::optional<std::string> remote_work_dir; //!< Working directory on the remote side
    std::optional<std::int64_t> cluster_start;  //!< Clustered job start, epoch seconds
    std::optional<double> cluster_duration;     //!< Clustered job duration in seconds
    std::optional<std::string> stdout_text;     //!< Application stdout embedded in the records
    std::optional<std::string> stderr_text;     //!< Application stderr embedded in the records

    [[nodiscard]] bool empty() const noexcept { return tasks.empty(); }
};

/**
 * Parser of a completed job's captured output
 *
 * Implementations locate and parse the job's output files. Missing or
 * unreadable output yields an empty result.
 */
class OutputExtractor {
public:
    OutputExtractor() = default;
    virtual ~OutputExtractor() = default;

    OutputExtractor(const OutputExtractor &) = delete;
    OutputExtractor &operator=(const OutputExtractor &) = delete;
    OutputExtractor(OutputExtractor &&) = delete;
    OutputExtractor &operator=(OutputExtractor &&) = delete;

    /**
     * Extract task records for a job whose main phase just ended
     *
     * @param[in] job Job instance, including its output file names and counter
     * @param[in] run_dir Workflow run directory
     * @return Extracted records, empty when no output is available
     */
    [[nodiscard]] virtual ExtractedOutput
    extract(const JobInstance &job, const std::filesystem::path &run_dir) = 0;
};

/**
 * Extractor that never finds any output
 */
class NullOutputExtractor final : public OutputExtractor {
public:
    [[nodiscard]] ExtractedOutput
    extract(const JobInstance & /*job*/, const std::filesystem::path & /*run_dir*/) override {
        return {};
    }
};

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_OUTPUT_EXTRACTOR_HPP
