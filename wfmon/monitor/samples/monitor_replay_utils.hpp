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
 * @file monitor_replay_utils.hpp
 * @brief Utility functions for the job state log replay tool
 */

#ifndef WFMON_MONITOR_MONITOR_REPLAY_UTILS_HPP
#define WFMON_MONITOR_MONITOR_REPLAY_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <tl/expected.hpp>

#include "log/components.hpp"
#include "log/logger.hpp"
#include "monitor/replay_log.hpp"
#include "monitor/workflow.hpp"

namespace wfmon::monitor::samples {

/// Default number of input lines between recovery marker updates
constexpr std::size_t DEFAULT_CHECKPOINT_INTERVAL = 100;

/**
 * Application command-line arguments
 */
struct AppArguments final {
    std::filesystem::path run_dir;                        //!< Workflow run directory
    std::filesystem::path input_file;                     //!< Job state log to replay
    std::filesystem::path events_file;                    //!< BP output file, events disabled if empty
    std::optional<std::filesystem::path> output_dir;      //!< Directory for state files
    std::optional<std::filesystem::path> log_file;        //!< Diagnostic log file, console if unset
    std::string log_format{"text"};                       //!< Diagnostic log format, text or json
    std::size_t log_rotate_bytes{0};                      //!< Rotate the text log at this size, 0 never
    std::string replay_log_name{"jobstate.log"};          //!< Replay log file name
    std::size_t max_output_length{DEFAULT_MAX_OUTPUT_LENGTH}; //!< stdout/stderr text limit
    std::size_t checkpoint_interval{DEFAULT_CHECKPOINT_INTERVAL}; //!< Lines between markers
    bool replay_mode{false};                              //!< Ignore prior state
    bool no_stdout_stderr{false};                         //!< Drop captured stdout/stderr text
    bool no_static_events{false};                         //!< Skip planner static events
    bool sync{false};                                     //!< fdatasync the replay log
    bool verbose{false};                                  //!< Debug level logging
};

/**
 * One parsed input line and the byte offset just past it
 */
struct InputLine final {
    ReplayRecord record;     //!< Parsed line
    std::uint64_t end_offset{}; //!< Offset of the next line
};

/**
 * Counters reported after a replay
 */
struct ReplayStats final {
    std::size_t lines{};      //!< Records read
    std::size_t skipped{};    //!< Records before the resume offset
    std::size_t applied{};    //!< Signals applied with events
    std::size_t suppressed{}; //!< Signals applied silently during recovery
    std::size_t ignored{};    //!< Regressing signals
    std::size_t dropped{};    //!< Signals for unknown jobs
    std::size_t refused{};    //!< Signals refused by the workflow
};

/**
 * Logger settings selected by the arguments
 *
 * Console unless a log file is given; a log file is JSON, size-rotated
 * text or plain text, in that order of precedence.
 */
wfmon::log::LoggerConfig make_logger_config(const AppArguments &args);

/**
 * Setup logging for all components
 *
 * @param[in] args Parsed arguments selecting the sink and level
 */
void setup_logging(const AppArguments &args);

/**
 * Parse command line arguments
 *
 * @param[in] argc Argument count
 * @param[in] argv Argument vector
 * @return Parsed arguments, or an error message (empty for --help and --version)
 */
tl::expected<AppArguments, std::string> parse_arguments(int argc, const char **argv);

/**
 * Build the workflow configuration from the arguments
 */
WorkflowConfig make_workflow_config(const AppArguments &args);

/**
 * Read a job state log into memory
 *
 * Malformed lines are logged and skipped.
 *
 * @param[in] file Log file path
 * @return Parsed lines, or FileOpenFailed
 */
tl::expected<std::vector<InputLine>, std::error_code>
read_input(const std::filesystem::path &file);

/**
 * Feed parsed lines to a started workflow
 *
 * Lines ending at or before the resume offset are skipped. INTERNAL
 * controller lines drive the controller start and finish handlers.
 *
 * @param[in] workflow Started workflow
 * @param[in] lines Parsed input
 * @param[in] checkpoint_interval Lines between recovery marker updates, 0 to disable
 * @return Replay counters, or the first persistence error
 */
tl::expected<ReplayStats, std::error_code> replay_lines(
        Workflow &workflow, const std::vector<InputLine> &lines, std::size_t checkpoint_interval);

} // namespace wfmon::monitor::samples

#endif // WFMON_MONITOR_MONITOR_REPLAY_UTILS_HPP
