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
 * @file monitor_errors.hpp
 * @brief Error codes for workflow monitoring operations
 *
 * Provides type-safe error codes compatible with std::error_code for
 * persistence, replay log, input parsing and sub-workflow resolution.
 */

#ifndef WFMON_MONITOR_MONITOR_ERRORS_HPP
#define WFMON_MONITOR_MONITOR_ERRORS_HPP

#include <array>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <wise_enum.h>

namespace wfmon::monitor {

/**
 * Monitor error codes compatible with std::error_code
 */
// clang-format off
enum class MonitorErrc : std::uint8_t {
    Success,               //!< Operation succeeded
    NotStarted,            //!< Workflow has not been started
    AlreadyStarted,        //!< Workflow was already started
    Finished,              //!< Workflow has already finished
    ReplayLogOpenFailed,   //!< Replay log could not be opened
    ReplayLogWriteFailed,  //!< Replay log append failed
    FileOpenFailed,        //!< File open operation failed
    FileWriteFailed,       //!< File write operation failed
    FileRenameFailed,      //!< File rename or removal failed
    ParseFailed,           //!< Input file is malformed
    MissingWorkflowId,     //!< Workflow properties lack a workflow id
    MissingDagFile,        //!< Workflow properties lack a DAG file
    UnknownJob,            //!< Job name has no static information
    NotSubworkflow,        //!< Job does not run a nested workflow
    SubworkflowLogMissing, //!< Nested workflow log could not be located
    SinkFailed             //!< Event sink rejected an event
};
// clang-format on

static_assert(
        static_cast<std::uint32_t>(MonitorErrc::SinkFailed) <=
                std::numeric_limits<std::uint8_t>::max(),
        "MonitorErrc enumerator values must fit in std::uint8_t");

} // namespace wfmon::monitor

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        wfmon::monitor::MonitorErrc,
        Success,
        NotStarted,
        AlreadyStarted,
        Finished,
        ReplayLogOpenFailed,
        ReplayLogWriteFailed,
        FileOpenFailed,
        FileWriteFailed,
        FileRenameFailed,
        ParseFailed,
        MissingWorkflowId,
        MissingDagFile,
        UnknownJob,
        NotSubworkflow,
        SubworkflowLogMissing,
        SinkFailed)

// NOTE: This MUST come before any functions that use MonitorErrc with
// std::error_code
namespace std {
template <> struct is_error_code_enum<wfmon::monitor::MonitorErrc> : true_type {};
} // namespace std

namespace wfmon::monitor {

/**
 * Error category for monitor errors
 */
class MonitorErrorCategory final : public std::error_category {
private:
    // Compile-time table indexed by the enum's underlying value
    static constexpr std::array<std::string_view, 16> KMESSAGES{
            "Success: Operation completed successfully",
            "Not started: Workflow must be started first",
            "Already started: Workflow was already started",
            "Finished: Workflow has already finished",
            "Replay log open failed: Unable to open the job state log",
            "Replay log write failed: Unable to append to the job state log",
            "File open failed: Unable to open file",
            "File write failed: Unable to write data to file",
            "File rename failed: Unable to rename or remove file",
            "Parse failed: Input file is malformed",
            "Missing workflow id: Workflow properties have no wf_uuid",
            "Missing DAG file: Workflow properties have no dag entry",
            "Unknown job: Job has no static information",
            "Not a sub-workflow: Job does not run a nested workflow",
            "Sub-workflow log missing: Nested workflow log could not be located",
            "Sink failed: Event sink rejected an event"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<MonitorErrc>,
            "KMESSAGES array size must match the number of MonitorErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "wfmon::monitor"; }

    /**
     * Get a descriptive message for the given error code
     *
     * @param[in] condition The error code value
     * @return A descriptive error message
     */
    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown monitor error: {}", condition);
    }

    /**
     * Map monitor errors to standard error conditions where applicable
     *
     * @param[in] condition The error code value
     * @return The equivalent standard error condition
     */
    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<MonitorErrc>(condition)) {
        case MonitorErrc::Success:
            return {};
        case MonitorErrc::ReplayLogOpenFailed:
        case MonitorErrc::ReplayLogWriteFailed:
        case MonitorErrc::FileOpenFailed:
        case MonitorErrc::FileWriteFailed:
        case MonitorErrc::FileRenameFailed:
            return std::errc::io_error;
        case MonitorErrc::SubworkflowLogMissing:
            return std::errc::no_such_file_or_directory;
        case MonitorErrc::ParseFailed:
        case MonitorErrc::MissingWorkflowId:
        case MonitorErrc::MissingDagFile:
            return std::errc::invalid_argument;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

/**
 * Get the singleton instance of the monitor error category
 *
 * @return Reference to the monitor error category
 */
[[nodiscard]] inline const MonitorErrorCategory &monitor_category() noexcept {
    static const MonitorErrorCategory instance{};
    return instance;
}

/**
 * Create an error_code from a MonitorErrc value
 *
 * @param[in] errc The monitor error code
 * @return A std::error_code representing the monitor error
 */
[[nodiscard]] inline std::error_code make_error_code(const MonitorErrc errc) noexcept {
    return {static_cast<int>(errc), monitor_category()};
}

[[nodiscard]] constexpr bool is_success(const MonitorErrc errc) noexcept {
    return errc == MonitorErrc::Success;
}

/**
 * Get the name of a MonitorErrc enum value
 *
 * @param[in] errc The error code
 * @return The enum name as a string
 */
[[nodiscard]] inline const char *get_error_name(const MonitorErrc errc) noexcept {
    return ::wise_enum::to_string(errc).data();
}

/**
 * Get the name of a MonitorErrc from a std::error_code
 *
 * @param[in] ec The error code
 * @return The enum name, or "unknown" if not a monitor error
 */
[[nodiscard]] inline const char *get_error_name(const std::error_code &ec) noexcept {
    if (ec.category() != monitor_category()) {
        return "unknown";
    }
    return get_error_name(static_cast<MonitorErrc>(ec.value()));
}

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_MONITOR_ERRORS_HPP
