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
 * @file monitor_test_helpers.hpp
 * @brief Scratch run directories and recording sinks for monitor tests
 */

#ifndef WFMON_MONITOR_TESTS_MONITOR_TEST_HELPERS_HPP
#define WFMON_MONITOR_TESTS_MONITOR_TEST_HELPERS_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "monitor/event.hpp"
#include "monitor/sink.hpp"

namespace wfmon::monitor::tests {

/**
 * @brief RAII scratch directory removed with its contents on destruction
 */
class TempRunDir final {
public:
    explicit TempRunDir(std::string_view prefix = "wfmon_run");
    ~TempRunDir();

    TempRunDir(const TempRunDir &) = delete;
    TempRunDir &operator=(const TempRunDir &) = delete;
    TempRunDir(TempRunDir &&) = delete;
    TempRunDir &operator=(TempRunDir &&) = delete;

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

    /**
     * @brief Write a file below the directory, creating parent directories
     * @param relative File name relative to the directory
     * @param content File contents
     * @return Full path of the written file
     */
    std::filesystem::path write(const std::string &relative, std::string_view content) const;

    /**
     * @brief Create a sub-directory
     */
    std::filesystem::path make_dir(const std::string &relative) const;

private:
    std::filesystem::path path_;
};

/**
 * @brief Read a whole file, empty if it cannot be opened
 */
std::string read_file(const std::filesystem::path &file);

/**
 * @brief Read the non-empty lines of a file
 */
std::vector<std::string> read_lines(const std::filesystem::path &file);

/**
 * @brief Sink that keeps every event it receives
 */
class RecordingSink final : public EventSink {
public:
    [[nodiscard]] std::error_code send(const Event &event) override;
    [[nodiscard]] std::error_code flush() override;

    [[nodiscard]] const std::vector<Event> &events() const noexcept { return events_; }
    [[nodiscard]] std::size_t flush_count() const noexcept { return flushes_; }

    /// Names of the received events, in order
    [[nodiscard]] std::vector<std::string> names() const;

    /// Number of events with the given name
    [[nodiscard]] std::size_t count(std::string_view name) const;

    /// Last event with the given name
    [[nodiscard]] std::optional<Event> last(std::string_view name) const;

    void clear() noexcept { events_.clear(); }

private:
    std::vector<Event> events_;
    std::size_t flushes_{0};
};

/**
 * @brief Sink that fails every send after accepting a number of events
 */
class FailingSink final : public EventSink {
public:
    explicit FailingSink(std::size_t accept, bool throw_on_failure = false)
            : accept_{accept}, throw_{throw_on_failure} {}

    [[nodiscard]] std::error_code send(const Event &event) override;

    [[nodiscard]] std::size_t attempts() const noexcept { return attempts_; }

private:
    std::size_t accept_;
    bool throw_;
    std::size_t attempts_{0};
};

/// Workflow id written by write_diamond_workflow
inline constexpr std::string_view TEST_WF_UUID = "7f3c2a10-0d5e-4b8a-9c61-3e2f1a0b4c5d";

/// Submit directory recorded at plan time by write_diamond_workflow
inline constexpr std::string_view TEST_SUBMIT_DIR = "/home/tester/runs/diamond/run0001";

/**
 * @brief Populate a run directory with a small planned workflow
 *
 * Jobs: "preprocess" with a post-script, "analyze" with a submit file
 * naming its stdout/stderr, "stage_out" already DONE, and the nested
 * workflow job "subdag_inner" running "inner/inner.dag".
 */
void write_diamond_workflow(const TempRunDir &dir);

} // namespace wfmon::monitor::tests

#endif // WFMON_MONITOR_TESTS_MONITOR_TEST_HELPERS_HPP
