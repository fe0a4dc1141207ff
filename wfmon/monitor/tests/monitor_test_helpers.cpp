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


#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <format>
#include <fstream>
#include <ranges>
#include <sstream>
#include <stdexcept>

#include "monitor/monitor_errors.hpp"
#include "monitor_test_helpers.hpp"

namespace wfmon::monitor::tests {

namespace {

std::atomic<unsigned> g_dir_counter{0};

} // namespace

TempRunDir::TempRunDir(std::string_view prefix)
        : path_{std::filesystem::temp_directory_path() /
                std::format("{}_{}_{}", prefix, ::getpid(), g_dir_counter.fetch_add(1))} {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
}

TempRunDir::~TempRunDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempRunDir::write(const std::string &relative, std::string_view content) const {
    const auto file = path_ / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error(std::format("Cannot create {}", file.string()));
    }
    out << content;
    return file;
}

std::filesystem::path TempRunDir::make_dir(const std::string &relative) const {
    const auto dir = path_ / relative;
    std::filesystem::create_directories(dir);
    return dir;
}

std::string read_file(const std::filesystem::path &file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::vector<std::string> read_lines(const std::filesystem::path &file) {
    std::vector<std::string> lines;
    std::istringstream in{read_file(file)};
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::error_code RecordingSink::send(const Event &event) {
    events_.push_back(event);
    return {};
}

std::error_code RecordingSink::flush() {
    ++flushes_;
    return {};
}

std::vector<std::string> RecordingSink::names() const {
    std::vector<std::string> names;
    names.reserve(events_.size());
    for (const auto &event : events_) {
        names.push_back(event.name);
    }
    return names;
}

std::size_t RecordingSink::count(std::string_view name) const {
    return static_cast<std::size_t>(
            std::ranges::count_if(events_, [name](const Event &e) { return e.name == name; }));
}

std::optional<Event> RecordingSink::last(std::string_view name) const {
    for (const auto &event : std::views::reverse(events_)) {
        if (event.name == name) {
            return event;
        }
    }
    return std::nullopt;
}

std::error_code FailingSink::send(const Event & /*event*/) {
    ++attempts_;
    if (attempts_ <= accept_) {
        return {};
    }
    if (throw_) {
        throw std::runtime_error("connection reset by peer");
    }
    return make_error_code(MonitorErrc::SinkFailed);
}

void write_diamond_workflow(const TempRunDir &dir) {
    dir.write(
            "braindump.txt",
            std::format(
                    "wf_uuid {}\n"
                    "dag diamond-0.dag\n"
                    "dax_label diamond\n"
                    "dax_index 0\n"
                    "dax_version 3.6\n"
                    "submit_dir {}\n"
                    "user tester\n"
                    "planner_version 5.0.1\n"
                    "planner_arguments \"--dax diamond.dax --submit\"\n"
                    "timestamp 2024-03-01T10:00:00Z\n",
                    TEST_WF_UUID,
                    TEST_SUBMIT_DIR));
    dir.write(
            "diamond-0.dag",
            "# generated\n"
            "JOB preprocess preprocess.sub\n"
            "SCRIPT POST preprocess /usr/bin/pegasus-exitcode preprocess.out\n"
            "JOB analyze analyze.sub\n"
            "JOB stage_out stage_out.sub DONE\n"
            "SUBDAG EXTERNAL subdag_inner inner/inner.dag DIR inner\n"
            "PARENT preprocess CHILD analyze\n");
    dir.write(
            "analyze.sub",
            std::format(
                    "universe = vanilla\n"
                    "+pegasus_site = \"condorpool\"\n"
                    "executable = /usr/bin/analyze\n"
                    "arguments = \"-i f.b -o f.c\"\n"
                    "output = {0}/analyze.out\n"
                    "error = {0}/analyze.err\n"
                    "+pegasus_wf_xformation = \"diamond::analyze:4.0\"\n"
                    "+pegasus_wf_dax_job_id = \"ID0000002\"\n"
                    "queue\n",
                    TEST_SUBMIT_DIR));
    dir.write(
            "preprocess.sub",
            "+pegasus_site = \"local\"\n"
            "executable = /usr/bin/preprocess\n"
            "queue\n");
}

} // namespace wfmon::monitor::tests
