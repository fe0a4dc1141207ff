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


#include <cstddef>     // for size_t
#include <filesystem>  // for path
#include <fstream>     // for ifstream
#include <istream>     // for istream, getline
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move
#include <vector>      // for vector

#include <tl/expected.hpp> // for expected, unexpected

#include "log/log_macros.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/static_info.hpp"
#include "text.hpp"

namespace wfmon::monitor {

namespace {

using Tokens = std::vector<std::string_view>;

std::filesystem::path resolve_against(const std::filesystem::path &base, std::string_view name) {
    const std::filesystem::path file{name};
    return file.is_absolute() ? file : base / file;
}

bool has_keyword(const Tokens &tokens, std::size_t from, std::string_view keyword) {
    for (std::size_t i = from; i < tokens.size(); ++i) {
        if (detail::iequals(tokens[i], keyword)) {
            return true;
        }
    }
    return false;
}

// JOB <name> <submit file> [DIR <dir>] [NOOP] [DONE]
void parse_job_line(const Tokens &tokens, const std::filesystem::path &run_dir, StaticInfoTable &table) {
    if (tokens.size() < 3) {
        WFMON_LOGC_WARN(MonitorLog::StaticInfo, "Malformed JOB line ignored");
        return;
    }
    if (has_keyword(tokens, 3, "DONE")) {
        WFMON_LOGC_DEBUG(MonitorLog::StaticInfo, "Job {} already DONE", tokens[1]);
        return;
    }
    table[std::string{tokens[1]}].submit_file = resolve_against(run_dir, tokens[2]);
}

// SCRIPT [DEFER <status> <time>] PRE|POST <name> <executable> [arguments...]
void parse_script_line(std::string_view line, const Tokens &tokens, StaticInfoTable &table) {
    std::size_t idx = 1;
    if (tokens.size() > idx && detail::iequals(tokens[idx], "DEFER")) {
        idx += 3;
    }
    if (tokens.size() < idx + 3) {
        WFMON_LOGC_WARN(MonitorLog::StaticInfo, "Malformed SCRIPT line ignored");
        return;
    }
    const bool is_pre = detail::iequals(tokens[idx], "PRE");
    if (!is_pre && !detail::iequals(tokens[idx], "POST")) {
        WFMON_LOGC_WARN(MonitorLog::StaticInfo, "Unknown SCRIPT type {}", tokens[idx]);
        return;
    }
    auto &info = table[std::string{tokens[idx + 1]}];
    std::string executable{tokens[idx + 2]};
    std::string arguments{detail::remainder_after(line, idx + 3)};
    if (is_pre) {
        info.pre_script_executable = std::move(executable);
        info.pre_script_arguments = std::move(arguments);
    } else {
        info.post_script_executable = std::move(executable);
        info.post_script_arguments = std::move(arguments);
    }
}

// SUBDAG EXTERNAL <name> <dag file> [DIR <dir>] [NOOP] [DONE]
void parse_subdag_line(const Tokens &tokens, StaticInfoTable &table) {
    if (tokens.size() < 4 || !detail::iequals(tokens[1], "EXTERNAL")) {
        WFMON_LOGC_WARN(MonitorLog::StaticInfo, "Malformed SUBDAG line ignored");
        return;
    }
    auto &info = table[std::string{tokens[2]}];
    info.is_subworkflow = true;
    info.subdag_file = std::string{tokens[3]};
    info.subdag_dir.reset();
    for (std::size_t i = 4; i + 1 < tokens.size(); ++i) {
        if (detail::iequals(tokens[i], "DIR")) {
            info.subdag_dir = std::string{tokens[i + 1]};
            break;
        }
    }
    if (!info.subdag_dir) {
        info.subdag_dir = std::filesystem::path{tokens[3]}.parent_path().string();
    }
}

} // anonymous namespace

StaticInfoTable parse_dag(std::istream &input, const std::filesystem::path &run_dir) {
    StaticInfoTable table;
    std::string line;
    while (std::getline(input, line)) {
        const auto tokens = detail::split_whitespace(line);
        if (tokens.empty() || tokens.front().front() == '#') {
            continue;
        }
        const auto &keyword = tokens.front();
        if (detail::iequals(keyword, "JOB")) {
            parse_job_line(tokens, run_dir, table);
        } else if (detail::iequals(keyword, "SCRIPT")) {
            parse_script_line(line, tokens, table);
        } else if (detail::iequals(keyword, "SUBDAG")) {
            parse_subdag_line(tokens, table);
        }
    }
    WFMON_LOGC_DEBUG(MonitorLog::StaticInfo, "Parsed static information for {} jobs", table.size());
    return table;
}

tl::expected<StaticInfoTable, std::string>
parse_dag_file(const std::filesystem::path &dag_file, const std::filesystem::path &run_dir) {
    std::ifstream input(dag_file);
    if (!input.is_open()) {
        return tl::unexpected("Unable to read DAG file " + dag_file.string());
    }
    return parse_dag(input, run_dir);
}

} // namespace wfmon::monitor
