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


#include <filesystem>   // for path
#include <fstream>      // for ifstream
#include <istream>      // for istream, getline
#include <optional>     // for optional, nullopt
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move

#include <tl/expected.hpp> // for expected, unexpected

#include "log/log_macros.hpp"
#include "monitor/monitor_errors.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/submit_file.hpp"
#include "text.hpp"

namespace wfmon::monitor {

namespace {

constexpr std::string_view DAG_ARGUMENT = "-Dag";
constexpr std::string_view DAGMAN_OUT_SUFFIX = ".dagman.out";

std::optional<std::string> find_nested_dag(std::string_view arguments) {
    const auto tokens = detail::split_whitespace(arguments);
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i] == DAG_ARGUMENT) {
            return std::string{detail::unquote(tokens[i + 1])};
        }
    }
    return std::nullopt;
}

} // anonymous namespace

SubmitFileInfo parse_submit(std::istream &input) {
    SubmitFileInfo info{};
    std::string line;
    while (std::getline(input, line)) {
        const auto content = detail::trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }
        const auto equals = content.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }
        const std::string key = detail::to_lower(detail::trim(content.substr(0, equals)));
        std::string value{detail::unquote(content.substr(equals + 1))};

        if (key == "+pegasus_site") {
            info.site = std::move(value);
        } else if (key == "input") {
            info.input = std::move(value);
        } else if (key == "output") {
            info.output = std::move(value);
        } else if (key == "error") {
            info.error = std::move(value);
        } else if (key == "executable") {
            info.executable = std::move(value);
        } else if (key == "arguments") {
            if (auto dag = find_nested_dag(value)) {
                info.dagman_out = *dag + std::string{DAGMAN_OUT_SUFFIX};
            }
            info.arguments = std::move(value);
        } else if (key == "+pegasus_wf_xformation") {
            info.transformation = std::move(value);
        } else if (key == "+pegasus_wf_dax_job_id") {
            info.derivation = std::move(value);
        } else if (key == "+pegasus_job_multiplier_factor") {
            info.multiplier_factor = std::move(value);
        }
    }
    return info;
}

tl::expected<SubmitFileInfo, std::error_code>
parse_submit_file(const std::filesystem::path &file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        WFMON_LOGC_WARN(MonitorLog::StaticInfo, "Unable to read submit file {}", file.string());
        return tl::unexpected(make_error_code(MonitorErrc::FileOpenFailed));
    }
    return parse_submit(input);
}

} // namespace wfmon::monitor
