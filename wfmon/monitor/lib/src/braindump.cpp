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


#include <cstdint>      // for int64_t
#include <filesystem>   // for path
#include <fstream>      // for ifstream
#include <istream>      // for istream, getline
#include <optional>     // for optional
#include <string>       // for string
#include <system_error> // for error_code
#include <unordered_map> // for unordered_map
#include <utility>       // for move

#include <tl/expected.hpp> // for expected, unexpected

#include "log/log_macros.hpp"
#include "monitor/braindump.hpp"
#include "monitor/monitor_errors.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/timestamp.hpp"
#include "text.hpp"

namespace wfmon::monitor {

namespace {

using KeyValues = std::unordered_map<std::string, std::string>;

KeyValues read_key_values(std::istream &input) {
    KeyValues values;
    std::string line;
    while (std::getline(input, line)) {
        const std::string content{detail::trim(line)};
        if (content.empty() || content.front() == '#') {
            continue;
        }
        const auto split = content.find_first_of(" \t");
        if (split == std::string::npos) {
            values.emplace(content, std::string{});
            continue;
        }
        values.emplace(
                content.substr(0, split), std::string{detail::trim(content.substr(split + 1))});
    }
    return values;
}

std::optional<std::string> lookup(const KeyValues &values, const char *key) {
    const auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string>
lookup_either(const KeyValues &values, const char *key, const char *fallback) {
    auto value = lookup(values, key);
    return value ? value : lookup(values, fallback);
}

} // anonymous namespace

std::string WorkflowProperties::display_label() const {
    return dax_label.value_or("unknown") + "-" + dax_index.value_or("unknown");
}

tl::expected<WorkflowProperties, std::error_code>
parse_braindump(std::istream &input, const std::int64_t now) {
    const KeyValues values = read_key_values(input);

    WorkflowProperties props{};

    auto wf_uuid = lookup(values, "wf_uuid");
    if (!wf_uuid || wf_uuid->empty()) {
        WFMON_LOGC_ERROR(MonitorLog::Properties, "wf_uuid not specified in braindump");
        return tl::unexpected(make_error_code(MonitorErrc::MissingWorkflowId));
    }
    props.wf_uuid = std::move(*wf_uuid);

    auto dag = lookup(values, "dag");
    if (!dag || dag->empty()) {
        WFMON_LOGC_ERROR(
                MonitorLog::Properties, "dag not specified in braindump for {}", props.wf_uuid);
        return tl::unexpected(make_error_code(MonitorErrc::MissingDagFile));
    }
    props.dag_file = std::move(*dag);

    props.root_wf_uuid = lookup(values, "root_wf_uuid");
    props.dax_label = lookup_either(values, "dax_label", "label");
    props.dax_index = lookup(values, "dax_index");
    props.dax_version = lookup(values, "dax_version");
    props.dax_file = lookup(values, "dax");
    props.planner_version = lookup_either(values, "planner_version", "pegasus_version");
    props.planner_arguments = lookup(values, "planner_arguments");
    props.submit_hostname = lookup(values, "submit_hostname");
    props.user = lookup(values, "user");
    props.notify_file = lookup(values, "notify");

    auto grid_dn = lookup(values, "grid_dn");
    if (grid_dn && *grid_dn != "null") {
        props.grid_dn = std::move(grid_dn);
    }

    props.timestamp = now;
    if (const auto stamp = lookup_either(values, "timestamp", "pegasus_wf_time")) {
        if (const auto epoch = parse_iso_timestamp(*stamp)) {
            props.timestamp = *epoch;
        } else {
            WFMON_LOGC_WARN(
                    MonitorLog::Properties,
                    "Unparseable planning time '{}', using current time",
                    *stamp);
        }
    }

    if (auto submit_dir = lookup(values, "submit_dir")) {
        props.original_submit_dir =
                std::filesystem::path{*submit_dir}.lexically_normal().string();
        props.submit_dir = std::move(submit_dir);
    } else {
        props.submit_dir = lookup(values, "run");
        if (const auto jsd = lookup(values, "jsd")) {
            props.original_submit_dir =
                    std::filesystem::path{*jsd}.lexically_normal().parent_path().string();
        }
    }
    if (props.original_submit_dir && props.original_submit_dir->size() > 1 &&
        props.original_submit_dir->back() == '/') {
        props.original_submit_dir->pop_back();
    }

    WFMON_LOGC_DEBUG(
            MonitorLog::Properties,
            "Workflow {} ({}) dag {}",
            props.wf_uuid,
            props.display_label(),
            props.dag_file);
    return props;
}

tl::expected<WorkflowProperties, std::error_code>
load_braindump(const std::filesystem::path &file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        WFMON_LOGC_ERROR(MonitorLog::Properties, "Cannot open braindump {}", file.string());
        return tl::unexpected(make_error_code(MonitorErrc::FileOpenFailed));
    }
    return parse_braindump(input, now_epoch_seconds());
}

} // namespace wfmon::monitor
