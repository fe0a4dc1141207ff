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


#include <filesystem> // for path
#include <optional>   // for optional, nullopt
#include <string>     // for string
#include <utility>    // for move

#include "log/log_macros.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/workflow_registry.hpp"

namespace wfmon::monitor {

namespace {

std::string registry_key(const std::filesystem::path &run_dir) {
    auto key = run_dir.lexically_normal().string();
    while (key.size() > 1 && key.back() == '/') {
        key.pop_back();
    }
    return key;
}

} // anonymous namespace

bool WorkflowRegistry::register_workflow(const std::filesystem::path &run_dir, WorkflowLink link) {
    const auto [it, inserted] = workflows_.try_emplace(registry_key(run_dir), std::move(link));
    if (!inserted) {
        WFMON_LOGC_DEBUG(
                MonitorLog::Workflow,
                "Run directory {} already registered to {}",
                it->first,
                it->second.wf_uuid);
    }
    return inserted;
}

std::optional<WorkflowLink> WorkflowRegistry::find(const std::filesystem::path &run_dir) const {
    const auto it = workflows_.find(registry_key(run_dir));
    if (it == workflows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace wfmon::monitor
