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


#include <cstdint>      // for uint32_t
#include <filesystem>   // for path, is_directory
#include <format>       // for format
#include <optional>     // for optional, nullopt
#include <string>       // for string
#include <system_error> // for error_code

#include <tl/expected.hpp> // for expected, unexpected

#include "log/log_macros.hpp"
#include "monitor/monitor_errors.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/subworkflow_resolver.hpp"

namespace wfmon::monitor {

namespace {

std::filesystem::path numbered_dir(const std::filesystem::path &dir, const std::uint32_t retry) {
    return std::filesystem::path{std::format("{}.{:03d}", dir.string(), retry)};
}

bool is_directory(const std::filesystem::path &dir) {
    std::error_code ec;
    return std::filesystem::is_directory(dir, ec);
}

} // anonymous namespace

std::filesystem::path SubworkflowResolver::relocate(
        const std::filesystem::path &nested_log,
        const std::filesystem::path &run_dir,
        const std::optional<std::string> &original_submit_dir) {
    std::string normalized = nested_log.lexically_normal().string();
    if (!original_submit_dir.has_value() || original_submit_dir->empty()) {
        return normalized;
    }
    const std::string prefix = *original_submit_dir + "/";
    const auto pos = normalized.find(prefix);
    if (pos == std::string::npos) {
        return normalized;
    }
    normalized.erase(pos, prefix.size());
    return (run_dir / std::filesystem::path{normalized}.lexically_normal()).lexically_normal();
}

tl::expected<std::filesystem::path, std::error_code> SubworkflowResolver::resolve(
        const std::filesystem::path &nested_log,
        const std::filesystem::path &run_dir,
        const std::optional<std::string> &original_submit_dir) {
    const auto relocated = relocate(nested_log, run_dir, original_submit_dir);
    const auto dir = relocated.parent_path();
    const auto file = relocated.filename();

    // First encounter uses retry 0, each later one the next number
    auto [it, inserted] = retries_.try_emplace(dir.string(), 0);
    if (!inserted) {
        ++it->second;
    }
    const std::uint32_t retry = it->second;

    auto candidate = numbered_dir(dir, retry);
    if (!is_directory(candidate)) {
        WFMON_LOGC_DEBUG(
                MonitorLog::Resolver,
                "Sub-workflow directory {} does not exist, trying rescue directory",
                candidate.string());
        candidate = numbered_dir(dir, 0);
        if (!is_directory(candidate)) {
            WFMON_LOGC_WARN(
                    MonitorLog::Resolver,
                    "Sub-workflow directory {} does not exist, skipping sub-workflow",
                    candidate.string());
            return tl::unexpected(make_error_code(MonitorErrc::SubworkflowLogMissing));
        }
    }

    auto resolved = candidate / file;
    WFMON_LOGC_INFO(
            MonitorLog::Resolver,
            "Resolved sub-workflow log {} (retry {})",
            resolved.string(),
            retry);
    return resolved;
}

std::optional<std::uint32_t>
SubworkflowResolver::retry_count(const std::filesystem::path &dir) const {
    const auto it = retries_.find(dir.lexically_normal().string());
    if (it == retries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace wfmon::monitor
