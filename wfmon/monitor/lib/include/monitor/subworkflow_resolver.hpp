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
 * @file subworkflow_resolver.hpp
 * @brief Location of nested workflow logs across relocated and replanned runs
 */

#ifndef WFMON_MONITOR_SUBWORKFLOW_RESOLVER_HPP
#define WFMON_MONITOR_SUBWORKFLOW_RESOLVER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>

#include <tl/expected.hpp>

namespace wfmon::monitor {

/**
 * Resolver of nested controller logs
 *
 * A nested workflow runs in "<dir>.NNN" where NNN counts how many times
 * the parent submitted it (replanning), or in "<dir>.000" when the
 * controller resumed it from a rescue DAG. The retry counter per
 * directory lives for the whole process so that every orchestrator
 * sharing the resolver sees the same numbering.
 */
class SubworkflowResolver final {
public:
    /**
     * Resolve the nested log of a sub-workflow job
     *
     * Each call counts as one submission of the nested directory.
     *
     * @param[in] nested_log Nested log as named by the DAG or submit file
     * @param[in] run_dir Current run directory of the parent workflow
     * @param[in] original_submit_dir Parent submit directory at plan time
     * @return Path of the nested log, or SubworkflowLogMissing
     */
    [[nodiscard]] tl::expected<std::filesystem::path, std::error_code> resolve(
            const std::filesystem::path &nested_log,
            const std::filesystem::path &run_dir,
            const std::optional<std::string> &original_submit_dir);

    /**
     * Move a path planned under the original submit directory to the run directory
     *
     * Paths outside the original submit directory are only normalized.
     */
    [[nodiscard]] static std::filesystem::path relocate(
            const std::filesystem::path &nested_log,
            const std::filesystem::path &run_dir,
            const std::optional<std::string> &original_submit_dir);

    /**
     * Retry counter of a nested directory, nullopt if never resolved
     */
    [[nodiscard]] std::optional<std::uint32_t> retry_count(const std::filesystem::path &dir) const;

private:
    std::unordered_map<std::string, std::uint32_t> retries_;
};

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_SUBWORKFLOW_RESOLVER_HPP
