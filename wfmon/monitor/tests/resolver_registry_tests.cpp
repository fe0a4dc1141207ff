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
 * @file resolver_registry_tests.cpp
 * @brief Tests for sub-workflow log discovery and the workflow registry
 */

#include <filesystem>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "monitor/monitor_errors.hpp"
#include "monitor/subworkflow_resolver.hpp"
#include "monitor/workflow_registry.hpp"
#include "monitor_test_helpers.hpp"

namespace {

namespace wm = wfmon::monitor;

TEST(SubworkflowResolverTest, RelocatesMovedSubmitDirectory) {
    EXPECT_EQ(
            wm::SubworkflowResolver::relocate(
                    "/orig/run/inner/inner.dag.dagman.out", "/new/run", std::string{"/orig/run"}),
            std::filesystem::path{"/new/run/inner/inner.dag.dagman.out"});
    EXPECT_EQ(
            wm::SubworkflowResolver::relocate(
                    "/other/inner.dag.dagman.out", "/new/run", std::string{"/orig/run"}),
            std::filesystem::path{"/other/inner.dag.dagman.out"});
    EXPECT_EQ(
            wm::SubworkflowResolver::relocate("/a/./b/../c.out", "/new/run", std::nullopt),
            std::filesystem::path{"/a/c.out"});
}

TEST(SubworkflowResolverTest, EachRetryUsesNextNumberedDirectory) {
    const wm::tests::TempRunDir dir{};
    dir.make_dir("inner.000");
    dir.make_dir("inner.001");
    const auto nested = dir.path() / "inner" / "inner.dag.dagman.out";

    wm::SubworkflowResolver resolver{};
    EXPECT_FALSE(resolver.retry_count(dir.path() / "inner").has_value());

    const auto first = resolver.resolve(nested, dir.path(), std::nullopt);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, dir.path() / "inner.000" / "inner.dag.dagman.out");
    EXPECT_EQ(resolver.retry_count(dir.path() / "inner"), 0U);

    const auto second = resolver.resolve(nested, dir.path(), std::nullopt);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, dir.path() / "inner.001" / "inner.dag.dagman.out");

    // No inner.002: a rescue run reuses the first directory
    const auto third = resolver.resolve(nested, dir.path(), std::nullopt);
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(*third, dir.path() / "inner.000" / "inner.dag.dagman.out");
    EXPECT_EQ(resolver.retry_count(dir.path() / "inner"), 2U);
}

TEST(SubworkflowResolverTest, MissingDirectoryIsReported) {
    const wm::tests::TempRunDir dir{};
    wm::SubworkflowResolver resolver{};
    const auto resolved =
            resolver.resolve(dir.path() / "absent" / "x.dagman.out", dir.path(), std::nullopt);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error(), wm::MonitorErrc::SubworkflowLogMissing);
}

TEST(WorkflowRegistryTest, FirstRegistrationWins) {
    wm::WorkflowRegistry registry{};
    EXPECT_TRUE(registry.register_workflow("/runs/a/", wm::WorkflowLink{"wf-a", std::nullopt, "wf-a"}));
    EXPECT_FALSE(registry.register_workflow("/runs/./a", wm::WorkflowLink{"wf-b", std::nullopt, std::nullopt}));
    EXPECT_EQ(registry.size(), 1U);

    const auto found = registry.find("/runs/a");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->wf_uuid, "wf-a");
    EXPECT_EQ(found->root_wf_uuid, "wf-a");
    EXPECT_FALSE(registry.find("/runs/b").has_value());
}

} // namespace
