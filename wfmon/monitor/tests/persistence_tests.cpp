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
 * @file persistence_tests.cpp
 * @brief Tests for the checkpoint, recovery marker and sentinel files
 */

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "monitor/monitor_errors.hpp"
#include "monitor/persistence.hpp"
#include "monitor_test_helpers.hpp"

namespace {

namespace wm = wfmon::monitor;

class PersistenceTest : public ::testing::Test {
protected:
    wm::tests::TempRunDir dir_{"wfmon_persist"};
    wm::FileLayout layout_{wm::FileLayout::make(dir_.path(), std::nullopt, "wf-1")};
};

TEST(FileLayoutTest, OutputDirPrefixesWorkflowId) {
    const auto in_run = wm::FileLayout::make("/run", std::nullopt, "wf-1");
    EXPECT_EQ(in_run.checkpoint, std::filesystem::path{"/run/monitord.info"});
    EXPECT_EQ(in_run.replay_log, std::filesystem::path{"/run/jobstate.log"});

    const auto elsewhere = wm::FileLayout::make("/run", std::filesystem::path{"/out"}, "wf-1", "js.log");
    EXPECT_EQ(elsewhere.recovery_marker, std::filesystem::path{"/out/wf-1-monitord.recover"});
    EXPECT_EQ(elsewhere.done, std::filesystem::path{"/out/wf-1-monitord.done"});
    EXPECT_EQ(elsewhere.replay_log, std::filesystem::path{"/out/wf-1-js.log"});
}

TEST(CheckpointTest, FormatThenParse) {
    wm::Checkpoint checkpoint{};
    checkpoint.next_submit_seq = 12;
    checkpoint.last_processed_offset = 4096;
    checkpoint.restart_count = 2;
    checkpoint.job_counters = {{"analyze", 1}, {"preprocess", 0}};

    const auto text = wm::format_checkpoint(checkpoint);
    EXPECT_EQ(
            text,
            "monitord_job_sequence 12\n"
            "monitord_dagman_out_sequence 4096\n"
            "monitord_workflow_restart_count 2\n"
            "analyze 1\n"
            "preprocess 0\n");

    std::istringstream input{text};
    const auto parsed = wm::parse_checkpoint(input);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, checkpoint);
}

TEST(CheckpointTest, MalformedLineFails) {
    std::istringstream input{"monitord_job_sequence twelve\n"};
    const auto parsed = wm::parse_checkpoint(input);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error(), wm::MonitorErrc::ParseFailed);
}

TEST_F(PersistenceTest, AtomicWriteReplacesContent) {
    const auto file = dir_.path() / "state.txt";
    ASSERT_FALSE(wm::write_file_atomic(file, "one\n"));
    ASSERT_FALSE(wm::write_file_atomic(file, "two\n"));
    EXPECT_EQ(wm::tests::read_file(file), "two\n");
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "state.txt.tmp"));
}

TEST_F(PersistenceTest, AtomicWriteIntoMissingDirectoryFails) {
    EXPECT_EQ(
            wm::write_file_atomic(dir_.path() / "missing" / "state.txt", "x"),
            wm::MonitorErrc::FileOpenFailed);
}

TEST_F(PersistenceTest, RotateUsesFirstFreeSlot) {
    const auto file = dir_.write("jobstate.log", "first\n");
    dir_.write("jobstate.log.000", "older\n");

    const auto rotated = wm::rotate_file(file);
    ASSERT_TRUE(rotated.has_value());
    ASSERT_TRUE(rotated->has_value());
    EXPECT_EQ(**rotated, dir_.path() / "jobstate.log.001");
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_EQ(wm::tests::read_file(dir_.path() / "jobstate.log.001"), "first\n");

    const auto nothing = wm::rotate_file(file);
    ASSERT_TRUE(nothing.has_value());
    EXPECT_FALSE(nothing->has_value());
}

TEST_F(PersistenceTest, FreshDirectoryLoadsDefaults) {
    wm::Persistence persistence{layout_};
    const auto state = persistence.load(false);
    EXPECT_FALSE(state.recovering());
    EXPECT_EQ(state.checkpoint, wm::Checkpoint{});
    EXPECT_EQ(state.resume_offset(), 0U);
}

TEST_F(PersistenceTest, SavedCheckpointIsResumed) {
    wm::Persistence persistence{layout_};
    wm::Checkpoint checkpoint{};
    checkpoint.next_submit_seq = 5;
    checkpoint.last_processed_offset = 300;
    ASSERT_FALSE(persistence.save(checkpoint));

    wm::Persistence reloaded{layout_};
    const auto state = reloaded.load(false);
    EXPECT_FALSE(state.recovering());
    EXPECT_EQ(state.checkpoint.next_submit_seq, 5U);
    EXPECT_EQ(state.resume_offset(), 300U);

    const auto replay = reloaded.load(true);
    EXPECT_EQ(replay.checkpoint, wm::Checkpoint{});
}

TEST_F(PersistenceTest, RecoveryMarkerDiscardsCheckpoint) {
    wm::Persistence persistence{layout_};
    wm::Checkpoint checkpoint{};
    checkpoint.next_submit_seq = 5;
    checkpoint.last_processed_offset = 300;
    ASSERT_FALSE(persistence.save(checkpoint));
    ASSERT_FALSE(persistence.checkpoint_progress(700));

    wm::Persistence crashed{layout_};
    const auto state = crashed.load(false);
    EXPECT_TRUE(state.recovering());
    EXPECT_EQ(state.recovery_offset, 700U);
    EXPECT_EQ(state.checkpoint, wm::Checkpoint{});
    EXPECT_EQ(state.resume_offset(), 0U);
    EXPECT_EQ(crashed.previous_marker(), 700U);

    // Progress behind the previous marker leaves it untouched
    ASSERT_FALSE(crashed.checkpoint_progress(100));
    EXPECT_EQ(wm::read_recovery_marker(layout_.recovery_marker), 700U);
    ASSERT_FALSE(crashed.checkpoint_progress(900));
    EXPECT_EQ(wm::read_recovery_marker(layout_.recovery_marker), 900U);

    ASSERT_FALSE(crashed.save(checkpoint));
    EXPECT_FALSE(std::filesystem::exists(layout_.recovery_marker));
    EXPECT_FALSE(crashed.previous_marker().has_value());
}

TEST_F(PersistenceTest, UnreadableMarkerIsIgnored) {
    dir_.write("monitord.recover", "garbage\n");
    wm::Persistence persistence{layout_};
    const auto state = persistence.load(false);
    EXPECT_FALSE(state.recovering());
    EXPECT_EQ(
            wm::read_recovery_marker(layout_.recovery_marker).error(), wm::MonitorErrc::ParseFailed);
}

TEST_F(PersistenceTest, SentinelFiles) {
    wm::Persistence persistence{layout_};
    ASSERT_FALSE(persistence.write_started(1709287200));
    const auto started = wm::tests::read_file(layout_.started);
    EXPECT_EQ(started.rfind("pid ", 0), 0U);
    EXPECT_NE(started.find("start 2024-"), std::string::npos);

    ASSERT_FALSE(persistence.write_done(1709287260, 60.0));
    EXPECT_FALSE(std::filesystem::exists(layout_.started));
    EXPECT_NE(wm::tests::read_file(layout_.done).find(" 60.000"), std::string::npos);

    persistence.remove_stale_done();
    EXPECT_FALSE(std::filesystem::exists(layout_.done));
}

} // namespace
