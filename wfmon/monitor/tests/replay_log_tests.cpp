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
 * @file replay_log_tests.cpp
 * @brief Tests for the job state replay log
 */

#include <string>
#include <utility>
#include <variant>

#include <gtest/gtest.h>

#include "monitor/job_state.hpp"
#include "monitor/monitor_errors.hpp"
#include "monitor/replay_log.hpp"
#include "monitor_test_helpers.hpp"

namespace {

namespace wm = wfmon::monitor;
using wm::JobState;

wm::JobStateRecord make_record(const JobState state) {
    wm::JobStateRecord record{};
    record.timestamp = 1709287200;
    record.job_name = "analyze";
    record.state = state;
    record.submit_seq = 3;
    return record;
}

TEST(ReplayLineTest, FormatsSevenFields) {
    auto record = make_record(JobState::EXECUTE);
    record.sched_id = "1234.0";
    record.site = "condorpool";
    EXPECT_EQ(wm::format_replay_line(record), "1709287200 analyze EXECUTE 1234.0 condorpool - 3");

    auto done = make_record(JobState::JOB_SUCCESS);
    done.status = 0;
    done.sched_id = "1234.0";
    done.walltime = "42";
    EXPECT_EQ(wm::format_replay_line(done), "1709287200 analyze JOB_SUCCESS 0 - 42 3");
}

TEST(ReplayLineTest, ParsesJobStateLine) {
    const auto parsed = wm::parse_replay_line("1709287200 analyze JOB_FAILURE 2 condorpool 17 9");
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    const auto *record = std::get_if<wm::JobStateRecord>(&*parsed);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->timestamp, 1709287200);
    EXPECT_EQ(record->job_name, "analyze");
    EXPECT_EQ(record->state, JobState::JOB_FAILURE);
    EXPECT_EQ(record->status, 2);
    EXPECT_FALSE(record->sched_id.has_value());
    EXPECT_EQ(record->site, "condorpool");
    EXPECT_EQ(record->walltime, "17");
    EXPECT_EQ(record->submit_seq, 9U);
}

TEST(ReplayLineTest, FractionalWalltimeIsKeptVerbatim) {
    const std::string line = "1709287200 analyze JOB_SUCCESS 0 condorpool 12.75 4";
    const auto parsed = wm::parse_replay_line(line);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    const auto &record = std::get<wm::JobStateRecord>(*parsed);
    EXPECT_EQ(record.walltime, "12.75");
    EXPECT_EQ(wm::format_replay_line(record), line);
}

TEST(ReplayLineTest, NumericIdOnNonCompletionStateIsSchedulerId) {
    const auto parsed = wm::parse_replay_line("100 analyze SUBMIT 4711 - - 1");
    ASSERT_TRUE(parsed.has_value());
    const auto &record = std::get<wm::JobStateRecord>(*parsed);
    EXPECT_EQ(record.sched_id, "4711");
    EXPECT_FALSE(record.status.has_value());
    EXPECT_FALSE(record.site.has_value());
}

TEST(ReplayLineTest, ParsesInternalLine) {
    const auto line = wm::format_internal_line(100, "DAGMAN_STARTED 12.0");
    EXPECT_EQ(line, "100 INTERNAL *** DAGMAN_STARTED 12.0 ***");
    const auto parsed = wm::parse_replay_line(line);
    ASSERT_TRUE(parsed.has_value());
    const auto &record = std::get<wm::InternalRecord>(*parsed);
    EXPECT_EQ(record.timestamp, 100);
    EXPECT_EQ(record.message, "DAGMAN_STARTED 12.0");
}

TEST(ReplayLineTest, RejectsMalformedLines) {
    EXPECT_FALSE(wm::parse_replay_line("").has_value());
    EXPECT_FALSE(wm::parse_replay_line("abc analyze SUBMIT - - - 1").has_value());
    EXPECT_FALSE(wm::parse_replay_line("100 analyze SUBMIT - - 1").has_value());
    EXPECT_FALSE(wm::parse_replay_line("100 analyze LAUNCHED - - - 1").has_value());
    EXPECT_FALSE(wm::parse_replay_line("100 analyze SUBMIT - - - x").has_value());
    EXPECT_FALSE(wm::parse_replay_line("100 INTERNAL DAGMAN_STARTED").has_value());
}

TEST(ReplayLogTest, AppendsAndTruncates) {
    const wm::tests::TempRunDir dir{};
    const auto file = dir.path() / "jobstate.log";

    wm::ReplayLog log{};
    ASSERT_FALSE(log.open(file, wm::ReplayOpenMode::Append));
    EXPECT_TRUE(log.is_open());
    EXPECT_FALSE(log.write_internal(1, "MONITORD_STARTED"));
    EXPECT_FALSE(log.append(make_record(JobState::SUBMIT)));
    EXPECT_EQ(log.lines_written(), 2U);
    log.close();
    EXPECT_FALSE(log.is_open());

    ASSERT_FALSE(log.open(file, wm::ReplayOpenMode::Append, true));
    EXPECT_FALSE(log.append(make_record(JobState::EXECUTE)));
    log.close();
    EXPECT_EQ(wm::tests::read_lines(file).size(), 3U);

    ASSERT_FALSE(log.open(file, wm::ReplayOpenMode::Truncate));
    EXPECT_FALSE(log.write_internal(5, "MONITORD_STARTED"));
    log.close();
    const auto lines = wm::tests::read_lines(file);
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(lines[0], "5 INTERNAL *** MONITORD_STARTED ***");
}

TEST(ReplayLogTest, MoveTransfersOwnership) {
    const wm::tests::TempRunDir dir{};
    wm::ReplayLog log{};
    ASSERT_FALSE(log.open(dir.path() / "jobstate.log", wm::ReplayOpenMode::Append));

    wm::ReplayLog moved{std::move(log)};
    EXPECT_TRUE(moved.is_open());
    EXPECT_FALSE(moved.append(make_record(JobState::SUBMIT)));
    EXPECT_EQ(moved.file(), dir.path() / "jobstate.log");
}

TEST(ReplayLogTest, ClosedLogRejectsWrites) {
    wm::ReplayLog log{};
    EXPECT_EQ(log.append(make_record(JobState::SUBMIT)), wm::MonitorErrc::ReplayLogWriteFailed);
}

TEST(ReplayLogTest, OpenFailureIsReported) {
    wm::ReplayLog log{};
    EXPECT_EQ(
            log.open("/nonexistent/wfmon/jobstate.log", wm::ReplayOpenMode::Append),
            wm::MonitorErrc::ReplayLogOpenFailed);
    EXPECT_FALSE(log.is_open());
}

} // namespace
