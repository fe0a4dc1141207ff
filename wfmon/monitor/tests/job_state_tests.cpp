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
 * @file job_state_tests.cpp
 * @brief Tests for job states and per-instance state tracking
 */

#include <filesystem>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "monitor/job_instance.hpp"
#include "monitor/job_state.hpp"
#include "monitor/output_extractor.hpp"
#include "monitor/submit_file.hpp"
#include "monitor_test_helpers.hpp"

namespace {

namespace wm = wfmon::monitor;
using wm::JobState;

TEST(JobStateTest, TokensRoundTripThroughParser) {
    for (const auto &[state, name] : ::wise_enum::range<JobState>) {
        const auto parsed = wm::parse_job_state(name);
        ASSERT_TRUE(parsed.has_value()) << name;
        EXPECT_EQ(*parsed, state);
        EXPECT_EQ(wm::to_token(state), name);
    }
}

TEST(JobStateTest, UnknownTokenIsRejected) {
    EXPECT_FALSE(wm::parse_job_state("JOB_EXPLODED").has_value());
    EXPECT_FALSE(wm::parse_job_state("").has_value());
    EXPECT_FALSE(wm::parse_job_state("job_success").has_value());
}

TEST(JobStateTest, PhasesAreOrdered) {
    EXPECT_EQ(wm::phase_of(JobState::PRE_SCRIPT_SUCCESS), wm::JobPhase::PreScript);
    EXPECT_EQ(wm::phase_of(JobState::GRID_SUBMIT), wm::JobPhase::Submit);
    EXPECT_EQ(wm::phase_of(JobState::DAGMAN_SUBMIT), wm::JobPhase::Submit);
    EXPECT_EQ(wm::phase_of(JobState::JOB_HELD), wm::JobPhase::Main);
    EXPECT_EQ(wm::phase_of(JobState::POST_SCRIPT_TERMINATED), wm::JobPhase::PostScript);
    EXPECT_LT(wm::JobPhase::PreScript, wm::JobPhase::Submit);
    EXPECT_LT(wm::JobPhase::Submit, wm::JobPhase::Main);
    EXPECT_LT(wm::JobPhase::Main, wm::JobPhase::PostScript);
}

TEST(JobStateTest, SubmitClassAndOutcomes) {
    EXPECT_TRUE(wm::is_submit_class(JobState::PRE_SCRIPT_STARTED));
    EXPECT_TRUE(wm::is_submit_class(JobState::SUBMIT));
    EXPECT_TRUE(wm::is_submit_class(JobState::SUBMIT_FAILED));
    EXPECT_TRUE(wm::is_submit_class(JobState::DAGMAN_SUBMIT));
    EXPECT_FALSE(wm::is_submit_class(JobState::GRID_SUBMIT));
    EXPECT_FALSE(wm::is_submit_class(JobState::EXECUTE));

    EXPECT_TRUE(wm::is_success_state(JobState::JOB_SUCCESS));
    EXPECT_TRUE(wm::is_failure_state(JobState::POST_SCRIPT_FAILURE));
    EXPECT_FALSE(wm::is_failure_state(JobState::JOB_EVICTED));
}

TEST(JobStateTest, TerminalDependsOnPostScript) {
    EXPECT_TRUE(wm::is_terminal_state(JobState::JOB_SUCCESS, false));
    EXPECT_TRUE(wm::is_terminal_state(JobState::JOB_FAILURE, false));
    EXPECT_FALSE(wm::is_terminal_state(JobState::JOB_SUCCESS, true));
    EXPECT_TRUE(wm::is_terminal_state(JobState::POST_SCRIPT_FAILURE, true));
    EXPECT_FALSE(wm::is_terminal_state(JobState::EXECUTE, false));
}

TEST(JobInstanceTest, ApplyTracksPhaseTimes) {
    wm::JobInstance job{"analyze", 4};
    EXPECT_FALSE(job.state().has_value());
    EXPECT_EQ(job.key(), (wm::JobKey{"analyze", 4}));

    job.apply(JobState::PRE_SCRIPT_STARTED, 100, std::nullopt);
    job.apply(JobState::PRE_SCRIPT_SUCCESS, 105, std::nullopt);
    job.apply(JobState::SUBMIT, 106, std::nullopt);
    job.apply(JobState::EXECUTE, 110, std::nullopt);
    job.apply(JobState::JOB_EVICTED, 120, std::nullopt);
    job.apply(JobState::EXECUTE, 130, std::nullopt);
    job.apply(JobState::JOB_SUCCESS, 150, std::nullopt);

    EXPECT_EQ(job.state(), JobState::JOB_SUCCESS);
    EXPECT_EQ(job.state_timestamp(), 150);
    EXPECT_EQ(job.state_seq(), 7U);
    EXPECT_EQ(job.pre_script().start, 100);
    EXPECT_EQ(job.pre_script().end, 105);
    EXPECT_EQ(job.pre_script().exitcode, 0);
    // Re-execution after eviction keeps the first start
    EXPECT_EQ(job.main_job().start, 110);
    EXPECT_EQ(job.main_job().end, 150);
    EXPECT_EQ(job.main_job().exitcode, 0);
    EXPECT_TRUE(job.is_terminal(false));
    EXPECT_FALSE(job.is_terminal(true));
}

TEST(JobInstanceTest, FailureWithoutStatusDefaultsToOne) {
    wm::JobInstance job{"analyze", 1};
    job.apply(JobState::JOB_FAILURE, 10, std::nullopt);
    EXPECT_EQ(job.main_job().exitcode, 1);

    wm::JobInstance post{"analyze", 2};
    post.apply(JobState::POST_SCRIPT_FAILURE, 10, 3);
    EXPECT_EQ(post.post_script().exitcode, 3);
}

TEST(JobInstanceTest, SubmitFilePathsAreMadeRelative) {
    wm::SubmitFileInfo info{};
    info.site = "condorpool";
    info.output = "/submit/dir/job.out";
    info.error = "/elsewhere/job.err";
    info.dagman_out = "inner.dag.dagman.out";

    wm::JobInstance job{"analyze", 1};
    job.apply_submit_file(info, std::string{"/submit/dir"});

    EXPECT_TRUE(job.submit_file_parsed());
    EXPECT_EQ(job.run_info().site, "condorpool");
    EXPECT_EQ(job.run_info().stdout_file, "job.out");
    EXPECT_EQ(job.run_info().stderr_file, "/elsewhere/job.err");
    EXPECT_EQ(job.run_info().dagman_out, "inner.dag.dagman.out");
}

TEST(JobInstanceTest, CapturedOutputPrefersRotatedFile) {
    const wm::tests::TempRunDir dir{};
    dir.write("job.out", "current");
    dir.write("job.out.001", "first retry");
    dir.write("job.err", "0123456789");

    wm::JobInstance job{"analyze", 1};
    job.run_info().stdout_file = "job.out";
    job.run_info().stderr_file = (dir.path() / "job.err").string();
    job.run_info().output_counter = 1;

    job.read_captured_output(dir.path(), 4);
    EXPECT_EQ(job.run_info().stdout_text, "first");
    // One byte beyond the limit is read so truncation can be detected
    EXPECT_EQ(job.run_info().stderr_text, "01234");

    job.release_output();
    EXPECT_FALSE(job.run_info().stdout_text.has_value());
    EXPECT_FALSE(job.run_info().stderr_text.has_value());
}

TEST(JobInstanceTest, MissingOutputFilesLeaveTextEmpty) {
    const wm::tests::TempRunDir dir{};
    wm::JobInstance job{"analyze", 1};
    job.run_info().stdout_file = "absent.out";
    job.read_captured_output(dir.path(), 100);
    EXPECT_FALSE(job.run_info().stdout_text.has_value());
    EXPECT_FALSE(job.run_info().stderr_text.has_value());
}

TEST(JobInstanceTest, AbsorbOutputMarksParsed) {
    wm::ExtractedOutput output{};
    output.remote_user = "condor";
    output.cluster_duration = 12.5;
    output.tasks.emplace_back();

    wm::JobInstance job{"analyze", 1};
    job.absorb_output(output);
    EXPECT_TRUE(job.run_info().output_parsed);
    EXPECT_EQ(job.run_info().remote_user, "condor");
    EXPECT_EQ(job.run_info().cluster_duration, 12.5);

    job.absorb_output(wm::ExtractedOutput{});
    EXPECT_FALSE(job.run_info().output_parsed);
    EXPECT_EQ(job.run_info().remote_user, "condor");
}

} // namespace
