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
 * @file workflow.hpp
 * @brief Orchestrator tracking the jobs of one workflow run
 *
 * A Workflow owns the job instances, replay log and persisted state of
 * one (sub-)workflow. The controller log tokenizer drives it through
 * apply_signal and the controller start/finish notifications; every
 * applied transition is written to the replay log before its events are
 * projected to the sink.
 */

#ifndef WFMON_MONITOR_WORKFLOW_HPP
#define WFMON_MONITOR_WORKFLOW_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>

#include <gsl-lite/gsl-lite.hpp>
#include <tl/expected.hpp>
#include <wise_enum.h>

#include "log/log_macros.hpp"
#include "monitor/braindump.hpp"
#include "monitor/event.hpp"
#include "monitor/event_projection.hpp"
#include "monitor/job_instance.hpp"
#include "monitor/output_extractor.hpp"
#include "monitor/persistence.hpp"
#include "monitor/replay_log.hpp"
#include "monitor/signal.hpp"
#include "monitor/sink.hpp"
#include "monitor/static_info.hpp"
#include "monitor/subworkflow_resolver.hpp"
#include "monitor/workflow_config.hpp"
#include "monitor/workflow_registry.hpp"

namespace wfmon::monitor {

/**
 * Outcome of applying a signal
 */
enum class ApplyStatus : std::uint8_t {
    Applied,    //!< State changed, replay line written, events projected
    Suppressed, //!< State changed and logged, events withheld during recovery
    Ignored,    //!< Regressing signal logged, state kept, no events
    Dropped,    //!< Unknown job, nothing recorded
    Refused     //!< Workflow not started, finished, or replay log broken
};

/**
 * Result of apply_signal
 */
struct ApplyResult final {
    ApplyStatus status{ApplyStatus::Dropped}; //!< Outcome
    std::optional<JobKey> job;                //!< Instance the signal was applied to
};

/**
 * State tracker of one workflow run
 */
class Workflow final {
public:
    /**
     * Create an orchestrator
     *
     * @param[in] config Run-time options
     * @param[in] sink Event destination, null to disable event projection
     * @param[in] extractor Output parser, null for no task records
     * @param[in] registry Process-wide workflow registry
     * @param[in] resolver Process-wide sub-workflow resolver
     */
    Workflow(
            WorkflowConfig config,
            std::shared_ptr<EventSink> sink,
            std::shared_ptr<OutputExtractor> extractor,
            gsl_lite::not_null<WorkflowRegistry *> registry,
            gsl_lite::not_null<SubworkflowResolver *> resolver);

    ~Workflow() = default;
    Workflow(const Workflow &) = delete;
    Workflow &operator=(const Workflow &) = delete;
    Workflow(Workflow &&) = delete;
    Workflow &operator=(Workflow &&) = delete;

    /**
     * Load configuration and prior state and open the replay log
     *
     * Reads the braindump and DAG files, loads the checkpoint and the
     * recovery marker, opens (rotating in replay or recovery mode) the
     * replay log and registers the workflow. On a first run the plan
     * and static events are sent.
     *
     * @return Empty error code on success; on failure the workflow
     *         refuses all signals
     */
    [[nodiscard]] std::error_code start();

    /**
     * Apply one state-transition signal
     *
     * @param[in] signal Signal from the controller log
     * @return Outcome and target instance
     */
    ApplyResult apply_signal(const Signal &signal);

    /**
     * Set the input offset of the signals that follow
     *
     * Signals at or before the recovery marker offset are applied
     * without projecting events.
     */
    void set_input_offset(std::uint64_t offset) noexcept { input_offset_ = offset; }

    /**
     * Record the current input offset in the recovery marker
     */
    [[nodiscard]] std::error_code checkpoint_progress();

    /**
     * Handle a controller (re)start
     *
     * Evicts completed instances and sends xwf.start.
     *
     * @param[in] timestamp Epoch seconds
     * @param[in] controller_id Scheduler id of the controller
     */
    [[nodiscard]] std::error_code
    controller_started(std::int64_t timestamp, const std::string &controller_id);

    /**
     * Handle the controller exit, sending xwf.end and tearing down
     *
     * An exit replayed during recovery belongs to an earlier run. It
     * only clears the live instances and the workflow keeps going.
     *
     * @param[in] timestamp Epoch seconds
     * @param[in] exit_code Controller exit code
     */
    [[nodiscard]] std::error_code controller_finished(std::int64_t timestamp, int exit_code);

    /**
     * Close the replay log, save the checkpoint and write the done sentinel
     *
     * Safe to call more than once.
     */
    [[nodiscard]] std::error_code finish();

    /**
     * Locate the nested log of a sub-workflow job
     *
     * @param[in] job_name Job running the nested workflow
     * @return Nested log path, UnknownJob, NotSubworkflow or SubworkflowLogMissing
     */
    [[nodiscard]] tl::expected<std::filesystem::path, std::error_code>
    subworkflow_log(const std::string &job_name);

    /**
     * Link a child workflow to one of this workflow's jobs
     *
     * @param[in] parent_job_name Job running the child
     * @param[in] parent_job_seq Submit sequence of that job
     * @param[in] child Child workflow identity
     * @return Empty error code on success, NotStarted before start()
     */
    [[nodiscard]] std::error_code map_subworkflow(
            const std::string &parent_job_name,
            std::uint64_t parent_job_seq,
            const WorkflowLink &child);

    /**
     * Input offset the tokenizer should resume reading from
     */
    [[nodiscard]] std::uint64_t resume_offset() const noexcept { return resume_offset_; }

    /**
     * Whether signals at the current input offset are being replayed silently
     */
    [[nodiscard]] bool is_recovering() const noexcept;

    [[nodiscard]] bool is_started() const noexcept { return started_; }
    [[nodiscard]] bool is_finished() const noexcept { return finished_; }
    [[nodiscard]] const std::string &wf_uuid() const noexcept { return context_.wf_uuid; }
    [[nodiscard]] const std::optional<WorkflowProperties> &properties() const noexcept {
        return properties_;
    }
    [[nodiscard]] const StaticInfoTable &static_info() const noexcept { return static_info_; }
    [[nodiscard]] const WorkflowConfig &config() const noexcept { return config_; }
    [[nodiscard]] std::uint64_t next_submit_seq() const noexcept { return next_submit_seq_; }
    [[nodiscard]] std::uint32_t restart_count() const noexcept { return restart_count_; }
    [[nodiscard]] std::size_t instance_count() const noexcept { return instances_.size(); }
    [[nodiscard]] std::optional<std::uint32_t> job_counter(const std::string &job_name) const;

    /**
     * Latest live instance of a job, null if none
     */
    [[nodiscard]] const JobInstance *latest_instance(const std::string &job_name) const;

    /**
     * Live instance by identity, null if none
     */
    [[nodiscard]] const JobInstance *find_instance(const JobKey &key) const;

    /**
     * State file locations, available after start()
     */
    [[nodiscard]] std::optional<FileLayout> layout() const;

    /**
     * Whether the sink is still accepting events
     */
    [[nodiscard]] bool sink_enabled() const noexcept { return sink_.enabled(); }

private:
    JobInstance *latest_mutable(const std::string &job_name);
    JobInstance &create_instance(const std::string &job_name);
    JobInstance *select_instance(const Signal &signal, bool &created);
    void parse_submit_file_once(JobInstance &job, const JobStaticInfo &info);
    void count_submission(JobInstance &job);
    ExtractedOutput extract_output(JobInstance &job, const JobStaticInfo &info);
    ApplyResult close_late_submit(JobInstance &job, const Signal &signal, bool suppressed);
    std::error_code write_replay_line(const JobInstance &job, const Signal &signal);
    void send(const Event &event);
    void send_static_events();
    void evict_completed();
    void ensure_local_host();

    WorkflowConfig config_;
    GuardedSink sink_;
    std::shared_ptr<OutputExtractor> extractor_;
    gsl_lite::not_null<WorkflowRegistry *> registry_;
    gsl_lite::not_null<SubworkflowResolver *> resolver_;

    std::optional<WorkflowProperties> properties_;
    std::optional<std::string> root_wf_uuid_;
    StaticInfoTable static_info_;
    std::optional<Persistence> persistence_;
    ReplayLog replay_log_;
    ProjectionContext context_;

    std::map<JobKey, JobInstance> instances_;
    std::unordered_map<std::string, std::uint64_t> latest_;
    std::map<std::string, std::uint32_t> job_counters_;
    std::uint64_t next_submit_seq_{1};
    std::uint32_t restart_count_{0};

    std::uint64_t input_offset_{0};
    std::uint64_t last_processed_offset_{0};
    std::uint64_t resume_offset_{0};
    std::optional<std::uint64_t> recovery_threshold_;

    std::int64_t start_time_{0};
    std::optional<int> controller_exit_code_;
    bool started_{false};
    bool finished_{false};
    bool broken_{false};
    bool local_host_resolved_{false};
};

} // namespace wfmon::monitor

WISE_ENUM_ADAPT(wfmon::monitor::ApplyStatus, Applied, Suppressed, Ignored, Dropped, Refused)

#endif // WFMON_MONITOR_WORKFLOW_HPP
