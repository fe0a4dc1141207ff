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


#include <algorithm>    // for max
#include <array>        // for array
#include <cstddef>      // for size_t
#include <cstdint>      // for int64_t, uint64_t, uint32_t
#include <exception>    // for exception
#include <filesystem>   // for path
#include <format>       // for format
#include <fstream>      // for ifstream
#include <memory>       // for shared_ptr, make_shared
#include <optional>     // for optional, nullopt
#include <string>       // for string, getline
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move

#include <arpa/inet.h>  // for inet_ntop
#include <netdb.h>      // for getaddrinfo, freeaddrinfo
#include <netinet/in.h> // for sockaddr_in
#include <unistd.h>     // for gethostname

#include <gsl-lite/gsl-lite.hpp>
#include <tl/expected.hpp> // for expected, unexpected

#include "log/log_macros.hpp"
#include "monitor/bp_format.hpp"
#include "monitor/braindump.hpp"
#include "monitor/event_projection.hpp"
#include "monitor/job_state.hpp"
#include "monitor/monitor_errors.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/persistence.hpp"
#include "monitor/replay_log.hpp"
#include "monitor/submit_file.hpp"
#include "monitor/timestamp.hpp"
#include "monitor/workflow.hpp"

namespace wfmon::monitor {

namespace {

constexpr std::string_view MONITORD_STARTED = "MONITORD_STARTED";
constexpr std::string_view STATIC_BP_EXTENSION = ".static.bp";
constexpr std::string_view DAGMAN_OUT_SUFFIX = ".dagman.out";
constexpr std::size_t HOST_NAME_BUFFER = 256;

HostInfo resolve_local_host() {
    HostInfo host{};
    std::array<char, HOST_NAME_BUFFER> name{};
    if (::gethostname(name.data(), name.size() - 1) != 0) {
        return host;
    }
    host.hostname = name.data();

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_flags = AI_CANONNAME;
    addrinfo *result = nullptr;
    if (::getaddrinfo(host.hostname.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return host;
    }
    const auto release = gsl_lite::finally([result] { ::freeaddrinfo(result); });

    if (result->ai_canonname != nullptr) {
        host.hostname = result->ai_canonname;
    }
    std::array<char, INET_ADDRSTRLEN> address{};
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *ipv4 = reinterpret_cast<const sockaddr_in *>(result->ai_addr);
    if (::inet_ntop(AF_INET, &ipv4->sin_addr, address.data(), address.size()) != nullptr) {
        host.ip = address.data();
    }
    return host;
}

bool is_completed(const JobInstance &job, const bool has_post_script) {
    const auto state = job.state();
    return state == JobState::POST_SCRIPT_SUCCESS ||
           (state == JobState::JOB_SUCCESS && !has_post_script);
}

} // anonymous namespace

Workflow::Workflow(
        WorkflowConfig config,
        std::shared_ptr<EventSink> sink,
        std::shared_ptr<OutputExtractor> extractor,
        gsl_lite::not_null<WorkflowRegistry *> registry,
        gsl_lite::not_null<SubworkflowResolver *> resolver)
        : config_{std::move(config)}, sink_{std::move(sink), "event sink"},
          extractor_{extractor != nullptr ? std::move(extractor) : std::make_shared<NullOutputExtractor>()},
          registry_{registry}, resolver_{resolver} {}

std::error_code Workflow::start() {
    if (started_) {
        return make_error_code(MonitorErrc::AlreadyStarted);
    }

    auto properties = load_braindump(config_.run_dir / config_.braindump_file);
    if (!properties) {
        WFMON_LOGC_ERROR(
                MonitorLog::Workflow,
                "Cannot load workflow properties from {}: {}",
                config_.run_dir.string(),
                properties.error().message());
        return properties.error();
    }
    properties_ = std::move(*properties);
    root_wf_uuid_ = config_.root_wf_uuid.has_value() ? config_.root_wf_uuid : properties_->root_wf_uuid;

    auto table = parse_dag_file(config_.run_dir / properties_->dag_file, config_.run_dir);
    if (!table) {
        WFMON_LOGC_ERROR(MonitorLog::Workflow, "{}", table.error());
        return make_error_code(MonitorErrc::FileOpenFailed);
    }
    static_info_ = std::move(*table);

    persistence_.emplace(FileLayout::make(
            config_.run_dir, config_.output_dir, properties_->wf_uuid, config_.replay_log_name));
    persistence_->remove_stale_done();
    const LoadedState loaded = persistence_->load(config_.replay_mode);

    next_submit_seq_ = loaded.checkpoint.next_submit_seq;
    job_counters_ = loaded.checkpoint.job_counters;
    restart_count_ = loaded.checkpoint.restart_count;
    last_processed_offset_ = loaded.checkpoint.last_processed_offset;
    resume_offset_ = loaded.resume_offset();
    recovery_threshold_ = loaded.recovery_offset;
    input_offset_ = resume_offset_;

    const auto &layout = persistence_->layout();
    auto mode = ReplayOpenMode::Append;
    if (config_.replay_mode || loaded.recovering()) {
        if (const auto rotated = rotate_file(layout.replay_log); !rotated) {
            return make_error_code(MonitorErrc::ReplayLogOpenFailed);
        }
        mode = ReplayOpenMode::Truncate;
    }
    if (const auto ec = replay_log_.open(layout.replay_log, mode, config_.sync_replay_log); ec) {
        return ec;
    }

    start_time_ = now_epoch_seconds();
    if (const auto ec = replay_log_.write_internal(start_time_, MONITORD_STARTED); ec) {
        replay_log_.close();
        return ec;
    }
    if (const auto ec = persistence_->write_started(start_time_); ec) {
        WFMON_LOGC_WARN(
                MonitorLog::Workflow, "Cannot write {}: {}", layout.started.string(), ec.message());
    }

    context_.wf_uuid = properties_->wf_uuid;
    context_.user = properties_->user;
    context_.original_submit_dir = properties_->original_submit_dir;
    context_.max_output_length = config_.max_output_length;
    context_.store_stdout_stderr = config_.store_stdout_stderr;

    registry_->register_workflow(
            config_.run_dir, WorkflowLink{properties_->wf_uuid, config_.parent_wf_uuid, root_wf_uuid_});
    started_ = true;

    const bool first_run = !loaded.recovering() && loaded.checkpoint.last_processed_offset == 0;
    if (first_run && sink_.enabled()) {
        send(project_workflow_plan(*properties_, config_.parent_wf_uuid, root_wf_uuid_));
        if (config_.emit_static_events) {
            send_static_events();
        }
    }
    if (first_run && config_.parent_wf_uuid.has_value() && config_.parent_job_name.has_value() &&
        config_.parent_job_seq.has_value()) {
        send(project_subworkflow_map(
                *config_.parent_wf_uuid,
                properties_->wf_uuid,
                *config_.parent_job_name,
                *config_.parent_job_seq,
                properties_->timestamp));
    }

    WFMON_LOGC_INFO(
            MonitorLog::Workflow,
            "Started {} ({}), {} jobs, resuming at offset {}{}",
            properties_->wf_uuid,
            properties_->display_label(),
            static_info_.size(),
            resume_offset_,
            loaded.recovering() ? ", recovering" : "");
    return {};
}

ApplyResult Workflow::apply_signal(const Signal &signal) {
    if (!started_ || finished_ || broken_) {
        WFMON_LOGC_WARN(MonitorLog::Workflow, "Refusing signal {}", signal);
        return ApplyResult{ApplyStatus::Refused, std::nullopt};
    }
    const auto info_it = static_info_.find(signal.job_name);
    if (info_it == static_info_.end()) {
        WFMON_LOGC_WARN(MonitorLog::JobState, "Dropping signal for unknown job {}", signal.job_name);
        return ApplyResult{ApplyStatus::Dropped, std::nullopt};
    }
    const JobStaticInfo &info = info_it->second;
    const bool suppressed = is_recovering();
    context_.current_timestamp = signal.timestamp;

    bool created = false;
    JobInstance *job = select_instance(signal, created);

    if (!created && job->state().has_value() && phase_of(signal.kind) < phase_of(*job->state())) {
        if (signal.kind == JobState::SUBMIT && signal.sched_id.has_value() &&
            job->sched_id() == signal.sched_id) {
            return close_late_submit(*job, signal, suppressed);
        }
        if (job->is_terminal(info.has_post_script())) {
            WFMON_LOGC_INFO(
                    MonitorLog::JobState,
                    "{} after terminal {} of {}, starting a new instance",
                    to_token(signal.kind),
                    to_token(*job->state()),
                    job->key());
            job = &create_instance(signal.job_name);
            created = true;
        } else {
            WFMON_LOGC_WARN(
                    MonitorLog::JobState,
                    "Ignoring {} for {} already in {}",
                    to_token(signal.kind),
                    job->key(),
                    to_token(*job->state()));
            if (const auto ec = write_replay_line(*job, signal); ec) {
                return ApplyResult{ApplyStatus::Refused, job->key()};
            }
            return ApplyResult{ApplyStatus::Ignored, job->key()};
        }
    }

    const bool late_sched_id = !is_submit_class(signal.kind) && signal.sched_id.has_value() &&
                               !job->sched_id().has_value();
    if (signal.sched_id.has_value()) {
        job->set_sched_id(*signal.sched_id);
    }
    if (signal.kind == JobState::SUBMIT) {
        count_submission(*job);
    }
    if (created || is_submit_class(signal.kind)) {
        parse_submit_file_once(*job, info);
    }
    job->apply(signal.kind, signal.timestamp, signal.status);

    if (const auto ec = write_replay_line(*job, signal); ec) {
        return ApplyResult{ApplyStatus::Refused, job->key()};
    }
    const bool submit_pair = signal.kind == JobState::SUBMIT || signal.kind == JobState::SUBMIT_FAILED;
    if (late_sched_id || submit_pair) {
        job->mark_submit_reported();
    }
    if (submit_pair) {
        job->mark_submit_closed();
    }
    WFMON_LOGC_DEBUG(MonitorLog::JobState, "Applied {} to {}", signal, job->key());

    if (suppressed) {
        return ApplyResult{ApplyStatus::Suppressed, job->key()};
    }
    if (sink_.enabled()) {
        ExtractedOutput output{};
        if (signal.kind == JobState::JOB_SUCCESS || signal.kind == JobState::JOB_FAILURE) {
            output = extract_output(*job, info);
        }
        for (const Event &event :
             project_transition(*job, info, signal.kind, output, context_, late_sched_id)) {
            send(event);
        }
    }
    job->release_output();
    return ApplyResult{ApplyStatus::Applied, job->key()};
}

std::error_code Workflow::checkpoint_progress() {
    if (!started_) {
        return make_error_code(MonitorErrc::NotStarted);
    }
    if (finished_) {
        return {};
    }
    return persistence_->checkpoint_progress(input_offset_);
}

std::error_code
Workflow::controller_started(const std::int64_t timestamp, const std::string &controller_id) {
    if (!started_) {
        return make_error_code(MonitorErrc::NotStarted);
    }
    if (finished_ || broken_) {
        return make_error_code(MonitorErrc::Finished);
    }
    context_.current_timestamp = timestamp;
    if (const auto ec =
                replay_log_.write_internal(timestamp, std::format("DAGMAN_STARTED {}", controller_id));
        ec) {
        broken_ = true;
        return ec;
    }
    ++restart_count_;
    evict_completed();
    WFMON_LOGC_INFO(
            MonitorLog::Workflow,
            "Controller {} started for {}, restart count {}",
            controller_id,
            wf_uuid(),
            restart_count_);
    if (!is_recovering()) {
        send(project_workflow_state(wf_uuid(), timestamp, restart_count_, std::nullopt, false));
    }
    return {};
}

std::error_code Workflow::controller_finished(const std::int64_t timestamp, const int exit_code) {
    if (!started_) {
        return make_error_code(MonitorErrc::NotStarted);
    }
    if (finished_ || broken_) {
        return make_error_code(MonitorErrc::Finished);
    }
    context_.current_timestamp = timestamp;
    controller_exit_code_ = exit_code;
    if (const auto ec =
                replay_log_.write_internal(timestamp, std::format("DAGMAN_FINISHED {}", exit_code));
        ec) {
        broken_ = true;
        return ec;
    }
    if (is_recovering()) {
        // Exit of an earlier controller run: the daemon that followed it
        // started with an empty instance index
        WFMON_LOGC_INFO(
                MonitorLog::Workflow,
                "Replayed controller exit {} of {}, dropping {} instances",
                exit_code,
                wf_uuid(),
                instances_.size());
        instances_.clear();
        latest_.clear();
        return {};
    }
    WFMON_LOGC_INFO(
            MonitorLog::Workflow, "Controller finished {} with exit code {}", wf_uuid(), exit_code);
    send(project_workflow_state(wf_uuid(), timestamp, restart_count_, exit_code, true));
    return finish();
}

std::error_code Workflow::finish() {
    if (!started_) {
        return make_error_code(MonitorErrc::NotStarted);
    }
    if (finished_) {
        return {};
    }
    finished_ = true;

    const auto now = now_epoch_seconds();
    std::error_code result{};
    if (replay_log_.is_open()) {
        result = replay_log_.write_internal(now, "MONITORD_FINISHED 0");
        replay_log_.close();
    }

    const Checkpoint checkpoint{
            .next_submit_seq = next_submit_seq_,
            .last_processed_offset = std::max(
                    {input_offset_, last_processed_offset_, recovery_threshold_.value_or(0)}),
            .restart_count = restart_count_,
            .job_counters = job_counters_};
    if (const auto ec = persistence_->save(checkpoint); ec && !result) {
        result = ec;
    }
    if (const auto ec = persistence_->write_done(now, static_cast<double>(now - start_time_));
        ec && !result) {
        result = ec;
    }
    sink_.flush();

    WFMON_LOGC_INFO(
            MonitorLog::Workflow,
            "Finished {}, {} events sent, next sequence {}",
            wf_uuid(),
            sink_.sent_count(),
            next_submit_seq_);
    return result;
}

tl::expected<std::filesystem::path, std::error_code>
Workflow::subworkflow_log(const std::string &job_name) {
    if (!started_) {
        return tl::unexpected(make_error_code(MonitorErrc::NotStarted));
    }
    const auto info_it = static_info_.find(job_name);
    if (info_it == static_info_.end()) {
        return tl::unexpected(make_error_code(MonitorErrc::UnknownJob));
    }
    const JobStaticInfo &info = info_it->second;

    std::optional<std::filesystem::path> nested;
    if (info.is_subworkflow && info.subdag_file.has_value()) {
        std::filesystem::path dag{*info.subdag_file};
        if (dag.is_relative()) {
            const std::filesystem::path dir{info.subdag_dir.value_or("")};
            dag = dir == dag.parent_path() ? config_.run_dir / dag : config_.run_dir / dir / dag;
        }
        nested = dag.string() + std::string{DAGMAN_OUT_SUFFIX};
    } else if (const auto *job = latest_instance(job_name);
               job != nullptr && job->run_info().dagman_out.has_value()) {
        nested = std::filesystem::path{*job->run_info().dagman_out};
    }
    if (!nested.has_value()) {
        return tl::unexpected(make_error_code(MonitorErrc::NotSubworkflow));
    }
    return resolver_->resolve(*nested, config_.run_dir, properties_->original_submit_dir);
}

std::error_code Workflow::map_subworkflow(
        const std::string &parent_job_name,
        const std::uint64_t parent_job_seq,
        const WorkflowLink &child) {
    if (!started_) {
        return make_error_code(MonitorErrc::NotStarted);
    }
    if (is_recovering()) {
        WFMON_LOGC_DEBUG(
                MonitorLog::Workflow, "Not re-sending link of {} during recovery", child.wf_uuid);
        return {};
    }
    send(project_subworkflow_map(
            child.parent_wf_uuid.value_or(wf_uuid()),
            child.wf_uuid,
            parent_job_name,
            parent_job_seq,
            properties_->timestamp));
    return {};
}

bool Workflow::is_recovering() const noexcept {
    return recovery_threshold_.has_value() && input_offset_ <= *recovery_threshold_;
}

std::optional<std::uint32_t> Workflow::job_counter(const std::string &job_name) const {
    const auto it = job_counters_.find(job_name);
    if (it == job_counters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const JobInstance *Workflow::latest_instance(const std::string &job_name) const {
    const auto it = latest_.find(job_name);
    if (it == latest_.end()) {
        return nullptr;
    }
    return find_instance(JobKey{job_name, it->second});
}

const JobInstance *Workflow::find_instance(const JobKey &key) const {
    const auto it = instances_.find(key);
    return it == instances_.end() ? nullptr : &it->second;
}

std::optional<FileLayout> Workflow::layout() const {
    if (!persistence_.has_value()) {
        return std::nullopt;
    }
    return persistence_->layout();
}

JobInstance *Workflow::latest_mutable(const std::string &job_name) {
    const auto it = latest_.find(job_name);
    if (it == latest_.end()) {
        return nullptr;
    }
    const auto job = instances_.find(JobKey{job_name, it->second});
    return job == instances_.end() ? nullptr : &job->second;
}

JobInstance &Workflow::create_instance(const std::string &job_name) {
    const std::uint64_t seq = next_submit_seq_++;
    auto [it, inserted] = instances_.try_emplace(JobKey{job_name, seq}, job_name, seq);
    latest_.insert_or_assign(job_name, seq);
    WFMON_LOGC_DEBUG(MonitorLog::JobState, "New instance {}", it->first);
    return it->second;
}

JobInstance *Workflow::select_instance(const Signal &signal, bool &created) {
    JobInstance *latest = latest_mutable(signal.job_name);

    if (is_submit_class(signal.kind)) {
        if (latest != nullptr) {
            const auto state = latest->state();
            const bool resumable =
                    state == JobState::PRE_SCRIPT_SUCCESS || state == JobState::DAGMAN_SUBMIT;
            const bool same_sched_id =
                    signal.sched_id.has_value() && latest->sched_id() == signal.sched_id;
            if (resumable || same_sched_id) {
                return latest;
            }
        }
        created = true;
        return &create_instance(signal.job_name);
    }

    if (latest == nullptr) {
        WFMON_LOGC_WARN(
                MonitorLog::JobState,
                "No live instance of {} for {}, creating one",
                signal.job_name,
                to_token(signal.kind));
        created = true;
        return &create_instance(signal.job_name);
    }

    const auto &known = latest->sched_id();
    if (signal.sched_id.has_value() && known.has_value() && *known != *signal.sched_id &&
        latest->state().has_value() && phase_of(*latest->state()) != JobPhase::PreScript) {
        WFMON_LOGC_WARN(
                MonitorLog::JobState,
                "Scheduler id {} does not match {} of {}, creating a new instance",
                *signal.sched_id,
                *known,
                latest->key());
        created = true;
        return &create_instance(signal.job_name);
    }
    return latest;
}

void Workflow::parse_submit_file_once(JobInstance &job, const JobStaticInfo &info) {
    if (job.submit_file_parsed()) {
        return;
    }
    if (!info.submit_file.has_value()) {
        job.mark_submit_file_parsed();
        return;
    }
    const auto parsed = parse_submit_file(*info.submit_file);
    if (!parsed) {
        WFMON_LOGC_WARN(
                MonitorLog::StaticInfo,
                "Cannot parse submit file {} of {}: {}",
                info.submit_file->string(),
                job.name(),
                parsed.error().message());
        job.mark_submit_file_parsed();
        return;
    }
    job.apply_submit_file(*parsed, properties_->original_submit_dir);
}

void Workflow::count_submission(JobInstance &job) {
    auto [it, inserted] = job_counters_.try_emplace(job.name(), 0U);
    if (!inserted) {
        ++it->second;
    }
    job.run_info().output_counter = it->second;
}

ExtractedOutput Workflow::extract_output(JobInstance &job, const JobStaticInfo &info) {
    ExtractedOutput output{};
    if (info.is_subworkflow) {
        WFMON_LOGC_DEBUG(
                MonitorLog::Extractor, "Not extracting output of sub-workflow job {}", job.name());
    } else {
        try {
            output = extractor_->extract(job, config_.run_dir);
        } catch (const std::exception &e) {
            WFMON_LOGC_WARN(
                    MonitorLog::Extractor,
                    "Output extraction for {} failed: {}",
                    job.key(),
                    e.what());
            output = ExtractedOutput{};
        }
        job.absorb_output(output);
    }

    if (output.empty()) {
        if (config_.store_stdout_stderr) {
            job.read_captured_output(config_.run_dir, config_.max_output_length);
        }
        if (info.is_subworkflow || job.name().starts_with("subdax_")) {
            ensure_local_host();
        }
    }
    return output;
}

ApplyResult
Workflow::close_late_submit(JobInstance &job, const Signal &signal, const bool suppressed) {
    if (const auto ec = write_replay_line(job, signal); ec) {
        return ApplyResult{ApplyStatus::Refused, job.key()};
    }
    if (job.submit_closed()) {
        WFMON_LOGC_INFO(MonitorLog::JobState, "Repeated SUBMIT for {} ignored", job.key());
        return ApplyResult{ApplyStatus::Ignored, job.key()};
    }
    WFMON_LOGC_INFO(
            MonitorLog::JobState, "Late SUBMIT for {} closes its submit events", job.key());
    const bool report_start = !job.submit_reported();
    job.mark_submit_reported();
    job.mark_submit_closed();
    if (suppressed) {
        return ApplyResult{ApplyStatus::Suppressed, job.key()};
    }
    if (report_start) {
        send(make_job_event(job, context_, "submit.start"));
    }
    send(make_job_event(job, context_, "submit.end", 0));
    return ApplyResult{ApplyStatus::Applied, job.key()};
}

std::error_code Workflow::write_replay_line(const JobInstance &job, const Signal &signal) {
    const JobStateRecord record{
            .timestamp = signal.timestamp,
            .job_name = job.name(),
            .state = signal.kind,
            .status = signal.status,
            .sched_id = job.sched_id(),
            .site = job.run_info().site,
            .walltime = signal.walltime,
            .submit_seq = job.submit_seq()};
    if (const auto ec = replay_log_.append(record); ec) {
        broken_ = true;
        WFMON_LOGC_CRITICAL(
                MonitorLog::Workflow,
                "Replay log of {} is broken, refusing further signals",
                wf_uuid());
        return ec;
    }
    return {};
}

void Workflow::send(const Event &event) {
    if (sink_.send(event)) {
        WFMON_LOGC_TRACE(MonitorLog::Sink, "Sent {}", event.name);
    }
}

void Workflow::send_static_events() {
    const auto bp_file = config_.run_dir /
                         std::filesystem::path{properties_->dag_file}.replace_extension(
                                 std::string{STATIC_BP_EXTENSION});
    std::ifstream input(bp_file);
    if (!input.is_open()) {
        WFMON_LOGC_WARN(MonitorLog::Workflow, "Cannot find static events file {}", bp_file.string());
        return;
    }

    send(Event{"static.start"});
    std::string line;
    std::size_t sent = 0;
    while (std::getline(input, line)) {
        const auto parsed = parse_bp_line(line);
        if (!parsed) {
            WFMON_LOGC_ERROR(
                    MonitorLog::Workflow,
                    "Bad event in {}: {} ({})",
                    bp_file.string(),
                    line,
                    parsed.error());
            continue;
        }
        if (parsed->has_value()) {
            send(**parsed);
            ++sent;
        }
    }
    send(Event{"static.end"});
    WFMON_LOGC_DEBUG(MonitorLog::Workflow, "Sent {} static events", sent);
}

void Workflow::evict_completed() {
    std::size_t evicted = 0;
    for (auto it = instances_.begin(); it != instances_.end();) {
        const auto info_it = static_info_.find(it->first.name);
        const bool has_post =
                info_it != static_info_.end() && info_it->second.has_post_script();
        if (!is_completed(it->second, has_post)) {
            ++it;
            continue;
        }
        if (const auto latest = latest_.find(it->first.name);
            latest != latest_.end() && latest->second == it->first.submit_seq) {
            latest_.erase(latest);
        }
        it = instances_.erase(it);
        ++evicted;
    }
    WFMON_LOGC_DEBUG(MonitorLog::Workflow, "Evicted {} completed instances", evicted);
}

void Workflow::ensure_local_host() {
    if (local_host_resolved_) {
        return;
    }
    context_.local_host = resolve_local_host();
    local_host_resolved_ = true;
}

} // namespace wfmon::monitor
