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


#include <cstddef>     // for size_t
#include <cstdint>     // for int64_t, uint64_t
#include <format>      // for format
#include <optional>    // for optional, nullopt
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move
#include <vector>      // for vector

#include "log/log_macros.hpp"
#include "monitor/braindump.hpp"
#include "monitor/event.hpp"
#include "monitor/event_projection.hpp"
#include "monitor/job_instance.hpp"
#include "monitor/job_state.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/output_extractor.hpp"
#include "monitor/static_info.hpp"

namespace wfmon::monitor {

namespace {

constexpr std::string_view ERROR_LEVEL = "Error";
constexpr std::string_view PLANNER_ARGV_STRIP = "\" \t\n\r";

/**
 * Which side of the main job a script runs on
 */
enum class ScriptSide { Pre, Post };

Event make_invocation_base(const JobInstance &job, const ProjectionContext &ctx, std::string name) {
    Event event{std::move(name)};
    event.set("xwf.id", ctx.wf_uuid)
            .set("job.id", job.name())
            .set("job_inst.id", job.submit_seq());
    return event;
}

void mark_error_unless_zero_exit(Event &event) {
    const auto exitcode = event.get("exitcode");
    if (!exitcode.has_value() || *exitcode != "0") {
        event.set("level", std::string{ERROR_LEVEL});
    }
}

void append_script_invocation(
        std::vector<Event> &events,
        const JobInstance &job,
        const JobStaticInfo &info,
        const ProjectionContext &ctx,
        const ScriptSide side) {
    const bool pre = side == ScriptSide::Pre;
    const PhaseTiming &timing = pre ? job.pre_script() : job.post_script();
    const int task_id = pre ? PRE_SCRIPT_TASK_ID : POST_SCRIPT_TASK_ID;
    const auto &executable = pre ? info.pre_script_executable : info.post_script_executable;
    const auto &arguments = pre ? info.pre_script_arguments : info.post_script_arguments;

    Event start = make_invocation_base(job, ctx, "inv.start");
    start.set("inv.id", task_id);
    start.set_if("ts", timing.start.has_value() ? timing.start : timing.end);
    events.push_back(std::move(start));

    Event end = make_invocation_base(job, ctx, "inv.end");
    end.set("inv.id", task_id);
    end.set("transformation", std::string{pre ? "dagman::pre" : "dagman::post"});
    end.set_if("start_time", timing.start.has_value() ? timing.start : timing.end);
    if (timing.start.has_value() && timing.end.has_value()) {
        end.set("dur", *timing.end - *timing.start);
        end.set("remote_cpu_time", *timing.end - *timing.start);
    } else {
        end.set("dur", 0);
    }
    end.set_if("exitcode", timing.exitcode);
    end.set("executable", executable.value_or(""));
    end.set_if("argv", arguments);
    end.set_if("ts", timing.end);
    mark_error_unless_zero_exit(end);
    events.push_back(std::move(end));
}

void append_task_invocation(
        std::vector<Event> &events,
        const JobInstance &job,
        const JobStaticInfo &info,
        const ProjectionContext &ctx,
        const int task_id,
        const TaskRecord &record) {
    const PhaseTiming &main = job.main_job();
    const JobRunInfo &run = job.run_info();

    std::optional<std::int64_t> start = record.start;
    if (!start.has_value()) {
        start = main.start.has_value() ? main.start : main.end;
    }

    Event begin = make_invocation_base(job, ctx, "inv.start");
    begin.set("inv.id", task_id);
    begin.set_if("ts", start);
    events.push_back(std::move(begin));

    Event end = make_invocation_base(job, ctx, "inv.end");
    end.set("inv.id", task_id);

    if (record.transformation.has_value()) {
        end.set("transformation", *record.transformation);
    } else if (run.transformation.has_value()) {
        end.set("transformation", *run.transformation);
    } else if (info.is_subworkflow) {
        end.set("transformation", std::string{"condor::dagman"});
    }

    if (record.derivation.has_value()) {
        if (*record.derivation != "null") {
            end.set("task.id", *record.derivation);
        }
    } else {
        end.set_if("task.id", run.derivation);
    }

    end.set_if("start_time", start);
    if (record.duration.has_value()) {
        end.set("dur", *record.duration);
    } else if (main.start.has_value() && main.end.has_value()) {
        end.set("dur", *main.end - *main.start);
    } else if (main.end.has_value()) {
        end.set("dur", 0);
    }
    end.set_if("remote_cpu_time", record.remote_cpu_time);

    if (start.has_value() && record.duration.has_value()) {
        end.set("ts", *start + static_cast<std::int64_t>(*record.duration));
    } else {
        end.set_if("ts", main.end);
    }

    if (record.exitcode.has_value()) {
        end.set("exitcode", *record.exitcode);
    } else {
        end.set_if("exitcode", main.exitcode);
    }

    if (record.executable.has_value()) {
        end.set("executable", *record.executable);
    } else if (run.executable.has_value()) {
        end.set("executable", *run.executable);
    } else if (info.is_subworkflow) {
        end.set("executable", ctx.dagman_executable);
    } else {
        end.set("executable", std::string{});
    }

    if (record.argv.has_value()) {
        if (!record.argv->empty()) {
            end.set("argv", *record.argv);
        }
    } else if (run.arguments.has_value() && !run.arguments->empty()) {
        end.set("argv", *run.arguments);
    }

    mark_error_unless_zero_exit(end);
    events.push_back(std::move(end));
}

Event make_host_event(const JobInstance &job, const ProjectionContext &ctx, const HostInfo &host) {
    Event event = make_invocation_base(job, ctx, "job_inst.host.info");
    event.set("hostname", host.hostname)
            .set("ip", host.ip)
            .set("site", host.site)
            .set_if("total_memory", host.total_memory)
            .set_if("uname", host.uname)
            .set("ts", ctx.current_timestamp);
    return event;
}

std::string output_file_name(
        const std::optional<std::string> &file, const JobRunInfo &run) {
    if (!file.has_value()) {
        return {};
    }
    if (run.output_parsed) {
        return std::format("{}.{:03d}", *file, run.output_counter);
    }
    return *file;
}

Event make_main_start(const JobInstance &job, const ProjectionContext &ctx) {
    const JobRunInfo &run = job.run_info();
    Event event = make_job_event(job, ctx, "main.start");
    event.set_if("stdin.file", run.stdin_file)
            .set_if("stdout.file", run.stdout_file)
            .set_if("stderr.file", run.stderr_file);
    return event;
}

Event make_main_end(const JobInstance &job, const ProjectionContext &ctx, const int status) {
    const JobRunInfo &run = job.run_info();
    const PhaseTiming &main = job.main_job();
    Event event = make_job_event(job, ctx, "main.end", status);

    event.set("site", run.site.value_or(""));
    if (run.remote_user.has_value()) {
        event.set("user", *run.remote_user);
    } else {
        event.set_if("user", ctx.user);
    }
    if (run.remote_work_dir.has_value()) {
        event.set("work_dir", *run.remote_work_dir);
    } else {
        event.set_if("work_dir", ctx.original_submit_dir);
    }
    event.set_if("cluster.start", run.cluster_start);
    event.set_if("cluster.dur", run.cluster_duration);
    if (main.start.has_value() && main.end.has_value()) {
        event.set("local.dur", *main.end - *main.start);
    }
    event.set_if("stdin.file", run.stdin_file);
    event.set("stdout.file", output_file_name(run.stdout_file, run));
    event.set("stderr.file", output_file_name(run.stderr_file, run));

    if (ctx.store_stdout_stderr) {
        if (run.stdout_text.has_value()) {
            event.set(
                    "stdout.text",
                    truncate_output(*run.stdout_text, ctx.max_output_length, job.name(), "stdout"));
        }
        if (run.stderr_text.has_value()) {
            event.set(
                    "stderr.text",
                    truncate_output(*run.stderr_text, ctx.max_output_length, job.name(), "stderr"));
        }
    }

    event.set_if("multiplier_factor", run.multiplier_factor);
    event.set("exitcode", main.exitcode.value_or(status == 0 ? 0 : 1));
    return event;
}

void append_main_job_end(
        std::vector<Event> &events,
        const JobInstance &job,
        const JobStaticInfo &info,
        const ExtractedOutput &output,
        const ProjectionContext &ctx) {
    if (output.empty()) {
        append_task_invocation(events, job, info, ctx, 1, TaskRecord{});
        if (info.is_subworkflow || job.name().starts_with("subdax_")) {
            HostInfo local = ctx.local_host;
            local.site = job.run_info().site.value_or("unknown");
            events.push_back(make_host_event(job, ctx, local));
        }
        return;
    }

    int task_id = 1;
    for (const TaskRecord &record : output.tasks) {
        append_task_invocation(events, job, info, ctx, task_id, record);
        ++task_id;
        if (record.host.has_value()) {
            events.push_back(make_host_event(job, ctx, *record.host));
        }
    }
}

void append_submit_pair(
        std::vector<Event> &events,
        const JobInstance &job,
        const ProjectionContext &ctx,
        const std::string_view prefix,
        const int status) {
    events.push_back(make_job_event(job, ctx, std::string{prefix} + ".start"));
    events.push_back(make_job_event(job, ctx, std::string{prefix} + ".end", status));
}

} // anonymous namespace

Event make_job_event(
        const JobInstance &job,
        const ProjectionContext &ctx,
        std::string_view suffix,
        const std::optional<int> status) {
    Event event{std::string{"job_inst."} + std::string{suffix}};
    event.set("xwf.id", ctx.wf_uuid)
            .set("job.id", job.name())
            .set("job_inst.id", job.submit_seq())
            .set("ts", job.state_timestamp())
            .set("js.id", job.state_seq())
            .set_if("sched.id", job.sched_id());
    if (status.has_value()) {
        event.set("status", *status);
        if (*status != 0) {
            event.set("level", std::string{ERROR_LEVEL});
        }
    }
    return event;
}

std::string truncate_output(
        std::string_view text,
        const std::size_t max_length,
        std::string_view job_name,
        std::string_view stream) {
    if (text.size() <= max_length) {
        return std::string{text};
    }
    WFMON_LOGC_WARN(
            MonitorLog::Projection,
            "Truncating {} for job {} from {} to {} bytes",
            stream,
            job_name,
            text.size(),
            max_length);
    return std::string{text.substr(0, max_length)};
}

std::vector<Event> project_transition(
        const JobInstance &job,
        const JobStaticInfo &info,
        const JobState state,
        const ExtractedOutput &output,
        const ProjectionContext &ctx,
        const bool emit_submit_start) {
    std::vector<Event> events;
    if (emit_submit_start) {
        events.push_back(make_job_event(job, ctx, "submit.start"));
    }

    switch (state) {
    case JobState::PRE_SCRIPT_STARTED:
        events.push_back(make_job_event(job, ctx, "pre.start"));
        break;
    case JobState::PRE_SCRIPT_TERMINATED:
        events.push_back(make_job_event(job, ctx, "pre.term"));
        break;
    case JobState::PRE_SCRIPT_SUCCESS:
    case JobState::PRE_SCRIPT_FAILURE:
        append_script_invocation(events, job, info, ctx, ScriptSide::Pre);
        events.push_back(make_job_event(
                job, ctx, "pre.end", state == JobState::PRE_SCRIPT_SUCCESS ? 0 : -1));
        break;
    case JobState::SUBMIT:
        append_submit_pair(events, job, ctx, "submit", 0);
        break;
    case JobState::SUBMIT_FAILED:
        append_submit_pair(events, job, ctx, "submit", -1);
        break;
    case JobState::GRID_SUBMIT:
        append_submit_pair(events, job, ctx, "grid.submit", 0);
        break;
    case JobState::GRID_SUBMIT_FAILED:
        append_submit_pair(events, job, ctx, "grid.submit", -1);
        break;
    case JobState::GLOBUS_SUBMIT:
        append_submit_pair(events, job, ctx, "globus.submit", 0);
        break;
    case JobState::GLOBUS_SUBMIT_FAILED:
        append_submit_pair(events, job, ctx, "globus.submit", -1);
        break;
    case JobState::EXECUTE:
        events.push_back(make_main_start(job, ctx));
        break;
    case JobState::REMOTE_ERROR:
        events.push_back(make_job_event(job, ctx, "remote_error"));
        break;
    case JobState::IMAGE_SIZE:
        events.push_back(make_job_event(job, ctx, "image.info"));
        break;
    case JobState::JOB_TERMINATED:
        events.push_back(make_job_event(job, ctx, "main.term", 0));
        break;
    case JobState::JOB_EVICTED:
        events.push_back(make_job_event(job, ctx, "main.term", -1));
        break;
    case JobState::JOB_HELD:
        events.push_back(make_job_event(job, ctx, "held.start"));
        break;
    case JobState::JOB_RELEASED:
        events.push_back(make_job_event(job, ctx, "held.end", 0));
        break;
    case JobState::JOB_SUCCESS:
    case JobState::JOB_FAILURE:
        append_main_job_end(events, job, info, output, ctx);
        events.push_back(make_main_end(job, ctx, state == JobState::JOB_SUCCESS ? 0 : -1));
        break;
    case JobState::POST_SCRIPT_STARTED:
        events.push_back(make_job_event(job, ctx, "post.start"));
        break;
    case JobState::POST_SCRIPT_TERMINATED:
        events.push_back(make_job_event(job, ctx, "post.term"));
        break;
    case JobState::POST_SCRIPT_SUCCESS:
    case JobState::POST_SCRIPT_FAILURE: {
        append_script_invocation(events, job, info, ctx, ScriptSide::Post);
        Event post_end = make_job_event(
                job, ctx, "post.end", state == JobState::POST_SCRIPT_SUCCESS ? 0 : -1);
        post_end.set_if("exitcode", job.post_script().exitcode);
        events.push_back(std::move(post_end));
        break;
    }
    case JobState::DAGMAN_SUBMIT:
        break;
    }
    return events;
}

Event project_workflow_plan(
        const WorkflowProperties &properties,
        const std::optional<std::string> &parent_wf_uuid,
        const std::optional<std::string> &root_wf_uuid) {
    Event event{"wf.plan"};
    event.set("xwf.id", properties.wf_uuid)
            .set_if("dax.label", properties.dax_label)
            .set_if("dax.version", properties.dax_version)
            .set_if("dax.index", properties.dax_index)
            .set_if("dax.file", properties.dax_file)
            .set("dag.file.name", properties.dag_file)
            .set("ts", properties.timestamp)
            .set_if("submit.hostname", properties.submit_hostname)
            .set_if("submit.dir", properties.submit_dir);
    if (properties.planner_arguments.has_value()) {
        std::string_view argv{*properties.planner_arguments};
        const auto first = argv.find_first_not_of(PLANNER_ARGV_STRIP);
        argv = first == std::string_view::npos ? std::string_view{} : argv.substr(first);
        const auto last = argv.find_last_not_of(PLANNER_ARGV_STRIP);
        argv = last == std::string_view::npos ? std::string_view{} : argv.substr(0, last + 1);
        event.set("argv", std::string{argv});
    }
    event.set_if("user", properties.user);
    if (properties.grid_dn.has_value() && *properties.grid_dn != "null") {
        event.set("grid_dn", *properties.grid_dn);
    }
    event.set_if("planner.version", properties.planner_version)
            .set_if("parent.xwf.id", parent_wf_uuid)
            .set_if("root.xwf.id", root_wf_uuid);
    return event;
}

Event project_workflow_state(
        const std::string &wf_uuid,
        const std::int64_t timestamp,
        const std::uint32_t restart_count,
        const std::optional<int> exit_code,
        const bool is_end) {
    Event event{is_end ? "xwf.end" : "xwf.start"};
    event.set("xwf.id", wf_uuid)
            .set("ts", timestamp)
            .set("restart_count", static_cast<std::int64_t>(restart_count) - 1);
    if (is_end) {
        const int status = exit_code.value_or(0);
        event.set("status", status);
        if (status != 0) {
            event.set("level", std::string{ERROR_LEVEL});
        }
    }
    return event;
}

Event project_subworkflow_map(
        const std::string &parent_wf_uuid,
        const std::string &child_wf_uuid,
        const std::string &parent_job_name,
        const std::uint64_t parent_job_seq,
        const std::int64_t timestamp) {
    Event event{"xwf.map.subwf_job"};
    event.set("xwf.id", parent_wf_uuid)
            .set("ts", timestamp)
            .set("subwf.id", child_wf_uuid)
            .set("job.id", parent_job_name)
            .set("job_inst.id", parent_job_seq);
    return event;
}

} // namespace wfmon::monitor
