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
 * @file monitor_replay.cpp
 * @brief Replays a job state log through the workflow monitor
 *
 * Reads a job state log, feeds every transition to a Workflow for the
 * given run directory and writes the derived events to a BP file. The
 * replay log, checkpoint and sentinel files are maintained exactly as a
 * live monitor would, so a second run resumes where the first stopped.
 */

#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <gsl-lite/gsl-lite.hpp>
#include <quill/LogMacros.h>
#include <tl/expected.hpp>

#include "log/log_macros.hpp"
#include "log/logger.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/output_extractor.hpp"
#include "monitor/sink.hpp"
#include "monitor/subworkflow_resolver.hpp"
#include "monitor/workflow.hpp"
#include "monitor/workflow_registry.hpp"
#include "monitor_replay_utils.hpp"

int main(const int argc, const char **argv) {
    namespace wm = wfmon::monitor;

    try {
        const auto args = wm::samples::parse_arguments(argc, argv);
        if (!args.has_value()) {
            // Empty error string means --help or --version was shown (success)
            if (!args.error().empty()) {
                std::cerr << args.error() << '\n';
                return EXIT_FAILURE;
            }
            return EXIT_SUCCESS;
        }

        wm::samples::setup_logging(*args);

        const auto lines = wm::samples::read_input(args->input_file);
        if (!lines.has_value()) {
            return EXIT_FAILURE;
        }

        std::shared_ptr<wm::EventSink> sink{};
        if (!args->events_file.empty()) {
            auto file_sink = wm::BpFileSink::open(args->events_file, true);
            if (!file_sink.has_value()) {
                WFMON_LOGC_ERROR(
                        wm::ReplayApp::App,
                        "Cannot open events file {}: {}",
                        args->events_file.string(),
                        file_sink.error().message());
                return EXIT_FAILURE;
            }
            sink = std::move(*file_sink);
        }

        wm::WorkflowRegistry registry{};
        wm::SubworkflowResolver resolver{};
        wm::Workflow workflow{
                wm::samples::make_workflow_config(*args),
                sink,
                std::make_shared<wm::NullOutputExtractor>(),
                gsl_lite::not_null<wm::WorkflowRegistry *>(&registry),
                gsl_lite::not_null<wm::SubworkflowResolver *>(&resolver)};

        if (const auto ec = workflow.start(); ec) {
            WFMON_LOGC_ERROR(wm::ReplayApp::App, "Workflow failed to start: {}", ec.message());
            return EXIT_FAILURE;
        }

        const auto stats =
                wm::samples::replay_lines(workflow, *lines, args->checkpoint_interval);

        // Controller may not have finished yet; persist what was seen
        if (const auto ec = workflow.finish(); ec) {
            WFMON_LOGC_ERROR(wm::ReplayApp::App, "Workflow teardown failed: {}", ec.message());
            return EXIT_FAILURE;
        }
        wfmon::log::Logger::flush();
        return stats.has_value() ? EXIT_SUCCESS : EXIT_FAILURE;

    } catch (const std::exception &e) {
        std::cerr << std::format("Unhandled exception: {}\n", e.what());
        return EXIT_FAILURE;
    } catch (...) {
        std::cerr << "Unknown exception occurred\n";
        return EXIT_FAILURE;
    }
}
