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


// Logging components for the workflow monitor
// Enables component-based logging with WFMON_LOGC_* macros

#ifndef WFMON_MONITOR_MONITOR_LOG_HPP
#define WFMON_MONITOR_MONITOR_LOG_HPP

#include "log/components.hpp"

namespace wfmon::monitor {

/**
 * Monitor library logging components
 *
 * Components:
 * - Workflow: orchestrator lifecycle and signal dispatch
 * - JobState: per-instance transitions, regressions and late ids
 * - StaticInfo: DAG file and submit file parsing
 * - Properties: braindump parsing
 * - Persistence: checkpoint, recovery marker and sentinel files
 * - ReplayLog: job state log writes and rotation
 * - Projection: event derivation and output truncation
 * - Sink: event sink delivery
 * - Resolver: sub-workflow log discovery
 * - Extractor: captured output and task record extraction
 */
DECLARE_LOG_COMPONENT(
        MonitorLog,
        Workflow,
        JobState,
        StaticInfo,
        Properties,
        Persistence,
        ReplayLog,
        Projection,
        Sink,
        Resolver,
        Extractor);

/**
 * Replay tool logging components
 */
DECLARE_LOG_COMPONENT(ReplayApp, App, Input, Stats);

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_MONITOR_LOG_HPP
