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


#include <gtest/gtest.h> // for Environment, AddGlobalTestEnvironment

#include "log/components.hpp"      // for LogLevel, register_component
#include "log/log_macros.hpp"      // for WFMON_LOG_INFO
#include "log/logger.hpp"          // for Logger
#include "monitor/monitor_log.hpp" // for MonitorLog, ReplayApp

namespace {

namespace wl = ::wfmon::log;

/**
 * Runs every monitor log statement at Debug so formatting errors in
 * rarely taken paths surface in the unit tests
 */
class VerboseMonitorLogging final : public ::testing::Environment {
public:
    void SetUp() override {
        wl::Logger::set_level(wl::LogLevel::Debug);
        wl::register_component<wfmon::monitor::MonitorLog>(wl::LogLevel::Debug);
        wl::register_component<wfmon::monitor::ReplayApp>(wl::LogLevel::Debug);
        WFMON_LOG_INFO("wfmon monitor tests starting");
    }

    void TearDown() override {
        WFMON_LOG_INFO("wfmon monitor tests done");
        wl::Logger::flush();
    }
};

// gtest takes ownership of the environment
// NOLINTNEXTLINE(cert-err58-cpp,cppcoreguidelines-owning-memory)
const ::testing::Environment *const verbose_logging =
        ::testing::AddGlobalTestEnvironment(new VerboseMonitorLogging);

} // namespace
