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
 * @file logger_tests.cpp
 * @brief Unit tests for the wfmon logger wrapper
 */

#include <filesystem>    // for exists
#include <stdexcept>     // for invalid_argument
#include <string>        // for string
#include <unordered_map> // for unordered_map

#include <gtest/gtest.h>

#include "log/components.hpp"
#include "log/log_macros.hpp"
#include "log/logger.hpp"
#include "scratch_dir.hpp"

namespace {

namespace wl = ::wfmon::log;
namespace wlt = ::wfmon::log::tests;

DECLARE_LOG_COMPONENT(TestComponent, Reader, Writer, Index);

/**
 * Restores a console logger after each test so later suites are unaffected
 */
class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        wl::Logger::configure(wl::LoggerConfig::console(wl::LogLevel::Info));
        wl::register_component<TestComponent>(wl::LogLevel::Info);
    }
};

// Test: The default console logger accepts messages without configuration
TEST_F(LoggerTest, DefaultConsoleLogging) {
    WFMON_LOG_INFO("Info message: {}", 42);
    WFMON_LOG_WARN("Warning message");
    EXPECT_EQ(wl::Logger::sink_type(), wl::SinkType::Console);
    EXPECT_TRUE(wl::Logger::log_file().empty());
}

// Test: A file logger writes all messages at or above its level
TEST_F(LoggerTest, FileLoggingWritesMessages) {
    const wlt::ScratchDir scratch{"file_logging"};
    const std::string log_file = scratch.path("monitor.log");

    wl::Logger::configure(wl::LoggerConfig::file(log_file, wl::LogLevel::Debug));
    WFMON_LOG_DEBUG("Debug file message: {}", 123);
    WFMON_LOG_ERROR("Error file message: {}", "disk");
    wl::Logger::flush();

    const std::string actual = wl::Logger::log_file();
    EXPECT_TRUE(std::filesystem::exists(actual));
    EXPECT_TRUE(wlt::file_contains(actual, "Debug file message: 123"));
    EXPECT_TRUE(wlt::file_contains(actual, "Error file message: disk"));
}

// Test: Messages below the configured level are filtered out
TEST_F(LoggerTest, LevelFiltering) {
    const wlt::ScratchDir scratch{"level_filtering"};
    const std::string log_file = scratch.path("monitor.log");

    wl::Logger::configure(wl::LoggerConfig::file(log_file, wl::LogLevel::Warn));
    EXPECT_EQ(wl::Logger::level(), wl::LogLevel::Warn);
    WFMON_LOG_INFO("should not appear");
    WFMON_LOG_WARN("should appear");
    wl::Logger::flush();

    const std::string actual = wl::Logger::log_file();
    EXPECT_FALSE(wlt::file_contains(actual, "should not appear"));
    EXPECT_TRUE(wlt::file_contains(actual, "should appear"));
}

// Test: Component messages carry the component name and honour component levels
TEST_F(LoggerTest, ComponentLevels) {
    const wlt::ScratchDir scratch{"component_levels"};
    const std::string log_file = scratch.path("monitor.log");

    wl::Logger::configure(wl::LoggerConfig::file(log_file, wl::LogLevel::Debug));
    wl::register_component<TestComponent>(
            {{TestComponent::Reader, wl::LogLevel::Debug},
             {TestComponent::Writer, wl::LogLevel::Error}});

    WFMON_LOGC_DEBUG(TestComponent::Reader, "reader detail {}", 7);
    WFMON_LOGC_WARN(TestComponent::Writer, "writer warning hidden");
    WFMON_LOGC_ERROR(TestComponent::Writer, "writer error shown");
    wl::Logger::flush();

    const std::string actual = wl::Logger::log_file();
    EXPECT_TRUE(wlt::file_contains(actual, "[Reader] reader detail 7"));
    EXPECT_FALSE(wlt::file_contains(actual, "writer warning hidden"));
    EXPECT_TRUE(wlt::file_contains(actual, "[Writer] writer error shown"));
    EXPECT_EQ(wl::get_component_level(TestComponent::Writer), wl::LogLevel::Error);
    EXPECT_EQ(wl::get_component_level(TestComponent::Index), wl::LogLevel::Info);
}

// Test: Rotating and JSON sinks report the file they write to
TEST_F(LoggerTest, RotatingAndJsonSinks) {
    const wlt::ScratchDir scratch{"rotating_json"};
    const std::string rotating_file = scratch.path("rotating.log");
    const std::string json_file = scratch.path("events.json");

    wl::Logger::configure(
            wl::LoggerConfig::rotating_file(rotating_file).with_rotation_max_bytes(1024 * 1024));
    EXPECT_EQ(wl::Logger::sink_type(), wl::SinkType::RotatingFile);
    WFMON_LOG_INFO("rotating message");
    wl::Logger::flush();
    EXPECT_TRUE(wlt::file_contains(wl::Logger::log_file(), "rotating message"));

    wl::Logger::configure(wl::LoggerConfig::json_file(json_file));
    EXPECT_EQ(wl::Logger::sink_type(), wl::SinkType::JsonFile);
    WFMON_LOG_INFO("json message {}", 5);
    wl::Logger::flush();
    EXPECT_TRUE(wlt::file_contains(wl::Logger::log_file(), "json message"));
}

// Test: File sinks without a path are rejected
TEST_F(LoggerTest, MissingLogFileThrows) {
    EXPECT_THROW(wl::Logger::configure(wl::LoggerConfig::file("")), std::invalid_argument);
    EXPECT_THROW(wl::Logger::configure(wl::LoggerConfig::json_file("")), std::invalid_argument);
}

// Test: Fluent setters update the matching fields
TEST_F(LoggerTest, FluentConfiguration) {
    const auto config = wl::LoggerConfig::console(wl::LogLevel::Debug, true)
                                .with_colors(false)
                                .with_file_line()
                                .with_timestamps(false)
                                .with_log_level(false)
                                .with_append(false);
    EXPECT_EQ(config.min_level, wl::LogLevel::Debug);
    EXPECT_FALSE(config.enable_colors);
    EXPECT_TRUE(config.enable_file_line);
    EXPECT_FALSE(config.enable_timestamps);
    EXPECT_FALSE(config.enable_log_level);
    EXPECT_FALSE(config.append);
}

// Test: Runtime level changes are reflected by the logger
TEST_F(LoggerTest, RuntimeLevelChange) {
    wl::Logger::set_level(wl::LogLevel::Error);
    EXPECT_EQ(wl::Logger::level(), wl::LogLevel::Error);
    wl::Logger::set_level(wl::LogLevel::Trace);
    EXPECT_EQ(wl::Logger::level(), wl::LogLevel::Trace);
}

} // namespace
