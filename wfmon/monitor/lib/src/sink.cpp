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


#include <exception>    // for exception
#include <filesystem>   // for path
#include <fstream>      // for ofstream
#include <ios>          // for ios
#include <memory>       // for unique_ptr, shared_ptr
#include <string>       // for string
#include <system_error> // for error_code
#include <utility>      // for move

#include <tl/expected.hpp> // for expected, unexpected

#include "log/log_macros.hpp"
#include "monitor/bp_format.hpp"
#include "monitor/monitor_errors.hpp"
#include "monitor/monitor_log.hpp"
#include "monitor/sink.hpp"

namespace wfmon::monitor {

GuardedSink::GuardedSink(std::shared_ptr<EventSink> sink, std::string label)
        : sink_{std::move(sink)}, label_{std::move(label)} {}

bool GuardedSink::send(const Event &event) {
    if (!enabled()) {
        return false;
    }
    try {
        if (const auto ec = sink_->send(event); ec) {
            disable(ec.message());
            return false;
        }
    } catch (const std::exception &e) {
        disable(e.what());
        return false;
    }
    ++sent_;
    return true;
}

void GuardedSink::flush() {
    if (!enabled()) {
        return;
    }
    try {
        if (const auto ec = sink_->flush(); ec) {
            disable(ec.message());
        }
    } catch (const std::exception &e) {
        disable(e.what());
    }
}

void GuardedSink::disable(const std::string &reason) {
    failed_ = true;
    WFMON_LOGC_ERROR(
            MonitorLog::Sink,
            "Error sending event to {}: {}; disabling it for the rest of the run",
            label_,
            reason);
}

BpFileSink::BpFileSink(std::filesystem::path file, std::ofstream stream)
        : file_{std::move(file)}, stream_{std::move(stream)} {}

tl::expected<std::unique_ptr<BpFileSink>, std::error_code>
BpFileSink::open(const std::filesystem::path &file, const bool append) {
    std::ofstream stream(file, append ? std::ios::app : std::ios::trunc);
    if (!stream.is_open()) {
        WFMON_LOGC_ERROR(MonitorLog::Sink, "Cannot open event file {}", file.string());
        return tl::unexpected(make_error_code(MonitorErrc::FileOpenFailed));
    }
    return std::unique_ptr<BpFileSink>(new BpFileSink(file, std::move(stream)));
}

std::error_code BpFileSink::send(const Event &event) {
    stream_ << format_bp_line(event) << '\n';
    if (!stream_) {
        return make_error_code(MonitorErrc::FileWriteFailed);
    }
    return {};
}

std::error_code BpFileSink::flush() {
    stream_.flush();
    if (!stream_) {
        return make_error_code(MonitorErrc::FileWriteFailed);
    }
    return {};
}

} // namespace wfmon::monitor
