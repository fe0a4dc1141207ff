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
 * @file sink.hpp
 * @brief Event sink interface, fail-open guard and BP file sink
 */

#ifndef WFMON_MONITOR_SINK_HPP
#define WFMON_MONITOR_SINK_HPP

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

#include <tl/expected.hpp>

#include "monitor/event.hpp"

namespace wfmon::monitor {

/**
 * Destination of projected events
 *
 * Implementations report failure through the returned error code or by
 * throwing; either way the guard disables them for the rest of the run.
 */
class EventSink {
public:
    EventSink() = default;
    virtual ~EventSink() = default;

    EventSink(const EventSink &) = delete;
    EventSink &operator=(const EventSink &) = delete;
    EventSink(EventSink &&) = delete;
    EventSink &operator=(EventSink &&) = delete;

    /**
     * Deliver one event
     *
     * @param[in] event Event to deliver
     * @return Empty error code on success
     */
    [[nodiscard]] virtual std::error_code send(const Event &event) = 0;

    /**
     * Push buffered events to the backing store
     */
    [[nodiscard]] virtual std::error_code flush() { return {}; }
};

/**
 * Fail-open wrapper around a sink
 *
 * The first failure is logged once at error level and disables the
 * sink; later sends are dropped silently. A guard without a sink is
 * permanently disabled.
 */
class GuardedSink final {
public:
    /**
     * @param[in] sink Wrapped sink, may be null
     * @param[in] label Name used in diagnostics
     */
    explicit GuardedSink(std::shared_ptr<EventSink> sink, std::string label = "sink");

    /**
     * Forward an event unless the sink is disabled
     *
     * @param[in] event Event to forward
     * @return true if the event was delivered
     */
    bool send(const Event &event);

    /**
     * Flush the wrapped sink, disabling it on failure
     */
    void flush();

    [[nodiscard]] bool enabled() const noexcept { return sink_ != nullptr && !failed_; }
    [[nodiscard]] std::size_t sent_count() const noexcept { return sent_; }

private:
    void disable(const std::string &reason);

    std::shared_ptr<EventSink> sink_;
    std::string label_;
    bool failed_{false};
    std::size_t sent_{0};
};

/**
 * Sink writing one BP line per event to a file
 */
class BpFileSink final : public EventSink {
public:
    /**
     * Open the output file
     *
     * @param[in] file File to write
     * @param[in] append Append to an existing file instead of truncating it
     * @return Sink, or FileOpenFailed
     */
    [[nodiscard]] static tl::expected<std::unique_ptr<BpFileSink>, std::error_code>
    open(const std::filesystem::path &file, bool append = false);

    [[nodiscard]] std::error_code send(const Event &event) override;
    [[nodiscard]] std::error_code flush() override;

    [[nodiscard]] const std::filesystem::path &file() const noexcept { return file_; }

private:
    BpFileSink(std::filesystem::path file, std::ofstream stream);

    std::filesystem::path file_;
    std::ofstream stream_;
};

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_SINK_HPP
