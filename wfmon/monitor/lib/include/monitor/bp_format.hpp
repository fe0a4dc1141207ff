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
 * @file bp_format.hpp
 * @brief NetLogger BP line encoding of events
 *
 * A BP line is a sequence of key=value pairs separated by spaces. The
 * first pair is the ISO-8601 "ts", the second the "event" name. Values
 * containing spaces, quotes or '=' are double quoted with backslash
 * escapes.
 */

#ifndef WFMON_MONITOR_BP_FORMAT_HPP
#define WFMON_MONITOR_BP_FORMAT_HPP

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "monitor/event.hpp"

namespace wfmon::monitor {

/**
 * Encode an event as one BP line, without the trailing newline
 *
 * An integral "ts" field is written as a UTC ISO-8601 timestamp;
 * remaining fields follow in key order.
 *
 * @param[in] event Event to encode
 * @return Encoded line
 */
[[nodiscard]] std::string format_bp_line(const Event &event);

/**
 * Decode one BP line into an event
 *
 * The "event" pair becomes the event name. An ISO-8601 "ts" is converted
 * to epoch seconds; other timestamps are kept as written.
 *
 * @param[in] line Line to decode
 * @return Decoded event, nullopt for blank and comment lines, or an
 *         error message for malformed lines and lines without "event"
 */
[[nodiscard]] tl::expected<std::optional<Event>, std::string> parse_bp_line(std::string_view line);

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_BP_FORMAT_HPP
