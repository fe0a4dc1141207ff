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
 * @file timestamp.hpp
 * @brief ISO-8601 conversions used by planner files and output files
 */

#ifndef WFMON_MONITOR_TIMESTAMP_HPP
#define WFMON_MONITOR_TIMESTAMP_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wfmon::monitor {

/**
 * Convert an ISO-8601 timestamp to epoch seconds
 *
 * Accepts the extended form (2024-01-31T12:00:00.123+02:00) and the
 * basic form written by the planner (20240131T120000+0200). A missing
 * zone designator means local time. Fractional seconds are dropped.
 *
 * @param[in] text Timestamp text
 * @return Epoch seconds, or nullopt if the text is not a timestamp
 */
[[nodiscard]] std::optional<std::int64_t> parse_iso_timestamp(std::string_view text);

/**
 * Format epoch seconds as an extended ISO-8601 timestamp
 *
 * @param[in] epoch Epoch seconds
 * @param[in] utc Format in UTC with a "Z" designator instead of local time
 * @return Formatted timestamp
 */
[[nodiscard]] std::string format_iso_timestamp(std::int64_t epoch, bool utc = false);

/**
 * Current wall-clock time in epoch seconds
 */
[[nodiscard]] std::int64_t now_epoch_seconds();

} // namespace wfmon::monitor

#endif // WFMON_MONITOR_TIMESTAMP_HPP
