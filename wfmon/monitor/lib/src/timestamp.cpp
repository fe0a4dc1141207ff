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


#include <cctype>       // for isdigit
#include <charconv>     // for from_chars
#include <chrono>       // for system_clock
#include <cstdint>      // for int64_t
#include <ctime>        // for tm, mktime, timegm, localtime_r, gmtime_r, strftime
#include <optional>     // for optional, nullopt
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for errc

#include "monitor/timestamp.hpp"

namespace wfmon::monitor {

namespace {

/**
 * Cursor over timestamp text that consumes fixed-width fields
 */
class Scanner final {
public:
    explicit Scanner(std::string_view text) : text_{text} {}

    std::optional<int> digits(const std::size_t count) {
        if (text_.size() < count) {
            return std::nullopt;
        }
        int value{};
        const auto *first = text_.data();
        const auto *last = first + count;
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        text_.remove_prefix(count);
        return value;
    }

    bool accept(const char c) {
        if (!text_.empty() && text_.front() == c) {
            text_.remove_prefix(1);
            return true;
        }
        return false;
    }

    void skip_digits() {
        while (!text_.empty() && std::isdigit(static_cast<unsigned char>(text_.front())) != 0) {
            text_.remove_prefix(1);
        }
    }

    [[nodiscard]] bool done() const noexcept { return text_.empty(); }
    [[nodiscard]] char peek() const noexcept { return text_.empty() ? '\0' : text_.front(); }

private:
    std::string_view text_;
};

} // anonymous namespace

std::optional<std::int64_t> parse_iso_timestamp(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '"')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '"' || text.back() == '\n')) {
        text.remove_suffix(1);
    }

    Scanner scan{text};
    std::tm tm{};

    const auto year = scan.digits(4);
    if (!year) {
        return std::nullopt;
    }
    const bool extended = scan.accept('-');
    const auto month = scan.digits(2);
    if (extended && !scan.accept('-')) {
        return std::nullopt;
    }
    const auto day = scan.digits(2);
    if (!month || !day || !(scan.accept('T') || scan.accept(' '))) {
        return std::nullopt;
    }
    const auto hour = scan.digits(2);
    if (extended && !scan.accept(':')) {
        return std::nullopt;
    }
    const auto minute = scan.digits(2);
    if (extended && !scan.accept(':')) {
        return std::nullopt;
    }
    const auto second = scan.digits(2);
    if (!hour || !minute || !second) {
        return std::nullopt;
    }
    if (scan.accept('.') || scan.accept(',')) {
        scan.skip_digits();
    }

    tm.tm_year = *year - 1900;
    tm.tm_mon = *month - 1;
    tm.tm_mday = *day;
    tm.tm_hour = *hour;
    tm.tm_min = *minute;
    tm.tm_sec = *second;

    if (scan.done()) {
        tm.tm_isdst = -1;
        const std::time_t local = std::mktime(&tm);
        if (local == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(local);
    }

    const std::int64_t utc = static_cast<std::int64_t>(::timegm(&tm));
    if (scan.accept('Z')) {
        return scan.done() ? std::optional<std::int64_t>{utc} : std::nullopt;
    }

    const char sign = scan.peek();
    if (sign != '+' && sign != '-') {
        return std::nullopt;
    }
    scan.accept(sign);
    const auto offset_hours = scan.digits(2);
    scan.accept(':');
    const auto offset_minutes = scan.done() ? std::optional<int>{0} : scan.digits(2);
    if (!offset_hours || !offset_minutes || !scan.done()) {
        return std::nullopt;
    }
    const std::int64_t offset = (*offset_hours * 3600LL) + (*offset_minutes * 60LL);
    return sign == '+' ? utc - offset : utc + offset;
}

std::string format_iso_timestamp(const std::int64_t epoch, const bool utc) {
    const auto seconds = static_cast<std::time_t>(epoch);
    std::tm tm{};
    if (utc) {
        ::gmtime_r(&seconds, &tm);
    } else {
        ::localtime_r(&seconds, &tm);
    }

    std::string buffer(64, '\0');
    const char *format = utc ? "%Y-%m-%dT%H:%M:%SZ" : "%Y-%m-%dT%H:%M:%S%z";
    const std::size_t written = std::strftime(buffer.data(), buffer.size(), format, &tm);
    buffer.resize(written);
    return buffer;
}

std::int64_t now_epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
}

} // namespace wfmon::monitor
