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


#include <charconv>     // for from_chars
#include <cstddef>      // for size_t
#include <cstdint>      // for int64_t
#include <format>       // for format
#include <optional>     // for optional, nullopt
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for errc
#include <utility>      // for move

#include <tl/expected.hpp> // for expected, unexpected

#include "monitor/bp_format.hpp"
#include "monitor/event.hpp"
#include "monitor/timestamp.hpp"

namespace wfmon::monitor {

namespace {

constexpr std::string_view TS_KEY = "ts";
constexpr std::string_view EVENT_KEY = "event";

bool needs_quoting(std::string_view value) noexcept {
    return value.empty() || value.find_first_of(" \t\r\n\"=\\") != std::string_view::npos;
}

void append_value(std::string &out, std::string_view value) {
    if (!needs_quoting(value)) {
        out.append(value);
        return;
    }
    out.push_back('"');
    for (const char c : value) {
        switch (c) {
        case '"':
        case '\\':
            out.push_back('\\');
            out.push_back(c);
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        default:
            out.push_back(c);
        }
    }
    out.push_back('"');
}

void append_pair(std::string &out, std::string_view key, std::string_view value) {
    if (!out.empty()) {
        out.push_back(' ');
    }
    out.append(key);
    out.push_back('=');
    append_value(out, value);
}

std::optional<std::int64_t> as_epoch(std::string_view text) noexcept {
    std::int64_t value{};
    const auto *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

/**
 * Read a quoted value starting after the opening quote
 */
tl::expected<std::string, std::string> read_quoted(std::string_view line, std::size_t &pos) {
    std::string value;
    while (pos < line.size()) {
        const char c = line[pos++];
        if (c == '"') {
            return value;
        }
        if (c == '\\' && pos < line.size()) {
            const char escaped = line[pos++];
            switch (escaped) {
            case 'n':
                value.push_back('\n');
                break;
            case 'r':
                value.push_back('\r');
                break;
            default:
                value.push_back(escaped);
            }
            continue;
        }
        value.push_back(c);
    }
    return tl::unexpected(std::string{"unterminated quoted value"});
}

} // anonymous namespace

std::string format_bp_line(const Event &event) {
    std::string out;
    if (const auto ts = event.get(std::string{TS_KEY}); ts.has_value()) {
        const auto epoch = as_epoch(*ts);
        append_pair(out, TS_KEY, epoch.has_value() ? format_iso_timestamp(*epoch, true) : *ts);
    }
    append_pair(out, EVENT_KEY, event.name);
    for (const auto &[key, value] : event.fields) {
        if (key != TS_KEY) {
            append_pair(out, key, value);
        }
    }
    return out;
}

tl::expected<std::optional<Event>, std::string> parse_bp_line(std::string_view line) {
    Event event;
    bool has_event = false;
    bool has_pair = false;
    std::size_t pos = 0;

    while (pos < line.size()) {
        pos = line.find_first_not_of(" \t\r\n", pos);
        if (pos == std::string_view::npos) {
            break;
        }
        if (!has_pair && line[pos] == '#') {
            return std::optional<Event>{};
        }
        const auto equals = line.find('=', pos);
        if (equals == std::string_view::npos) {
            return tl::unexpected(std::format("missing '=' after '{}'", line.substr(pos)));
        }
        std::string key{line.substr(pos, equals - pos)};
        if (key.empty() || key.find_first_of(" \t") != std::string::npos) {
            return tl::unexpected(std::format("malformed key near '{}'", line.substr(pos)));
        }
        pos = equals + 1;

        std::string value;
        if (pos < line.size() && line[pos] == '"') {
            ++pos;
            auto quoted = read_quoted(line, pos);
            if (!quoted) {
                return tl::unexpected(std::move(quoted.error()));
            }
            value = std::move(*quoted);
        } else {
            auto end = line.find_first_of(" \t\r\n", pos);
            if (end == std::string_view::npos) {
                end = line.size();
            }
            value = std::string{line.substr(pos, end - pos)};
            pos = end;
        }

        has_pair = true;
        if (key == EVENT_KEY) {
            event.name = std::move(value);
            has_event = true;
        } else if (key == TS_KEY) {
            const auto epoch = parse_iso_timestamp(value);
            event.set(key, epoch.has_value() ? std::to_string(*epoch) : std::move(value));
        } else {
            event.set(key, std::move(value));
        }
    }

    if (!has_pair) {
        return std::optional<Event>{};
    }
    if (!has_event) {
        return tl::unexpected(std::string{"no event name"});
    }
    return std::optional<Event>{std::move(event)};
}

} // namespace wfmon::monitor
