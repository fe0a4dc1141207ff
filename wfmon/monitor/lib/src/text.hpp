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


// Internal string helpers shared by the file parsers

#ifndef WFMON_MONITOR_SRC_TEXT_HPP
#define WFMON_MONITOR_SRC_TEXT_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace wfmon::monitor::detail {

inline constexpr std::string_view WHITESPACE = " \t\r\n";

[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

[[nodiscard]] inline std::string to_lower(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

[[nodiscard]] inline bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

/**
 * Split on runs of whitespace
 */
[[nodiscard]] inline std::vector<std::string_view> split_whitespace(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto start = text.find_first_not_of(WHITESPACE, pos);
        if (start == std::string_view::npos) {
            break;
        }
        auto end = text.find_first_of(WHITESPACE, start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        tokens.push_back(text.substr(start, end - start));
        pos = end;
    }
    return tokens;
}

/**
 * Remainder of a line after skipping a number of whitespace separated tokens
 */
[[nodiscard]] inline std::string_view
remainder_after(std::string_view text, std::size_t tokens) noexcept {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < tokens; ++i) {
        pos = text.find_first_not_of(WHITESPACE, pos);
        if (pos == std::string_view::npos) {
            return {};
        }
        pos = text.find_first_of(WHITESPACE, pos);
        if (pos == std::string_view::npos) {
            return {};
        }
    }
    return trim(text.substr(pos));
}

[[nodiscard]] inline std::string_view unquote(std::string_view text) noexcept {
    text = trim(text);
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        text = text.substr(1, text.size() - 2);
    }
    return text;
}

} // namespace wfmon::monitor::detail

#endif // WFMON_MONITOR_SRC_TEXT_HPP
