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


#include <atomic>       // for atomic
#include <fstream>      // for ifstream
#include <iterator>     // for istreambuf_iterator
#include <stdexcept>    // for runtime_error
#include <system_error> // for error_code

#include <unistd.h> // for getpid

#include "scratch_dir.hpp"

namespace wfmon::log::tests {

namespace fs = std::filesystem;

ScratchDir::ScratchDir(const std::string_view tag) {
    static std::atomic<unsigned> serial{0};
    const std::string leaf = "wfmon_" + std::string{tag} + "." + std::to_string(::getpid()) +
                             "." + std::to_string(serial++);
    root_ = fs::temp_directory_path() / leaf;
    fs::remove_all(root_);
    if (!fs::create_directories(root_)) {
        throw std::runtime_error("cannot create scratch directory " + root_.string());
    }
}

ScratchDir::~ScratchDir() {
    std::error_code ignored;
    fs::remove_all(root_, ignored);
}

std::string ScratchDir::path(const std::string_view name) const { return (root_ / name).string(); }

std::string slurp(const std::string &file) {
    std::ifstream in(file, std::ios::binary);
    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

bool file_contains(const std::string &file, const std::string_view needle) {
    return slurp(file).find(needle) != std::string::npos;
}

} // namespace wfmon::log::tests
