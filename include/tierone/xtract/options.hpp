/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <tierone/xtract/log.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace tierone::xtract {

struct options {
    bool batch = false;          // never prompt, take the default answers
    bool flat = false;           // extract everything into the current directory
    bool overwrite = false;      // replace existing targets
    bool metadata = false;       // extract .deb/.gem metadata instead of payload
    bool recursive = false;      // always extract included archives
    bool show_list = false;      // list members instead of extracting
    std::optional<std::string> password;
    std::optional<std::string> one_entry_default;  // prefix of inside/rename/here
    log::level log_level = log::level::warning;

    // How long a pipeline wait blocks before the stall/prompt checks run
    std::chrono::milliseconds poll_interval{1000};

    // Included archives must exceed 1/N of the extracted files before asking
    // whether to recurse
    std::size_t recursion_threshold = 10;
};

} // namespace tierone::xtract
