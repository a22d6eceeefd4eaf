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

#include <tierone/xtract/content.hpp>
#include <tierone/xtract/error.hpp>
#include <tierone/xtract/extractor.hpp>
#include <tierone/xtract/options.hpp>
#include <tierone/xtract/policy.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>

namespace tierone::xtract {

enum class placement_strategy : uint8_t {
    flat,       // merge everything into the current directory
    overwrite,  // replace whatever holds the basename
    match,      // promote the single entry
    empty,      // nothing to place
    bomb        // wrap everything in a new directory
};

[[nodiscard]] std::string_view to_string(placement_strategy strategy) noexcept;

// First strategy in priority order that accepts the extraction
[[nodiscard]] placement_strategy select_strategy(content_type type, const options& opts,
                                                 bool one_entry_ok_for_match) noexcept;

enum class name_kind : uint8_t {
    directory,
    file
};

// Claim a free name: the wanted name, then name.1 through name.9, then a
// fresh unique name.N...N. The claimed name exists on return, as an empty
// directory or file.
[[nodiscard]] std::expected<std::filesystem::path, error> reserve_name(const std::filesystem::path& wanted,
                                                                       name_kind kind);

// Give the owner read/write access to everything extracted, and search
// access to directories
[[nodiscard]] std::expected<void, error> repair_permissions(const std::filesystem::path& root);

// Move a finished extraction into the current directory. Returns the
// target, "." for flat placement and an empty path when nothing was placed.
[[nodiscard]] std::expected<std::filesystem::path, error> place(placement_strategy strategy,
                                                                extractor& ex,
                                                                one_entry_choice choice);

} // namespace tierone::xtract
