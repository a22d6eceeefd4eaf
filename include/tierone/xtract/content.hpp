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

#include <tierone/xtract/error.hpp>
#include <tierone/xtract/workspace.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tierone::xtract {

// Shape of what an extraction produced
enum class content_type : uint8_t {
    empty,
    matching_directory,     // one entry named like the archive
    one_entry_known,        // single decompressed stream, name already decided
    one_entry_file,
    one_entry_directory,
    bomb                    // several top-level entries
};

[[nodiscard]] std::string_view to_string(content_type type) noexcept;

// One entry whose name differs from the archive's
[[nodiscard]] constexpr bool is_one_entry_unknown(const content_type type) noexcept {
    return type == content_type::one_entry_file || type == content_type::one_entry_directory;
}

struct extraction_result {
    temporary_path target;                  // scratch directory or file
    std::optional<std::vector<std::string>> contents;  // top-level names; none for single streams
    content_type type = content_type::empty;
    std::string content_name;               // directories end with '/'
    size_t file_count = 0;
    std::vector<std::filesystem::path> included_archives;  // relative to included_root
    std::filesystem::path included_root = "./";
    std::vector<int> exit_codes;
    std::string stderr_text;
    std::string stdout_text;
    bool password_prompted = false;
};

struct classification {
    content_type type = content_type::empty;
    std::string content_name;
    std::filesystem::path included_root = "./";
};

// Classify the top-level entries found under root
[[nodiscard]] classification classify_contents(std::span<const std::string> contents,
                                               std::string_view basename,
                                               const std::filesystem::path& root);

// Top-level entry names of a directory, sorted
[[nodiscard]] std::expected<std::vector<std::string>, error> list_directory(const std::filesystem::path& directory);

struct archive_scan {
    size_t file_count = 0;
    std::vector<std::filesystem::path> archives;
};

// Count the files below root and collect those that look like archives,
// as paths relative to root
[[nodiscard]] std::expected<archive_scan, error> scan_included_archives(const std::filesystem::path& root);

} // namespace tierone::xtract
