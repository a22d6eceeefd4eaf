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

#include <tierone/xtract/content.hpp>
#include <tierone/xtract/format.hpp>
#include <algorithm>

namespace fs = std::filesystem;

namespace tierone::xtract {

std::string_view to_string(const content_type type) noexcept {
    switch (type) {
        case content_type::empty:               return "empty";
        case content_type::matching_directory:  return "matching directory";
        case content_type::one_entry_known:     return "file";
        case content_type::one_entry_file:      return "file";
        case content_type::one_entry_directory: return "directory";
        case content_type::bomb:                return "bomb";
    }
    return "unknown";
}

classification classify_contents(const std::span<const std::string> contents, const std::string_view basename,
                                 const fs::path &root) {
    classification result;
    if (contents.empty()) {
        result.type = content_type::empty;
        return result;
    }
    if (contents.size() > 1) {
        result.type = content_type::bomb;
        return result;
    }

    const std::string& name = contents.front();
    std::error_code ec;
    const bool is_directory = fs::is_directory(root / name, ec);

    result.content_name = name;
    if (is_directory) {
        result.content_name += '/';
        result.included_root = result.content_name;
    }

    if (name == basename) {
        result.type = content_type::matching_directory;
    } else {
        result.type = is_directory ? content_type::one_entry_directory : content_type::one_entry_file;
    }
    return result;
}

auto list_directory(const fs::path &directory) -> std::expected<std::vector<std::string>, error> {
    std::error_code ec;
    std::vector<std::string> names;
    for (fs::directory_iterator it{directory, ec}, end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return std::unexpected(io_error("cannot list " + directory.string(), ec));
    }
    std::ranges::sort(names);
    return names;
}

auto scan_included_archives(const fs::path &root) -> std::expected<archive_scan, error> {
    archive_scan scan;
    std::error_code ec;
    // Unreadable directories are skipped; placement repairs their permissions later
    constexpr auto walk = fs::directory_options::skip_permission_denied;
    for (fs::recursive_directory_iterator it{root, walk, ec}, end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            continue;
        }
        ++scan.file_count;
        if (looks_like_archive(it->path().filename().string())) {
            scan.archives.push_back(it->path().lexically_relative(root));
        }
    }
    if (ec) {
        return std::unexpected(io_error("cannot scan " + root.string(), ec));
    }
    std::ranges::sort(scan.archives);
    return scan;
}

} // namespace tierone::xtract
