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

#include <tierone/xtract/format.hpp>
#include <tierone/xtract/log.hpp>
#include <tierone/xtract/process.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <set>
#include <tuple>

namespace tierone::xtract {

namespace {

struct mime_entry {
    std::string_view suffix;
    archive_kind kind;
};

struct alias_entry {
    std::string_view suffix;
    std::string_view replacement;
};

struct encoding_entry {
    std::string_view suffix;
    encoding enc;
};

struct extension_entry {
    std::string_view suffix;
    archive_descriptor descriptor;
};

// Suffixes whose MIME type maps onto an archive kind
constexpr std::array mime_types{
    mime_entry{".tar", archive_kind::tar},
    mime_entry{".zip", archive_kind::zip},
    mime_entry{".jar", archive_kind::zip},
    mime_entry{".xpi", archive_kind::zip},
    mime_entry{".lzh", archive_kind::lzh},
    mime_entry{".lha", archive_kind::lzh},
    mime_entry{".rpm", archive_kind::rpm},
    mime_entry{".deb", archive_kind::deb},
    mime_entry{".cpio", archive_kind::cpio},
    mime_entry{".gem", archive_kind::gem},
    mime_entry{".7z", archive_kind::seven_zip},
    mime_entry{".rar", archive_kind::rar},
    mime_entry{".arj", archive_kind::arj},
    mime_entry{".msi", archive_kind::msi},
    mime_entry{".dmg", archive_kind::dmg},
};

constexpr std::array suffix_aliases{
    alias_entry{".tgz", ".tar.gz"},
    alias_entry{".taz", ".tar.gz"},
    alias_entry{".tz", ".tar.gz"},
    alias_entry{".tbz2", ".tar.bz2"},
    alias_entry{".txz", ".tar.xz"},
};

// Content encodings, matched case-sensitively (.Z is not .z)
constexpr std::array encodings{
    encoding_entry{".gz", encoding::gzip},
    encoding_entry{".Z", encoding::compress},
    encoding_entry{".bz2", encoding::bzip2},
    encoding_entry{".xz", encoding::xz},
    encoding_entry{".lzma", encoding::lzma},
    encoding_entry{".lz", encoding::lzip},
    encoding_entry{".lrz", encoding::lrzip},
    encoding_entry{".zst", encoding::zstd},
    encoding_entry{".zstd", encoding::zstd},
    encoding_entry{".br", encoding::brotli},
};

constexpr std::array extensions{
    extension_entry{"tar", {archive_kind::tar, encoding::none}},
    extension_entry{"zip", {archive_kind::zip, encoding::none}},
    extension_entry{"jar", {archive_kind::zip, encoding::none}},
    extension_entry{"epub", {archive_kind::zip, encoding::none}},
    extension_entry{"xpi", {archive_kind::zip, encoding::none}},
    extension_entry{"crx", {archive_kind::zip, encoding::none}},
    extension_entry{"lzh", {archive_kind::lzh, encoding::none}},
    extension_entry{"lha", {archive_kind::lzh, encoding::none}},
    extension_entry{"rpm", {archive_kind::rpm, encoding::none}},
    extension_entry{"deb", {archive_kind::deb, encoding::none}},
    extension_entry{"cpio", {archive_kind::cpio, encoding::none}},
    extension_entry{"gem", {archive_kind::gem, encoding::none}},
    extension_entry{"7z", {archive_kind::seven_zip, encoding::none}},
    extension_entry{"cab", {archive_kind::cab, encoding::none}},
    extension_entry{"rar", {archive_kind::rar, encoding::none}},
    extension_entry{"arj", {archive_kind::arj, encoding::none}},
    extension_entry{"cab", {archive_kind::shield, encoding::none}},
    extension_entry{"hdr", {archive_kind::shield, encoding::none}},
    extension_entry{"msi", {archive_kind::msi, encoding::none}},
    extension_entry{"dmg", {archive_kind::dmg, encoding::none}},
    extension_entry{"zst", {archive_kind::zst, encoding::none}},
    extension_entry{"zstd", {archive_kind::zst, encoding::none}},
    extension_entry{"br", {archive_kind::brotli, encoding::none}},
    extension_entry{"tar.bz2", {archive_kind::tar, encoding::bzip2}},
    extension_entry{"tbz2", {archive_kind::tar, encoding::bzip2}},
    extension_entry{"tb2", {archive_kind::tar, encoding::bzip2}},
    extension_entry{"tbz", {archive_kind::tar, encoding::bzip2}},
    extension_entry{"tar.gz", {archive_kind::tar, encoding::gzip}},
    extension_entry{"tgz", {archive_kind::tar, encoding::gzip}},
    extension_entry{"tar.lzma", {archive_kind::tar, encoding::lzma}},
    extension_entry{"tlz", {archive_kind::tar, encoding::lzma}},
    extension_entry{"tar.xz", {archive_kind::tar, encoding::xz}},
    extension_entry{"txz", {archive_kind::tar, encoding::xz}},
    extension_entry{"tar.lz", {archive_kind::tar, encoding::lzip}},
    extension_entry{"tar.Z", {archive_kind::tar, encoding::compress}},
    extension_entry{"taz", {archive_kind::tar, encoding::compress}},
    extension_entry{"tar.lrz", {archive_kind::tar, encoding::lrzip}},
    extension_entry{"tar.zst", {archive_kind::tar, encoding::zstd}},
    extension_entry{"Z", {archive_kind::compress, encoding::gzip}},
    extension_entry{"gz", {archive_kind::compress, encoding::gzip}},
    extension_entry{"bz2", {archive_kind::compress, encoding::bzip2}},
    extension_entry{"lzma", {archive_kind::compress, encoding::lzma}},
    extension_entry{"xz", {archive_kind::compress, encoding::xz}},
    extension_entry{"lrz", {archive_kind::compress, encoding::lrzip}},
};

struct magic_pattern {
    std::regex pattern;
    archive_kind kind;
};

struct magic_encoding {
    std::regex pattern;
    encoding enc;
};

const std::vector<magic_pattern>& magic_kinds() {
    static const std::vector<magic_pattern> table{
        {std::regex{"POSIX tar archive"}, archive_kind::tar},
        {std::regex{"(Zip|ZIP self-extracting) archive"}, archive_kind::zip},
        {std::regex{R"(LHa [\d\.\?]+ archive)"}, archive_kind::lzh},
        {std::regex{"RPM"}, archive_kind::rpm},
        {std::regex{"Debian binary package"}, archive_kind::deb},
        {std::regex{"cpio archive"}, archive_kind::cpio},
        {std::regex{"7-zip archive"}, archive_kind::seven_zip},
        {std::regex{"Microsoft Cabinet Archive"}, archive_kind::cab},
        {std::regex{"RAR archive"}, archive_kind::rar},
        {std::regex{"ARJ archive"}, archive_kind::arj},
        {std::regex{"InstallShield CAB"}, archive_kind::shield},
        {std::regex{"Application: Windows Installer"}, archive_kind::msi},
        {std::regex{"ISO 9660 CD-ROM filesystem data"}, archive_kind::dmg},
        {std::regex{"zlib compressed data"}, archive_kind::dmg},
        {std::regex{"Zstandard compressed data"}, archive_kind::zst},
    };
    return table;
}

const std::vector<magic_encoding>& magic_encodings() {
    static const std::vector<magic_encoding> table{
        {std::regex{"bzip2 compressed"}, encoding::bzip2},
        {std::regex{"gzip compressed"}, encoding::gzip},
        {std::regex{"LZMA compressed"}, encoding::lzma},
        {std::regex{"lzip compressed"}, encoding::lzip},
        {std::regex{"LRZIP compressed"}, encoding::lrzip},
        {std::regex{"Zstandard compressed"}, encoding::zstd},
        {std::regex{"xz compressed"}, encoding::xz},
    };
    return table;
}

std::string to_lower(std::string_view text) {
    std::string result{text};
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Split "dir/name.ext" into ("dir/name", ".ext"); leading dots of the
// final component do not start an extension
std::pair<std::string, std::string> split_extension(std::string_view path) {
    const auto slash = path.rfind('/');
    const size_t name_start = slash == std::string_view::npos ? 0 : slash + 1;
    const auto dot = path.rfind('.');
    if (dot == std::string_view::npos || dot < name_start) {
        return {std::string{path}, {}};
    }
    // A dot preceded only by dots is part of the name
    const auto first_non_dot = path.find_first_not_of('.', name_start);
    if (first_non_dot == std::string_view::npos || dot < first_non_dot) {
        return {std::string{path}, {}};
    }
    return {std::string{path.substr(0, dot)}, std::string{path.substr(dot)}};
}

std::optional<archive_kind> kind_for_type_suffix(std::string_view suffix) {
    for (const auto& entry : mime_types) {
        if (entry.suffix == suffix) return entry.kind;
    }
    const auto lowered = to_lower(suffix);
    for (const auto& entry : mime_types) {
        if (entry.suffix == lowered) return entry.kind;
    }
    return std::nullopt;
}

std::optional<std::string_view> alias_for(std::string_view suffix) {
    for (const auto& entry : suffix_aliases) {
        if (entry.suffix == suffix) return entry.replacement;
    }
    return std::nullopt;
}

void append_unique(std::vector<archive_descriptor>& list, const archive_descriptor& descriptor) {
    if (std::ranges::find(list, descriptor) == list.end()) {
        list.push_back(descriptor);
    }
}

} // anonymous namespace

std::string_view to_string(const archive_kind kind) noexcept {
    switch (kind) {
        case archive_kind::tar:       return "tar";
        case archive_kind::zip:       return "zip";
        case archive_kind::lzh:       return "lzh";
        case archive_kind::rpm:       return "rpm";
        case archive_kind::deb:       return "deb";
        case archive_kind::cpio:      return "cpio";
        case archive_kind::gem:       return "gem";
        case archive_kind::seven_zip: return "7z";
        case archive_kind::cab:       return "cab";
        case archive_kind::rar:       return "rar";
        case archive_kind::arj:       return "arj";
        case archive_kind::shield:    return "shield";
        case archive_kind::msi:       return "msi";
        case archive_kind::dmg:       return "dmg";
        case archive_kind::zst:       return "zst";
        case archive_kind::brotli:    return "brotli";
        case archive_kind::compress:  return "compress";
    }
    return "unknown";
}

std::string_view to_string(const encoding enc) noexcept {
    switch (enc) {
        case encoding::none:     return "none";
        case encoding::gzip:     return "gzip";
        case encoding::bzip2:    return "bzip2";
        case encoding::compress: return "compress";
        case encoding::lzma:     return "lzma";
        case encoding::xz:       return "xz";
        case encoding::lzip:     return "lzip";
        case encoding::lrzip:    return "lrzip";
        case encoding::zstd:     return "zstd";
        case encoding::brotli:   return "brotli";
    }
    return "unknown";
}

std::string_view to_string(const detection_tier tier) noexcept {
    switch (tier) {
        case detection_tier::mimetype:  return "mimetype";
        case detection_tier::extension: return "extension";
        case detection_tier::magic:     return "magic";
    }
    return "unknown";
}

std::optional<encoding> encoding_for_suffix(const std::string_view suffix) noexcept {
    for (const auto& entry : encodings) {
        if (entry.suffix == suffix) return entry.enc;
    }
    return std::nullopt;
}

bool is_known_type_suffix(const std::string_view suffix) noexcept {
    for (const auto& entry : mime_types) {
        if (entry.suffix == suffix) return true;
    }
    return alias_for(suffix).has_value();
}

std::vector<archive_descriptor> guess_by_mimetype(const std::string_view filename) {
    auto [base, ext] = split_extension(filename);
    while (auto alias = alias_for(ext)) {
        std::tie(base, ext) = split_extension(base + std::string{*alias});
    }

    std::optional<encoding> enc;
    if (auto found = encoding_for_suffix(ext)) {
        enc = found;
        std::tie(base, ext) = split_extension(base);
    }

    if (auto kind = kind_for_type_suffix(ext)) {
        return {archive_descriptor{*kind, enc.value_or(encoding::none)}};
    }
    if (enc) {
        return {archive_descriptor{archive_kind::compress, *enc}};
    }
    return {};
}

std::vector<archive_descriptor> guess_by_extension(const std::string_view filename) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const auto dot = filename.find('.', start);
        parts.push_back(filename.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }

    std::vector<archive_descriptor> results;
    if (parts.size() < 2) {
        return results;
    }

    // Only the last two pieces take part, longest combination first
    const std::string two = std::string{parts[parts.size() - 2]} + "." + std::string{parts.back()};
    for (const std::string_view key : {std::string_view{two}, parts.back()}) {
        for (const auto& entry : extensions) {
            if (entry.suffix == key) {
                results.push_back(entry.descriptor);
            }
        }
    }
    return results;
}

std::vector<archive_descriptor> match_magic(const std::string_view description) {
    const std::string text{description};

    std::vector<archive_kind> kinds;
    for (const auto& entry : magic_kinds()) {
        if (std::regex_search(text, entry.pattern) && std::ranges::find(kinds, entry.kind) == kinds.end()) {
            kinds.push_back(entry.kind);
        }
    }
    std::vector<encoding> encs;
    for (const auto& entry : magic_encodings()) {
        if (std::regex_search(text, entry.pattern)) {
            encs.push_back(entry.enc);
        }
    }

    if (!kinds.empty() && encs.empty()) {
        encs.push_back(encoding::none);
    } else if (!encs.empty() && kinds.empty()) {
        kinds.push_back(archive_kind::compress);
    }

    std::vector<archive_descriptor> results;
    for (const auto kind : kinds) {
        for (const auto enc : encs) {
            results.push_back({kind, enc});
        }
    }
    return results;
}

std::vector<archive_descriptor> guess_by_magic(const std::filesystem::path &path) {
    auto output = capture_output({"file", "-zL", path.string()});
    if (!output) {
        if (output.error().code() == error_code::tool_unusable) {
            log::error("'file' command not found, skipping magic test");
        } else {
            log::debug("magic test failed: {}", output.error().message());
        }
        return {};
    }
    if (output->status != 0) {
        return {};
    }

    std::string_view line{output->out};
    line = line.substr(0, line.find('\n'));
    const std::string prefix = path.string() + ": ";
    if (line.starts_with(prefix)) {
        line.remove_prefix(prefix.size());
    }
    return match_magic(line);
}

bool looks_like_archive(const std::string_view filename) {
    return !guess_by_mimetype(filename).empty() || !guess_by_extension(filename).empty();
}

std::vector<std::string> supported_extensions() {
    std::set<std::string> names;
    for (const auto& entry : extensions) names.emplace(entry.suffix);
    for (const auto& entry : mime_types) names.emplace(entry.suffix.substr(1));
    for (const auto& entry : suffix_aliases) names.emplace(entry.suffix.substr(1));
    for (const auto& entry : encodings) names.emplace(entry.suffix.substr(1));
    return {names.begin(), names.end()};
}

// candidate_sequence implementation
void candidate_sequence::load_tier() {
    const std::string name = path_.string();
    switch (tier_) {
        case detection_tier::mimetype:
            pending_ = guess_by_mimetype(name);
            break;
        case detection_tier::extension:
            pending_ = guess_by_extension(name);
            break;
        case detection_tier::magic:
            pending_ = guess_by_magic(path_);
            break;
    }
    pending_index_ = 0;
    tier_loaded_ = true;
    log::debug("getting candidates by {}: {} found", to_string(tier_), pending_.size());
}

auto candidate_sequence::next() -> std::optional<archive_descriptor> {
    while (!exhausted_) {
        if (!tier_loaded_) {
            load_tier();
        }
        while (pending_index_ < pending_.size()) {
            const auto candidate = pending_[pending_index_++];
            if (std::ranges::find(tried_, candidate) != tried_.end()) {
                continue;
            }
            append_unique(tried_, candidate);
            return candidate;
        }
        if (tier_ == detection_tier::magic) {
            exhausted_ = true;
        } else {
            tier_ = static_cast<detection_tier>(static_cast<uint8_t>(tier_) + 1);
            tier_loaded_ = false;
        }
    }
    return std::nullopt;
}

} // namespace tierone::xtract
