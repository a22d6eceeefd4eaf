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
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tierone::xtract {

enum class archive_kind : uint8_t {
    tar,
    zip,
    lzh,
    rpm,
    deb,
    cpio,
    gem,
    seven_zip,
    cab,
    rar,
    arj,
    shield,     // InstallShield cabinet
    msi,
    dmg,
    zst,
    brotli,
    compress    // a bare compressed stream with no archive structure
};

enum class encoding : uint8_t {
    none,
    gzip,
    bzip2,
    compress,   // .Z
    lzma,
    xz,
    lzip,
    lrzip,
    zstd,
    brotli
};

[[nodiscard]] std::string_view to_string(archive_kind kind) noexcept;
[[nodiscard]] std::string_view to_string(encoding enc) noexcept;

struct archive_descriptor {
    archive_kind kind = archive_kind::compress;
    encoding enc = encoding::none;

    [[nodiscard]] bool operator==(const archive_descriptor&) const = default;
};

// Encoding named by a single suffix such as ".gz"
[[nodiscard]] std::optional<encoding> encoding_for_suffix(std::string_view suffix) noexcept;

// True for suffixes of a recognised MIME type or a suffix alias (".tgz")
[[nodiscard]] bool is_known_type_suffix(std::string_view suffix) noexcept;

// First tier: MIME type and content encoding implied by the file name
[[nodiscard]] std::vector<archive_descriptor> guess_by_mimetype(std::string_view filename);

// Second tier: the last one or two dot-separated suffixes, longest first
[[nodiscard]] std::vector<archive_descriptor> guess_by_extension(std::string_view filename);

// Third tier: run `file -zL` on the file and match its description
[[nodiscard]] std::vector<archive_descriptor> guess_by_magic(const std::filesystem::path& path);

// Match a `file` description (without the "name: " prefix)
[[nodiscard]] std::vector<archive_descriptor> match_magic(std::string_view description);

// Whether the name alone suggests an archive; used to find nested archives
[[nodiscard]] bool looks_like_archive(std::string_view filename);

// Every suffix the classifier recognises, without the leading dot, sorted
[[nodiscard]] std::vector<std::string> supported_extensions();

enum class detection_tier : uint8_t {
    mimetype,
    extension,
    magic
};

[[nodiscard]] std::string_view to_string(detection_tier tier) noexcept;

// Lazily walks the three detection tiers, skipping descriptors already
// produced. The magic probe only runs once the first two tiers are exhausted.
class candidate_sequence {
private:
    std::filesystem::path path_;
    detection_tier tier_ = detection_tier::mimetype;
    bool tier_loaded_ = false;
    bool exhausted_ = false;
    std::vector<archive_descriptor> pending_;
    size_t pending_index_ = 0;
    std::vector<archive_descriptor> tried_;

    void load_tier();

public:
    explicit candidate_sequence(std::filesystem::path path)
        : path_(std::move(path)) {}

    [[nodiscard]] std::optional<archive_descriptor> next();

    // Tier that produced the most recent candidate
    [[nodiscard]] detection_tier tier() const noexcept { return tier_; }

    [[nodiscard]] const std::vector<archive_descriptor>& tried() const noexcept { return tried_; }
};

} // namespace tierone::xtract
