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

#include <tierone/xtract/cancellation.hpp>
#include <tierone/xtract/content.hpp>
#include <tierone/xtract/error.hpp>
#include <tierone/xtract/format.hpp>
#include <tierone/xtract/listing.hpp>
#include <tierone/xtract/options.hpp>
#include <tierone/xtract/pipeline.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tierone::xtract {

enum class variant : uint8_t {
    tar,
    cpio,
    rpm,
    deb,
    deb_metadata,
    gem,
    gem_metadata,
    compression,
    zip,
    lzh,
    seven_zip,
    zstd,
    brotli,
    cab,
    shield,
    rar,
    unarchiver,
    arj
};

// How the archive reaches the first tool
enum class input_discipline : uint8_t {
    piped,      // streamed through stdin
    no_pipe     // named on the command line; stdin is the null device
};

using command_builder = std::vector<std::string> (*)(const std::optional<std::string>& password);
using stage_builder = std::expected<void, error> (*)(const std::filesystem::path& archive, encoding enc,
                                                     pipeline& stages);
using basename_rule = std::string (*)(std::string_view filename);

// Everything that distinguishes one extractor variant from another
struct variant_traits {
    variant id = variant::tar;
    std::string_view file_type;
    input_discipline discipline = input_discipline::piped;
    command_builder extract_command = nullptr;      // none for single streams
    std::vector<std::string> list_command;          // empty when listing is unsupported
    listing_parser parse_listing = parsers::plain;
    stage_builder prepare = nullptr;                // default: decoder for the encoding
    basename_rule basename = nullptr;
    fatal_predicate is_fatal = nullptr;
    prompt_stream prompt = prompt_stream::none;
    bool capture_stdout = false;
    bool always_bomb = false;                       // containers with many entries by design
    bool single_stream = false;                     // one decoded file named by basename()
};

[[nodiscard]] std::string_view to_string(variant v) noexcept;

[[nodiscard]] const variant_traits& traits_of(variant v);

// Variants to try, in order, for an archive kind
[[nodiscard]] std::span<const variant> variants_for(archive_kind kind, bool metadata) noexcept;

// Command that decodes an encoding from stdin to stdout
[[nodiscard]] std::expected<std::vector<std::string>, error> decoder_command(encoding enc);

namespace naming {

// Strip the encoding suffix, then a known type suffix, else a short
// leftover suffix
[[nodiscard]] std::string archive_basename(std::string_view filename);

// Strip only the encoding suffix
[[nodiscard]] std::string compressed_basename(std::string_view filename);

// foo-1.0-1.i386.rpm -> foo-1.0-1
[[nodiscard]] std::string rpm_basename(std::string_view filename);

// foo_1.0-1_amd64.deb -> foo_1.0-1
[[nodiscard]] std::string deb_basename(std::string_view filename);

[[nodiscard]] std::string gem_metadata_basename(std::string_view filename);

[[nodiscard]] std::string shield_basename(std::string_view filename);

} // namespace naming

// One attempt at handling an archive as a particular variant and encoding.
// extract() leaves its output in a scratch location owned by result().target,
// which is removed unless a placement takes it over.
class extractor {
private:
    std::string name_;                  // as given, for messages
    std::filesystem::path path_;        // absolute
    encoding encoding_;
    const variant_traits* traits_;
    extraction_result result_;

    extractor(std::string name, std::filesystem::path path, encoding enc, const variant_traits& traits);

    [[nodiscard]] std::expected<pipeline, error> prepare() const;
    [[nodiscard]] std::vector<std::string> tool_command(const std::vector<std::string>& base) const;
    [[nodiscard]] run_settings settings_for(const options& opts, const cancellation_token& cancel) const;
    [[nodiscard]] std::expected<void, error> record(std::expected<run_outcome, error> outcome);
    [[nodiscard]] std::expected<void, error> extract_stream(pipeline& stages, const run_settings& settings);
    [[nodiscard]] std::expected<void, error> extract_tree(pipeline& stages, run_settings settings,
                                                          const options& opts);

public:
    // Fails early when the archive cannot be opened for reading
    [[nodiscard]] static std::expected<extractor, error> create(const std::filesystem::path& filename,
                                                                encoding enc, variant v);

    [[nodiscard]] std::expected<void, error> extract(const options& opts, const cancellation_token& cancel);

    // Start the lister; names are parsed as it produces them
    [[nodiscard]] std::expected<member_listing, error> list() const;

    [[nodiscard]] std::string basename() const;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::string_view file_type() const noexcept { return traits_->file_type; }
    [[nodiscard]] encoding archive_encoding() const noexcept { return encoding_; }
    [[nodiscard]] const variant_traits& traits() const noexcept { return *traits_; }

    [[nodiscard]] extraction_result& result() noexcept { return result_; }
    [[nodiscard]] const extraction_result& result() const noexcept { return result_; }
};

} // namespace tierone::xtract
