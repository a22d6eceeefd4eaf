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
#include <tierone/xtract/pipeline.hpp>
#include <expected>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tierone::xtract {

// Scratch state a listing parser keeps between calls
struct listing_state {
    bool started = false;       // header consumed
    bool finished = false;      // trailer seen; remaining lines are ignored
    bool inside = false;        // between border lines
    bool name_line = true;      // alternating name/detail lines
    size_t column = 0;          // start of the name column
};

// Pull the next member name out of a tool's listing output
using listing_parser = std::expected<std::optional<std::string>, error> (*)(line_source&, listing_state&);

namespace parsers {

// One member per line, verbatim (tar, cpio, zipinfo -1)
[[nodiscard]] std::expected<std::optional<std::string>, error> plain(line_source& lines, listing_state& state);

// lha l: names follow the column found on the first border line
[[nodiscard]] std::expected<std::optional<std::string>, error> lzh(line_source& lines, listing_state& state);

// 7z l -ba: name is everything after the last space
[[nodiscard]] std::expected<std::optional<std::string>, error> seven_zip(line_source& lines, listing_state& state);

// zstd -l: names start after the last space of a dashes-and-spaces border row
[[nodiscard]] std::expected<std::optional<std::string>, error> zstd(line_source& lines, listing_state& state);

// cabextract -l: third " | " column after the border
[[nodiscard]] std::expected<std::optional<std::string>, error> cab(line_source& lines, listing_state& state);

// unshield l: numbered rows up to the dashed trailer
[[nodiscard]] std::expected<std::optional<std::string>, error> shield(line_source& lines, listing_state& state);

// unrar v: name and detail lines alternate between dashed borders
[[nodiscard]] std::expected<std::optional<std::string>, error> rar(line_source& lines, listing_state& state);

// lsar: first line is a title; names end before the last "("
[[nodiscard]] std::expected<std::optional<std::string>, error> unarchiver(line_source& lines, listing_state& state);

// arj v: rows prefixed with "NNN) "
[[nodiscard]] std::expected<std::optional<std::string>, error> arj(line_source& lines, listing_state& state);

// Column index following the last space of an lha-style border line, or
// nullopt when the line is not a border
[[nodiscard]] std::optional<size_t> border_column(std::string_view line);

} // namespace parsers

// Single-pass member listing of an archive. Lines are parsed as the lister
// produces them; once exhausted, the lister's exit statuses are checked.
class member_listing {
private:
    std::unique_ptr<running_pipeline> source_;
    listing_parser parser_ = nullptr;
    fatal_predicate is_fatal_ = nullptr;
    listing_state state_;
    std::vector<std::string> fixed_;
    size_t fixed_index_ = 0;
    bool done_ = false;

public:
    member_listing(std::unique_ptr<running_pipeline> source, listing_parser parser, fatal_predicate is_fatal)
        : source_(std::move(source)), parser_(parser), is_fatal_(is_fatal) {}

    // Listing known without running a tool
    explicit member_listing(std::vector<std::string> names)
        : fixed_(std::move(names)) {}

    // Next member name, nullopt at the end. A failing lister is reported
    // once its output has been consumed.
    [[nodiscard]] std::expected<std::optional<std::string>, error> next();

    [[nodiscard]] std::string stderr_text() const;

    class iterator {
    private:
        member_listing* listing_ = nullptr;
        std::optional<std::string> current_;
        std::optional<error> error_;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(member_listing* listing) : listing_(listing) {
            ++(*this);
        }

        [[nodiscard]] const std::string& operator*() const { return *current_; }
        [[nodiscard]] const std::string* operator->() const { return &*current_; }

        iterator& operator++() {
            if (listing_) {
                if (auto result = listing_->next(); result && *result) {
                    current_ = std::move(**result);
                } else {
                    if (!result) {
                        error_ = result.error();
                    }
                    listing_ = nullptr;
                    current_.reset();
                }
            }
            return *this;
        }

        [[nodiscard]] bool operator==(const iterator& other) const {
            return listing_ == other.listing_;
        }

        [[nodiscard]] const std::optional<error>& failure() const noexcept { return error_; }
    };

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] iterator end() const { return {}; }
};

} // namespace tierone::xtract
