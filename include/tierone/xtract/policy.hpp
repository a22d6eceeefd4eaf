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
#include <tierone/xtract/options.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tierone::xtract {

// Asks multiple-choice questions on a pair of streams
class prompter {
private:
    std::istream& in_;
    std::ostream& out_;
    size_t width_;

public:
    prompter(std::istream& in, std::ostream& out, size_t width = terminal_width());

    // Columns available on the controlling terminal, less one; 79 otherwise
    [[nodiscard]] static size_t terminal_width() noexcept;

    // Word-wrap text to the prompt width
    [[nodiscard]] std::vector<std::string> wrap(std::string_view text, std::string_view first_indent = "",
                                                std::string_view indent = "") const;

    // Print the question and its choices, then read answers until one of
    // the keys matches. An empty answer or end of input picks the default.
    template<typename Choice>
    [[nodiscard]] Choice ask(const std::vector<std::string>& question,
                             const std::vector<std::string>& choices,
                             std::string_view prompt_text,
                             const std::vector<std::pair<std::string_view, Choice>>& answers,
                             Choice fallback);

    [[nodiscard]] std::ostream& out() noexcept { return out_; }

private:
    void show(const std::vector<std::string>& question, const std::vector<std::string>& choices,
              std::string_view prompt_text);
    [[nodiscard]] std::optional<std::string> read_answer();
};

enum class one_entry_choice : uint8_t {
    unset,
    here,       // keep the entry's own name
    wrap,       // put it inside a directory named after the archive
    rename      // rename it after the archive
};

// What to do with an archive holding one entry whose name differs from the
// archive's. A choice set up front, or by batch mode, applies to every
// archive without asking.
class one_entry_policy {
private:
    one_entry_choice permanent_ = one_entry_choice::unset;
    one_entry_choice current_ = one_entry_choice::unset;

    explicit one_entry_policy(const one_entry_choice permanent) noexcept
        : permanent_(permanent) {}

public:
    // Fails when the configured default is not a prefix of here/rename/inside
    [[nodiscard]] static std::expected<one_entry_policy, error> create(const options& opts);

    void prep(std::string_view archive_name, content_type type, std::string_view basename,
              std::string_view content_name, prompter& prompt);

    [[nodiscard]] bool ok_for_match() const noexcept {
        return current_ == one_entry_choice::here || current_ == one_entry_choice::rename;
    }

    [[nodiscard]] one_entry_choice current() const noexcept { return current_; }
    [[nodiscard]] one_entry_choice permanent() const noexcept { return permanent_; }
    void set_permanent(const one_entry_choice choice) noexcept { permanent_ = choice; }
};

enum class recursion_choice : uint8_t {
    not_now,
    once,
    always,
    never,
    list
};

// Whether to extract archives found inside an extraction
class recursion_policy {
private:
    std::optional<recursion_choice> permanent_;
    recursion_choice current_ = recursion_choice::not_now;
    size_t threshold_ = 10;

public:
    explicit recursion_policy(const options& opts) noexcept;

    // Decide for one extraction, asking unless a sticky answer exists or the
    // included archives are too few to be worth a question
    void prep(std::string_view archive_name, const std::filesystem::path& target,
              const extraction_result& result, prompter& prompt);

    [[nodiscard]] bool ok_to_recurse() const noexcept {
        return current_ == recursion_choice::once || current_ == recursion_choice::always;
    }

    [[nodiscard]] recursion_choice current() const noexcept { return current_; }
    [[nodiscard]] const std::optional<recursion_choice>& permanent() const noexcept { return permanent_; }
};

template<typename Choice>
Choice prompter::ask(const std::vector<std::string>& question,
                     const std::vector<std::string>& choices,
                     const std::string_view prompt_text,
                     const std::vector<std::pair<std::string_view, Choice>>& answers,
                     const Choice fallback) {
    while (true) {
        show(question, choices, prompt_text);
        const auto answer = read_answer();
        if (!answer || answer->empty()) {
            return fallback;
        }
        for (const auto& [key, choice] : answers) {
            if (*answer == key) {
                return choice;
            }
        }
        out_ << '\n';
    }
}

} // namespace tierone::xtract
