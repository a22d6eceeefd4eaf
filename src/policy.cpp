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

#include <tierone/xtract/policy.hpp>
#include <algorithm>
#include <cctype>
#include <format>

#include <sys/ioctl.h>
#include <unistd.h>

namespace tierone::xtract {

namespace {

constexpr size_t fallback_width = 79;

std::string lowercase(std::string text) {
    std::ranges::transform(text, text.begin(), [](const unsigned char c) { return std::tolower(c); });
    return text;
}

std::string trim(const std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1)};
}

bool is_prefix_of(const std::string_view prefix, const std::string_view word) {
    return word.starts_with(prefix);
}

} // anonymous namespace

// prompter implementation
prompter::prompter(std::istream& in, std::ostream& out, const size_t width)
    : in_(in), out_(out), width_(width) {}

size_t prompter::terminal_width() noexcept {
    winsize size{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 1) {
        return static_cast<size_t>(size.ws_col) - 1;
    }
    return fallback_width;
}

std::vector<std::string> prompter::wrap(const std::string_view text, const std::string_view first_indent,
                                        const std::string_view indent) const {
    std::vector<std::string> lines;
    std::string line{first_indent};
    bool line_has_words = false;

    size_t pos = 0;
    while (pos < text.size()) {
        const auto start = text.find_first_not_of(' ', pos);
        if (start == std::string_view::npos) {
            break;
        }
        auto end = text.find(' ', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const auto word = text.substr(start, end - start);
        pos = end;

        if (line_has_words && line.size() + 1 + word.size() > width_) {
            lines.push_back(std::move(line));
            line = std::string{indent};
            line_has_words = false;
        }
        if (line_has_words) {
            line += ' ';
        }
        line += word;
        line_has_words = true;
    }
    if (line_has_words || lines.empty()) {
        lines.push_back(std::move(line));
    }
    return lines;
}

void prompter::show(const std::vector<std::string>& question, const std::vector<std::string>& choices,
                    const std::string_view prompt_text) {
    for (const auto& line : question) {
        out_ << line << '\n';
    }
    out_ << "You can:\n";
    for (const auto& choice : choices) {
        for (const auto& line : wrap(choice, " * ", "   ")) {
            out_ << line << '\n';
        }
    }
    out_ << prompt_text << std::flush;
}

std::optional<std::string> prompter::read_answer() {
    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << '\n';
        return std::nullopt;
    }
    return lowercase(trim(answer));
}

// one_entry_policy implementation
auto one_entry_policy::create(const options &opts) -> std::expected<one_entry_policy, error> {
    one_entry_policy policy{opts.batch ? one_entry_choice::wrap : one_entry_choice::unset};

    std::string configured;
    if (opts.flat) {
        configured = "h";
    } else if (opts.one_entry_default) {
        configured = lowercase(*opts.one_entry_default);
    } else {
        return policy;
    }

    if (is_prefix_of(configured, "here")) {
        policy.permanent_ = one_entry_choice::here;
    } else if (is_prefix_of(configured, "rename")) {
        policy.permanent_ = one_entry_choice::rename;
    } else if (is_prefix_of(configured, "inside")) {
        policy.permanent_ = one_entry_choice::wrap;
    } else {
        return std::unexpected(error{error_code::invalid_operation,
            std::format("invalid value for --one-entry option: {}", *opts.one_entry_default)});
    }
    return policy;
}

void one_entry_policy::prep(const std::string_view archive_name, const content_type type,
                            const std::string_view basename, const std::string_view content_name,
                            prompter& prompt) {
    if (permanent_ != one_entry_choice::unset) {
        current_ = permanent_;
        return;
    }

    static const std::vector<std::pair<std::string_view, one_entry_choice>> answers{
        {"h", one_entry_choice::here},
        {"i", one_entry_choice::wrap},
        {"r", one_entry_choice::rename},
    };

    const auto type_name = to_string(type);
    auto question = prompt.wrap(std::format("{} contains one {} but its name doesn't match.",
                                            archive_name, type_name));
    question.push_back(std::format(" Expected: {}", basename));
    question.push_back(std::format("   Actual: {}", content_name));

    const std::vector<std::string> choices{
        std::format("extract the {} _I_nside a new directory named {}", type_name, basename),
        std::format("extract the {} and _R_ename it {}", type_name, basename),
        std::format("extract the {} _H_ere", type_name),
    };
    current_ = prompt.ask(question, choices, "What do you want to do?  (I/r/h) ", answers,
                          one_entry_choice::wrap);
}

// recursion_policy implementation
recursion_policy::recursion_policy(const options& opts) noexcept
    : threshold_(opts.recursion_threshold) {
    if (opts.batch) {
        permanent_ = recursion_choice::not_now;
    }
    if (opts.show_list) {
        permanent_ = recursion_choice::never;
    } else if (opts.recursive) {
        permanent_ = recursion_choice::always;
    }
}

void recursion_policy::prep(const std::string_view archive_name, const std::filesystem::path& target,
                            const extraction_result& result, prompter& prompt) {
    const size_t archive_count = result.included_archives.size();
    if (permanent_ || archive_count * threshold_ <= result.file_count) {
        current_ = permanent_.value_or(recursion_choice::not_now);
        return;
    }

    static const std::vector<std::pair<std::string_view, recursion_choice>> answers{
        {"a", recursion_choice::always},
        {"o", recursion_choice::once},
        {"n", recursion_choice::not_now},
        {"v", recursion_choice::never},
        {"l", recursion_choice::list},
    };
    static const std::vector<std::string> choices{
        "_A_lways extract included archives during this session",
        "extract included archives this _O_nce",
        "choose _N_ot to extract included archives this once",
        "ne_V_er extract included archives during this session",
        "_L_ist included archives",
    };

    const auto question = prompt.wrap(std::format("{} contains {} other archive file(s), out of {} file(s) total.",
                                                  archive_name, archive_count, result.file_count));
    const std::filesystem::path shown_target = target == "." ? std::filesystem::path{} : target;
    const std::filesystem::path shown_root =
        result.included_root == "./" ? std::filesystem::path{} : result.included_root;

    while (true) {
        current_ = prompt.ask(question, choices, "What do you want to do?  (a/o/N/v/l) ", answers,
                              recursion_choice::not_now);
        if (current_ != recursion_choice::list) {
            break;
        }
        prompt.out() << '\n';
        for (const auto& archive : result.included_archives) {
            prompt.out() << (shown_target / shown_root / archive).string() << '\n';
        }
        prompt.out() << '\n';
    }

    if (current_ == recursion_choice::always || current_ == recursion_choice::never) {
        permanent_ = current_;
    }
}

} // namespace tierone::xtract
