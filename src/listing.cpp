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

#include <tierone/xtract/listing.hpp>
#include <algorithm>
#include <regex>

namespace tierone::xtract {

namespace {

using parse_result = std::expected<std::optional<std::string>, error>;

std::string trim(std::string_view text) {
    constexpr std::string_view blanks = " \t\r\n";
    const auto first = text.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(blanks);
    return std::string{text.substr(first, last - first + 1)};
}

bool all_of_chars(std::string_view line, std::string_view allowed) {
    return !line.empty() && line.find_first_not_of(allowed) == std::string_view::npos;
}

// Shared by lha and zstd: names start at a column fixed by a border line
// and stop at the next border.
template<typename IsBorder, typename ColumnOf>
parse_result bordered_column(line_source& lines, listing_state& state, IsBorder is_border, ColumnOf column_of) {
    if (state.finished) {
        return std::nullopt;
    }
    while (true) {
        auto line = lines.read_line();
        if (!line || !*line) {
            return line;
        }
        const std::string& text = **line;
        if (!state.started) {
            if (is_border(text)) {
                state.column = column_of(text);
                state.started = true;
            }
            continue;
        }
        if (is_border(text)) {
            state.finished = true;
            return std::nullopt;
        }
        return text.substr(std::min(state.column, text.size()));
    }
}

} // anonymous namespace

namespace parsers {

std::optional<size_t> border_column(const std::string_view line) {
    std::optional<size_t> last_space;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == ' ') {
            last_space = i;
        } else if (line[i] != '-') {
            return std::nullopt;
        }
    }
    if (!last_space) {
        return std::nullopt;
    }
    return *last_space + 1;
}

parse_result plain(line_source& lines, listing_state&) {
    return lines.read_line();
}

parse_result lzh(line_source& lines, listing_state& state) {
    return bordered_column(lines, state,
        [](const std::string& text) { return border_column(text).has_value(); },
        [](const std::string& text) { return *border_column(text); });
}

parse_result zstd(line_source& lines, listing_state& state) {
    return bordered_column(lines, state,
        [](const std::string& text) { return all_of_chars(text, "- "); },
        [](const std::string& text) {
            const auto space = text.rfind(' ');
            return space == std::string::npos ? size_t{0} : space + 1;
        });
}

parse_result seven_zip(line_source& lines, listing_state&) {
    while (true) {
        auto line = lines.read_line();
        if (!line || !*line) {
            return line;
        }
        if (const auto space = (*line)->rfind(' '); space != std::string::npos) {
            return (*line)->substr(space + 1);
        }
    }
}

parse_result cab(line_source& lines, listing_state& state) {
    if (state.finished) {
        return std::nullopt;
    }
    while (true) {
        auto line = lines.read_line();
        if (!line || !*line) {
            return line;
        }
        const std::string& text = **line;
        if (!state.started) {
            state.started = all_of_chars(text, "-+");
            continue;
        }
        constexpr std::string_view separator = " | ";
        const auto first = text.find(separator);
        const auto second = first == std::string::npos
            ? std::string::npos : text.find(separator, first + separator.size());
        if (second == std::string::npos) {
            state.finished = true;
            return std::nullopt;
        }
        return text.substr(second + separator.size());
    }
}

parse_result shield(line_source& lines, listing_state& state) {
    static const std::regex prefix{R"(^\s+\d+\s+)"};
    static const std::regex trailer{R"(^\s+-+\s+-+\s*$)"};
    if (state.finished) {
        return std::nullopt;
    }
    while (true) {
        auto line = lines.read_line();
        if (!line || !*line) {
            return line;
        }
        const std::string& text = **line;
        if (std::regex_match(text, trailer)) {
            state.finished = true;
            return std::nullopt;
        }
        if (std::smatch match; std::regex_search(text, match, prefix)) {
            return match.suffix().str();
        }
    }
}

parse_result rar(line_source& lines, listing_state& state) {
    while (true) {
        auto line = lines.read_line();
        if (!line || !*line) {
            return line;
        }
        const std::string& text = **line;
        if (all_of_chars(text, "-")) {
            state.inside = !state.inside;
            continue;
        }
        if (!state.inside) {
            continue;
        }
        const bool is_name = state.name_line;
        state.name_line = !state.name_line;
        if (is_name) {
            return trim(text);
        }
    }
}

parse_result unarchiver(line_source& lines, listing_state& state) {
    while (true) {
        auto line = lines.read_line();
        if (!line || !*line) {
            return line;
        }
        if (!state.started) {
            state.started = true;
            continue;
        }
        const std::string& text = **line;
        const auto paren = text.rfind('(');
        return trim(paren == std::string::npos ? std::string_view{text} : std::string_view{text}.substr(0, paren));
    }
}

parse_result arj(line_source& lines, listing_state&) {
    static const std::regex prefix{R"(^\d+\)\s+)"};
    while (true) {
        auto line = lines.read_line();
        if (!line || !*line) {
            return line;
        }
        if (std::smatch match; std::regex_search(**line, match, prefix)) {
            return match.suffix().str();
        }
    }
}

} // namespace parsers

auto member_listing::next() -> std::expected<std::optional<std::string>, error> {
    if (done_) {
        return std::nullopt;
    }
    if (!source_) {
        if (fixed_index_ < fixed_.size()) {
            return fixed_[fixed_index_++];
        }
        done_ = true;
        return std::nullopt;
    }

    if (!state_.finished) {
        auto name = parser_(*source_, state_);
        if (!name) {
            done_ = true;
            return name;
        }
        if (*name) {
            return name;
        }
    }

    done_ = true;
    if (auto finished = source_->finish(is_fatal_); !finished) {
        return std::unexpected(finished.error());
    }
    return std::nullopt;
}

std::string member_listing::stderr_text() const {
    return source_ ? source_->stderr_text() : std::string{};
}

} // namespace tierone::xtract
