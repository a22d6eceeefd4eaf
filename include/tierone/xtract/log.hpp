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

#include <format>
#include <string>
#include <string_view>
#include <utility>

/*
 * Leveled diagnostics written to stderr as "xtract: LEVEL: message".
 *
 * The threshold is process-wide; messages below it are dropped before
 * formatting. Usage:
 *   log::set_threshold(log::level::debug);
 *   log::warning("extracting {} to {}", archive, target);
 */
namespace tierone::xtract::log {

enum class level : int {
    debug = 10,
    info = 20,
    warning = 30,
    error = 40,
    critical = 50
};

void set_threshold(level threshold) noexcept;
[[nodiscard]] level threshold() noexcept;
[[nodiscard]] bool enabled(level lvl) noexcept;

// Map a -v/-q balance onto a level, warning being the default
[[nodiscard]] level from_verbosity(int verbose, int quiet) noexcept;

[[nodiscard]] std::string_view name(level lvl) noexcept;

void write(level lvl, std::string_view message);

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(level::debug)) write(level::debug, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(level::info)) write(level::info, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(level::warning)) write(level::warning, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(level::error)) write(level::error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace tierone::xtract::log
