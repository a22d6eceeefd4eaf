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

#include <tierone/xtract/log.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <print>

namespace tierone::xtract::log {

namespace {

std::atomic<int> current_threshold{static_cast<int>(level::warning)};

} // anonymous namespace

void set_threshold(const level threshold) noexcept {
    current_threshold.store(static_cast<int>(threshold), std::memory_order_relaxed);
}

level threshold() noexcept {
    return static_cast<level>(current_threshold.load(std::memory_order_relaxed));
}

bool enabled(const level lvl) noexcept {
    return static_cast<int>(lvl) >= current_threshold.load(std::memory_order_relaxed);
}

level from_verbosity(const int verbose, const int quiet) noexcept {
    const int value = static_cast<int>(level::warning) + 10 * (quiet - verbose);
    return static_cast<level>(std::clamp(value, static_cast<int>(level::debug),
                                         static_cast<int>(level::critical)));
}

std::string_view name(const level lvl) noexcept {
    switch (lvl) {
        case level::debug:    return "DEBUG";
        case level::info:     return "INFO";
        case level::warning:  return "WARNING";
        case level::error:    return "ERROR";
        case level::critical: return "CRITICAL";
    }
    return "LOG";
}

void write(const level lvl, const std::string_view message) {
    std::println(stderr, "xtract: {}: {}", name(lvl), message);
}

} // namespace tierone::xtract::log
