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

#include <tierone/xtract/download.hpp>
#include <tierone/xtract/log.hpp>
#include <tierone/xtract/process.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace tierone::xtract {

namespace {

constexpr std::array<std::string_view, 3> url_schemes{"http://", "https://", "ftp://"};

bool starts_with_nocase(const std::string_view text, const std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    return std::ranges::equal(text.substr(0, prefix.size()), prefix, [](const char a, const char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

} // anonymous namespace

bool is_url(const std::string_view argument) noexcept {
    return std::ranges::any_of(url_schemes, [&](const std::string_view scheme) {
        return starts_with_nocase(argument, scheme);
    });
}

std::string download_name(std::string_view url) {
    if (const auto scheme = url.find("://"); scheme != std::string_view::npos) {
        url.remove_prefix(scheme + 3);
    }
    if (const auto end = url.find_first_of("?#"); end != std::string_view::npos) {
        url = url.substr(0, end);
    }
    // Drop the host; what is left is the path
    const auto path_start = url.find('/');
    if (path_start == std::string_view::npos) {
        return {};
    }
    const auto path = url.substr(path_start);
    return std::string{path.substr(path.rfind('/') + 1)};
}

auto fetch(const std::string_view url) -> std::expected<std::string, error> {
    auto name = download_name(url);
    if (name.empty()) {
        return std::unexpected(error{error_code::invalid_operation,
            std::format("cannot tell which file {} names", url)});
    }

    log::info("downloading {}", url);
    auto wget = child_process::spawn({"wget", "-c", std::string{url}},
                                     stdio_setup{.stdout_mode = stream_mode::inherit,
                                                 .stderr_mode = stream_mode::inherit});
    if (!wget) {
        return std::unexpected(wget.error());
    }
    auto status = wget->wait();
    if (!status) {
        return std::unexpected(status.error());
    }
    if (*status != 0) {
        return std::unexpected(error{error_code::io_error,
            std::format("wget returned status code {}", *status)});
    }
    return name;
}

} // namespace tierone::xtract
