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

#include <tierone/xtract/workspace.hpp>
#include <tierone/xtract/log.hpp>
#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <stdlib.h>

namespace tierone::xtract {

namespace {

std::vector<char> make_template(const std::filesystem::path& parent, const std::string_view prefix) {
    const std::string pattern = (parent / prefix).string() + "XXXXXX";
    return std::vector<char>(pattern.c_str(), pattern.c_str() + pattern.size() + 1);
}

} // anonymous namespace

auto scoped_working_directory::enter(const std::filesystem::path &directory)
    -> std::expected<scoped_working_directory, error> {
    std::error_code ec;
    auto previous = std::filesystem::current_path(ec);
    if (ec) {
        return std::unexpected(io_error("cannot determine working directory", ec));
    }
    std::filesystem::current_path(directory, ec);
    if (ec) {
        return std::unexpected(io_error("cannot enter " + directory.string(), ec));
    }
    return scoped_working_directory{std::move(previous)};
}

scoped_working_directory::~scoped_working_directory() {
    if (!active_) {
        return;
    }
    std::error_code ec;
    std::filesystem::current_path(previous_, ec);
    if (ec) {
        log::error("could not return to {}: {}", previous_.string(), ec.message());
    }
}

temporary_path::temporary_path(std::filesystem::path path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    path_ = ec ? std::move(path) : std::move(absolute);
}

void temporary_path::remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        log::warning("could not remove {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

auto make_temporary_directory(const std::filesystem::path &parent, const std::string_view prefix)
    -> std::expected<temporary_path, error> {
    auto pattern = make_template(parent, prefix);
    if (::mkdtemp(pattern.data()) == nullptr) {
        return std::unexpected(error{error_code::io_error,
            std::string{"cannot create temporary directory: "} + std::strerror(errno)});
    }
    return temporary_path{std::filesystem::path{pattern.data()}};
}

auto make_temporary_file(const std::filesystem::path &parent, const std::string_view prefix)
    -> std::expected<temporary_file, error> {
    auto pattern = make_template(parent, prefix);
    const int fd = ::mkostemp(pattern.data(), O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(error{error_code::io_error,
            std::string{"cannot create temporary file: "} + std::strerror(errno)});
    }
    return temporary_file{temporary_path{std::filesystem::path{pattern.data()}}, file_descriptor{fd}};
}

} // namespace tierone::xtract
