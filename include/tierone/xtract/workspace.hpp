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
#include <tierone/xtract/process.hpp>
#include <expected>
#include <filesystem>
#include <string_view>
#include <utility>

namespace tierone::xtract {

// Changes the working directory for its lifetime and changes back when it
// goes out of scope, whichever way the scope is left.
class scoped_working_directory {
private:
    std::filesystem::path previous_;
    bool active_ = false;

    explicit scoped_working_directory(std::filesystem::path previous) noexcept
        : previous_(std::move(previous)), active_(true) {}

public:
    [[nodiscard]] static std::expected<scoped_working_directory, error> enter(
        const std::filesystem::path& directory);

    scoped_working_directory(scoped_working_directory&& other) noexcept
        : previous_(std::move(other.previous_)), active_(std::exchange(other.active_, false)) {}
    scoped_working_directory& operator=(scoped_working_directory&&) = delete;
    scoped_working_directory(const scoped_working_directory&) = delete;
    scoped_working_directory& operator=(const scoped_working_directory&) = delete;
    ~scoped_working_directory();

    [[nodiscard]] const std::filesystem::path& previous() const noexcept { return previous_; }
};

// A temporary file or directory removed on destruction unless released.
// Always holds an absolute path so cleanup works after chdir.
class temporary_path {
private:
    std::filesystem::path path_;

public:
    temporary_path() = default;
    explicit temporary_path(std::filesystem::path path);
    ~temporary_path() { remove(); }

    temporary_path(temporary_path&& other) noexcept : path_(std::exchange(other.path_, {})) {}
    temporary_path& operator=(temporary_path&& other) noexcept {
        if (this != &other) {
            remove();
            path_ = std::exchange(other.path_, {});
        }
        return *this;
    }
    temporary_path(const temporary_path&) = delete;
    temporary_path& operator=(const temporary_path&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool empty() const noexcept { return path_.empty(); }

    // Stop owning the path; it stays on disk
    std::filesystem::path release() noexcept { return std::exchange(path_, {}); }

    void remove() noexcept;
};

// mkdtemp-style directory "<parent>/<prefix>XXXXXX"
[[nodiscard]] std::expected<temporary_path, error> make_temporary_directory(
    const std::filesystem::path& parent, std::string_view prefix);

struct temporary_file {
    temporary_path path;
    file_descriptor descriptor;
};

// mkstemp-style file "<parent>/<prefix>XXXXXX", opened for writing
[[nodiscard]] std::expected<temporary_file, error> make_temporary_file(
    const std::filesystem::path& parent, std::string_view prefix);

} // namespace tierone::xtract
