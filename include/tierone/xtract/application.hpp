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
#include <tierone/xtract/extractor.hpp>
#include <tierone/xtract/run_context.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace tierone::xtract {

// Drives a run: archives are queued per directory, and archives found
// inside an extraction are queued under the directory they landed in.
// The most recently queued directory is handled first.
class application {
private:
    run_context& context_;
    std::vector<std::pair<std::filesystem::path, std::vector<std::string>>> queue_;
    std::vector<std::string> successes_;
    std::vector<std::string> failures_;
    bool show_names_ = false;
    bool listed_before_ = false;

    void enqueue(const std::filesystem::path& directory, std::string name);

    [[nodiscard]] bool handle(const std::filesystem::path& directory, const std::string& name);

    // Walk the format candidates until one variant succeeds
    [[nodiscard]] std::expected<std::filesystem::path, error> try_extractors(
        const std::filesystem::path& directory, const std::string& filename);

    [[nodiscard]] std::expected<std::filesystem::path, error> extract_archive(
        const std::filesystem::path& directory, const std::string& filename, extractor& ex);

    [[nodiscard]] std::expected<void, error> list_archive(const std::string& filename, extractor& ex);

    void show_stderr(const std::string& filename, const extractor& ex) const;
    void show_extraction(const std::string& filename, const extractor& ex,
                         const std::filesystem::path& target) const;
    [[nodiscard]] std::expected<void, error> recurse(const std::filesystem::path& directory,
                                                     const std::string& filename, const extractor& ex,
                                                     const std::filesystem::path& target);

public:
    explicit application(run_context& context) noexcept : context_(context) {}

    // Handle every archive; 0 when all succeeded, 1 otherwise
    [[nodiscard]] int run(const std::vector<std::string>& archives);

    [[nodiscard]] const std::vector<std::string>& successes() const noexcept { return successes_; }
    [[nodiscard]] const std::vector<std::string>& failures() const noexcept { return failures_; }
};

// Problem with an argument that rules out trying any extractor
[[nodiscard]] std::expected<void, error> check_file(const std::filesystem::path& filename);

} // namespace tierone::xtract
