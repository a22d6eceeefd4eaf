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

#include <tierone/xtract/cancellation.hpp>
#include <tierone/xtract/error.hpp>
#include <tierone/xtract/process.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tierone::xtract {

struct pipeline_stage {
    std::vector<std::string> command;
    std::string purpose = "extraction";

    // The command as it would be typed, for error messages
    [[nodiscard]] std::string display() const;
};

// Which stream of the waited-for tool may carry a password prompt
enum class prompt_stream : uint8_t {
    none,
    standard_error,
    standard_output
};

// Decides whether a non-zero exit status is an error even when the tool
// produced output. Tools without one treat every status as tolerable.
using fatal_predicate = bool (*)(int status);

struct run_settings {
    int stdin_fd = -1;                 // input of the first stage
    int stdout_fd = -1;                // output of the last stage; -1 discards it
    bool capture_stdout = false;       // collect the last stage's output instead
    prompt_stream watch = prompt_stream::none;
    bool refuse_prompts = false;       // kill the chain once a prompt shows up
    std::chrono::milliseconds poll_interval{1000};
    const cancellation_token* cancel = nullptr;
};

struct run_outcome {
    std::vector<int> exit_codes;       // one per stage, in order
    std::string stderr_text;
    std::string stdout_text;           // only with capture_stdout
    bool password_prompted = false;
};

// Source of text lines, consumed once
class line_source {
public:
    virtual ~line_source() = default;

    // Next line without its terminator; nullopt once the output is exhausted
    [[nodiscard]] virtual std::expected<std::optional<std::string>, error> read_line() = 0;
};

// A chain whose last stage is read line by line as it runs
class running_pipeline : public line_source {
private:
    std::vector<pipeline_stage> stages_;
    std::vector<child_process> processes_;
    std::vector<std::string> errors_;
    std::vector<bool> errors_closed_;
    file_descriptor output_;
    std::string buffer_;
    bool output_closed_ = false;
    std::vector<int> exit_codes_;

    [[nodiscard]] std::expected<void, error> fill();

public:
    running_pipeline(std::vector<pipeline_stage> stages, std::vector<child_process> processes);

    [[nodiscard]] std::expected<std::optional<std::string>, error> read_line() override;

    // Read the rest of the output, reap every stage and check the statuses
    [[nodiscard]] std::expected<void, error> finish(fatal_predicate is_fatal);

    [[nodiscard]] const std::vector<int>& exit_codes() const noexcept { return exit_codes_; }
    [[nodiscard]] std::string stderr_text() const;
};

// An ordered chain of external commands, each reading the previous one's
// standard output.
class pipeline {
private:
    std::vector<pipeline_stage> stages_;

public:
    void add(std::vector<std::string> command, std::string purpose = "extraction");
    void pop_back() { stages_.pop_back(); }

    [[nodiscard]] const std::vector<pipeline_stage>& stages() const noexcept { return stages_; }
    [[nodiscard]] bool empty() const noexcept { return stages_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return stages_.size(); }

    // Run the chain to completion. Each stage is waited for in order with a
    // poll_interval timeout; every timeout checks for cancellation and for
    // a password prompt on the watched stream.
    [[nodiscard]] std::expected<run_outcome, error> run(const run_settings& settings) const;

    // Start the chain with the last stage's output readable as lines
    [[nodiscard]] std::expected<running_pipeline, error> open(int stdin_fd) const;
};

// First stage with a status above zero fails the run when the status is
// fatal for the tool or when nothing was extracted.
[[nodiscard]] std::expected<void, error> check_success(std::span<const pipeline_stage> stages,
                                                       std::span<const int> exit_codes,
                                                       bool got_files,
                                                       fatal_predicate is_fatal = nullptr);

} // namespace tierone::xtract
