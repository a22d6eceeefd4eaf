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

#include <tierone/xtract/pipeline.hpp>
#include <tierone/xtract/log.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <print>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace tierone::xtract {

namespace {

constexpr auto drain_slice = std::chrono::milliseconds{20};

// Snapshot of the controlling terminal, put back after a prompting tool
// is killed with echo turned off.
class terminal_state {
private:
    termios saved_{};
    bool valid_ = false;

public:
    terminal_state() noexcept {
        valid_ = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &saved_) == 0;
    }

    void restore() const noexcept {
        if (valid_) {
            ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
        }
    }
};

std::string join_command(const std::vector<std::string>& command) {
    std::string result;
    for (const auto& arg : command) {
        if (!result.empty()) result += ' ';
        result += arg;
    }
    return result;
}

// Spawn every stage, wiring each stdout into the next stdin
std::expected<std::vector<child_process>, error> spawn_chain(const std::vector<pipeline_stage>& stages,
                                                             const int stdin_fd,
                                                             const int stdout_fd,
                                                             const stream_mode last_stdout) {
    std::vector<child_process> children;
    children.reserve(stages.size());
    file_descriptor previous_output;

    for (size_t i = 0; i < stages.size(); ++i) {
        const bool last = i + 1 == stages.size();
        stdio_setup stdio{
            .stdin_fd = i == 0 ? stdin_fd : previous_output.get(),
            .stdout_fd = last ? stdout_fd : -1,
            .stdout_mode = last ? last_stdout : stream_mode::capture,
            .stderr_mode = stream_mode::capture,
        };

        auto child = child_process::spawn(stages[i].command, stdio);
        if (!child) {
            // Already started stages are killed and reaped by their destructors
            return std::unexpected(child.error());
        }
        previous_output.reset();
        if (!last) {
            // The next stage reads this end itself and expects blocking reads
            previous_output = child->take_stdout();
            set_nonblocking(previous_output.get(), false);
        }
        log::debug("started {} (pid {})", stages[i].display(), child->pid());
        children.push_back(std::move(*child));
    }
    return children;
}

// Output gathered from a running chain
struct chain_output {
    std::vector<std::string> errors;
    std::vector<bool> errors_closed;
    std::string stdout_text;
    bool stdout_closed = false;
    std::string fresh;          // unseen text from the watched stream

    explicit chain_output(const size_t stages)
        : errors(stages), errors_closed(stages, false) {}
};

// Wait up to timeout for output and read whatever arrived
void drain(std::vector<child_process>& children, chain_output& output, const size_t watched,
           const prompt_stream watch, const std::chrono::milliseconds timeout) {
    std::vector<pollfd> fds;
    for (size_t i = 0; i < children.size(); ++i) {
        if (!output.errors_closed[i] && children[i].stderr_fd() >= 0) {
            fds.push_back({.fd = children[i].stderr_fd(), .events = POLLIN, .revents = 0});
        }
    }
    const int final_stdout = children.back().stdout_fd();
    if (!output.stdout_closed && final_stdout >= 0) {
        fds.push_back({.fd = final_stdout, .events = POLLIN, .revents = 0});
    }

    if (fds.empty()) {
        std::this_thread::sleep_for(timeout);
        return;
    }
    if (::poll(fds.data(), fds.size(), static_cast<int>(timeout.count())) <= 0) {
        return;
    }

    for (size_t i = 0; i < children.size(); ++i) {
        if (output.errors_closed[i] || children[i].stderr_fd() < 0) continue;
        bool eof = false;
        auto text = read_available(children[i].stderr_fd(), &eof);
        if (watch == prompt_stream::standard_error && i == watched) {
            output.fresh += text;
        }
        output.errors[i] += text;
        output.errors_closed[i] = eof;
    }
    if (!output.stdout_closed && final_stdout >= 0) {
        bool eof = false;
        auto text = read_available(final_stdout, &eof);
        if (watch == prompt_stream::standard_output) {
            output.fresh += text;
        }
        output.stdout_text += text;
        output.stdout_closed = eof;
    }
}

std::string last_line(std::string_view text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    const auto start = text.find_last_of('\n');
    return std::string{start == std::string_view::npos ? text : text.substr(start + 1)};
}

void kill_all(std::vector<child_process>& children) noexcept {
    for (auto& child : children) {
        child.kill();
    }
    for (auto& child : children) {
        [[maybe_unused]] auto status = child.wait();
    }
}

} // anonymous namespace

std::string pipeline_stage::display() const {
    return join_command(command);
}

void pipeline::add(std::vector<std::string> command, std::string purpose) {
    stages_.push_back({std::move(command), std::move(purpose)});
}

auto pipeline::run(const run_settings &settings) const -> std::expected<run_outcome, error> {
    run_outcome outcome;
    if (stages_.empty()) {
        return outcome;
    }

    const terminal_state terminal;
    const stream_mode last_stdout = settings.capture_stdout ? stream_mode::capture : stream_mode::discard;
    auto children = spawn_chain(stages_, settings.stdin_fd, settings.stdout_fd, last_stdout);
    if (!children) {
        return std::unexpected(children.error());
    }

    chain_output output{children->size()};

    for (size_t i = 0; i < children->size(); ++i) {
        auto& child = (*children)[i];
        auto deadline = std::chrono::steady_clock::now() + settings.poll_interval;

        while (true) {
            auto status = child.try_wait();
            if (!status) {
                kill_all(*children);
                return std::unexpected(status.error());
            }
            if (*status) {
                outcome.exit_codes.push_back(**status);
                break;
            }

            if (settings.cancel && settings.cancel->requested()) {
                kill_all(*children);
                terminal.restore();
                return std::unexpected(error{error_code::cancelled, "interrupted"});
            }

            const auto now = std::chrono::steady_clock::now();
            if (now < deadline) {
                drain(*children, output, i, settings.watch,
                      std::min(drain_slice, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)));
                continue;
            }

            // Timed out waiting: the tool may be sitting at a prompt
            deadline = now + settings.poll_interval;
            if (settings.watch != prompt_stream::none && !output.fresh.empty()) {
                auto line = last_line(output.fresh);
                output.fresh.clear();
                if (line.find("password") != std::string::npos) {
                    outcome.password_prompted = true;
                    if (!settings.refuse_prompts) {
                        std::print(stdout, "\n{}", line);
                        std::fflush(stdout);
                    }
                }
            }
            if (outcome.password_prompted && settings.refuse_prompts) {
                log::debug("{} is waiting for a password; stopping it", child.program());
                kill_all(*children);
                terminal.restore();
                return std::unexpected(error{error_code::password_required,
                    "archive is encrypted and no password was supplied"});
            }
        }
    }

    // Everything has exited: what is left in the pipes is complete
    drain(*children, output, children->size(), prompt_stream::none, std::chrono::milliseconds{0});
    for (size_t i = 0; i < children->size(); ++i) {
        if (!output.errors_closed[i] && (*children)[i].stderr_fd() >= 0) {
            output.errors[i] += read_available((*children)[i].stderr_fd());
        }
    }
    if (!output.stdout_closed) {
        output.stdout_text += read_available(children->back().stdout_fd());
    }

    for (const auto& text : output.errors) {
        outcome.stderr_text += text;
    }
    outcome.stdout_text = std::move(output.stdout_text);
    return outcome;
}

auto pipeline::open(const int stdin_fd) const -> std::expected<running_pipeline, error> {
    if (stages_.empty()) {
        return std::unexpected(error{error_code::invalid_operation, "no commands to run"});
    }
    auto children = spawn_chain(stages_, stdin_fd, -1, stream_mode::capture);
    if (!children) {
        return std::unexpected(children.error());
    }
    return running_pipeline{stages_, std::move(*children)};
}

// running_pipeline implementation
running_pipeline::running_pipeline(std::vector<pipeline_stage> stages, std::vector<child_process> processes)
    : stages_(std::move(stages))
    , processes_(std::move(processes))
    , errors_(processes_.size())
    , errors_closed_(processes_.size(), false)
    , output_(processes_.back().take_stdout()) {}

auto running_pipeline::fill() -> std::expected<void, error> {
    std::vector<pollfd> fds{{.fd = output_.get(), .events = POLLIN, .revents = 0}};
    for (size_t i = 0; i < processes_.size(); ++i) {
        if (!errors_closed_[i] && processes_[i].stderr_fd() >= 0) {
            fds.push_back({.fd = processes_[i].stderr_fd(), .events = POLLIN, .revents = 0});
        }
    }
    if (::poll(fds.data(), fds.size(), -1) == -1 && errno != EINTR) {
        return std::unexpected(error{error_code::io_error,
            std::string{"poll failed: "} + std::strerror(errno)});
    }

    bool eof = false;
    buffer_ += read_available(output_.get(), &eof);
    output_closed_ = eof;
    for (size_t i = 0; i < processes_.size(); ++i) {
        if (errors_closed_[i] || processes_[i].stderr_fd() < 0) continue;
        bool closed = false;
        errors_[i] += read_available(processes_[i].stderr_fd(), &closed);
        errors_closed_[i] = closed;
    }
    return {};
}

auto running_pipeline::read_line() -> std::expected<std::optional<std::string>, error> {
    while (true) {
        if (const auto newline = buffer_.find('\n'); newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        if (output_closed_) {
            if (buffer_.empty()) {
                return std::nullopt;
            }
            return std::exchange(buffer_, {});
        }
        if (auto filled = fill(); !filled) {
            return std::unexpected(filled.error());
        }
    }
}

auto running_pipeline::finish(const fatal_predicate is_fatal) -> std::expected<void, error> {
    while (!output_closed_) {
        if (auto filled = fill(); !filled) {
            return std::unexpected(filled.error());
        }
    }
    buffer_.clear();

    exit_codes_.clear();
    for (size_t i = 0; i < processes_.size(); ++i) {
        auto status = processes_[i].wait();
        if (!status) {
            return std::unexpected(status.error());
        }
        exit_codes_.push_back(*status);
        if (!errors_closed_[i] && processes_[i].stderr_fd() >= 0) {
            errors_[i] += read_available(processes_[i].stderr_fd());
        }
    }
    return check_success(stages_, exit_codes_, false, is_fatal);
}

std::string running_pipeline::stderr_text() const {
    std::string result;
    for (const auto& text : errors_) {
        result += text;
    }
    return result;
}

auto check_success(const std::span<const pipeline_stage> stages, const std::span<const int> exit_codes,
                   const bool got_files, const fatal_predicate is_fatal) -> std::expected<void, error> {
    const auto bad = std::ranges::find_if(exit_codes, [](const int code) { return code > 0; });
    if (bad == exit_codes.end()) {
        return {};
    }
    const int code = *bad;
    if (got_files && !(is_fatal && is_fatal(code))) {
        return {};
    }
    const auto index = static_cast<size_t>(bad - exit_codes.begin());
    const auto& stage = stages[index];
    return std::unexpected(error{error_code::extraction_failed,
        std::format("{} error: '{}' returned status code {}", stage.purpose, stage.display(), code)});
}

} // namespace tierone::xtract
