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
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace tierone::xtract {

// Owning wrapper around a POSIX file descriptor
class file_descriptor {
private:
    int fd_ = -1;

public:
    file_descriptor() = default;
    explicit file_descriptor(int fd) noexcept : fd_(fd) {}
    ~file_descriptor() { reset(); }

    file_descriptor(const file_descriptor&) = delete;
    file_descriptor& operator=(const file_descriptor&) = delete;

    file_descriptor(file_descriptor&& other) noexcept : fd_(other.release()) {}
    file_descriptor& operator=(file_descriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    // Open with O_CLOEXEC added so children never inherit it by accident
    [[nodiscard]] static std::expected<file_descriptor, error> open(
        const std::filesystem::path& path, int flags, mode_t mode = 0);

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return valid(); }

    int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept;
};

struct pipe_ends {
    file_descriptor read_end;
    file_descriptor write_end;
};

// Both ends are close-on-exec
[[nodiscard]] std::expected<pipe_ends, error> make_pipe();

// Toggle O_NONBLOCK on the open file description
void set_nonblocking(int fd, bool enabled) noexcept;

// Read whatever is available on a non-blocking descriptor without waiting.
// Sets eof when the writer has closed its end.
[[nodiscard]] std::string read_available(int fd, bool* eof = nullptr);

enum class stream_mode : uint8_t {
    inherit,
    capture,
    discard
};

struct stdio_setup {
    int stdin_fd = -1;                          // -1 inherits the parent's stdin
    int stdout_fd = -1;                         // used as-is when >= 0
    stream_mode stdout_mode = stream_mode::capture;  // applies when stdout_fd < 0
    stream_mode stderr_mode = stream_mode::capture;
};

// A spawned child process. The destructor kills and reaps a child that was
// never waited for, so no zombie outlives its owner.
class child_process {
private:
    pid_t pid_ = -1;
    std::string program_;
    file_descriptor stdout_;
    file_descriptor stderr_;
    std::optional<int> exit_status_;

    child_process(pid_t pid, std::string program, file_descriptor out, file_descriptor err);

public:
    // Fails with tool_unusable when the program cannot be executed
    [[nodiscard]] static std::expected<child_process, error> spawn(
        const std::vector<std::string>& argv, const stdio_setup& stdio);

    child_process(child_process&& other) noexcept;
    child_process& operator=(child_process&& other) noexcept;
    child_process(const child_process&) = delete;
    child_process& operator=(const child_process&) = delete;
    ~child_process();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] const std::string& program() const noexcept { return program_; }

    // Captured streams; invalid unless the matching mode was capture.
    // Both are non-blocking.
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_.get(); }
    [[nodiscard]] int stderr_fd() const noexcept { return stderr_.get(); }

    // Hand the captured stdout to the next stage of a chain
    [[nodiscard]] file_descriptor take_stdout() noexcept { return std::move(stdout_); }
    void close_stdout() noexcept { stdout_.reset(); }

    // Non-blocking: returns the exit status once the child has exited
    [[nodiscard]] std::expected<std::optional<int>, error> try_wait();

    // Polls until the child exits or the timeout elapses
    [[nodiscard]] std::expected<std::optional<int>, error> wait_for(std::chrono::milliseconds timeout);

    [[nodiscard]] std::expected<int, error> wait();

    [[nodiscard]] bool exited() const noexcept { return exit_status_.has_value(); }

    void kill() noexcept;
};

struct captured_output {
    int status = 0;
    std::string out;
    std::string err;
};

// Run a command to completion collecting stdout and stderr
[[nodiscard]] std::expected<captured_output, error> capture_output(
    const std::vector<std::string>& argv, int stdin_fd = -1);

// Decode a waitpid() status: exit code, or 128 + signal number
[[nodiscard]] int decode_wait_status(int status) noexcept;

} // namespace tierone::xtract
