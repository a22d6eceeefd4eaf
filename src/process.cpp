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

#include <tierone/xtract/process.hpp>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tierone::xtract {

namespace {

constexpr auto wait_slice = std::chrono::milliseconds{20};

std::string errno_message(const std::string_view what) {
    return std::string{what} + ": " + std::strerror(errno);
}

// Runs in the forked child: only async-signal-safe calls from here on
[[noreturn]] void exec_child(const std::vector<char*>& argv, const int stdin_fd, const int stdout_fd,
                             const int stderr_fd, const int report_fd) {
    if (stdin_fd >= 0 && ::dup2(stdin_fd, STDIN_FILENO) == -1) {
        const int err = errno;
        [[maybe_unused]] auto n = ::write(report_fd, &err, sizeof err);
        ::_exit(127);
    }
    if (stdout_fd >= 0 && ::dup2(stdout_fd, STDOUT_FILENO) == -1) {
        const int err = errno;
        [[maybe_unused]] auto n = ::write(report_fd, &err, sizeof err);
        ::_exit(127);
    }
    if (stderr_fd >= 0 && ::dup2(stderr_fd, STDERR_FILENO) == -1) {
        const int err = errno;
        [[maybe_unused]] auto n = ::write(report_fd, &err, sizeof err);
        ::_exit(127);
    }

    // Restore default dispositions the parent may have changed
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    ::signal(SIGPIPE, SIG_DFL);

    ::execvp(argv[0], argv.data());

    const int err = errno;
    [[maybe_unused]] auto n = ::write(report_fd, &err, sizeof err);
    ::_exit(127);
}

} // anonymous namespace

void file_descriptor::reset(const int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

auto file_descriptor::open(const std::filesystem::path &path, const int flags, const mode_t mode)
    -> std::expected<file_descriptor, error> {
    const int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    if (fd == -1) {
        return std::unexpected(error{error_code::io_error,
            "could not open " + path.string() + ": " + std::strerror(errno)});
    }
    return file_descriptor{fd};
}

auto make_pipe() -> std::expected<pipe_ends, error> {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
        return std::unexpected(error{error_code::io_error, errno_message("pipe creation failed")});
    }
    return pipe_ends{file_descriptor{fds[0]}, file_descriptor{fds[1]}};
}

std::string read_available(const int fd, bool* eof) {
    std::string result;
    if (eof) *eof = false;
    if (fd < 0) {
        if (eof) *eof = true;
        return result;
    }

    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            result.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            if (eof) *eof = true;
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: nothing more right now; anything else ends the stream
        if (errno != EAGAIN && errno != EWOULDBLOCK && eof) {
            *eof = true;
        }
        break;
    }
    return result;
}

void set_nonblocking(const int fd, const bool enabled) noexcept {
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags != -1) {
        ::fcntl(fd, F_SETFL, enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK));
    }
}

int decode_wait_status(const int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

// child_process implementation
child_process::child_process(const pid_t pid, std::string program, file_descriptor out, file_descriptor err)
    : pid_(pid), program_(std::move(program)), stdout_(std::move(out)), stderr_(std::move(err)) {}

child_process::child_process(child_process&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , program_(std::move(other.program_))
    , stdout_(std::move(other.stdout_))
    , stderr_(std::move(other.stderr_))
    , exit_status_(other.exit_status_) {}

child_process& child_process::operator=(child_process&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0 && !exit_status_) {
            kill();
            [[maybe_unused]] auto reaped = wait();
        }
        pid_ = std::exchange(other.pid_, -1);
        program_ = std::move(other.program_);
        stdout_ = std::move(other.stdout_);
        stderr_ = std::move(other.stderr_);
        exit_status_ = other.exit_status_;
    }
    return *this;
}

child_process::~child_process() {
    if (pid_ > 0 && !exit_status_) {
        kill();
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
    }
}

auto child_process::spawn(const std::vector<std::string> &argv, const stdio_setup &stdio)
    -> std::expected<child_process, error> {
    if (argv.empty()) {
        return std::unexpected(error{error_code::invalid_operation, "empty command"});
    }

    file_descriptor out_read, out_write, err_read, err_write, null_fd;

    int child_stdout = stdio.stdout_fd;
    if (child_stdout < 0 && stdio.stdout_mode != stream_mode::inherit) {
        if (stdio.stdout_mode == stream_mode::capture) {
            auto p = make_pipe();
            if (!p) return std::unexpected(p.error());
            out_read = std::move(p->read_end);
            out_write = std::move(p->write_end);
            child_stdout = out_write.get();
        } else {
            auto devnull = file_descriptor::open("/dev/null", O_WRONLY);
            if (!devnull) return std::unexpected(devnull.error());
            null_fd = std::move(*devnull);
            child_stdout = null_fd.get();
        }
    }

    int child_stderr = -1;
    if (stdio.stderr_mode == stream_mode::capture) {
        auto p = make_pipe();
        if (!p) return std::unexpected(p.error());
        err_read = std::move(p->read_end);
        err_write = std::move(p->write_end);
        child_stderr = err_write.get();
    } else if (stdio.stderr_mode == stream_mode::discard) {
        if (!null_fd) {
            auto devnull = file_descriptor::open("/dev/null", O_WRONLY);
            if (!devnull) return std::unexpected(devnull.error());
            null_fd = std::move(*devnull);
        }
        child_stderr = null_fd.get();
    }

    // exec failures are reported back through this close-on-exec pipe
    auto report = make_pipe();
    if (!report) return std::unexpected(report.error());

    std::vector<std::string> args_copy = argv;
    std::vector<char*> args;
    args.reserve(args_copy.size() + 1);
    for (auto& arg : args_copy) {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid == -1) {
        return std::unexpected(error{error_code::io_error, errno_message("fork failed")});
    }
    if (pid == 0) {
        exec_child(args, stdio.stdin_fd, child_stdout, child_stderr, report->write_end.get());
    }

    report->write_end.reset();
    out_write.reset();
    err_write.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(report->read_end.get(), &child_errno, sizeof child_errno);
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof child_errno)) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        if (child_errno == ENOENT || child_errno == EACCES || child_errno == ENOTDIR) {
            return std::unexpected(error{error_code::tool_unusable, "could not run " + argv.front()});
        }
        return std::unexpected(error{error_code::io_error,
            "could not run " + argv.front() + ": " + std::strerror(child_errno)});
    }

    if (out_read) set_nonblocking(out_read.get(), true);
    if (err_read) set_nonblocking(err_read.get(), true);

    return child_process{pid, argv.front(), std::move(out_read), std::move(err_read)};
}

auto child_process::try_wait() -> std::expected<std::optional<int>, error> {
    if (exit_status_) {
        return exit_status_;
    }
    int status = 0;
    const pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return std::nullopt;
    }
    if (result == -1) {
        if (errno == EINTR) {
            return std::nullopt;
        }
        return std::unexpected(error{error_code::io_error, errno_message("waitpid failed for " + program_)});
    }
    exit_status_ = decode_wait_status(status);
    return exit_status_;
}

auto child_process::wait_for(const std::chrono::milliseconds timeout) -> std::expected<std::optional<int>, error> {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto status = try_wait();
        if (!status || *status) {
            return status;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(wait_slice, deadline - now));
    }
}

auto child_process::wait() -> std::expected<int, error> {
    if (exit_status_) {
        return *exit_status_;
    }
    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1) {
        if (errno != EINTR) {
            return std::unexpected(error{error_code::io_error, errno_message("waitpid failed for " + program_)});
        }
    }
    exit_status_ = decode_wait_status(status);
    return *exit_status_;
}

void child_process::kill() noexcept {
    if (pid_ > 0 && !exit_status_) {
        ::kill(pid_, SIGKILL);
    }
}

auto capture_output(const std::vector<std::string> &argv, const int stdin_fd) -> std::expected<captured_output, error> {
    auto child = child_process::spawn(argv, stdio_setup{.stdin_fd = stdin_fd});
    if (!child) {
        return std::unexpected(child.error());
    }

    captured_output result;
    bool out_eof = false;
    bool err_eof = false;
    while (!out_eof || !err_eof) {
        std::array<pollfd, 2> fds{{
            {.fd = out_eof ? -1 : child->stdout_fd(), .events = POLLIN, .revents = 0},
            {.fd = err_eof ? -1 : child->stderr_fd(), .events = POLLIN, .revents = 0},
        }};
        if (::poll(fds.data(), fds.size(), -1) == -1 && errno != EINTR) {
            return std::unexpected(error{error_code::io_error, errno_message("poll failed")});
        }
        if (!out_eof) result.out += read_available(child->stdout_fd(), &out_eof);
        if (!err_eof) result.err += read_available(child->stderr_fd(), &err_eof);
    }

    auto status = child->wait();
    if (!status) {
        return std::unexpected(status.error());
    }
    result.status = *status;
    return result;
}

} // namespace tierone::xtract
