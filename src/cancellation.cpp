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

#include <tierone/xtract/cancellation.hpp>
#include <csignal>

#include <unistd.h>

namespace tierone::xtract {

namespace {

std::atomic<cancellation_token*> signal_target{nullptr};

extern "C" void handle_termination(const int signal_number) {
    // Acknowledge once; a repeated ^C must not interrupt the cleanup
    std::signal(signal_number, SIG_IGN);
    if (auto* token = signal_target.load()) {
        token->request(signal_number);
    }
    constexpr char newline = '\n';
    [[maybe_unused]] auto n = ::write(STDOUT_FILENO, &newline, 1);
}

void install(const int signal_number) {
    struct sigaction action{};
    action.sa_handler = handle_termination;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: a blocked prompt read returns so the token is seen
    action.sa_flags = 0;
    ::sigaction(signal_number, &action, nullptr);
}

} // anonymous namespace

void install_signal_handlers(cancellation_token& token) {
    signal_target.store(&token);
    install(SIGINT);
    install(SIGTERM);
    std::signal(SIGPIPE, SIG_DFL);
}

void restore_signal_handlers() noexcept {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    signal_target.store(nullptr);
}

} // namespace tierone::xtract
