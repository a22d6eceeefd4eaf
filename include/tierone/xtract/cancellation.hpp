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
#include <atomic>
#include <expected>

namespace tierone::xtract {

// Set once when the run should stop; polled by the pipeline engine on every
// wait slice and by the driver between archives.
class cancellation_token {
private:
    std::atomic<int> signal_{0};

public:
    cancellation_token() = default;
    cancellation_token(const cancellation_token&) = delete;
    cancellation_token& operator=(const cancellation_token&) = delete;

    // Safe to call from a signal handler
    void request(int signal_number) noexcept {
        int expected = 0;
        signal_.compare_exchange_strong(expected, signal_number == 0 ? -1 : signal_number);
    }

    [[nodiscard]] bool requested() const noexcept { return signal_.load() != 0; }

    // Signal that triggered the request, 0 if none or requested directly
    [[nodiscard]] int signal_number() const noexcept {
        const int value = signal_.load();
        return value > 0 ? value : 0;
    }

    [[nodiscard]] std::expected<void, error> check() const {
        if (requested()) {
            return std::unexpected(error{error_code::cancelled, "interrupted"});
        }
        return {};
    }
};

// Route SIGINT and SIGTERM to the token. Each signal is acknowledged once;
// later deliveries of the same signal are ignored while cleanup runs.
void install_signal_handlers(cancellation_token& token);

// Put SIGINT and SIGTERM back to their default dispositions
void restore_signal_handlers() noexcept;

} // namespace tierone::xtract
