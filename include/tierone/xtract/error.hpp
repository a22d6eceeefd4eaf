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

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace tierone::xtract {

enum class error_code {
    unknown_format,      // no candidate format could handle the file
    tool_unusable,       // an external tool could not be started
    extraction_failed,   // a pipeline stage exited with a failing status
    password_required,   // encrypted archive in non-interactive mode
    io_error,
    invalid_operation,
    cancelled            // interrupted by a signal
};

[[nodiscard]] constexpr std::string_view to_string(const error_code code) noexcept {
    switch (code) {
        case error_code::unknown_format:    return "unknown format";
        case error_code::tool_unusable:     return "tool unusable";
        case error_code::extraction_failed: return "extraction failed";
        case error_code::password_required: return "password required";
        case error_code::io_error:          return "I/O error";
        case error_code::invalid_operation: return "invalid operation";
        case error_code::cancelled:         return "cancelled";
    }
    return "unknown error";
}

class error {
public:
    error(const error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    error_code code_;
    std::string message_;
};

// Convert a filesystem error into an io_error with some context
[[nodiscard]] inline error io_error(std::string_view what, const std::error_code& ec) {
    return error{error_code::io_error, std::string{what} + ": " + ec.message()};
}

} // namespace tierone::xtract
