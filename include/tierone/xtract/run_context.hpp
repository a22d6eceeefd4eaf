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
#include <tierone/xtract/options.hpp>
#include <tierone/xtract/policy.hpp>
#include <expected>
#include <utility>

namespace tierone::xtract {

// Per-run state handed down to every archive: the settings, the sticky
// answers given so far, where to ask, and whether to stop.
struct run_context {
    options opts;
    one_entry_policy one_entry;
    recursion_policy recursion;
    prompter& prompt;
    cancellation_token& cancel;

    [[nodiscard]] static std::expected<run_context, error> create(options opts, prompter& prompt,
                                                                  cancellation_token& cancel) {
        auto one_entry = one_entry_policy::create(opts);
        if (!one_entry) {
            return std::unexpected(one_entry.error());
        }
        recursion_policy recursion{opts};
        return run_context{std::move(opts), *one_entry, recursion, prompt, cancel};
    }
};

} // namespace tierone::xtract
