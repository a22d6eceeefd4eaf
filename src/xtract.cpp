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

#include <tierone/xtract/xtract.hpp>
#include <tierone/xtract/cancellation.hpp>
#include <tierone/xtract/log.hpp>
#include <tierone/xtract/run_context.hpp>
#include <iostream>

namespace tierone::xtract {

int run(const options &opts, const std::vector<std::string> &archives) {
    log::set_threshold(opts.log_level);

    cancellation_token cancel;
    prompter prompt{std::cin, std::cout};
    auto context = run_context::create(opts, prompt, cancel);
    if (!context) {
        log::error("{}", context.error().message());
        return 2;
    }

    install_signal_handlers(cancel);
    application app{*context};
    const int status = app.run(archives);
    restore_signal_handlers();
    return status;
}

} // namespace tierone::xtract
