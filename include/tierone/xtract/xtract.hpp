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
#include <tierone/xtract/options.hpp>
#include <tierone/xtract/format.hpp>
#include <tierone/xtract/pipeline.hpp>
#include <tierone/xtract/extractor.hpp>
#include <tierone/xtract/content.hpp>
#include <tierone/xtract/placement.hpp>
#include <tierone/xtract/policy.hpp>
#include <tierone/xtract/application.hpp>
#include <string>
#include <vector>

namespace tierone::xtract {

// Main convenience API: handle the archives with prompts on the standard
// streams and SIGINT/SIGTERM routed to cancellation. Returns the exit status.
[[nodiscard]] int run(const options& opts, const std::vector<std::string>& archives);

} // namespace tierone::xtract
