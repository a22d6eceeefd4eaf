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
#include <expected>
#include <string>
#include <string_view>

namespace tierone::xtract {

// http://, https:// and ftp:// arguments, in any letter case
[[nodiscard]] bool is_url(std::string_view argument) noexcept;

// Last component of the URL's path, ignoring any query or fragment
[[nodiscard]] std::string download_name(std::string_view url);

// Fetch with `wget -c` into the current directory; returns the local name
[[nodiscard]] std::expected<std::string, error> fetch(std::string_view url);

} // namespace tierone::xtract
