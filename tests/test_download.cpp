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

#include <catch2/catch_test_macros.hpp>
#include <tierone/xtract/download.hpp>

using namespace tierone::xtract;

TEST_CASE("URL detection", "[unit][download]") {
    CHECK(is_url("http://example.com/project.tar.gz"));
    CHECK(is_url("https://example.com/project.tar.gz"));
    CHECK(is_url("ftp://mirror.example.org/pub/file.zip"));
    CHECK(is_url("HTTPS://EXAMPLE.COM/A.ZIP"));

    CHECK_FALSE(is_url("project.tar.gz"));
    CHECK_FALSE(is_url("/srv/http://odd/name.zip"));
    CHECK_FALSE(is_url("file:///tmp/project.tar.gz"));
    CHECK_FALSE(is_url("http:/"));
}

TEST_CASE("Download names", "[unit][download]") {
    CHECK(download_name("https://example.com/releases/project-1.0.tar.gz") == "project-1.0.tar.gz");
    CHECK(download_name("http://example.com/files/a.zip?token=abc") == "a.zip");
    CHECK(download_name("http://example.com/files/a.zip#section") == "a.zip");
    CHECK(download_name("ftp://mirror.example.org/pub/file.tar.xz") == "file.tar.xz");

    // Nothing after the host
    CHECK(download_name("http://example.com").empty());
    CHECK(download_name("http://example.com/").empty());
}

TEST_CASE("Fetching needs a file name", "[unit][download]") {
    const auto fetched = fetch("http://example.com/");
    REQUIRE_FALSE(fetched.has_value());
    CHECK(fetched.error().code() == error_code::invalid_operation);
}
