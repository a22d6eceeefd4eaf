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
#include <tierone/xtract/content.hpp>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

using namespace tierone::xtract;
namespace fs = std::filesystem;

namespace {

class TempDirectory {
    fs::path path_;
public:
    TempDirectory() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(100000, 999999);
        path_ = fs::temp_directory_path() / ("xtract_content_" + std::to_string(dis(gen)));
        fs::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }
};

void write_file(const fs::path& path, const std::string& content = "data\n") {
    fs::create_directories(path.parent_path());
    std::ofstream{path} << content;
}

} // anonymous namespace

TEST_CASE("Content classification", "[unit][content]") {
    TempDirectory temp;

    SECTION("Nothing extracted") {
        const auto found = classify_contents({}, "project", temp.path());
        CHECK(found.type == content_type::empty);
    }

    SECTION("Single directory named after the archive") {
        fs::create_directory(temp.path() / "project");
        const std::vector<std::string> contents{"project"};
        const auto found = classify_contents(contents, "project", temp.path());
        CHECK(found.type == content_type::matching_directory);
        CHECK(found.content_name == "project/");
        CHECK(found.included_root.string() == "project/");
    }

    SECTION("Single file named after the archive also matches") {
        write_file(temp.path() / "notes");
        const std::vector<std::string> contents{"notes"};
        const auto found = classify_contents(contents, "notes", temp.path());
        CHECK(found.type == content_type::matching_directory);
        CHECK(found.content_name == "notes");
        CHECK(found.included_root.string() == "./");
    }

    SECTION("Single directory with another name") {
        fs::create_directory(temp.path() / "src");
        const std::vector<std::string> contents{"src"};
        const auto found = classify_contents(contents, "project", temp.path());
        CHECK(found.type == content_type::one_entry_directory);
        CHECK(found.content_name == "src/");
        CHECK(found.included_root.string() == "src/");
    }

    SECTION("Single file with another name") {
        write_file(temp.path() / "README");
        const std::vector<std::string> contents{"README"};
        const auto found = classify_contents(contents, "project", temp.path());
        CHECK(found.type == content_type::one_entry_file);
        CHECK(found.content_name == "README");
    }

    SECTION("Two top-level files are a bomb") {
        write_file(temp.path() / "a.txt");
        write_file(temp.path() / "b.txt");
        const std::vector<std::string> contents{"a.txt", "b.txt"};
        const auto found = classify_contents(contents, "mixed", temp.path());
        CHECK(found.type == content_type::bomb);
        CHECK(found.content_name.empty());
    }
}

TEST_CASE("Content type names", "[unit][content]") {
    CHECK(to_string(content_type::one_entry_file) == "file");
    CHECK(to_string(content_type::one_entry_directory) == "directory");
    CHECK(is_one_entry_unknown(content_type::one_entry_file));
    CHECK(is_one_entry_unknown(content_type::one_entry_directory));
    CHECK_FALSE(is_one_entry_unknown(content_type::one_entry_known));
    CHECK_FALSE(is_one_entry_unknown(content_type::matching_directory));
}

TEST_CASE("Directory listing", "[unit][content]") {
    TempDirectory temp;
    write_file(temp.path() / "zeta");
    write_file(temp.path() / "alpha");
    fs::create_directory(temp.path() / "middle");

    const auto names = list_directory(temp.path());
    REQUIRE(names.has_value());
    CHECK(*names == std::vector<std::string>{"alpha", "middle", "zeta"});

    const auto missing = list_directory(temp.path() / "missing");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == error_code::io_error);
}

TEST_CASE("Included archive scan", "[unit][content]") {
    TempDirectory temp;

    SECTION("Counts files and finds archives at any depth") {
        write_file(temp.path() / "README");
        write_file(temp.path() / "inner.zip");
        write_file(temp.path() / "lib" / "bundle.tar.gz");
        write_file(temp.path() / "lib" / "code.c");
        fs::create_directories(temp.path() / "empty");

        const auto scan = scan_included_archives(temp.path());
        REQUIRE(scan.has_value());
        CHECK(scan->file_count == 4);
        std::vector<std::string> archives;
        for (const auto& archive : scan->archives) {
            archives.push_back(archive.string());
        }
        CHECK(archives == std::vector<std::string>{"inner.zip", "lib/bundle.tar.gz"});
    }

    SECTION("One archive among many files") {
        write_file(temp.path() / "inner.zip");
        for (int i = 0; i < 50; ++i) {
            write_file(temp.path() / ("file" + std::to_string(i) + ".txt"));
        }
        const auto scan = scan_included_archives(temp.path());
        REQUIRE(scan.has_value());
        CHECK(scan->file_count == 51);
        CHECK(scan->archives.size() == 1);
    }

    SECTION("Nothing to find") {
        const auto scan = scan_included_archives(temp.path());
        REQUIRE(scan.has_value());
        CHECK(scan->file_count == 0);
        CHECK(scan->archives.empty());
    }

    SECTION("Unreadable directory does not stop the scan") {
        write_file(temp.path() / "outer.tar");
        write_file(temp.path() / "locked" / "hidden.txt");
        fs::permissions(temp.path() / "locked", fs::perms::none);

        const auto scan = scan_included_archives(temp.path());
        fs::permissions(temp.path() / "locked", fs::perms::owner_all);

        REQUIRE(scan.has_value());
        // root can still read the locked directory
        CHECK(scan->file_count >= 1);
        REQUIRE(scan->archives.size() == 1);
        CHECK(scan->archives[0].string() == "outer.tar");
    }
}
