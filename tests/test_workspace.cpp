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
#include <catch2/matchers/catch_matchers_string.hpp>
#include <tierone/xtract/workspace.hpp>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <unistd.h>

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
        path_ = fs::canonical(fs::temp_directory_path()) / ("xtract_workspace_" + std::to_string(dis(gen)));
        fs::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }
};

} // anonymous namespace

TEST_CASE("Scoped working directory", "[unit][workspace]") {
    TempDirectory temp;
    const auto start = fs::current_path();

    SECTION("Returns on scope exit") {
        {
            auto inside = scoped_working_directory::enter(temp.path());
            REQUIRE(inside.has_value());
            CHECK(fs::current_path().string() == temp.path().string());
            CHECK(inside->previous().string() == start.string());
        }
        CHECK(fs::current_path().string() == start.string());
    }

    SECTION("A moved-from guard does nothing") {
        {
            auto inside = scoped_working_directory::enter(temp.path());
            REQUIRE(inside.has_value());
            auto moved = std::move(*inside);
            fs::create_directory(temp.path() / "deeper");
            {
                auto deeper = scoped_working_directory::enter("deeper");
                REQUIRE(deeper.has_value());
                CHECK(fs::current_path().string() == (temp.path() / "deeper").string());
            }
            CHECK(fs::current_path().string() == temp.path().string());
        }
        CHECK(fs::current_path().string() == start.string());
    }

    SECTION("Missing directory") {
        const auto inside = scoped_working_directory::enter(temp.path() / "missing");
        REQUIRE_FALSE(inside.has_value());
        CHECK(inside.error().code() == error_code::io_error);
        CHECK(fs::current_path().string() == start.string());
    }
}

TEST_CASE("Temporary paths", "[unit][workspace]") {
    TempDirectory temp;

    SECTION("Directories are removed with their contents") {
        fs::path created;
        {
            auto scratch = make_temporary_directory(temp.path(), ".xtract-");
            REQUIRE(scratch.has_value());
            created = scratch->path();
            CHECK(created.is_absolute());
            CHECK_THAT(created.filename().string(), Catch::Matchers::StartsWith(".xtract-"));
            std::ofstream{created / "file.txt"} << "data";
            fs::create_directory(created / "sub");
        }
        CHECK_FALSE(fs::exists(created));
    }

    SECTION("Released paths stay") {
        fs::path kept;
        {
            auto scratch = make_temporary_directory(temp.path(), "keep-");
            REQUIRE(scratch.has_value());
            kept = scratch->release();
            CHECK(scratch->empty());
        }
        CHECK(fs::is_directory(kept));
    }

    SECTION("Relative parents still give absolute paths") {
        auto inside = scoped_working_directory::enter(temp.path());
        REQUIRE(inside.has_value());

        auto scratch = make_temporary_directory(".", ".xtract-");
        REQUIRE(scratch.has_value());
        CHECK(scratch->path().is_absolute());
        CHECK(fs::is_directory(scratch->path()));
    }

    SECTION("Files come with an open descriptor") {
        fs::path created;
        {
            auto file = make_temporary_file(temp.path(), ".xtract-");
            REQUIRE(file.has_value());
            created = file->path.path();
            REQUIRE(file->descriptor.valid());
            CHECK(::write(file->descriptor.get(), "abc", 3) == 3);
            CHECK(fs::file_size(created) == 3);
        }
        CHECK_FALSE(fs::exists(created));
    }

    SECTION("Moving transfers ownership") {
        auto scratch = make_temporary_directory(temp.path(), "move-");
        REQUIRE(scratch.has_value());
        const auto created = scratch->path();

        temporary_path owner;
        owner = std::move(*scratch);
        CHECK(scratch->empty());
        CHECK(owner.path().string() == created.string());

        owner.remove();
        CHECK_FALSE(fs::exists(created));
        CHECK(owner.empty());
    }

    SECTION("Unwritable parent") {
        const auto scratch = make_temporary_directory(temp.path() / "missing", ".xtract-");
        REQUIRE_FALSE(scratch.has_value());
        CHECK(scratch.error().code() == error_code::io_error);
    }
}
