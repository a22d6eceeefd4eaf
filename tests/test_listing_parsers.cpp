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
#include <tierone/xtract/listing.hpp>
#include <string>
#include <vector>

using namespace tierone::xtract;

namespace {

// Lines served from memory in place of a running lister
class scripted_lines : public line_source {
    std::vector<std::string> lines_;
    size_t index_ = 0;
public:
    explicit scripted_lines(std::vector<std::string> lines) : lines_(std::move(lines)) {}

    std::expected<std::optional<std::string>, error> read_line() override {
        if (index_ >= lines_.size()) {
            return std::nullopt;
        }
        return lines_[index_++];
    }
};

std::vector<std::string> parse_all(listing_parser parser, std::vector<std::string> lines) {
    scripted_lines source{std::move(lines)};
    listing_state state;
    std::vector<std::string> names;
    while (true) {
        auto name = parser(source, state);
        REQUIRE(name.has_value());
        if (!*name) {
            break;
        }
        names.push_back(std::move(**name));
    }
    return names;
}

} // anonymous namespace

TEST_CASE("Plain listings pass lines through", "[unit][listing]") {
    const auto names = parse_all(parsers::plain, {"project/", "project/README", "project/src/main.c"});
    CHECK(names == std::vector<std::string>{"project/", "project/README", "project/src/main.c"});

    CHECK(parse_all(parsers::plain, {}).empty());
}

TEST_CASE("LHA listings", "[unit][listing]") {
    SECTION("Border line position") {
        CHECK(parsers::border_column("---------- --------") == 11);
        CHECK(parsers::border_column("----- ----- -----") == 12);
        CHECK_FALSE(parsers::border_column("----------").has_value());
        CHECK_FALSE(parsers::border_column(" PERMISSION  NAME").has_value());
    }

    SECTION("Names between the borders") {
        const auto names = parse_all(parsers::lzh, {
            " PERMISSION NAME",
            "---------- --------",
            "[generic]  a.txt",
            "[generic]  dir/b.txt",
            "---------- --------",
            " Total     2 files",
        });
        CHECK(names == std::vector<std::string>{"a.txt", "dir/b.txt"});
    }

    SECTION("No border means no names") {
        CHECK(parse_all(parsers::lzh, {"lha: not an archive"}).empty());
    }
}

TEST_CASE("7z listings", "[unit][listing]") {
    const auto names = parse_all(parsers::seven_zip, {
        "2024-01-01 12:00:00 ....A           12           20  a.txt",
        "2024-01-01 12:00:00 D....            0            0  docs",
        "unparsable",
    });
    CHECK(names == std::vector<std::string>{"a.txt", "docs"});
}

TEST_CASE("zstd listings", "[unit][listing]") {
    const auto names = parse_all(parsers::zstd, {
        "Frames  Skips  Compressed  Uncompressed  Ratio  Check  Filename",
        "------  -----  ----------  ------------  -----  -----  --------",
        "     1      0      1.2 KiB      4.0 KiB  3.333  XXH64  logs.zst",
        "------  -----  ----------  ------------  -----  -----  --------",
        "     1      0      1.2 KiB      4.0 KiB  3.333  XXH64  ignored",
    });
    REQUIRE(names.size() == 1);
    CHECK(names[0] == "logs.zst");
}

TEST_CASE("Cabinet listings", "[unit][listing]") {
    const auto names = parse_all(parsers::cab, {
        "Viewing cabinet: data.cab",
        " File size | Date       Time     | Name",
        "-----------+---------------------+-------------",
        "     12345 | 01.01.2024 12:00:00 | setup.exe",
        "       678 | 01.01.2024 12:00:00 | docs\\readme.txt",
        "",
        "All done, no errors.",
    });
    CHECK(names == std::vector<std::string>{"setup.exe", "docs\\readme.txt"});
}

TEST_CASE("InstallShield listings", "[unit][listing]") {
    const auto names = parse_all(parsers::shield, {
        "Cabinet: data1.cab",
        "     1234  Program Files/app.exe",
        "      567  Program Files/app.dll",
        "  --------  -------",
        "     1801  ignored",
    });
    CHECK(names == std::vector<std::string>{"Program Files/app.exe", "Program Files/app.dll"});
}

TEST_CASE("RAR listings", "[unit][listing]") {
    const auto names = parse_all(parsers::rar, {
        "UNRAR 5.00 freeware",
        "Archive: files.rar",
        "-------------------------------------------------------------------------------",
        " a.txt",
        "             12       12 100% 01-01-24 12:00 -rw-r--r-- 1234ABCD m3b 2.9",
        " dir/b.txt",
        "             34       34 100% 01-01-24 12:00 -rw-r--r-- 5678ABCD m3b 2.9",
        "-------------------------------------------------------------------------------",
        "    2           46       46 100%",
    });
    CHECK(names == std::vector<std::string>{"a.txt", "dir/b.txt"});
}

TEST_CASE("lsar listings", "[unit][listing]") {
    const auto names = parse_all(parsers::unarchiver, {
        "files.rar: RAR",
        "a.txt",
        "dir/b.txt  (4 B)",
    });
    CHECK(names == std::vector<std::string>{"a.txt", "dir/b.txt"});
}

TEST_CASE("ARJ listings", "[unit][listing]") {
    const auto names = parse_all(parsers::arj, {
        "ARJ32 v 3.10, Copyright (c) 1998-2004, ARJ Software Russia.",
        "Processing archive: files.arj",
        "Rev/Host OS    Original Compressed Ratio DateTime modified Attributes/GUA BPMGS",
        "001) a.txt",
        "  11 UNIX            12         12 1.000 24-01-01 12:00:00 -rw-r--r-- ---  +1",
        "002) dir/b.txt",
    });
    CHECK(names == std::vector<std::string>{"a.txt", "dir/b.txt"});
}

TEST_CASE("Member listing without a lister", "[unit][listing]") {
    member_listing listing{std::vector<std::string>{"readme.txt"}};

    std::vector<std::string> names;
    for (const auto& name : listing) {
        names.push_back(name);
    }
    CHECK(names == std::vector<std::string>{"readme.txt"});

    auto after = listing.next();
    REQUIRE(after.has_value());
    CHECK_FALSE(after->has_value());
    CHECK(listing.stderr_text().empty());
}
