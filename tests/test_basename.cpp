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
#include <tierone/xtract/extractor.hpp>
#include <algorithm>

using namespace tierone::xtract;

TEST_CASE("Archive basenames", "[unit][basename]") {
    SECTION("Encoding and type suffixes are stripped") {
        CHECK(naming::archive_basename("project.tar.gz") == "project");
        CHECK(naming::archive_basename("project.tar") == "project");
        CHECK(naming::archive_basename("mixed.zip") == "mixed");
        CHECK(naming::archive_basename("project.tgz") == "project");
    }

    SECTION("Directories do not take part") {
        CHECK(naming::archive_basename("downloads/project.tar.bz2") == "project");
        CHECK(naming::archive_basename("/tmp/x/mixed.zip") == "mixed");
    }

    SECTION("Short unknown suffix is dropped") {
        CHECK(naming::archive_basename("data.bin") == "data");
        CHECK(naming::archive_basename("book.epub") == "book");
    }

    SECTION("Long unknown suffix is kept") {
        CHECK(naming::archive_basename("weekly.backup") == "weekly.backup");
    }

    SECTION("Only the last type suffix goes") {
        CHECK(naming::archive_basename("release-1.2.3.tar.xz") == "release-1.2.3");
        CHECK(naming::archive_basename("nested.tar.tar") == "nested.tar");
    }

    SECTION("No suffix") {
        CHECK(naming::archive_basename("archive") == "archive");
    }
}

TEST_CASE("Compressed stream basenames", "[unit][basename]") {
    CHECK(naming::compressed_basename("readme.txt.gz") == "readme.txt");
    CHECK(naming::compressed_basename("dump.sql.xz") == "dump.sql");
    CHECK(naming::compressed_basename("data.Z") == "data");
    CHECK(naming::compressed_basename("plain.txt") == "plain.txt");
}

TEST_CASE("RPM basenames drop the architecture", "[unit][basename]") {
    CHECK(naming::rpm_basename("foo-1.0-1.i386.rpm") == "foo-1.0-1");
    CHECK(naming::rpm_basename("foo-1.0-1.x86_64.rpm") == "foo-1.0-1");
    CHECK(naming::rpm_basename("foo-1.0-1.noarch.rpm") == "foo-1.0-1");
    CHECK(naming::rpm_basename("foo.rpm") == "foo");
    CHECK(naming::rpm_basename("foo") == "foo");
}

TEST_CASE("Debian basenames drop the architecture", "[unit][basename]") {
    CHECK(naming::deb_basename("foo_1.0-1_amd64.deb") == "foo_1.0-1");
    CHECK(naming::deb_basename("foo_1.0-1_all.deb") == "foo_1.0-1");
    CHECK(naming::deb_basename("pool/main/f/foo_2.3_i386.deb") == "foo_2.3");
    // The last piece is too long to be an architecture
    CHECK(naming::deb_basename("foo_1.0-1_somethinglong.deb") == "foo_1.0-1_somethinglong");
}

TEST_CASE("Other basename rules", "[unit][basename]") {
    CHECK(naming::gem_metadata_basename("rake-13.0.gem") == "rake-13.0.gem-metadata.txt");
    CHECK(naming::shield_basename("data1.cab") == "data1");
    CHECK(naming::shield_basename("data1.hdr") == "data1");
}

TEST_CASE("Variant selection by kind", "[unit][basename]") {
    SECTION("Zip falls back to 7z") {
        const auto variants = variants_for(archive_kind::zip, false);
        REQUIRE(variants.size() == 2);
        CHECK(variants[0] == variant::zip);
        CHECK(variants[1] == variant::seven_zip);
    }

    SECTION("RAR falls back to unar") {
        const auto variants = variants_for(archive_kind::rar, false);
        REQUIRE(variants.size() == 2);
        CHECK(variants[1] == variant::unarchiver);
    }

    SECTION("Metadata mode swaps package variants only") {
        CHECK(variants_for(archive_kind::deb, true)[0] == variant::deb_metadata);
        CHECK(variants_for(archive_kind::gem, true)[0] == variant::gem_metadata);
        CHECK(variants_for(archive_kind::tar, true)[0] == variant::tar);
        CHECK(variants_for(archive_kind::deb, false)[0] == variant::deb);
    }

    SECTION("Disk images and installers go to 7z") {
        CHECK(variants_for(archive_kind::msi, false)[0] == variant::seven_zip);
        CHECK(variants_for(archive_kind::dmg, false)[0] == variant::seven_zip);
    }
}

TEST_CASE("Variant traits", "[unit][basename]") {
    SECTION("Packages always extract into their own directory") {
        CHECK(traits_of(variant::rpm).always_bomb);
        CHECK(traits_of(variant::deb).always_bomb);
        CHECK(traits_of(variant::gem).always_bomb);
        CHECK_FALSE(traits_of(variant::tar).always_bomb);
    }

    SECTION("Single streams have no extraction tool of their own") {
        CHECK(traits_of(variant::compression).single_stream);
        CHECK(traits_of(variant::gem_metadata).single_stream);
        const bool has_tool = traits_of(variant::compression).extract_command != nullptr;
        CHECK_FALSE(has_tool);
    }

    SECTION("Tools that read the file themselves") {
        CHECK(traits_of(variant::zip).discipline == input_discipline::no_pipe);
        CHECK(traits_of(variant::seven_zip).discipline == input_discipline::no_pipe);
        CHECK(traits_of(variant::tar).discipline == input_discipline::piped);
    }

    SECTION("Password prompts are watched where tools ask") {
        CHECK(traits_of(variant::zip).prompt == prompt_stream::standard_error);
        CHECK(traits_of(variant::seven_zip).prompt == prompt_stream::standard_output);
        CHECK(traits_of(variant::tar).prompt == prompt_stream::none);
    }

    SECTION("Zip tolerates warnings") {
        const auto is_fatal = traits_of(variant::zip).is_fatal;
        REQUIRE(static_cast<bool>(is_fatal));
        CHECK_FALSE(is_fatal(1));
        CHECK(is_fatal(2));
    }

    SECTION("Every variant has a basename rule") {
        for (const auto v : {variant::tar, variant::cpio, variant::rpm, variant::deb, variant::deb_metadata,
                             variant::gem, variant::gem_metadata, variant::compression, variant::zip,
                             variant::lzh, variant::seven_zip, variant::zstd, variant::brotli, variant::cab,
                             variant::shield, variant::rar, variant::unarchiver, variant::arj}) {
            INFO(to_string(v));
            CHECK(traits_of(v).id == v);
            const bool has_rule = traits_of(v).basename != nullptr;
            CHECK(has_rule);
        }
    }
}

TEST_CASE("Decoder commands", "[unit][basename]") {
    CHECK(decoder_command(encoding::gzip).value() == std::vector<std::string>{"zcat"});
    CHECK(decoder_command(encoding::bzip2).value() == std::vector<std::string>{"bzcat"});
    CHECK(decoder_command(encoding::xz).value() == std::vector<std::string>{"xzcat"});
    CHECK(decoder_command(encoding::zstd).value() == std::vector<std::string>{"zstd", "-d"});
}
