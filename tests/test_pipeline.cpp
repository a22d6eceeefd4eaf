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
#include <tierone/xtract/cancellation.hpp>
#include <tierone/xtract/pipeline.hpp>
#include <tierone/xtract/process.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include <csignal>
#include <fcntl.h>

using namespace tierone::xtract;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
namespace fs = std::filesystem;

namespace {

class TempFile {
    fs::path path_;
public:
    explicit TempFile(const std::string& content) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(100000, 999999);
        path_ = fs::temp_directory_path() / ("xtract_pipeline_" + std::to_string(dis(gen)));
        std::ofstream{path_, std::ios::binary} << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const fs::path& path() const { return path_; }
};

run_settings quick_settings() {
    run_settings settings;
    settings.poll_interval = 100ms;
    return settings;
}

bool fatal_above_one(const int status) {
    return status > 1;
}

} // anonymous namespace

TEST_CASE("Running a single stage", "[unit][pipeline]") {
    SECTION("Captures the final output") {
        pipeline stages;
        stages.add({"sh", "-c", "echo hello"});
        auto settings = quick_settings();
        settings.capture_stdout = true;

        const auto outcome = stages.run(settings);
        REQUIRE(outcome.has_value());
        CHECK(outcome->exit_codes == std::vector<int>{0});
        CHECK(outcome->stdout_text == "hello\n");
        CHECK(outcome->stderr_text.empty());
        CHECK_FALSE(outcome->password_prompted);
    }

    SECTION("Collects standard error and the exit status") {
        pipeline stages;
        stages.add({"sh", "-c", "echo oops >&2; exit 3"});

        const auto outcome = stages.run(quick_settings());
        REQUIRE(outcome.has_value());
        CHECK(outcome->exit_codes == std::vector<int>{3});
        CHECK(outcome->stderr_text == "oops\n");
    }

    SECTION("Death by signal is reported above 128") {
        pipeline stages;
        stages.add({"sh", "-c", "kill -TERM $$"});

        const auto outcome = stages.run(quick_settings());
        REQUIRE(outcome.has_value());
        CHECK(outcome->exit_codes == std::vector<int>{128 + SIGTERM});
    }

    SECTION("A missing tool is unusable") {
        pipeline stages;
        stages.add({"xtract-no-such-tool-anywhere"});

        const auto outcome = stages.run(quick_settings());
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code() == error_code::tool_unusable);
    }

    SECTION("An empty pipeline does nothing") {
        const pipeline stages;
        const auto outcome = stages.run(quick_settings());
        REQUIRE(outcome.has_value());
        CHECK(outcome->exit_codes.empty());
    }
}

TEST_CASE("Chaining stages", "[unit][pipeline]") {
    TempFile input{"banana\napple\ncherry\n"};
    auto archive = file_descriptor::open(input.path(), O_RDONLY);
    REQUIRE(archive.has_value());

    pipeline stages;
    stages.add({"cat"}, "reading");
    stages.add({"sort"}, "sorting");
    stages.add({"head", "-n", "2"}, "trimming");

    auto settings = quick_settings();
    settings.stdin_fd = archive->get();
    settings.capture_stdout = true;

    const auto outcome = stages.run(settings);
    REQUIRE(outcome.has_value());
    CHECK(outcome->exit_codes == std::vector<int>{0, 0, 0});
    CHECK(outcome->stdout_text == "apple\nbanana\n");
    CHECK(stages.size() == 3);
}

TEST_CASE("Password prompts", "[unit][pipeline]") {
    SECTION("Non-interactive runs stop at the first prompt") {
        pipeline stages;
        stages.add({"sh", "-c", "printf 'Enter password: ' >&2; exec sleep 10"});
        auto settings = quick_settings();
        settings.watch = prompt_stream::standard_error;
        settings.refuse_prompts = true;

        const auto started = std::chrono::steady_clock::now();
        const auto outcome = stages.run(settings);
        const auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code() == error_code::password_required);
        CHECK(elapsed < 5s);
    }

    SECTION("Interactive runs note the prompt and keep waiting") {
        pipeline stages;
        stages.add({"sh", "-c", "printf 'password: ' >&2; sleep 0.5"});
        auto settings = quick_settings();
        settings.watch = prompt_stream::standard_error;

        const auto outcome = stages.run(settings);
        REQUIRE(outcome.has_value());
        CHECK(outcome->password_prompted);
        CHECK(outcome->exit_codes == std::vector<int>{0});
    }

    SECTION("Prompts on standard output are seen when watched") {
        pipeline stages;
        stages.add({"sh", "-c", "printf 'Enter password (will not be echoed):'; exec sleep 10"});
        auto settings = quick_settings();
        settings.capture_stdout = true;
        settings.watch = prompt_stream::standard_output;
        settings.refuse_prompts = true;

        const auto outcome = stages.run(settings);
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code() == error_code::password_required);
    }

    SECTION("Unwatched streams are ignored") {
        pipeline stages;
        stages.add({"sh", "-c", "printf 'password: ' >&2; sleep 0.3"});
        auto settings = quick_settings();
        settings.refuse_prompts = true;

        const auto outcome = stages.run(settings);
        REQUIRE(outcome.has_value());
        CHECK_FALSE(outcome->password_prompted);
    }
}

TEST_CASE("Cancellation stops the chain", "[unit][pipeline]") {
    cancellation_token cancel;
    cancel.request(SIGINT);
    CHECK(cancel.requested());
    CHECK(cancel.signal_number() == SIGINT);

    pipeline stages;
    stages.add({"sleep", "10"});
    auto settings = quick_settings();
    settings.cancel = &cancel;

    const auto started = std::chrono::steady_clock::now();
    const auto outcome = stages.run(settings);
    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().code() == error_code::cancelled);
    CHECK(std::chrono::steady_clock::now() - started < 5s);

    // Only the first request counts
    cancel.request(SIGTERM);
    CHECK(cancel.signal_number() == SIGINT);
}

TEST_CASE("Line-by-line output", "[unit][pipeline]") {
    SECTION("Lines arrive in order, the last without a terminator") {
        pipeline stages;
        stages.add({"printf", "one\\ntwo\\r\\nthree"}, "listing");

        auto running = stages.open(-1);
        REQUIRE(running.has_value());

        std::vector<std::string> lines;
        while (true) {
            auto line = running->read_line();
            REQUIRE(line.has_value());
            if (!*line) break;
            lines.push_back(**line);
        }
        CHECK(lines == std::vector<std::string>{"one", "two", "three"});
        CHECK(running->finish(nullptr).has_value());
        CHECK(running->exit_codes() == std::vector<int>{0});
    }

    SECTION("A failing lister is reported when finished") {
        pipeline stages;
        stages.add({"sh", "-c", "echo partial; echo broken >&2; exit 2"}, "listing");

        auto running = stages.open(-1);
        REQUIRE(running.has_value());
        auto first = running->read_line();
        REQUIRE(first.has_value());
        CHECK(*first == std::optional<std::string>{"partial"});

        const auto finished = running->finish(nullptr);
        REQUIRE_FALSE(finished.has_value());
        CHECK(finished.error().code() == error_code::extraction_failed);
        CHECK(finished.error().message() == "listing error: 'sh -c echo partial; echo broken >&2; exit 2' returned status code 2");
        CHECK(running->stderr_text() == "broken\n");
    }

    SECTION("Nothing to open") {
        const pipeline stages;
        const auto running = stages.open(-1);
        REQUIRE_FALSE(running.has_value());
        CHECK(running.error().code() == error_code::invalid_operation);
    }
}

TEST_CASE("Exit status evaluation", "[unit][pipeline]") {
    pipeline stages;
    stages.add({"zcat"}, "decoding");
    stages.add({"unzip", "-q"});

    SECTION("All zero") {
        const std::vector<int> codes{0, 0};
        CHECK(check_success(stages.stages(), codes, false).has_value());
    }

    SECTION("First failing stage is named") {
        const std::vector<int> codes{1, 2};
        const auto checked = check_success(stages.stages(), codes, false);
        REQUIRE_FALSE(checked.has_value());
        CHECK(checked.error().code() == error_code::extraction_failed);
        CHECK(checked.error().message() == "decoding error: 'zcat' returned status code 1");
    }

    SECTION("Warnings are tolerated once files were extracted") {
        const std::vector<int> codes{0, 1};
        CHECK(check_success(stages.stages(), codes, true).has_value());
        CHECK(check_success(stages.stages(), codes, true, fatal_above_one).has_value());
        CHECK_FALSE(check_success(stages.stages(), codes, false, fatal_above_one).has_value());
    }

    SECTION("Fatal statuses fail even with files") {
        const std::vector<int> codes{0, 3};
        const auto checked = check_success(stages.stages(), codes, true, fatal_above_one);
        REQUIRE_FALSE(checked.has_value());
        CHECK_THAT(checked.error().message(), ContainsSubstring("'unzip -q' returned status code 3"));
    }
}

TEST_CASE("Capturing a command's output", "[unit][pipeline]") {
    const auto captured = capture_output({"sh", "-c", "echo out; echo err >&2; exit 4"});
    REQUIRE(captured.has_value());
    CHECK(captured->status == 4);
    CHECK(captured->out == "out\n");
    CHECK(captured->err == "err\n");

    const auto missing = capture_output({"xtract-no-such-tool-anywhere"});
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == error_code::tool_unusable);
}
