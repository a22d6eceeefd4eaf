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

/**
 * xtract - Extracts archives of many formats into tidy directories.
 *
 * Usage: xtract [options] archive [archive2 ...]
 */

#include <tierone/xtract/xtract.hpp>
#include <tierone/xtract/log.hpp>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view version = "xtract 1.0.0";
constexpr int usage_status = 2;

void print_usage(const char* program) {
    std::println("Usage: {} [options] archive [archive2 ...]", program);
    std::println("");
    std::println("Options:");
    std::println("  -l, -t, --list, --table   list the archive contents instead of extracting");
    std::println("  -m, --metadata            extract package metadata instead of contents");
    std::println("  -r, --recursive           extract archives found inside archives");
    std::println("  --one, --one-entry=MODE   handle archives with one entry: inside, rename or here");
    std::println("  -n, --noninteractive      never ask questions, use the default answers");
    std::println("  -p, --password=PW         password for encrypted archives");
    std::println("  -o, --overwrite           replace existing files and directories");
    std::println("  -f, --flat, --no-directory  extract everything into the current directory");
    std::println("  --list-extensions         list the recognised file extensions and exit");
    std::println("  -v, --verbose             show more messages (repeatable)");
    std::println("  -q, --quiet               show fewer messages (repeatable)");
    std::println("  -h, --help                show this help and exit");
    std::println("  --version                 show the version and exit");
}

int usage_error(const char* program, const std::string_view message) {
    std::println(stderr, "{}: {}", program, message);
    std::println(stderr, "Try '{} --help' for more information.", program);
    return usage_status;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    namespace xtract = tierone::xtract;

    xtract::options opts;
    std::vector<std::string> archives;
    int verbose = 0;
    int quiet = 0;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (options_done || arg == "-" || !arg.starts_with('-')) {
            archives.push_back(std::move(arg));
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        // --name=value
        std::optional<std::string> inline_value;
        if (arg.starts_with("--")) {
            if (const auto eq = arg.find('='); eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg.resize(eq);
            }
        }
        const auto value = [&]() -> std::optional<std::string> {
            if (inline_value) {
                return inline_value;
            }
            if (i + 1 < argc) {
                return std::string{argv[++i]};
            }
            return std::nullopt;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::println("{}", version);
            return 0;
        } else if (arg == "--list-extensions") {
            for (const auto& suffix : xtract::supported_extensions()) {
                std::println("{}", suffix);
            }
            return 0;
        } else if (arg == "-l" || arg == "-t" || arg == "--list" || arg == "--table") {
            opts.show_list = true;
        } else if (arg == "-m" || arg == "--metadata") {
            opts.metadata = true;
        } else if (arg == "-r" || arg == "--recursive") {
            opts.recursive = true;
        } else if (arg == "-n" || arg == "--noninteractive") {
            opts.batch = true;
        } else if (arg == "-o" || arg == "--overwrite") {
            opts.overwrite = true;
        } else if (arg == "-f" || arg == "--flat" || arg == "--no-directory") {
            opts.flat = true;
        } else if (arg == "-v" || arg == "--verbose") {
            ++verbose;
        } else if (arg == "-q" || arg == "--quiet") {
            ++quiet;
        } else if (arg == "-p" || arg == "--password") {
            auto password = value();
            if (!password) {
                return usage_error(argv[0], "option " + arg + " requires an argument");
            }
            opts.password = std::move(password);
        } else if (arg == "--one" || arg == "--one-entry") {
            auto mode = value();
            if (!mode) {
                return usage_error(argv[0], "option " + arg + " requires an argument");
            }
            opts.one_entry_default = std::move(mode);
        } else {
            return usage_error(argv[0], "unrecognized option " + arg);
        }
    }

    if (archives.empty()) {
        return usage_error(argv[0], "you must provide an archive to extract");
    }
    opts.log_level = xtract::log::from_verbosity(verbose, quiet);

    return xtract::run(opts, archives);
}
