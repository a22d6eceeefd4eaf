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

#include <tierone/xtract/application.hpp>
#include <tierone/xtract/download.hpp>
#include <tierone/xtract/format.hpp>
#include <tierone/xtract/log.hpp>
#include <tierone/xtract/placement.hpp>
#include <tierone/xtract/workspace.hpp>
#include <algorithm>
#include <cstring>
#include <format>
#include <ostream>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace tierone::xtract {

namespace {

// One failed variant, kept for the report
struct attempt {
    std::string description;
    std::string message;
    std::string output;
};

std::string describe(const extractor& ex) {
    if (ex.archive_encoding() == encoding::none) {
        return std::string{ex.file_type()};
    }
    return std::format("{}-encoded {}", to_string(ex.archive_encoding()), ex.file_type());
}

std::string_view without_trailing_newlines(std::string_view text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

bool is_real_directory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(fs::symlink_status(path, ec));
}

void print_tree(std::ostream& out, const fs::path& path) {
    if (!is_real_directory(path)) {
        out << path.string() << '\n';
        return;
    }
    out << path.string() << "/\n";

    std::vector<fs::path> children;
    std::error_code ec;
    for (fs::directory_iterator it{path, ec}, end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    std::ranges::sort(children);
    for (const auto& child : children) {
        print_tree(out, child);
    }
}

} // anonymous namespace

auto check_file(const fs::path &filename) -> std::expected<void, error> {
    struct stat info{};
    if (::stat(filename.c_str(), &info) == -1) {
        return std::unexpected(error{error_code::io_error, std::strerror(errno)});
    }
    if (S_ISDIR(info.st_mode)) {
        return std::unexpected(error{error_code::io_error, "cannot work with a directory"});
    }
    return {};
}

int application::run(const std::vector<std::string>& archives) {
    std::error_code ec;
    const auto start = fs::current_path(ec);
    if (ec) {
        log::error("cannot determine the working directory: {}", ec.message());
        return 1;
    }

    show_names_ = archives.size() > 1;
    queue_.emplace_back(start, archives);

    while (!queue_.empty() && !context_.cancel.requested()) {
        auto [directory, names] = std::move(queue_.back());
        queue_.pop_back();

        auto inside = scoped_working_directory::enter(directory);
        if (!inside) {
            log::error("{}", inside.error().message());
            failures_.insert(failures_.end(), names.begin(), names.end());
            continue;
        }

        for (const auto& name : names) {
            if (context_.cancel.requested()) {
                break;
            }
            if (handle(directory, name)) {
                successes_.push_back(name);
            } else {
                failures_.push_back(name);
            }
        }
        // Archives found by recursion are wrapped unless asked otherwise
        context_.one_entry.set_permanent(one_entry_choice::wrap);
    }

    if (context_.cancel.requested()) {
        if (const int signal_number = context_.cancel.signal_number(); signal_number != 0) {
            log::error("interrupted by signal {}", signal_number);
        } else {
            log::error("interrupted");
        }
        return 1;
    }
    return failures_.empty() ? 0 : 1;
}

void application::enqueue(const fs::path& directory, std::string name) {
    auto found = std::ranges::find(queue_, directory, [](const auto& entry) -> const fs::path& { return entry.first; });
    if (found != queue_.end()) {
        found->second.push_back(std::move(name));
    } else {
        queue_.emplace_back(directory, std::vector<std::string>{std::move(name)});
    }
}

bool application::handle(const fs::path& directory, const std::string& name) {
    std::string filename = name;
    if (is_url(name)) {
        auto fetched = fetch(name);
        if (!fetched) {
            log::error("{}: {}", name, fetched.error().message());
            return false;
        }
        filename = std::move(*fetched);
    }

    if (auto checked = check_file(filename); !checked) {
        log::error("{}: {}", filename, checked.error().message());
        return false;
    }
    auto handled = try_extractors(directory, filename);
    if (!handled) {
        log::debug("{}: {} ({})", filename, to_string(handled.error().code()), handled.error().message());
        return false;
    }
    return true;
}

auto application::try_extractors(const fs::path &directory, const std::string &filename)
    -> std::expected<fs::path, error> {
    std::vector<attempt> attempts;
    candidate_sequence candidates{filename};

    while (auto candidate = candidates.next()) {
        log::debug("trying {} with {} encoding ({} guess)", to_string(candidate->kind),
                   to_string(candidate->enc), to_string(candidates.tier()));

        for (const auto v : variants_for(candidate->kind, context_.opts.metadata)) {
            if (auto live = context_.cancel.check(); !live) {
                return std::unexpected(live.error());
            }

            auto ex = extractor::create(filename, candidate->enc, v);
            if (!ex) {
                attempts.push_back({std::string{traits_of(v).file_type}, ex.error().message(), {}});
                continue;
            }

            std::expected<fs::path, error> outcome = fs::path{};
            if (context_.opts.show_list) {
                if (auto listed = list_archive(filename, *ex); !listed) {
                    outcome = std::unexpected(listed.error());
                }
            } else {
                outcome = extract_archive(directory, filename, *ex);
            }

            if (outcome) {
                return outcome;
            }
            if (outcome.error().code() == error_code::cancelled) {
                return outcome;
            }
            log::debug("{} failed: {}", describe(*ex), outcome.error().message());
            std::string output = ex->result().stderr_text;
            if (outcome.error().code() != error_code::password_required) {
                output += ex->result().stdout_text;
            }
            attempts.push_back({describe(*ex), outcome.error().message(), std::move(output)});
        }
    }

    log::error("could not handle {}", filename);
    if (attempts.empty()) {
        log::error("not a known archive type");
        return std::unexpected(error{error_code::unknown_format, "not a known archive type"});
    }

    bool password_required = false;
    for (const auto& failed : attempts) {
        log::error("treating as {} failed: {}", failed.description, failed.message);
        if (const auto output = without_trailing_newlines(failed.output); !output.empty()) {
            log::error("Error output from this process:\n{}", output);
        }
        password_required = password_required || failed.message.starts_with("cannot extract encrypted");
    }
    return std::unexpected(error{password_required ? error_code::password_required : error_code::unknown_format,
        std::format("could not handle {}", filename)});
}

auto application::extract_archive(const fs::path &directory, const std::string &filename, extractor &ex)
    -> std::expected<fs::path, error> {
    if (auto extracted = ex.extract(context_.opts, context_.cancel); !extracted) {
        return std::unexpected(extracted.error());
    }
    if (auto live = context_.cancel.check(); !live) {
        return std::unexpected(live.error());
    }

    auto& result = ex.result();
    if (is_one_entry_unknown(result.type)) {
        context_.one_entry.prep(filename, result.type, ex.basename(), result.content_name, context_.prompt);
        // An interrupted prompt falls back to the default answer
        if (auto live = context_.cancel.check(); !live) {
            return std::unexpected(live.error());
        }
    }
    const auto strategy = select_strategy(result.type, context_.opts, context_.one_entry.ok_for_match());

    auto target = place(strategy, ex, context_.one_entry.current());
    if (!target) {
        return std::unexpected(target.error());
    }

    show_stderr(filename, ex);
    show_extraction(filename, ex, *target);
    if (!target->empty()) {
        if (auto recursed = recurse(directory, filename, ex, *target); !recursed) {
            return std::unexpected(recursed.error());
        }
    }
    return target;
}

auto application::list_archive(const std::string &filename, extractor &ex) -> std::expected<void, error> {
    auto listing = ex.list();
    if (!listing) {
        return std::unexpected(listing.error());
    }

    // Pull the first name before printing anything, so a lister that fails
    // straight away leaves no header behind
    auto first = listing->next();
    if (!first) {
        ex.result().stderr_text = listing->stderr_text();
        return std::unexpected(first.error());
    }

    auto& out = context_.prompt.out();
    if (show_names_) {
        if (listed_before_) {
            out << '\n';
        }
        out << filename << ":\n";
    }
    listed_before_ = true;

    if (*first) {
        out << **first << '\n';
        while (true) {
            auto name = listing->next();
            if (!name) {
                out.flush();
                log::error("lister failed: ignore above listing for {}", filename);
                ex.result().stderr_text = listing->stderr_text();
                return std::unexpected(name.error());
            }
            if (!*name) {
                break;
            }
            out << **name << '\n';
        }
    }
    out.flush();
    return {};
}

void application::show_stderr(const std::string& filename, const extractor& ex) const {
    const auto text = without_trailing_newlines(ex.result().stderr_text);
    if (text.empty()) {
        return;
    }
    if (ex.result().password_prompted) {
        log::debug("output from extracting {}:\n{}", filename, text);
    } else {
        log::warning("output from extracting {}:\n{}", filename, text);
    }
}

void application::show_extraction(const std::string& filename, const extractor& ex, const fs::path& target) const {
    if (!log::enabled(log::level::info) || target.empty()) {
        return;
    }
    auto& out = context_.prompt.out();
    if (show_names_) {
        out << filename << ":\n";
    }

    const auto& contents = ex.result().contents;
    if (target == "." && contents) {
        for (const auto& name : *contents) {
            print_tree(out, name);
        }
    } else {
        print_tree(out, target);
    }
    out.flush();
}

auto application::recurse(const fs::path &directory, const std::string &filename, const extractor &ex,
                          const fs::path &target) -> std::expected<void, error> {
    const auto& result = ex.result();
    context_.recursion.prep(filename, target, result, context_.prompt);
    if (auto live = context_.cancel.check(); !live) {
        return live;
    }
    if (!context_.recursion.ok_to_recurse()) {
        return {};
    }

    const fs::path base = is_real_directory(target) ? directory / target : directory;
    for (const auto& archive : result.included_archives) {
        auto parent = (base / result.included_root / archive.parent_path()).lexically_normal();
        if (!parent.has_filename() && parent.has_relative_path()) {
            parent = parent.parent_path();
        }
        enqueue(parent, archive.filename().string());
    }
    return {};
}

} // namespace tierone::xtract
