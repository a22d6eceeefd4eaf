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

#include <tierone/xtract/placement.hpp>
#include <tierone/xtract/log.hpp>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <vector>

#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tierone::xtract {

namespace {

constexpr int max_numbered_suffix = 9;

struct strategy_rule {
    placement_strategy strategy;
    bool (*accepts)(content_type type, const options& opts, bool ok_for_match);
};

// Evaluated in order; the last rule accepts everything
constexpr std::array<strategy_rule, 5> strategy_rules{{
    {placement_strategy::flat,
     [](const content_type type, const options& opts, bool) {
         return (opts.flat && type != content_type::one_entry_known)
             || (opts.overwrite && type == content_type::matching_directory);
     }},
    {placement_strategy::overwrite,
     [](const content_type type, const options& opts, bool) {
         return (opts.flat && type == content_type::one_entry_known)
             || (opts.overwrite && type != content_type::matching_directory);
     }},
    {placement_strategy::match,
     [](const content_type type, const options&, const bool ok_for_match) {
         return type == content_type::matching_directory || (is_one_entry_unknown(type) && ok_for_match);
     }},
    {placement_strategy::empty,
     [](const content_type type, const options&, bool) {
         return type == content_type::empty;
     }},
    {placement_strategy::bomb,
     [](content_type, const options&, bool) {
         return true;
     }},
}};

error errno_error(const std::string& what) {
    return error{error_code::io_error, what + ": " + std::strerror(errno)};
}

// Atomically create the name; false when something already holds it
std::expected<bool, error> claim(const fs::path& candidate, const name_kind kind) {
    if (kind == name_kind::directory) {
        if (::mkdir(candidate.c_str(), 0777) == 0) {
            return true;
        }
    } else {
        const int fd = ::open(candidate.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0666);
        if (fd != -1) {
            ::close(fd);
            return true;
        }
    }
    if (errno == EEXIST) {
        return false;
    }
    return std::unexpected(errno_error("cannot create " + candidate.string()));
}

std::expected<fs::path, error> claim_unique(const fs::path& wanted, const name_kind kind) {
    const std::string pattern = wanted.string() + ".XXXXXX";
    std::vector<char> buffer(pattern.c_str(), pattern.c_str() + pattern.size() + 1);
    if (kind == name_kind::directory) {
        if (::mkdtemp(buffer.data()) == nullptr) {
            return std::unexpected(errno_error("cannot create a directory named like " + wanted.string()));
        }
    } else {
        const int fd = ::mkostemp(buffer.data(), O_CLOEXEC);
        if (fd == -1) {
            return std::unexpected(errno_error("cannot create a file named like " + wanted.string()));
        }
        ::close(fd);
    }
    return fs::path{buffer.data()};
}

std::expected<void, error> rename_path(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        return std::unexpected(io_error(std::format("cannot move {} to {}", from.string(), to.string()), ec));
    }
    return {};
}

bool is_real_directory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(fs::symlink_status(path, ec));
}

std::expected<fs::path, error> place_flat(extractor& ex) {
    const fs::path scratch = ex.result().target.path();
    std::vector<fs::path> directories;
    std::vector<fs::path> files;

    std::error_code ec;
    for (fs::recursive_directory_iterator it{scratch, ec}, end; !ec && it != end; it.increment(ec)) {
        auto relative = it->path().lexically_relative(scratch);
        if (is_real_directory(it->path())) {
            directories.push_back(std::move(relative));
        } else {
            files.push_back(std::move(relative));
        }
    }
    if (ec) {
        return std::unexpected(io_error("cannot walk " + scratch.string(), ec));
    }

    for (const auto& directory : directories) {
        fs::create_directories(directory, ec);
        if (ec) {
            return std::unexpected(io_error("cannot create " + directory.string(), ec));
        }
    }
    for (const auto& file : files) {
        if (auto moved = rename_path(scratch / file, file); !moved) {
            return std::unexpected(moved.error());
        }
    }
    ex.result().target.remove();
    return fs::path{"."};
}

std::expected<fs::path, error> place_overwrite(extractor& ex) {
    const fs::path target = ex.basename();
    std::error_code ec;
    if (fs::exists(fs::symlink_status(target, ec))) {
        fs::remove_all(target, ec);
        if (ec) {
            return std::unexpected(io_error("cannot replace " + target.string(), ec));
        }
    }
    if (auto moved = rename_path(ex.result().target.path(), target); !moved) {
        return std::unexpected(moved.error());
    }
    ex.result().target.release();
    return target;
}

std::expected<fs::path, error> place_match(extractor& ex, const one_entry_choice choice) {
    auto& result = ex.result();
    const fs::path scratch = result.target.path();
    const bool scratch_is_directory = is_real_directory(scratch);

    fs::path source = scratch;
    if (scratch_is_directory && result.contents && !result.contents->empty()) {
        source = scratch / result.contents->front();
    }

    std::string wanted = ex.basename();
    if (choice == one_entry_choice::here) {
        wanted = result.content_name;
        while (wanted.size() > 1 && wanted.ends_with('/')) {
            wanted.pop_back();
        }
    }

    const auto kind = is_real_directory(source) ? name_kind::directory : name_kind::file;
    auto target = reserve_name(wanted, kind);
    if (!target) {
        return std::unexpected(target.error());
    }
    if (*target != fs::path{wanted}) {
        log::warning("extracting {} to {}", ex.name(), target->string());
    }
    if (auto moved = rename_path(source, *target); !moved) {
        std::error_code ignored;
        fs::remove(*target, ignored);
        return std::unexpected(moved.error());
    }

    if (scratch_is_directory) {
        result.target.remove();
    } else {
        result.target.release();
    }
    result.included_root = "./";
    return *target;
}

std::expected<fs::path, error> place_bomb(extractor& ex) {
    const auto kind = ex.traits().single_stream ? name_kind::file : name_kind::directory;
    const fs::path wanted = ex.basename();
    auto target = reserve_name(wanted, kind);
    if (!target) {
        return std::unexpected(target.error());
    }
    if (*target != wanted) {
        log::warning("extracting {} to {}", ex.name(), target->string());
    }
    if (auto moved = rename_path(ex.result().target.path(), *target); !moved) {
        std::error_code ignored;
        fs::remove(*target, ignored);
        return std::unexpected(moved.error());
    }
    ex.result().target.release();
    return *target;
}

} // anonymous namespace

std::string_view to_string(const placement_strategy strategy) noexcept {
    switch (strategy) {
        case placement_strategy::flat:      return "flat";
        case placement_strategy::overwrite: return "overwrite";
        case placement_strategy::match:     return "match";
        case placement_strategy::empty:     return "empty";
        case placement_strategy::bomb:      return "bomb";
    }
    return "unknown";
}

placement_strategy select_strategy(const content_type type, const options& opts,
                                   const bool one_entry_ok_for_match) noexcept {
    for (const auto& rule : strategy_rules) {
        if (rule.accepts(type, opts, one_entry_ok_for_match)) {
            return rule.strategy;
        }
    }
    return placement_strategy::bomb;
}

auto reserve_name(const fs::path &wanted, const name_kind kind) -> std::expected<fs::path, error> {
    for (int suffix = 0; suffix <= max_numbered_suffix; ++suffix) {
        fs::path candidate = suffix == 0 ? wanted : fs::path{std::format("{}.{}", wanted.string(), suffix)};
        auto claimed = claim(candidate, kind);
        if (!claimed) {
            return std::unexpected(claimed.error());
        }
        if (*claimed) {
            return candidate;
        }
    }
    return claim_unique(wanted, kind);
}

auto repair_permissions(const fs::path &root) -> std::expected<void, error> {
    constexpr auto owner_rw = fs::perms::owner_read | fs::perms::owner_write;
    constexpr auto any_exec = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;

    const auto repair = [&](const fs::path& path) -> std::expected<void, error> {
        std::error_code ec;
        const auto status = fs::symlink_status(path, ec);
        if (ec || fs::is_symlink(status)) {
            return {};
        }
        auto wanted = fs::is_directory(status) ? fs::perms::owner_all : owner_rw;
        if (fs::is_regular_file(status) && (status.permissions() & any_exec) != fs::perms::none) {
            wanted |= fs::perms::owner_exec;
        }
        if ((status.permissions() & wanted) == wanted) {
            return {};
        }
        fs::permissions(path, wanted, fs::perm_options::add | fs::perm_options::nofollow, ec);
        if (ec) {
            return std::unexpected(io_error("cannot fix permissions of " + path.string(), ec));
        }
        return {};
    };

    if (auto fixed = repair(root); !fixed) {
        return fixed;
    }
    if (!is_real_directory(root)) {
        return {};
    }

    std::error_code ec;
    // Each directory is repaired when visited, before the iterator descends
    for (fs::recursive_directory_iterator it{root, ec}, end; !ec && it != end; it.increment(ec)) {
        if (auto fixed = repair(it->path()); !fixed) {
            return fixed;
        }
    }
    if (ec) {
        return std::unexpected(io_error("cannot walk " + root.string(), ec));
    }
    return {};
}

auto place(const placement_strategy strategy, extractor &ex, const one_entry_choice choice)
    -> std::expected<fs::path, error> {
    if (auto repaired = repair_permissions(ex.result().target.path()); !repaired) {
        return std::unexpected(repaired.error());
    }

    log::debug("placing {} with the {} strategy", ex.name(), to_string(strategy));
    switch (strategy) {
        case placement_strategy::flat:
            return place_flat(ex);
        case placement_strategy::overwrite:
            return place_overwrite(ex);
        case placement_strategy::match:
            return place_match(ex, choice);
        case placement_strategy::empty:
            ex.result().target.remove();
            return fs::path{};
        case placement_strategy::bomb:
            return place_bomb(ex);
    }
    return place_bomb(ex);
}

} // namespace tierone::xtract
