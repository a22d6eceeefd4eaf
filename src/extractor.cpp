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

#include <tierone/xtract/extractor.hpp>
#include <tierone/xtract/log.hpp>
#include <tierone/xtract/process.hpp>
#include <tierone/xtract/workspace.hpp>
#include <algorithm>
#include <array>
#include <format>
#include <memory>
#include <regex>

#include <fcntl.h>

namespace fs = std::filesystem;

namespace tierone::xtract {

namespace {

constexpr std::string_view scratch_prefix = ".xtract-";
constexpr std::string_view output_file_token = "{OUTPUT_FILE}";

std::vector<std::string> split(const std::string_view text, const char separator) {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (true) {
        const auto end = text.find(separator, start);
        pieces.emplace_back(text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return pieces;
}

std::string join(const std::vector<std::string>& pieces, const char separator) {
    std::string result;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (i > 0) result += separator;
        result += pieces[i];
    }
    return result;
}

std::string file_component(const std::string_view filename) {
    return fs::path{filename}.filename().string();
}

bool fatal_above_one(const int status) {
    return status > 1;
}

// Extraction and listing commands

std::vector<std::string> tar_extract(const std::optional<std::string>&) {
    return {"tar", "-x"};
}

std::vector<std::string> cpio_extract(const std::optional<std::string>&) {
    return {"cpio", "-i", "--make-directories", "--quiet", "--no-absolute-filenames"};
}

std::vector<std::string> zip_extract(const std::optional<std::string>& password) {
    std::vector<std::string> command{"unzip", "-q"};
    if (password) {
        command.insert(command.end(), {"-P", *password});
    }
    return command;
}

std::vector<std::string> lzh_extract(const std::optional<std::string>&) {
    return {"lha", "xq"};
}

std::vector<std::string> seven_zip_extract(const std::optional<std::string>& password) {
    std::vector<std::string> command{"7z", "x"};
    if (password) {
        command.push_back("-p" + *password);
    }
    return command;
}

std::vector<std::string> zstd_extract(const std::optional<std::string>&) {
    return {"zstd", "-d", "-o", std::string{output_file_token}};
}

std::vector<std::string> brotli_extract(const std::optional<std::string>&) {
    return {"brotli", "--decompress", "--output=" + std::string{output_file_token}};
}

std::vector<std::string> cab_extract(const std::optional<std::string>&) {
    return {"cabextract", "-q"};
}

std::vector<std::string> shield_extract(const std::optional<std::string>&) {
    return {"unshield", "x"};
}

std::vector<std::string> rar_extract(const std::optional<std::string>& password) {
    std::vector<std::string> command{"unrar", "x"};
    if (password) {
        command.push_back("-p" + *password);
    }
    return command;
}

std::vector<std::string> unarchiver_extract(const std::optional<std::string>& password) {
    std::vector<std::string> command{"unar", "-D"};
    if (password) {
        command.insert(command.end(), {"-p", *password});
    }
    return command;
}

std::vector<std::string> arj_extract(const std::optional<std::string>& password) {
    std::vector<std::string> command{"arj", "x", "-y"};
    if (password) {
        command.push_back("-g" + *password);
    }
    return command;
}

// Stage preparation

std::expected<void, error> add_decoder(const encoding enc, pipeline& stages) {
    if (enc == encoding::none) {
        return {};
    }
    auto decoder = decoder_command(enc);
    if (!decoder) {
        return std::unexpected(decoder.error());
    }
    stages.add(std::move(*decoder), "decoding");
    return {};
}

std::expected<void, error> prepare_compression(const fs::path&, const encoding enc, pipeline& stages) {
    if (enc == encoding::none) {
        return std::unexpected(error{error_code::invalid_operation, "no decoder for an unencoded file"});
    }
    return add_decoder(enc, stages);
}

std::expected<void, error> prepare_rpm(const fs::path&, const encoding enc, pipeline& stages) {
    if (auto decoded = add_decoder(enc, stages); !decoded) {
        return decoded;
    }
    stages.add({"rpm2cpio", "-"}, "rpm2cpio");
    return {};
}

// The payload member and its encoding are found by listing the ar archive
std::expected<void, error> prepare_deb(const fs::path& archive, encoding, pipeline& stages) {
    static const std::regex data_member{R"(^data\.tar\.([a-z0-9]+)$)"};

    const std::vector<std::string> command{"ar", "t", archive.string()};
    auto members = capture_output(command);
    if (!members) {
        return std::unexpected(members.error());
    }
    if (members->status != 0) {
        return std::unexpected(error{error_code::extraction_failed,
            std::format("ar error: '{}' returned status code {}", pipeline_stage{command}.display(), members->status)});
    }

    for (const auto& line : split(members->out, '\n')) {
        std::smatch match;
        if (!std::regex_match(line, match, data_member)) {
            continue;
        }
        const auto enc = encoding_for_suffix("." + match[1].str());
        if (!enc) {
            return std::unexpected(error{error_code::extraction_failed,
                "unrecognized encoding of " + line});
        }
        stages.add({"ar", "p", archive.string(), line}, "data.tar extraction");
        return add_decoder(*enc, stages);
    }
    return std::unexpected(error{error_code::extraction_failed,
        "cannot find data.tar in " + archive.string()});
}

std::expected<void, error> prepare_deb_metadata(const fs::path& archive, encoding, pipeline& stages) {
    stages.add({"ar", "p", archive.string(), "control.tar.gz"}, "control.tar.gz extraction");
    stages.add({"zcat"}, "control.tar.gz decompression");
    return {};
}

std::expected<void, error> prepare_gem(const fs::path&, const encoding enc, pipeline& stages) {
    if (auto decoded = add_decoder(enc, stages); !decoded) {
        return decoded;
    }
    stages.add({"tar", "-xO", "data.tar.gz"}, "data.tar.gz extraction");
    stages.add({"zcat"}, "data.tar.gz decompression");
    return {};
}

std::expected<void, error> prepare_gem_metadata(const fs::path&, const encoding enc, pipeline& stages) {
    if (auto decoded = add_decoder(enc, stages); !decoded) {
        return decoded;
    }
    stages.add({"tar", "-xO", "metadata.gz"}, "metadata.gz extraction");
    stages.add({"zcat"}, "metadata.gz decompression");
    return {};
}

const std::array<variant_traits, 18>& variant_table() {
    static const std::array<variant_traits, 18> table{{
        {.id = variant::tar, .file_type = "tar file",
         .extract_command = tar_extract, .list_command = {"tar", "-t"},
         .basename = naming::archive_basename},
        {.id = variant::cpio, .file_type = "cpio file",
         .extract_command = cpio_extract, .list_command = {"cpio", "-t", "--quiet"},
         .basename = naming::archive_basename},
        {.id = variant::rpm, .file_type = "RPM",
         .extract_command = cpio_extract, .list_command = {"cpio", "-t", "--quiet"},
         .prepare = prepare_rpm, .basename = naming::rpm_basename, .always_bomb = true},
        {.id = variant::deb, .file_type = "Debian package",
         .extract_command = tar_extract, .list_command = {"tar", "-t"},
         .prepare = prepare_deb, .basename = naming::deb_basename, .always_bomb = true},
        {.id = variant::deb_metadata, .file_type = "Debian metadata",
         .extract_command = tar_extract, .list_command = {"tar", "-t"},
         .prepare = prepare_deb_metadata, .basename = naming::deb_basename, .always_bomb = true},
        {.id = variant::gem, .file_type = "Ruby gem",
         .extract_command = tar_extract, .list_command = {"tar", "-t"},
         .prepare = prepare_gem, .basename = naming::archive_basename, .always_bomb = true},
        {.id = variant::gem_metadata, .file_type = "Ruby gem metadata",
         .prepare = prepare_gem_metadata, .basename = naming::gem_metadata_basename,
         .single_stream = true},
        {.id = variant::compression, .file_type = "compressed file",
         .prepare = prepare_compression, .basename = naming::compressed_basename,
         .single_stream = true},
        {.id = variant::zip, .file_type = "Zip file", .discipline = input_discipline::no_pipe,
         .extract_command = zip_extract, .list_command = {"zipinfo", "-1"},
         .basename = naming::archive_basename, .is_fatal = fatal_above_one,
         .prompt = prompt_stream::standard_error},
        {.id = variant::lzh, .file_type = "LZH file", .discipline = input_discipline::no_pipe,
         .extract_command = lzh_extract, .list_command = {"lha", "l"}, .parse_listing = parsers::lzh,
         .basename = naming::archive_basename, .is_fatal = fatal_above_one,
         .prompt = prompt_stream::standard_error},
        {.id = variant::seven_zip, .file_type = "7z file", .discipline = input_discipline::no_pipe,
         .extract_command = seven_zip_extract, .list_command = {"7z", "l", "-ba"},
         .parse_listing = parsers::seven_zip, .basename = naming::archive_basename,
         .prompt = prompt_stream::standard_output, .capture_stdout = true},
        {.id = variant::zstd, .file_type = "zstd file", .discipline = input_discipline::no_pipe,
         .extract_command = zstd_extract, .list_command = {"zstd", "-l"}, .parse_listing = parsers::zstd,
         .basename = naming::archive_basename},
        {.id = variant::brotli, .file_type = "brotli file", .discipline = input_discipline::no_pipe,
         .extract_command = brotli_extract, .basename = naming::archive_basename},
        {.id = variant::cab, .file_type = "Microsoft Cabinet archive", .discipline = input_discipline::no_pipe,
         .extract_command = cab_extract, .list_command = {"cabextract", "-l"}, .parse_listing = parsers::cab,
         .basename = naming::archive_basename},
        {.id = variant::shield, .file_type = "InstallShield archive", .discipline = input_discipline::no_pipe,
         .extract_command = shield_extract, .list_command = {"unshield", "l"}, .parse_listing = parsers::shield,
         .basename = naming::shield_basename},
        {.id = variant::rar, .file_type = "RAR archive", .discipline = input_discipline::no_pipe,
         .extract_command = rar_extract, .list_command = {"unrar", "v"}, .parse_listing = parsers::rar,
         .basename = naming::archive_basename, .prompt = prompt_stream::standard_error},
        {.id = variant::unarchiver, .file_type = "archive", .discipline = input_discipline::no_pipe,
         .extract_command = unarchiver_extract, .list_command = {"lsar"}, .parse_listing = parsers::unarchiver,
         .basename = naming::archive_basename},
        {.id = variant::arj, .file_type = "ARJ archive", .discipline = input_discipline::no_pipe,
         .extract_command = arj_extract, .list_command = {"arj", "v"}, .parse_listing = parsers::arj,
         .basename = naming::archive_basename},
    }};
    return table;
}

constexpr std::array tar_variants{variant::tar};
constexpr std::array cpio_variants{variant::cpio};
constexpr std::array rpm_variants{variant::rpm};
constexpr std::array deb_variants{variant::deb};
constexpr std::array deb_metadata_variants{variant::deb_metadata};
constexpr std::array gem_variants{variant::gem};
constexpr std::array gem_metadata_variants{variant::gem_metadata};
constexpr std::array compression_variants{variant::compression};
constexpr std::array zip_variants{variant::zip, variant::seven_zip};
constexpr std::array lzh_variants{variant::lzh};
constexpr std::array seven_zip_variants{variant::seven_zip};
constexpr std::array zstd_variants{variant::zstd};
constexpr std::array brotli_variants{variant::brotli};
constexpr std::array cab_variants{variant::cab};
constexpr std::array shield_variants{variant::shield};
constexpr std::array rar_variants{variant::rar, variant::unarchiver};
constexpr std::array arj_variants{variant::arj};

} // anonymous namespace

std::string_view to_string(const variant v) noexcept {
    switch (v) {
        case variant::tar:          return "tar";
        case variant::cpio:         return "cpio";
        case variant::rpm:          return "rpm";
        case variant::deb:          return "deb";
        case variant::deb_metadata: return "deb metadata";
        case variant::gem:          return "gem";
        case variant::gem_metadata: return "gem metadata";
        case variant::compression:  return "compression";
        case variant::zip:          return "zip";
        case variant::lzh:          return "lzh";
        case variant::seven_zip:    return "7z";
        case variant::zstd:         return "zstd";
        case variant::brotli:       return "brotli";
        case variant::cab:          return "cab";
        case variant::shield:       return "shield";
        case variant::rar:          return "rar";
        case variant::unarchiver:   return "unar";
        case variant::arj:          return "arj";
    }
    return "unknown";
}

const variant_traits& traits_of(const variant v) {
    const auto& table = variant_table();
    const auto found = std::ranges::find(table, v, &variant_traits::id);
    return found != table.end() ? *found : table.front();
}

std::span<const variant> variants_for(const archive_kind kind, const bool metadata) noexcept {
    switch (kind) {
        case archive_kind::tar:       return tar_variants;
        case archive_kind::zip:       return zip_variants;
        case archive_kind::lzh:       return lzh_variants;
        case archive_kind::rpm:       return rpm_variants;
        case archive_kind::deb:
            return metadata ? std::span<const variant>{deb_metadata_variants} : std::span<const variant>{deb_variants};
        case archive_kind::cpio:      return cpio_variants;
        case archive_kind::gem:
            return metadata ? std::span<const variant>{gem_metadata_variants} : std::span<const variant>{gem_variants};
        case archive_kind::seven_zip: return seven_zip_variants;
        case archive_kind::cab:       return cab_variants;
        case archive_kind::rar:       return rar_variants;
        case archive_kind::arj:       return arj_variants;
        case archive_kind::shield:    return shield_variants;
        case archive_kind::msi:       return seven_zip_variants;
        case archive_kind::dmg:       return seven_zip_variants;
        case archive_kind::zst:       return zstd_variants;
        case archive_kind::brotli:    return brotli_variants;
        case archive_kind::compress:  return compression_variants;
    }
    return {};
}

auto decoder_command(const encoding enc) -> std::expected<std::vector<std::string>, error> {
    switch (enc) {
        case encoding::gzip:
        case encoding::compress: return std::vector<std::string>{"zcat"};
        case encoding::bzip2:    return std::vector<std::string>{"bzcat"};
        case encoding::lzma:     return std::vector<std::string>{"lzcat"};
        case encoding::xz:       return std::vector<std::string>{"xzcat"};
        case encoding::lzip:     return std::vector<std::string>{"lzip", "-cd"};
        case encoding::zstd:     return std::vector<std::string>{"zstd", "-d"};
        case encoding::brotli:   return std::vector<std::string>{"brotli", "--decompress"};
        case encoding::lrzip: {
            // Older lrzip builds spell quiet as -q
            static const std::string quiet_flag = [] {
                auto help = capture_output({"lrzip", "--help"});
                if (help && (help->out + help->err).find("-Q") == std::string::npos) {
                    return std::string{"-q"};
                }
                return std::string{"-Q"};
            }();
            return std::vector<std::string>{"lrzcat", quiet_flag};
        }
        case encoding::none:
            break;
    }
    return std::unexpected(error{error_code::invalid_operation,
        std::format("no decoder for {} encoding", to_string(enc))});
}

namespace naming {

std::string archive_basename(const std::string_view filename) {
    auto pieces = split(file_component(filename), '.');
    const size_t original_count = pieces.size();

    if (pieces.size() > 1 && encoding_for_suffix("." + pieces.back())) {
        pieces.pop_back();
    }
    if (pieces.size() > 1 && is_known_type_suffix("." + pieces.back())) {
        pieces.pop_back();
    }
    if (pieces.size() == original_count && original_count > 1 && pieces.back().size() < 5) {
        pieces.pop_back();
    }
    return join(pieces, '.');
}

std::string compressed_basename(const std::string_view filename) {
    auto pieces = split(file_component(filename), '.');
    if (pieces.size() > 1 && encoding_for_suffix("." + pieces.back())) {
        pieces.pop_back();
    }
    return join(pieces, '.');
}

std::string rpm_basename(const std::string_view filename) {
    auto pieces = split(file_component(filename), '.');
    if (pieces.size() == 1) {
        return pieces.front();
    }
    if (pieces.back() != "rpm") {
        return archive_basename(filename);
    }
    pieces.pop_back();
    if (pieces.size() == 1) {
        return pieces.front();
    }
    // architecture
    if (pieces.back().size() < 8) {
        pieces.pop_back();
    }
    return join(pieces, '.');
}

std::string deb_basename(const std::string_view filename) {
    auto pieces = split(file_component(filename), '_');
    if (pieces.size() == 1) {
        return pieces.front();
    }
    const std::string& last = pieces.back();
    if (last.size() > 10 || !last.ends_with(".deb")) {
        return archive_basename(filename);
    }
    pieces.pop_back();
    return join(pieces, '_');
}

std::string gem_metadata_basename(const std::string_view filename) {
    return file_component(filename) + "-metadata.txt";
}

std::string shield_basename(const std::string_view filename) {
    auto result = archive_basename(filename);
    if (result.ends_with(".hdr")) {
        result.resize(result.size() - 4);
    }
    return result;
}

} // namespace naming

// extractor implementation
extractor::extractor(std::string name, fs::path path, const encoding enc, const variant_traits& traits)
    : name_(std::move(name)), path_(std::move(path)), encoding_(enc), traits_(&traits) {}

auto extractor::create(const fs::path &filename, const encoding enc, const variant v)
    -> std::expected<extractor, error> {
    // Open once so an unreadable file is reported before any tool runs
    if (auto probe = file_descriptor::open(filename, O_RDONLY); !probe) {
        return std::unexpected(probe.error());
    }
    std::error_code ec;
    auto absolute = fs::absolute(filename, ec);
    if (ec) {
        return std::unexpected(io_error("cannot resolve " + filename.string(), ec));
    }
    const auto& traits = traits_of(v);
    // No-pipe tools read the file themselves; the encoding is theirs to handle
    const encoding effective = traits.discipline == input_discipline::no_pipe ? encoding::none : enc;
    return extractor{filename.string(), absolute.lexically_normal(), effective, traits};
}

std::string extractor::basename() const {
    return traits_->basename(name_);
}

auto extractor::prepare() const -> std::expected<pipeline, error> {
    pipeline stages;
    if (traits_->discipline == input_discipline::no_pipe) {
        return stages;
    }
    if (traits_->prepare) {
        if (auto prepared = traits_->prepare(path_, encoding_, stages); !prepared) {
            return std::unexpected(prepared.error());
        }
        return stages;
    }
    if (auto decoded = add_decoder(encoding_, stages); !decoded) {
        return std::unexpected(decoded.error());
    }
    return stages;
}

std::vector<std::string> extractor::tool_command(const std::vector<std::string>& base) const {
    if (traits_->discipline != input_discipline::no_pipe) {
        return base;
    }
    const std::string output_name = fs::path{name_}.filename().stem().string();
    std::vector<std::string> command;
    command.reserve(base.size() + 1);
    for (auto arg : base) {
        if (const auto token = arg.find(output_file_token); token != std::string::npos) {
            arg.replace(token, output_file_token.size(), output_name);
        }
        command.push_back(std::move(arg));
    }
    command.push_back(path_.string());
    return command;
}

run_settings extractor::settings_for(const options& opts, const cancellation_token& cancel) const {
    return run_settings{
        .capture_stdout = traits_->capture_stdout,
        .watch = traits_->prompt,
        .refuse_prompts = opts.batch && !opts.password,
        .poll_interval = opts.poll_interval,
        .cancel = &cancel,
    };
}

auto extractor::record(std::expected<run_outcome, error> outcome) -> std::expected<void, error> {
    if (!outcome) {
        if (outcome.error().code() == error_code::password_required) {
            result_.password_prompted = true;
            result_.stderr_text.clear();
            return std::unexpected(error{error_code::password_required,
                std::format("cannot extract encrypted archive '{}' in non-interactive mode without a password",
                            name_)});
        }
        return std::unexpected(outcome.error());
    }
    result_.exit_codes = std::move(outcome->exit_codes);
    result_.stderr_text = std::move(outcome->stderr_text);
    result_.stdout_text = std::move(outcome->stdout_text);
    result_.password_prompted = outcome->password_prompted;
    return {};
}

auto extractor::extract(const options &opts, const cancellation_token &cancel) -> std::expected<void, error> {
    result_ = extraction_result{};
    auto stages = prepare();
    if (!stages) {
        return std::unexpected(stages.error());
    }
    const auto settings = settings_for(opts, cancel);
    if (traits_->single_stream) {
        return extract_stream(*stages, settings);
    }
    return extract_tree(*stages, settings, opts);
}

auto extractor::extract_stream(pipeline &stages, const run_settings &settings) -> std::expected<void, error> {
    auto input = file_descriptor::open(path_, O_RDONLY);
    if (!input) {
        return std::unexpected(input.error());
    }
    auto output = make_temporary_file(".", scratch_prefix);
    if (!output) {
        return std::unexpected(output.error());
    }

    auto stream_settings = settings;
    stream_settings.stdin_fd = input->get();
    stream_settings.stdout_fd = output->descriptor.get();
    stream_settings.capture_stdout = false;
    auto outcome = stages.run(stream_settings);
    output->descriptor.reset();
    if (auto recorded = record(std::move(outcome)); !recorded) {
        return recorded;
    }

    result_.type = content_type::one_entry_known;
    result_.content_name = basename();
    result_.file_count = 1;

    std::error_code ec;
    const auto size = fs::file_size(output->path.path(), ec);
    if (auto checked = check_success(stages.stages(), result_.exit_codes, !ec && size > 0, traits_->is_fatal);
        !checked) {
        return checked;
    }
    result_.target = std::move(output->path);
    return {};
}

auto extractor::extract_tree(pipeline &stages, run_settings settings, const options &opts)
    -> std::expected<void, error> {
    auto scratch = make_temporary_directory(".", scratch_prefix);
    if (!scratch) {
        return std::unexpected(scratch.error());
    }

    {
        auto inside = scoped_working_directory::enter(scratch->path());
        if (!inside) {
            return std::unexpected(inside.error());
        }

        const bool piped = traits_->discipline == input_discipline::piped;
        auto input = file_descriptor::open(piped ? path_ : fs::path{"/dev/null"}, O_RDONLY);
        if (!input) {
            return std::unexpected(input.error());
        }
        stages.add(tool_command(traits_->extract_command(opts.password)));
        settings.stdin_fd = input->get();
        if (auto recorded = record(stages.run(settings)); !recorded) {
            return recorded;
        }
    }

    auto names = list_directory(scratch->path());
    if (!names) {
        return std::unexpected(names.error());
    }

    if (traits_->always_bomb) {
        result_.type = content_type::bomb;
    } else {
        auto found = classify_contents(*names, basename(), scratch->path());
        result_.type = found.type;
        result_.content_name = std::move(found.content_name);
        result_.included_root = std::move(found.included_root);
    }

    if (result_.type != content_type::empty) {
        auto scan = scan_included_archives(scratch->path() / result_.included_root);
        if (!scan) {
            return std::unexpected(scan.error());
        }
        result_.file_count = scan->file_count;
        result_.included_archives = std::move(scan->archives);
    }
    result_.contents = std::move(*names);

    if (auto checked = check_success(stages.stages(), result_.exit_codes, result_.type != content_type::empty,
                                     traits_->is_fatal);
        !checked) {
        return checked;
    }
    result_.target = std::move(*scratch);
    return {};
}

auto extractor::list() const -> std::expected<member_listing, error> {
    if (traits_->single_stream) {
        if (traits_->id == variant::compression) {
            // Only a bare encoding with no archive inside counts
            const auto guesses = guess_by_magic(path_);
            if (std::ranges::none_of(guesses, [](const archive_descriptor& guess) {
                    return guess.kind == archive_kind::compress;
                })) {
                return std::unexpected(error{error_code::extraction_failed,
                    "doesn't look like a compressed file"});
            }
        }
        return member_listing{std::vector<std::string>{basename()}};
    }

    if (traits_->list_command.empty()) {
        return std::unexpected(error{error_code::extraction_failed,
            std::format("listing the contents of a {} is not supported", traits_->file_type)});
    }

    auto stages = prepare();
    if (!stages) {
        return std::unexpected(stages.error());
    }
    stages->add(tool_command(traits_->list_command), "listing");

    const bool piped = traits_->discipline == input_discipline::piped;
    auto input = file_descriptor::open(piped ? path_ : fs::path{"/dev/null"}, O_RDONLY);
    if (!input) {
        return std::unexpected(input.error());
    }
    auto running = stages->open(input->get());
    if (!running) {
        return std::unexpected(running.error());
    }
    return member_listing{std::make_unique<running_pipeline>(std::move(*running)),
                          traits_->parse_listing, traits_->is_fatal};
}

} // namespace tierone::xtract
