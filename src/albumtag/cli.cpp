// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <glib.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "albumtag/cli.h"
#include "albumtag/review.h"
#include "internal.h"

using namespace albumtag::detail;

namespace albumtag {
namespace {

using ConfigPtr = std::unique_ptr<AlbumTagConfig, decltype(&albumtag_release_config)>;
using AlbumPtr = std::unique_ptr<AlbumTagAlbum, decltype(&albumtag_release_album)>;
using FileListPtr = std::unique_ptr<AlbumTagFileList, decltype(&albumtag_release_file_list)>;

struct TagFlag {
    const char* tag;
    const char* name;
};

constexpr TagFlag kTagFlags[] = {
    {kTagArtist, "artist"},
    {kTagAlbumArtist, "albumartist"},
    {kTagAlbum, "album"},
};

constexpr const char* kFarewells[] = {
    "See you next time!",
    "Good-bye!",
    "Thanks for tagging!",
    "Until next time!",
    "See you soon!",
};

std::string farewell() {
    constexpr int count = static_cast<int>(sizeof(kFarewells) / sizeof(kFarewells[0]));
    return kFarewells[g_random_int_range(0, count)];
}

// Returns false when arg is not a tag option. Sets error_out on misuse.
bool parse_tag_flag(
    const std::vector<std::string>& args,
    size_t& i,
    CliOptions& opts,
    std::string& error_out) {

    const std::string& arg = args[i];
    for (const auto& flag : kTagFlags) {
        const std::string name = flag.name;
        FieldOption option;
        if (arg == "--" + name) {
            if (i + 1 >= args.size()) {
                error_out = "--" + name + " requires a value";
                return true;
            }
            option = LiteralOption{args[++i]};
        } else if (arg == "--" + name + "-from-parent") {
            option = ParentDirOption{};
        } else if (arg == "--remove-" + name) {
            option = RemoveOption{};
        } else {
            continue;
        }
        if (opts.tag_options.count(flag.tag) > 0) {
            error_out = "--" + name + ", --" + name + "-from-parent and --remove-" + name +
                " are mutually exclusive";
            return true;
        }
        opts.tag_options[flag.tag] = std::move(option);
        return true;
    }
    return false;
}

std::optional<std::vector<std::filesystem::path>> collect_paths(
    const std::string& directory,
    const std::string& pattern,
    bool recursive,
    std::ostream& err_out) {

    const char* err = nullptr;
    FileListPtr list(
        albumtag_collect_files(directory.c_str(), pattern.c_str(), recursive, &err),
        &albumtag_release_file_list);
    if (!list) {
        err_out << "Error: " << (err ? std::string{err} : "Failed to collect files") << "\n";
        albumtag_release_error(err);
        return std::nullopt;
    }
    albumtag_release_error(err);

    std::vector<std::filesystem::path> paths;
    paths.reserve(list->count);
    for (size_t i = 0; i < list->count; ++i) {
        paths.emplace_back(to_string_or_empty(list->paths[i]));
    }
    return paths;
}

std::optional<AlbumMetadata> load_album(
    const std::string& path,
    std::ostream& err_out) {

    const char* err = nullptr;
    AlbumPtr raw(albumtag_load_album(path.c_str(), &err), &albumtag_release_album);
    if (!raw) {
        err_out << "Error: " << (err ? std::string{err} : "Failed to load album file") << "\n";
        err_out << "Fix the album file and run again.\n";
        albumtag_release_error(err);
        return std::nullopt;
    }
    albumtag_release_error(err);

    AlbumMetadata album;
    album.artist = to_string_or_empty(raw->artist);
    album.album = to_string_or_empty(raw->album);
    for (size_t i = 0; i < raw->tracklist_count; ++i) {
        album.tracklist.push_back(to_string_or_empty(raw->tracklist[i]));
    }
    return album;
}

int report_summary(const WriteSummary& summary, std::ostream& out) {
    out << "\nUpdated " << summary.changed << " file(s), "
        << summary.unchanged << " unchanged, "
        << summary.failed << " failed.\n";
    if (summary.changed > 0) {
        out << "Changes saved to files!\n";
    } else {
        out << "No changes were made to the files.\n";
    }
    return summary.failed > 0 ? kExitFailure : kExitSuccess;
}

int report_no_files(const std::string& pattern, const std::string& directory, std::ostream& out) {
    out << "No files matching \"" << pattern << "\" found in " << directory << ".\n";
    return kExitSuccess;
}

int run_print_mode(
    const std::vector<std::filesystem::path>& paths,
    const std::string& format,
    std::ostream& out,
    std::ostream& err_out) {

    FlacTagStore store;
    size_t failed = 0;
    for (const auto& path : paths) {
        TagMap tags;
        std::string err;
        if (!store.read(path.string(), tags, err)) {
            err_out << "Failed: " << path.string() << ": " << err << "\n";
            ++failed;
            continue;
        }
        out << path.string() << "\n";
        out << render_tag_format(format, tags) << "\n\n";
    }
    return failed > 0 ? kExitFailure : kExitSuccess;
}

int run_album_mode(
    const CliOptions& opts,
    const AlbumMetadata& album,
    const std::vector<std::filesystem::path>& paths,
    Console& console,
    std::ostream& out) {

    std::vector<TrackCandidate> candidates = identify_tracks(paths, album.tracklist);
    if (opts.yes) {
        out << "\n";
        display_match_summary(candidates, console);
    } else {
        ReviewSession session(std::move(candidates), album.tracklist, console);
        if (session.run() == ReviewSignal::Aborted) {
            out << "Quitting...\n";
            out << "No changes were made to the files.\n";
            return kExitSuccess;
        }
        candidates = session.candidates();
    }

    const TagOptions effective = resolve_album_options(album, opts.tag_options);
    std::vector<PlannedWrite> planned;
    planned.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        planned.push_back({
            candidate.path,
            build_write_plan(candidate, album, effective, parent_directory_name(candidate.path)),
        });
    }

    out << "\n";
    FlacTagStore store;
    const int rc = report_summary(apply_planned_writes(store, planned, console), out);
    out << farewell() << "\n";
    return rc;
}

int run_directory_mode(
    const CliOptions& opts,
    const std::vector<std::filesystem::path>& paths,
    Console& console,
    std::ostream& out) {

    std::vector<PlannedWrite> planned;
    planned.reserve(paths.size());
    for (const auto& path : paths) {
        planned.push_back({path, build_override_plan(opts.tag_options, parent_directory_name(path))});
    }

    FlacTagStore store;
    return report_summary(apply_planned_writes(store, planned, console), out);
}

}  // namespace

ParseResult parse_cli_args(
    const std::vector<std::string>& args,
    CliOptions& out,
    std::string& error_out) {

    out = CliOptions{};
    error_out.clear();
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();
        if ((arg == "-d" || arg == "--directory") && has_value) {
            out.directory = args[++i];
        } else if ((arg == "-g" || arg == "--pattern") && has_value) {
            out.pattern = args[++i];
        } else if (arg == "-r" || arg == "--recursive") {
            out.recursive = true;
        } else if (arg == "-y" || arg == "--yes") {
            out.yes = true;
        } else if (arg == "-p" || arg == "--print") {
            out.print = true;
        } else if ((arg == "-f" || arg == "--format") && has_value) {
            out.format = args[++i];
        } else if ((arg == "-i" || arg == "--input-config") && has_value) {
            out.config_file = args[++i];
        } else if (arg == "--no-color") {
            out.no_color = true;
        } else if (arg == "-?" || arg == "-h" || arg == "--help") {
            return ParseResult::Help;
        } else if (parse_tag_flag(args, i, out, error_out)) {
            if (!error_out.empty()) return ParseResult::UsageError;
        } else if (!arg.empty() && arg[0] == '-') {
            error_out = "Unknown or incomplete option: " + arg;
            return ParseResult::UsageError;
        } else if (out.input.empty()) {
            out.input = arg;
        } else {
            error_out = "Only one input path may be given";
            return ParseResult::UsageError;
        }
    }
    if (out.input.empty()) {
        error_out = "Input path is required";
        return ParseResult::UsageError;
    }
    return ParseResult::Ok;
}

void print_usage(std::ostream& out) {
    out << "Usage: albumtag [-d dir] [-g glob] [-r] [-y] [-p [-f format]] [-i config] [--no-color] [tag options] <album file|dir>\n";
    out << "  <album file>: Track list file with [artist], [album] and [tracklist] sections\n";
    out << "  <dir>       : Apply only the tag options to every file in the directory\n";
    out << "  -d / --directory: Directory holding the audio files (default: \".\")\n";
    out << "  -g / --pattern: File name glob (default: \"*.flac\")\n";
    out << "  -r / --recursive: Search subdirectories\n";
    out << "  -y / --yes: Accept automatic matches without review\n";
    out << "  -p / --print: Print current tags of the files (read only)\n";
    out << "  -f / --format: Print format (default: \"{title}\\n{artist}\\n{album}\", e.g. \"{tracknumber:02d} {title}\")\n";
    out << "  -i / --input-config: Config file path (default search: ./albumtag.conf --> ~/.albumtag.conf)\n";
    out << "  --no-color: Disable colored output\n";
    out << "Tag options (one per tag):\n";
    for (const auto& flag : kTagFlags) {
        out << "  --" << flag.name << " <value> | --" << flag.name << "-from-parent | --remove-" << flag.name << "\n";
    }
}

int run_cli(
    const CliOptions& opts,
    std::istream& in,
    std::ostream& out,
    std::ostream& err,
    bool color_capable) {

    const char* config_err = nullptr;
    ConfigPtr cfg(
        albumtag_load_config(opts.config_file.empty() ? nullptr : opts.config_file.c_str(), &config_err),
        &albumtag_release_config);
    if (!cfg) {
        err << "Error: " << (config_err ? std::string{config_err} : "Failed to load config") << "\n";
        albumtag_release_error(config_err);
        return kExitFailure;
    }
    albumtag_release_error(config_err);

    const std::string pattern = opts.pattern.value_or(to_string_or_empty(cfg->pattern));
    const bool recursive = opts.recursive.value_or(cfg->recursive);
    const std::string format = opts.format.value_or(to_string_or_empty(cfg->format));
    StreamConsole console(in, out, err, color_capable && cfg->color && !opts.no_color);

    std::error_code ec;
    const bool input_is_dir = std::filesystem::is_directory(opts.input, ec);
    if (!input_is_dir && !std::filesystem::is_regular_file(opts.input, ec)) {
        err << "Error: Input not found: " << opts.input << "\n";
        return kExitFailure;
    }

    if (opts.print) {
        if (!input_is_dir) {
            return run_print_mode({std::filesystem::path(opts.input)}, format, out, err);
        }
        const auto paths = collect_paths(opts.input, pattern, recursive, err);
        if (!paths) return kExitFailure;
        return run_print_mode(*paths, format, out, err);
    }

    if (input_is_dir) {
        if (opts.tag_options.empty()) {
            err << "Error: A directory input needs at least one tag option\n";
            return kExitUsage;
        }
        const auto paths = collect_paths(opts.input, pattern, recursive, err);
        if (!paths) return kExitFailure;
        if (paths->empty()) return report_no_files(pattern, opts.input, out);
        return run_directory_mode(opts, *paths, console, out);
    }

    const auto album = load_album(opts.input, err);
    if (!album) return kExitFailure;
    out << "Read album metadata from " << opts.input << "\n";
    out << "  artist : \"" << album->artist << "\"\n";
    out << "  album  : \"" << album->album << "\"\n";
    out << "  tracks : " << album->tracklist.size() << "\n";

    const auto paths = collect_paths(opts.directory, pattern, recursive, err);
    if (!paths) return kExitFailure;
    if (paths->empty()) return report_no_files(pattern, opts.directory, out);
    return run_album_mode(opts, *album, *paths, console, out);
}

}  // namespace albumtag
