#pragma once

// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "albumtag/tagging.h"

namespace albumtag {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/** Command line options; unset optionals fall back to the config file. */
struct CliOptions {
    std::string input;
    std::string directory = ".";
    std::optional<std::string> pattern;
    std::optional<bool> recursive;
    std::optional<std::string> format;
    std::string config_file;
    bool print = false;
    bool yes = false;
    bool no_color = false;
    TagOptions tag_options;
};

enum class ParseResult {
    Ok,
    Help,
    UsageError,
};

/**
 * Parse arguments without the program name.
 * At most one of --X, --X-from-parent and --remove-X is accepted per tag.
 */
ParseResult parse_cli_args(
    const std::vector<std::string>& args,
    CliOptions& out,
    std::string& error_out);

void print_usage(std::ostream& out);

/**
 * Run album, directory or print mode and return the process exit code.
 * Album mode reads the track list file before looking for audio files.
 * Colors are used only when color_capable is set and neither the config
 * nor --no-color turns them off.
 */
int run_cli(
    const CliOptions& opts,
    std::istream& in,
    std::ostream& out,
    std::ostream& err,
    bool color_capable);

}  // namespace albumtag
