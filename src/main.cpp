// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include "albumtag/cli.h"
#include "version.h"

#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

int main(int argc, char** argv) {
    std::cout << "\nAlbum metadata tagger [" << VERSION << "-" << COMMIT_ID << "]\n";
    std::cout << "Copyright (c) Kouji Matsui (@kekyo@mi.kekyo.net)\n";
    std::cout << "Licence: Under MIT.\n\n";

    const std::vector<std::string> args(argv + 1, argv + argc);
    albumtag::CliOptions opts;
    std::string error;
    switch (albumtag::parse_cli_args(args, opts, error)) {
        case albumtag::ParseResult::Help:
            albumtag::print_usage(std::cout);
            return albumtag::kExitSuccess;
        case albumtag::ParseResult::UsageError:
            std::cerr << "Error: " << error << "\n";
            std::cerr << "Run with --help for usage.\n";
            return albumtag::kExitUsage;
        case albumtag::ParseResult::Ok:
            break;
    }

    return albumtag::run_cli(opts, std::cin, std::cout, std::cerr, ::isatty(STDOUT_FILENO) != 0);
}
