// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <iostream>
#include <string>

#include "albumtag/console.h"

namespace albumtag {

StreamConsole::StreamConsole(std::istream& in, std::ostream& out, std::ostream& err, bool use_color)
    : in_(in), out_(out), err_(err), use_color_(use_color) {}

std::optional<std::string> StreamConsole::read_line(const std::string& prompt) {
    out_ << prompt;
    out_.flush();
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

void StreamConsole::print_line(const std::string& line) {
    out_ << line << "\n";
}

void StreamConsole::print_error(const std::string& line) {
    out_.flush();
    err_ << line << "\n";
}

std::string StreamConsole::color(Color c) const {
    if (!use_color_) return {};
    switch (c) {
        case Color::Default: return "\x1b[39m";
        case Color::Red: return "\x1b[31m";
        case Color::Yellow: return "\x1b[33m";
        case Color::Cyan: return "\x1b[36m";
    }
    return {};
}

}  // namespace albumtag
