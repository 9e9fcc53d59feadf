#pragma once

// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <iosfwd>
#include <optional>
#include <string>

namespace albumtag {

enum class Color {
    Default,
    Red,
    Yellow,
    Cyan,
};

/** Line oriented operator interaction. */
class Console {
public:
    virtual ~Console() = default;
    /** Show prompt and read one line; nullopt at end of input. */
    virtual std::optional<std::string> read_line(const std::string& prompt) = 0;
    virtual void print_line(const std::string& line) = 0;
    virtual void print_error(const std::string& line) = 0;
    /** Escape sequence switching to color, or empty when colors are off. */
    virtual std::string color(Color c) const = 0;
};

class StreamConsole : public Console {
public:
    StreamConsole(std::istream& in, std::ostream& out, std::ostream& err, bool use_color);

    std::optional<std::string> read_line(const std::string& prompt) override;
    void print_line(const std::string& line) override;
    void print_error(const std::string& line) override;
    std::string color(Color c) const override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    bool use_color_;
};

}  // namespace albumtag
