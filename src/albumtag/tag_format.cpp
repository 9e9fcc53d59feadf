// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "albumtag/tagging.h"
#include "internal.h"

using namespace albumtag::detail;

namespace albumtag {
namespace {

class TagValue {
public:
    virtual ~TagValue() = default;
    virtual std::string render(const std::string& spec) const = 0;
};

// Modifier "n": first line only, path separators and dots replaced.
// Modifier "u": upper case.
class TextTagValue : public TagValue {
public:
    explicit TextTagValue(std::string text)
        : text_(std::move(text)) {}

    std::string render(const std::string& spec) const override {
        if (spec == "n") return file_name_safe(text_);
        if (spec == "u") return to_upper(text_);
        return text_;
    }

private:
    static std::string file_name_safe(const std::string& s) {
        static constexpr char kTrailing[] = ".,;|~/\\^";
        static constexpr char kReplaced[] = ".:;|/\\^";
        std::string out = s.substr(0, s.find_first_of("\r\n"));
        while (!out.empty() && std::strchr(kTrailing, out.back()) != nullptr) {
            out.pop_back();
        }
        std::replace_if(out.begin(), out.end(),
            [](char ch) { return ch != '\0' && std::strchr(kReplaced, ch) != nullptr; }, '_');
        return out;
    }

    std::string text_;
};

// Modifier "<width>d": zero padded up to kMaxPadWidth. Anything else prints
// the stored text.
class NumberTagValue : public TagValue {
public:
    static constexpr int kMaxPadWidth = 32;

    NumberTagValue(int number, std::string text)
        : number_(number), text_(std::move(text)) {}

    std::string render(const std::string& spec) const override {
        int width = 0;
        if (spec.size() < 2 || spec.back() != 'd' ||
            !parse_int_strict(spec.substr(0, spec.size() - 1), width) ||
            width <= 0 || width > kMaxPadWidth) {
            return text_;
        }
        std::ostringstream oss;
        oss << std::setw(width) << std::setfill('0') << number_;
        return oss.str();
    }

private:
    int number_;
    std::string text_;
};

using TagValueMap = std::map<std::string, std::unique_ptr<TagValue>>;

bool is_numeric_tag(const std::string& key) {
    return key == kTagTrackNumber
        || key == "TRACKTOTAL"
        || key == "DISCNUMBER"
        || key == "DISCTOTAL";
}

TagValueMap make_tag_values(const TagMap& tags) {
    TagValueMap values;
    for (const auto& [key, text] : tags) {
        int number = 0;
        if (is_numeric_tag(key) && parse_int_strict(text, number)) {
            values[key] = std::make_unique<NumberTagValue>(number, text);
        } else {
            values[key] = std::make_unique<TextTagValue>(text);
        }
    }
    return values;
}

std::string render_field(const std::string& field, const TagValueMap& values) {
    const auto colon = field.find(':');
    const std::string key = to_upper(field.substr(0, colon));
    const std::string spec = colon == std::string::npos ? std::string{} : field.substr(colon + 1);
    const auto it = values.find(key);
    return it != values.end() ? it->second->render(spec) : std::string{};
}

// "{a+b/c}": '+' joins with a space, '/' with a slash; empty fields are
// dropped together with the joiner in front of them.
std::string render_placeholder(const std::string& body, const TagValueMap& values) {
    std::string out;
    char joiner = '\0';
    size_t start = 0;
    while (true) {
        const size_t op = body.find_first_of("+/", start);
        const std::string value = render_field(body.substr(start, op - start), values);
        if (!value.empty()) {
            if (!out.empty() && joiner != '\0') out.push_back(joiner == '+' ? ' ' : '/');
            out += value;
        }
        if (op == std::string::npos) break;
        joiner = body[op];
        start = op + 1;
    }
    return out;
}

}  // namespace

std::string render_tag_format(
    const std::string& format,
    const TagMap& tags) {

    const TagValueMap values = make_tag_values(tags);
    std::string out;
    out.reserve(format.size() * 2);
    for (size_t i = 0; i < format.size(); ++i) {
        const char ch = format[i];
        if (ch == '\\' && i + 1 < format.size()) {
            const char next = format[i + 1];
            if (next == 'n' || next == 't' || next == '\\') {
                out.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : '\\');
                ++i;
                continue;
            }
        }
        if (ch == '{') {
            const size_t close = format.find('}', i);
            if (close != std::string::npos) {
                out += render_placeholder(format.substr(i + 1, close - i - 1), values);
                i = close;
                continue;
            }
        }
        out.push_back(ch);
    }
    return out;
}

}  // namespace albumtag
