// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <glib.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "albumtag/matching.h"

namespace albumtag {
namespace {

constexpr char32_t kSkippableChars[] = U"()[]{}-_";

// Decode the character at byte offset pos. Bytes that do not start a valid
// UTF-8 sequence are taken as one Latin-1 character.
char32_t decode_char_at(const std::string& s, size_t pos, size_t& width) {
    const char* p = s.data() + pos;
    const gunichar ch = g_utf8_get_char_validated(p, static_cast<gssize>(s.size() - pos));
    if (ch == static_cast<gunichar>(-1) || ch == static_cast<gunichar>(-2)) {
        width = 1;
        return static_cast<unsigned char>(*p);
    }
    width = static_cast<size_t>(g_utf8_next_char(p) - p);
    return static_cast<char32_t>(ch);
}

size_t char_width_at(const std::string& s, size_t pos) {
    size_t width = 1;
    decode_char_at(s, pos, width);
    return width;
}

size_t count_mismatches(
    const std::u32string& haystack,
    size_t offset,
    const std::u32string& needle,
    std::vector<size_t>& positions) {

    positions.clear();
    for (size_t i = 0; i < needle.size(); ++i) {
        if (haystack[offset + i] != needle[i]) {
            positions.push_back(offset + i);
            // No need to scan the rest of a rejected window.
            if (positions.size() > kMaxMismatches) break;
        }
    }
    return positions.size();
}

}  // namespace

bool is_skippable_char(char32_t ch) {
    if (g_unichar_isspace(static_cast<gunichar>(ch))) return true;
    for (const char32_t* p = kSkippableChars; *p != U'\0'; ++p) {
        if (*p == ch) return true;
    }
    return false;
}

NormalizedString normalize(const std::string& input) {
    NormalizedString out;
    out.text.reserve(input.size());
    out.index_map.reserve(input.size());
    size_t pos = 0;
    while (pos < input.size()) {
        size_t width = 1;
        const char32_t ch = decode_char_at(input, pos, width);
        if (!is_skippable_char(ch)) {
            out.text.push_back(static_cast<char32_t>(g_unichar_tolower(static_cast<gunichar>(ch))));
            out.index_map.push_back(pos);
        }
        pos += width;
    }
    return out;
}

Match match_strings(
    const std::u32string& haystack,
    const std::u32string& needle) {

    if (haystack.empty() || needle.empty()) {
        throw std::invalid_argument("match_strings requires non-empty strings");
    }
    if (needle.size() > haystack.size()) return NoMatch{};

    std::vector<size_t> positions;
    positions.reserve(kMaxMismatches + 1);
    for (size_t offset = 0; offset + needle.size() <= haystack.size(); ++offset) {
        if (count_mismatches(haystack, offset, needle, positions) <= kMaxMismatches) {
            return AutomaticMatch{offset, needle.size(), positions};
        }
    }
    return NoMatch{};
}

TitleGuess select_best_title(
    const std::string& file_stem,
    const std::vector<std::string>& tracklist) {

    TitleGuess result{std::nullopt, NoMatch{}};
    const NormalizedString file = normalize(file_stem);
    if (file.text.empty()) return result;

    const AutomaticMatch* best = nullptr;
    for (const auto& title : tracklist) {
        const NormalizedString normalized_title = normalize(title);
        if (normalized_title.text.empty()) continue;

        Match match = match_strings(file.text, normalized_title.text);
        const auto* current = std::get_if<AutomaticMatch>(&match);
        if (!current) continue;

        const size_t best_length = best ? best->length : 0;
        const size_t best_misses = best ? best->mismatches.size() : 0;
        const size_t misses = current->mismatches.size();
        const bool longer_not_worse = current->length > best_length && misses <= best_misses;
        const bool fewer_misses = misses < best_misses;
        if (longer_not_worse || fewer_misses || !best) {
            result.title = title;
            result.match = std::move(match);
            best = std::get_if<AutomaticMatch>(&result.match);
        }
    }
    return result;
}

std::vector<TrackCandidate> identify_tracks(
    const std::vector<std::filesystem::path>& files,
    const std::vector<std::string>& tracklist) {

    std::vector<TrackCandidate> candidates;
    candidates.reserve(files.size());
    for (const auto& path : files) {
        TitleGuess guess = select_best_title(path.stem().string(), tracklist);
        candidates.push_back({path, std::move(guess.match), std::move(guess.title)});
    }
    return candidates;
}

std::optional<HighlightSpans> highlight_spans(
    const std::string& original,
    const AutomaticMatch& match) {

    const NormalizedString normalized = normalize(original);
    const auto& index_map = normalized.index_map;
    if (match.length == 0 || match.start + match.length > index_map.size()) {
        return std::nullopt;
    }

    HighlightSpans spans;
    const size_t last = index_map[match.start + match.length - 1];
    spans.matched = {index_map[match.start], last + char_width_at(original, last)};
    for (size_t idx : match.mismatches) {
        if (idx < match.start || idx >= match.start + match.length) return std::nullopt;
        const size_t begin = index_map[idx];
        spans.mismatches.emplace_back(begin, begin + char_width_at(original, begin));
    }
    std::sort(spans.mismatches.begin(), spans.mismatches.end());
    return spans;
}

std::string format_highlighted(
    const std::string& original,
    const AutomaticMatch& match,
    const HighlightMarkers& markers) {

    const auto spans = highlight_spans(original, match);
    if (!spans) return original;

    // All insertion points are known up front and already ordered, so the
    // output is assembled in one forward pass over the original.
    std::vector<std::pair<size_t, const std::string*>> inserts;
    inserts.reserve(spans->mismatches.size() * 2 + 2);
    inserts.emplace_back(spans->matched.first, &markers.start);
    for (const auto& [begin, end] : spans->mismatches) {
        inserts.emplace_back(begin, &markers.mismatch);
        inserts.emplace_back(end, &markers.start);
    }
    inserts.emplace_back(spans->matched.second, &markers.end);

    std::string out;
    out.reserve(original.size() + inserts.size() * 8);
    size_t copied = 0;
    for (const auto& [offset, marker] : inserts) {
        out.append(original, copied, offset - copied);
        out += *marker;
        copied = offset;
    }
    out.append(original, copied, std::string::npos);
    return out;
}

}  // namespace albumtag
