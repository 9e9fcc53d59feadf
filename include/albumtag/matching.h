#pragma once

// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace albumtag {

/** Maximum number of substituted characters accepted in one window. */
constexpr size_t kMaxMismatches = 2;

/**
 * Lower-cased text with skippable characters removed.
 * index_map[i] is the byte offset, in the original UTF-8 string, of the
 * character that became text[i]. The map is strictly increasing.
 */
struct NormalizedString {
    std::u32string text;
    std::vector<size_t> index_map;
};

/** Whitespace and the characters ()[]{}-_ are ignored when comparing. */
bool is_skippable_char(char32_t ch);

/**
 * Normalize a UTF-8 string for comparison.
 * Invalid UTF-8 bytes are taken as single characters.
 */
NormalizedString normalize(const std::string& input);

/** Nothing in the tracklist matched. */
struct NoMatch {};

/** Title chosen by the operator instead of by the matcher. */
struct ManualMatch {};

/** Window of the normalized file name that matched a normalized title. */
struct AutomaticMatch {
    size_t start{0};
    size_t length{0};
    /** Positions in the normalized file name, ascending. */
    std::vector<size_t> mismatches;
};

using Match = std::variant<NoMatch, AutomaticMatch, ManualMatch>;

/**
 * Find the leftmost window of haystack that equals needle with at most
 * kMaxMismatches substituted characters.
 * Windows with fewer mismatches further right are not considered.
 * @throws std::invalid_argument if haystack or needle is empty.
 */
Match match_strings(
    const std::u32string& haystack,
    const std::u32string& needle);

/** Best title for a file name, or no title with NoMatch. */
struct TitleGuess {
    std::optional<std::string> title;
    Match match;
};

/**
 * Match every tracklist title against the file name stem and pick one.
 * A later title replaces the current best when it is longer without more
 * mismatches, or when it has fewer mismatches. Remaining ties keep the
 * earlier title.
 */
TitleGuess select_best_title(
    const std::string& file_stem,
    const std::vector<std::string>& tracklist);

/** A file and the title it will be tagged with. */
struct TrackCandidate {
    std::filesystem::path path;
    Match match;
    /** Unset: the file is left unchanged. */
    std::optional<std::string> title;
};

std::vector<TrackCandidate> identify_tracks(
    const std::vector<std::filesystem::path>& files,
    const std::vector<std::string>& tracklist);

/** Byte ranges [first, second) in the original string. */
struct HighlightSpans {
    std::pair<size_t, size_t> matched;
    std::vector<std::pair<size_t, size_t>> mismatches;
};

/**
 * Translate a match on normalize(original) back to original byte ranges.
 * Returns nullopt when the match does not fit the string.
 */
std::optional<HighlightSpans> highlight_spans(
    const std::string& original,
    const AutomaticMatch& match);

/** Strings inserted around the highlighted parts. */
struct HighlightMarkers {
    std::string start;
    std::string mismatch;
    std::string end;
};

/**
 * Insert markers into original: start before the matched span, end after
 * it, mismatch before every mismatched character and start after it.
 */
std::string format_highlighted(
    const std::string& original,
    const AutomaticMatch& match,
    const HighlightMarkers& markers);

}  // namespace albumtag
