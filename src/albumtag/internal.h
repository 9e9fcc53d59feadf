#pragma once

// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#include <cctype>
#include <cstring>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

#include "albumtag/albumtag.h"
#include "albumtag/tagging.h"

/* ------------------------------------------------------------------- */

namespace albumtag::detail {

static inline const char* make_cstr_copy(const std::string& s) {
    auto* buf = new char[s.size() + 1];
    std::memcpy(buf, s.c_str(), s.size() + 1);
    return buf;
}

static inline const char* make_cstr_copy(const char* s) {
    return make_cstr_copy(s ? std::string{s} : std::string{});
}

static inline std::string to_string_or_empty(const char* s) {
    return s ? std::string{s} : std::string{};
}

static inline std::string to_lower(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (unsigned char c : s) r.push_back(static_cast<char>(std::tolower(c)));
    return r;
}

static inline std::string to_upper(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (unsigned char c : s) r.push_back(static_cast<char>(std::toupper(c)));
    return r;
}

static inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

static inline std::string trim_right(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

static inline bool parse_int_strict(const std::string& s, int& out) {
    const std::string trimmed = trim(s);
    if (trimmed.empty()) return false;
    size_t idx = 0;
    try {
        const int value = std::stoi(trimmed, &idx);
        if (idx != trimmed.size()) return false;
        out = value;
        return true;
    } catch (...) {
        return false;
    }
}

static inline void release_cstr(const char*& s) {
    delete[] s;
    s = nullptr;
}

static inline void set_error(const char** error, const std::string& message) {
    if (!error || *error) return;
    *error = make_cstr_copy(message);
}

static inline void clear_error(const char** error) {
    if (!error) return;
    albumtag_release_error(*error);
    *error = nullptr;
}

static inline AlbumTagTagKV make_kv(const std::string& key, const std::string& value) {
    AlbumTagTagKV kv{};
    kv.key = make_cstr_copy(to_upper(key));
    kv.value = make_cstr_copy(value);
    return kv;
}

static inline TagMap tag_map_from_list(const AlbumTagTagList* list) {
    TagMap out;
    if (!list || !list->tags) return out;
    for (size_t i = 0; i < list->tags_count; ++i) {
        const std::string key = to_upper(to_string_or_empty(list->tags[i].key));
        if (key.empty()) continue;
        out[key] = to_string_or_empty(list->tags[i].value);
    }
    return out;
}

static inline std::string join_multi_values(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ";";
        out += values[i];
    }
    return out;
}

// Parse "[artist]", "[album]" and "[tracklist]" sections.
bool parse_album_text(
    const std::string& text,
    AlbumMetadata& out,
    std::string& error_out);

}  // namespace albumtag::detail
