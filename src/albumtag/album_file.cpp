// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <glib.h>

#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "internal.h"

using namespace albumtag::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

using AlbumTable = std::map<std::string, std::vector<std::string>>;

static constexpr const char kArtistHeader[] = "artist";
static constexpr const char kAlbumHeader[] = "album";
static constexpr const char kTracklistHeader[] = "tracklist";

static std::string strip_bom(const std::string& line) {
    static constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";
    if (line.compare(0, 3, kUtf8Bom) == 0) return line.substr(3);
    return line;
}

// "[name]" -> name; other lines are values.
static bool parse_header(const std::string& entry, std::string& header) {
    if (entry.size() < 2 || entry.front() != '[' || entry.back() != ']') return false;
    header = entry.substr(1, entry.size() - 2);
    return true;
}

static AlbumTable read_album_table(const std::string& text) {
    AlbumTable data{{"", {}}};
    std::string current;
    std::istringstream iss(text);
    std::string line;
    bool first = true;
    while (std::getline(iss, line)) {
        if (first) {
            line = strip_bom(line);
            first = false;
        }
        const std::string entry = trim_right(line);
        if (entry.empty()) continue;

        std::string header;
        if (parse_header(entry, header)) {
            // A repeated header continues its existing list.
            current = header;
            data[current];
            continue;
        }
        data[current].push_back(entry);
    }
    return data;
}

static const std::vector<std::string>* find_header(
    const AlbumTable& data,
    const char* header) {

    const auto it = data.find(header);
    if (it == data.end() || it->second.empty()) return nullptr;
    return &it->second;
}

/* ------------------------------------------------------------------- */

namespace albumtag::detail {

bool parse_album_text(
    const std::string& text,
    AlbumMetadata& out,
    std::string& error_out) {

    const AlbumTable data = read_album_table(text);
    const auto* artist = find_header(data, kArtistHeader);
    if (!artist) {
        error_out = std::string{"No "} + kArtistHeader;
        return false;
    }
    const auto* album = find_header(data, kAlbumHeader);
    if (!album) {
        error_out = std::string{"No "} + kAlbumHeader;
        return false;
    }
    const auto* tracklist = find_header(data, kTracklistHeader);
    if (!tracklist) {
        error_out = std::string{"No "} + kTracklistHeader;
        return false;
    }

    out.artist = artist->front();
    out.album = album->front();
    out.tracklist = *tracklist;
    return true;
}

}  // namespace albumtag::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

AlbumTagAlbum* albumtag_load_album(
    const char* path,
    const char** error) {

    clear_error(error);
    if (!path) {
        set_error(error, "Path is null");
        return nullptr;
    }

    gchar* contents = nullptr;
    gsize length = 0;
    GError* gerr = nullptr;
    if (!g_file_get_contents(path, &contents, &length, &gerr)) {
        set_error(error, (gerr && gerr->message) ? gerr->message : "Failed to read album file");
        if (gerr) g_error_free(gerr);
        return nullptr;
    }
    const std::string text(contents, length);
    g_free(contents);

    if (!g_utf8_validate(text.data(), static_cast<gssize>(text.size()), nullptr)) {
        set_error(error, "Album file is not valid UTF-8: " + std::string{path});
        return nullptr;
    }

    albumtag::AlbumMetadata album;
    std::string parse_err;
    if (!parse_album_text(text, album, parse_err)) {
        set_error(error, parse_err);
        return nullptr;
    }

    auto* out = new AlbumTagAlbum{};
    out->artist = make_cstr_copy(album.artist);
    out->album = make_cstr_copy(album.album);
    out->tracklist_count = album.tracklist.size();
    out->tracklist = new const char*[out->tracklist_count]{};
    for (size_t i = 0; i < out->tracklist_count; ++i) {
        out->tracklist[i] = make_cstr_copy(album.tracklist[i]);
    }
    return out;
}

void albumtag_release_album(
    AlbumTagAlbum* p) {

    if (!p) return;
    release_cstr(p->artist);
    release_cstr(p->album);
    if (p->tracklist) {
        for (size_t i = 0; i < p->tracklist_count; ++i) {
            release_cstr(p->tracklist[i]);
        }
        delete[] p->tracklist;
        p->tracklist = nullptr;
    }
    p->tracklist_count = 0;
    delete p;
}

};
