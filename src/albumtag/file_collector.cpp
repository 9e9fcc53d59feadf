// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <glib.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "internal.h"

using namespace albumtag::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static bool matches_pattern(
    const std::filesystem::path& path,
    const std::string& pattern) {

    const std::string name = path.filename().string();
    return g_pattern_match_simple(pattern.c_str(), name.c_str()) != FALSE;
}

template <typename Iterator>
static bool collect_matching(
    Iterator it,
    const std::string& pattern,
    std::vector<std::string>& out,
    std::error_code& ec) {

    for (; !ec && it != Iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && matches_pattern(it->path(), pattern)) {
            out.push_back(it->path().string());
        }
    }
    return !ec;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

AlbumTagFileList* albumtag_collect_files(
    const char* directory,
    const char* pattern,
    bool recursive,
    const char** error) {

    clear_error(error);
    if (!directory || !pattern) {
        set_error(error, "Directory or pattern is null");
        return nullptr;
    }

    const std::filesystem::path root(directory);
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        set_error(error, "Not a directory: " + std::string(directory));
        return nullptr;
    }

    std::vector<std::string> paths;
    bool ok = false;
    if (recursive) {
        ok = collect_matching(
            std::filesystem::recursive_directory_iterator(
                root, std::filesystem::directory_options::skip_permission_denied, ec),
            pattern, paths, ec);
    } else {
        ok = collect_matching(std::filesystem::directory_iterator(root, ec), pattern, paths, ec);
    }
    if (!ok) {
        set_error(error, "Failed to list " + std::string(directory) + ": " + ec.message());
        return nullptr;
    }

    std::sort(paths.begin(), paths.end());

    auto* list = new AlbumTagFileList{};
    if (!paths.empty()) {
        list->count = paths.size();
        list->paths = new const char*[list->count]{};
        for (size_t i = 0; i < list->count; ++i) {
            list->paths[i] = make_cstr_copy(paths[i]);
        }
    }
    return list;
}

void albumtag_release_file_list(
    AlbumTagFileList* p) {

    if (!p) return;
    if (p->paths) {
        for (size_t i = 0; i < p->count; ++i) {
            release_cstr(p->paths[i]);
        }
        delete[] p->paths;
        p->paths = nullptr;
    }
    p->count = 0;
    delete p;
}

};
