// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <glib.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include "internal.h"

using namespace albumtag::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static constexpr const char kGroup[] = "albumtag";

static void replace_cstr(
    const char*& target,
    const std::string& value) {

    release_cstr(target);
    target = make_cstr_copy(value);
}

static std::string strip_inline_comment_value(
    const std::string& raw) {

    bool in_single = false;
    bool in_double = false;
    bool escaped = false;
    for (size_t i = 0; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (ch == '\\') {
            escaped = true;
            continue;
        }
        if (ch == '\'' && !in_double) {
            in_single = !in_single;
            continue;
        }
        if (ch == '"' && !in_single) {
            in_double = !in_double;
            continue;
        }
        if (!in_single && !in_double && (ch == '#' || ch == ';')) {
            if (i == 0 || std::isspace(static_cast<unsigned char>(raw[i - 1]))) {
                return trim(raw.substr(0, i));
            }
        }
    }
    return trim(raw);
}

static bool parse_bool_value(
    const std::string& raw,
    bool& out) {

    const std::string value = to_lower(trim(raw));
    if (value == "true" || value == "1") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0") {
        out = false;
        return true;
    }
    return false;
}

// Reads [albumtag] key. Returns false with error set when the value exists
// but cannot be read; found reports whether the key exists.
static bool read_string_key(
    GKeyFile* key_file,
    const char* key,
    std::string& out,
    bool& found,
    std::string& err) {

    found = false;
    if (!g_key_file_has_key(key_file, kGroup, key, nullptr)) return true;

    GError* gerr = nullptr;
    char* value = g_key_file_get_string(key_file, kGroup, key, &gerr);
    if (!value) {
        err = (gerr && gerr->message) ? gerr->message : std::string{"Failed to parse "} + key;
        if (gerr) g_error_free(gerr);
        return false;
    }
    out = strip_inline_comment_value(value);
    g_free(value);
    found = true;
    return true;
}

static bool read_bool_key(
    GKeyFile* key_file,
    const char* key,
    bool& out,
    std::string& err) {

    std::string raw;
    bool found = false;
    if (!read_string_key(key_file, key, raw, found, err)) return false;
    if (!found) return true;
    if (!parse_bool_value(raw, out)) {
        err = std::string{"Invalid "} + key + " value";
        return false;
    }
    return true;
}

static AlbumTagConfig* make_default_config() {
    auto* cfg = new AlbumTagConfig{};
    cfg->pattern = make_cstr_copy("*.flac");
    cfg->recursive = false;
    cfg->format = make_cstr_copy("{title}\\n{artist}\\n{album}");
    cfg->color = true;
    cfg->config_path = nullptr;
    return cfg;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

AlbumTagConfig* albumtag_load_config(
    const char* path,
    const char** error) {

    clear_error(error);

    auto* cfg = make_default_config();
    GKeyFile* key_file = g_key_file_new();
    bool loaded = false;
    std::string loaded_path;

    auto fail = [&](const std::string& message) -> AlbumTagConfig* {
        set_error(error, message);
        albumtag_release_config(cfg);
        g_key_file_unref(key_file);
        return nullptr;
    };

    std::vector<std::string> candidates;
    if (path) {
        candidates.emplace_back(path);
    } else {
        candidates.emplace_back("albumtag.conf");
        const char* home = std::getenv("HOME");
        if (home) {
            const std::filesystem::path home_path = std::filesystem::path(home) / ".albumtag.conf";
            candidates.emplace_back(home_path.string());
        }
    }

    for (const auto& candidate : candidates) {
        GError* gerr = nullptr;
        if (g_key_file_load_from_file(key_file, candidate.c_str(), G_KEY_FILE_NONE, &gerr)) {
            loaded = true;
            loaded_path = candidate;
            break;
        }
        if (gerr) {
            if (path) {
                const std::string message = gerr->message ? gerr->message : "Failed to load config";
                g_error_free(gerr);
                return fail(message);
            }
            g_error_free(gerr);
        }
    }

    if (!loaded) {
        g_key_file_unref(key_file);
        return cfg;
    }

    std::string err;
    std::string value;
    bool found = false;

    if (!read_string_key(key_file, "pattern", value, found, err)) return fail(err);
    if (found) {
        if (value.empty()) return fail("Invalid pattern value");
        replace_cstr(cfg->pattern, value);
    }

    if (!read_string_key(key_file, "format", value, found, err)) return fail(err);
    if (found && !value.empty()) replace_cstr(cfg->format, value);

    if (!read_bool_key(key_file, "recursive", cfg->recursive, err)) return fail(err);
    if (!read_bool_key(key_file, "color", cfg->color, err)) return fail(err);

    g_key_file_unref(key_file);
    cfg->config_path = make_cstr_copy(loaded_path);
    return cfg;
}

void albumtag_release_config(
    AlbumTagConfig* cfg) {

    if (!cfg) return;
    release_cstr(cfg->pattern);
    release_cstr(cfg->format);
    release_cstr(cfg->config_path);
    delete cfg;
}

};
