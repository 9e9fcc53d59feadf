#pragma once

// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#ifndef __ALBUMTAG_H
#define __ALBUMTAG_H

#include <stddef.h>
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------- */

/**
 * Release error string allocated by library functions.
 * @param p Pointer returned via error out-parameters (nullable).
 */
void albumtag_release_error(const char* p);

/* ------------------------------------------------------------------- */

/** Global configuration loaded from INI or defaults. */
typedef struct AlbumTagConfig {
    /** Audio file glob pattern (e.g. "*.flac"). */
    const char* pattern;
    /** Search directories recursively. */
    bool recursive;
    /** Print mode format template. */
    const char* format;
    /** Colored console output. */
    bool color;
    /** Loaded config file path, or null when defaults. */
    const char* config_path;
} AlbumTagConfig;

/**
 * Load configuration from INI file.
 * Search order when path is null: ./albumtag.conf then ~/.albumtag.conf.
 * Returns defaults if no file found; returns null on parse/load error.
 * @param path Optional explicit config path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated config, must free with albumtag_release_config; null on failure.
 */
AlbumTagConfig* albumtag_load_config(
    const char* path /* nullable */,
    const char** error /* nullable */);
/**
 * Release configuration and owned members.
 * @param cfg Config pointer (nullable).
 */
void albumtag_release_config(
    AlbumTagConfig* cfg);

/* ------------------------------------------------------------------- */

/** Album metadata read from a track list file. */
typedef struct AlbumTagAlbum {
    /** Album artist. */
    const char* artist;
    /** Album title. */
    const char* album;
    /** Track titles; array index + 1 is the track number. */
    const char** tracklist;
    /** Number of entries in tracklist. */
    size_t tracklist_count;
} AlbumTagAlbum;

/**
 * Load album metadata from a track list file.
 * The file consists of "[header]" lines followed by value lines.
 * Required headers: artist, album, tracklist.
 * @param path Track list file path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated album; free with albumtag_release_album. Null on failure.
 */
AlbumTagAlbum* albumtag_load_album(
    const char* path,
    const char** error /* nullable */);
/**
 * Release album metadata.
 * @param p Album pointer (nullable).
 */
void albumtag_release_album(
    AlbumTagAlbum* p);

/* ------------------------------------------------------------------- */

/** List of audio file paths. */
typedef struct AlbumTagFileList {
    /** Array of paths (sorted). */
    const char** paths;
    /** Number of entries in paths. */
    size_t count;
} AlbumTagFileList;

/**
 * Collect files under a directory whose names match a glob pattern.
 * @param directory Directory to search.
 * @param pattern Glob pattern matched against file names ('*' and '?').
 * @param recursive True to descend into subdirectories.
 * @param error Optional error string out-parameter.
 * @return Newly allocated list; free with albumtag_release_file_list. Null on failure.
 */
AlbumTagFileList* albumtag_collect_files(
    const char* directory,
    const char* pattern,
    bool recursive,
    const char** error /* nullable */);
/**
 * Release file list.
 * @param p List pointer (nullable).
 */
void albumtag_release_file_list(
    AlbumTagFileList* p);

/* ------------------------------------------------------------------- */

/** Generic tag key/value. */
typedef struct AlbumTagTagKV {
    const char* key;
    const char* value;
} AlbumTagTagKV;

/** Tag list stored in a file. */
typedef struct AlbumTagTagList {
    AlbumTagTagKV* tags;
    size_t tags_count;
} AlbumTagTagList;

/**
 * Read Vorbis comments from a FLAC file.
 * Keys are upper-cased; multiple values of one key are joined with ';'.
 * @param path FLAC file path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated tag list; free with albumtag_release_tag_list. Null on failure.
 */
AlbumTagTagList* albumtag_read_tags(
    const char* path,
    const char** error /* nullable */);
/**
 * Release tag list.
 * @param p List pointer (nullable).
 */
void albumtag_release_tag_list(
    AlbumTagTagList* p);

/**
 * Update Vorbis comments of a FLAC file.
 * Every comment named by a set entry is replaced by the single given value,
 * every comment named in remove is deleted. Other comments are kept.
 * @param path FLAC file path.
 * @param set Tags to set (nullable when set_count is 0).
 * @param set_count Number of tags to set.
 * @param remove Tag names to delete (nullable when remove_count is 0).
 * @param remove_count Number of tag names to delete.
 * @param error Optional error string out-parameter.
 * @return Non-zero on success.
 */
int albumtag_write_tags(
    const char* path,
    const AlbumTagTagKV* set,
    size_t set_count,
    const char* const* remove,
    size_t remove_count,
    const char** error /* nullable */);

#ifdef __cplusplus
}
#endif

#endif
