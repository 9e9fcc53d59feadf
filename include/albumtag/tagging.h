#pragma once

// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <array>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "albumtag/console.h"
#include "albumtag/matching.h"

namespace albumtag {

constexpr const char* kTagTitle = "TITLE";
constexpr const char* kTagTrackNumber = "TRACKNUMBER";
constexpr const char* kTagArtist = "ARTIST";
constexpr const char* kTagAlbumArtist = "ALBUMARTIST";
constexpr const char* kTagAlbum = "ALBUM";

/** Tags that accept per-run directives. */
constexpr std::array<const char*, 3> kOptionTags = {
    kTagArtist,
    kTagAlbumArtist,
    kTagAlbum,
};

/** Stored tags of one file: upper-case name -> value. */
using TagMap = std::map<std::string, std::string>;

struct AlbumMetadata {
    std::string artist;
    std::string album;
    std::vector<std::string> tracklist;
};

/** No directive given. */
struct UnsetOption {};

/** Use the value as given. */
struct LiteralOption {
    std::string value;
};

/** Use the name of the directory containing the file. */
struct ParentDirOption {};

/** Delete the tag. */
struct RemoveOption {};

using FieldOption = std::variant<UnsetOption, LiteralOption, ParentDirOption, RemoveOption>;

/** Directive per tag name; tags not present are unset. */
using TagOptions = std::map<std::string, FieldOption>;

struct WritePlan {
    std::map<std::string, std::string> set;
    std::set<std::string> remove;

    bool empty() const { return set.empty() && remove.empty(); }
};

/**
 * Fill unset ARTIST and ALBUMARTIST with the album artist and unset ALBUM
 * with the album title. Given directives are kept as they are.
 */
TagOptions resolve_album_options(
    const AlbumMetadata& album,
    const TagOptions& per_run);

/** Name of the directory that contains path. */
std::string parent_directory_name(const std::filesystem::path& path);

/**
 * Plan TITLE, TRACKNUMBER and every resolved directive for a candidate.
 * Candidates without a title get an empty plan.
 */
WritePlan build_write_plan(
    const TrackCandidate& candidate,
    const AlbumMetadata& album,
    const TagOptions& effective,
    const std::string& parent_dir);

/** Plan only the directives, as used without a track list. */
WritePlan build_override_plan(
    const TagOptions& effective,
    const std::string& parent_dir);

/**
 * Entries of plan that would change stored: set values that differ and
 * removals of tags that are present.
 */
WritePlan pending_changes(
    const WritePlan& plan,
    const TagMap& stored);

/** Read/write access to the tags of one file at a time. */
class TagStore {
public:
    virtual ~TagStore() = default;
    virtual bool read(const std::string& path, TagMap& out, std::string& error_out) = 0;
    virtual bool write(const std::string& path, const WritePlan& changes, std::string& error_out) = 0;
};

/** TagStore on FLAC Vorbis comments. */
class FlacTagStore : public TagStore {
public:
    bool read(const std::string& path, TagMap& out, std::string& error_out) override;
    bool write(const std::string& path, const WritePlan& changes, std::string& error_out) override;
};

enum class WriteOutcome {
    Unchanged,
    Changed,
    Failed,
};

/** Write the pending part of plan; no write happens when nothing differs. */
WriteOutcome write_if_changed(
    TagStore& store,
    const std::string& path,
    const WritePlan& plan,
    std::string& error_out);

struct PlannedWrite {
    std::filesystem::path path;
    WritePlan plan;
};

struct WriteSummary {
    size_t changed{0};
    size_t unchanged{0};
    size_t failed{0};
};

/**
 * Apply every plan in order. A failed file is reported and counted, the
 * remaining files are still processed.
 */
WriteSummary apply_planned_writes(
    TagStore& store,
    const std::vector<PlannedWrite>& planned,
    Console& console);

/**
 * Render a print-mode format string ({title}, {tracknumber:02d},
 * {artist:n}, {artist+album}) with stored tags. "\n" and "\t" escapes
 * are expanded.
 */
std::string render_tag_format(
    const std::string& format,
    const TagMap& tags);

}  // namespace albumtag
