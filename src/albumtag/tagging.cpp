// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "albumtag/tagging.h"
#include "internal.h"

using namespace albumtag::detail;

namespace albumtag {
namespace {

// Exhaustive over FieldOption: a new alternative fails to compile here.
struct PlanOptionVisitor {
    const std::string& tag;
    const std::string& parent_dir;
    WritePlan& plan;

    void operator()(const UnsetOption&) const {}
    void operator()(const LiteralOption& option) const { plan.set[tag] = option.value; }
    void operator()(const ParentDirOption&) const { plan.set[tag] = parent_dir; }
    void operator()(const RemoveOption&) const { plan.remove.insert(tag); }
};

void apply_options(
    const TagOptions& effective,
    const std::string& parent_dir,
    WritePlan& plan) {

    for (const auto& [tag, option] : effective) {
        std::visit(PlanOptionVisitor{tag, parent_dir, plan}, option);
    }
    // Removal wins over any value set for the same tag.
    for (const auto& tag : plan.remove) {
        plan.set.erase(tag);
    }
}

std::string album_default_for(const AlbumMetadata& album, const std::string& tag) {
    if (tag == kTagAlbum) return album.album;
    return album.artist;
}

}  // namespace

TagOptions resolve_album_options(
    const AlbumMetadata& album,
    const TagOptions& per_run) {

    TagOptions effective = per_run;
    for (const char* tag : kOptionTags) {
        auto it = effective.find(tag);
        if (it == effective.end() || std::holds_alternative<UnsetOption>(it->second)) {
            effective[tag] = LiteralOption{album_default_for(album, tag)};
        }
    }
    return effective;
}

std::string parent_directory_name(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) absolute = path;
    return absolute.lexically_normal().parent_path().filename().string();
}

WritePlan build_write_plan(
    const TrackCandidate& candidate,
    const AlbumMetadata& album,
    const TagOptions& effective,
    const std::string& parent_dir) {

    WritePlan plan;
    if (!candidate.title) return plan;

    plan.set[kTagTitle] = *candidate.title;
    const auto& tracklist = album.tracklist;
    const auto found = std::find(tracklist.begin(), tracklist.end(), *candidate.title);
    if (found != tracklist.end()) {
        plan.set[kTagTrackNumber] = std::to_string(found - tracklist.begin() + 1);
    }
    apply_options(effective, parent_dir, plan);
    return plan;
}

WritePlan build_override_plan(
    const TagOptions& effective,
    const std::string& parent_dir) {

    WritePlan plan;
    apply_options(effective, parent_dir, plan);
    return plan;
}

WritePlan pending_changes(
    const WritePlan& plan,
    const TagMap& stored) {

    WritePlan changes;
    for (const auto& [tag, value] : plan.set) {
        const auto it = stored.find(tag);
        if (it == stored.end() || it->second != value) {
            changes.set[tag] = value;
        }
    }
    for (const auto& tag : plan.remove) {
        if (stored.find(tag) != stored.end()) {
            changes.remove.insert(tag);
        }
    }
    return changes;
}

WriteOutcome write_if_changed(
    TagStore& store,
    const std::string& path,
    const WritePlan& plan,
    std::string& error_out) {

    error_out.clear();
    if (plan.empty()) return WriteOutcome::Unchanged;

    TagMap stored;
    if (!store.read(path, stored, error_out)) return WriteOutcome::Failed;

    const WritePlan changes = pending_changes(plan, stored);
    if (changes.empty()) return WriteOutcome::Unchanged;

    if (!store.write(path, changes, error_out)) return WriteOutcome::Failed;
    return WriteOutcome::Changed;
}

WriteSummary apply_planned_writes(
    TagStore& store,
    const std::vector<PlannedWrite>& planned,
    Console& console) {

    WriteSummary summary;
    for (size_t i = 0; i < planned.size(); ++i) {
        const auto& item = planned[i];
        const std::string path = item.path.string();
        console.print_line("[" + std::to_string(i + 1) + "/" + std::to_string(planned.size()) + "] " + path);

        std::string err;
        switch (write_if_changed(store, path, item.plan, err)) {
            case WriteOutcome::Changed:
                console.print_line("  Updated.");
                ++summary.changed;
                break;
            case WriteOutcome::Unchanged:
                console.print_line("  Unchanged.");
                ++summary.unchanged;
                break;
            case WriteOutcome::Failed:
                console.print_error("  Failed: " + path + ": " + (err.empty() ? "unknown error" : err));
                ++summary.failed;
                break;
        }
    }
    return summary;
}

/* ------------------------------------------------------------------- */

bool FlacTagStore::read(const std::string& path, TagMap& out, std::string& error_out) {
    const char* err = nullptr;
    std::unique_ptr<AlbumTagTagList, decltype(&albumtag_release_tag_list)> list(
        albumtag_read_tags(path.c_str(), &err), &albumtag_release_tag_list);
    if (!list) {
        error_out = err ? std::string{err} : "Failed to read tags";
        albumtag_release_error(err);
        return false;
    }
    albumtag_release_error(err);
    out = tag_map_from_list(list.get());
    return true;
}

bool FlacTagStore::write(const std::string& path, const WritePlan& changes, std::string& error_out) {
    std::vector<AlbumTagTagKV> set;
    set.reserve(changes.set.size());
    for (const auto& [tag, value] : changes.set) {
        set.push_back({tag.c_str(), value.c_str()});
    }
    std::vector<const char*> remove;
    remove.reserve(changes.remove.size());
    for (const auto& tag : changes.remove) {
        remove.push_back(tag.c_str());
    }

    const char* err = nullptr;
    const int ok = albumtag_write_tags(
        path.c_str(),
        set.empty() ? nullptr : set.data(), set.size(),
        remove.empty() ? nullptr : remove.data(), remove.size(),
        &err);
    if (!ok) {
        error_out = err ? std::string{err} : "Failed to write tags";
    }
    albumtag_release_error(err);
    return ok != 0;
}

}  // namespace albumtag
