// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <FLAC/metadata.h>

#include "internal.h"

using namespace albumtag::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

using ChainPtr = std::unique_ptr<FLAC__Metadata_Chain, decltype(&FLAC__metadata_chain_delete)>;
using IteratorPtr = std::unique_ptr<FLAC__Metadata_Iterator, decltype(&FLAC__metadata_iterator_delete)>;

static ChainPtr read_chain(
    const std::string& path,
    const char** error) {

    ChainPtr chain(FLAC__metadata_chain_new(), &FLAC__metadata_chain_delete);
    if (!chain) {
        set_error(error, "Failed to create FLAC metadata chain");
        return chain;
    }
    if (!FLAC__metadata_chain_read(chain.get(), path.c_str())) {
        const FLAC__Metadata_ChainStatus status = FLAC__metadata_chain_status(chain.get());
        set_error(error, "Failed to read FLAC metadata: " + path +
            " (" + FLAC__Metadata_ChainStatusString[status] + ")");
        chain.reset();
    }
    return chain;
}

// Leaves the iterator on the Vorbis comment block when one exists.
static FLAC__StreamMetadata* find_vorbis_comment(
    FLAC__Metadata_Iterator* it,
    FLAC__Metadata_Chain* chain) {

    FLAC__metadata_iterator_init(it, chain);
    do {
        FLAC__StreamMetadata* block = FLAC__metadata_iterator_get_block(it);
        if (block && block->type == FLAC__METADATA_TYPE_VORBIS_COMMENT) {
            return block;
        }
    } while (FLAC__metadata_iterator_next(it));
    return nullptr;
}

static std::map<std::string, std::vector<std::string>> collect_vorbis_comments(
    const FLAC__StreamMetadata* block) {

    std::map<std::string, std::vector<std::string>> out;
    const auto& vc = block->data.vorbis_comment;
    for (uint32_t i = 0; i < vc.num_comments; ++i) {
        const auto& entry = vc.comments[i];
        char* name = nullptr;
        char* value = nullptr;
        if (FLAC__metadata_object_vorbiscomment_entry_to_name_value_pair(
                entry, &name, &value)) {
            out[to_upper(to_string_or_empty(name))].push_back(to_string_or_empty(value));
        }
        if (name) free(name);
        if (value) free(value);
    }
    return out;
}

static FLAC__StreamMetadata* append_vorbis_comment(
    FLAC__Metadata_Iterator* it,
    FLAC__Metadata_Chain* chain,
    const char** error) {

    FLAC__StreamMetadata* block = FLAC__metadata_object_new(FLAC__METADATA_TYPE_VORBIS_COMMENT);
    if (!block) {
        set_error(error, "Failed to create Vorbis comment block");
        return nullptr;
    }
    FLAC__metadata_iterator_init(it, chain);
    while (FLAC__metadata_iterator_next(it)) {
        // move to last block
    }
    if (!FLAC__metadata_iterator_insert_block_after(it, block)) {
        FLAC__metadata_object_delete(block);
        set_error(error, "Failed to insert Vorbis comment block");
        return nullptr;
    }
    return block;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

AlbumTagTagList* albumtag_read_tags(
    const char* path,
    const char** error) {

    clear_error(error);
    if (!path) {
        set_error(error, "Path is null");
        return nullptr;
    }

    const std::string path_str(path);
    ChainPtr chain = read_chain(path_str, error);
    if (!chain) return nullptr;

    IteratorPtr it(FLAC__metadata_iterator_new(), &FLAC__metadata_iterator_delete);
    if (!it) {
        set_error(error, "Failed to create FLAC metadata iterator");
        return nullptr;
    }

    auto* list = new AlbumTagTagList{};
    const FLAC__StreamMetadata* block = find_vorbis_comment(it.get(), chain.get());
    if (!block) return list;

    const auto comments = collect_vorbis_comments(block);
    if (!comments.empty()) {
        list->tags_count = comments.size();
        list->tags = new AlbumTagTagKV[list->tags_count]{};
        size_t i = 0;
        for (const auto& [key, values] : comments) {
            list->tags[i++] = make_kv(key, join_multi_values(values));
        }
    }
    return list;
}

void albumtag_release_tag_list(
    AlbumTagTagList* p) {

    if (!p) return;
    if (p->tags) {
        for (size_t i = 0; i < p->tags_count; ++i) {
            release_cstr(p->tags[i].key);
            release_cstr(p->tags[i].value);
        }
        delete[] p->tags;
        p->tags = nullptr;
    }
    p->tags_count = 0;
    delete p;
}

int albumtag_write_tags(
    const char* path,
    const AlbumTagTagKV* set,
    size_t set_count,
    const char* const* remove,
    size_t remove_count,
    const char** error) {

    clear_error(error);
    if (!path || (!set && set_count > 0) || (!remove && remove_count > 0)) {
        set_error(error, "Invalid arguments to albumtag_write_tags");
        return 0;
    }

    const std::string path_str(path);
    ChainPtr chain = read_chain(path_str, error);
    if (!chain) return 0;

    IteratorPtr it(FLAC__metadata_iterator_new(), &FLAC__metadata_iterator_delete);
    if (!it) {
        set_error(error, "Failed to create FLAC metadata iterator");
        return 0;
    }

    FLAC__StreamMetadata* vorbis = find_vorbis_comment(it.get(), chain.get());
    if (!vorbis) {
        vorbis = append_vorbis_comment(it.get(), chain.get(), error);
        if (!vorbis) return 0;
    }

    for (size_t i = 0; i < remove_count; ++i) {
        const std::string key = to_upper(to_string_or_empty(remove[i]));
        if (key.empty()) continue;
        if (FLAC__metadata_object_vorbiscomment_remove_entries_matching(vorbis, key.c_str()) < 0) {
            set_error(error, "Failed to remove tag " + key + ": " + path_str);
            return 0;
        }
    }

    for (size_t i = 0; i < set_count; ++i) {
        const std::string key = to_upper(to_string_or_empty(set[i].key));
        const std::string value = to_string_or_empty(set[i].value);
        FLAC__StreamMetadata_VorbisComment_Entry entry;
        if (key.empty() ||
            !FLAC__metadata_object_vorbiscomment_entry_from_name_value_pair(&entry, key.c_str(), value.c_str())) {
            set_error(error, "Invalid tag \"" + key + "\": " + path_str);
            return 0;
        }
        // Takes ownership of entry on success.
        if (!FLAC__metadata_object_vorbiscomment_replace_comment(vorbis, entry, /*all=*/true, /*copy=*/false)) {
            free(entry.entry);
            set_error(error, "Failed to set tag " + key + ": " + path_str);
            return 0;
        }
    }

    if (!FLAC__metadata_chain_write(chain.get(), /*use_padding=*/true, /*preserve_file_stats=*/true)) {
        const FLAC__Metadata_ChainStatus status = FLAC__metadata_chain_status(chain.get());
        set_error(error, "Failed to write FLAC metadata: " + path_str +
            " (" + FLAC__Metadata_ChainStatusString[status] + ")");
        return 0;
    }
    return 1;
}

};
