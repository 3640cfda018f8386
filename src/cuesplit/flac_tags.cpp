// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <map>
#include <optional>
#include <string>

#include <FLAC/metadata.h>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static FLAC__StreamMetadata* build_vorbis_comments(
    const std::map<std::string, std::string>& tags) {

    FLAC__StreamMetadata* meta = FLAC__metadata_object_new(FLAC__METADATA_TYPE_VORBIS_COMMENT);
    if (!meta) return nullptr;
    for (const auto& [key, value] : tags) {
        FLAC__StreamMetadata_VorbisComment_Entry entry;
        if (FLAC__metadata_object_vorbiscomment_entry_from_name_value_pair(&entry, key.c_str(), value.c_str())) {
            // Ownership of entry moves into the block.
            FLAC__metadata_object_vorbiscomment_append_comment(meta, entry, false);
        }
    }
    return meta;
}

namespace cuesplit::detail {

bool tag_flac_file(
    const std::string& path,
    const CueMetadata& meta,
    int track_number,
    int track_total,
    std::optional<int> disc,
    std::string& err) {

    std::map<std::string, std::string> tags = {
        {"ARTIST", meta.artist.value_or(std::string{})},
        {"ALBUM", meta.album.value_or(std::string{})},
        {"DATE", meta.year.value_or(std::string{})},
        {"TRACKNUMBER", track_number > 0 ? std::to_string(track_number) : std::string{}},
        {"TRACKTOTAL", track_total > 0 ? std::to_string(track_total) : std::string{}},
        {"DISCNUMBER", disc ? std::to_string(*disc) : std::string{}},
    };
    for (auto it = tags.begin(); it != tags.end();) {
        if (it->second.empty()) it = tags.erase(it);
        else ++it;
    }

    FLAC__Metadata_Chain* chain = FLAC__metadata_chain_new();
    if (!chain) {
        err = "Failed to create FLAC metadata chain";
        return false;
    }
    if (!FLAC__metadata_chain_read(chain, path.c_str())) {
        err = "Failed to read FLAC metadata: " + path;
        FLAC__metadata_chain_delete(chain);
        return false;
    }
    FLAC__Metadata_Iterator* it = FLAC__metadata_iterator_new();
    if (!it) {
        err = "Failed to create FLAC metadata iterator";
        FLAC__metadata_chain_delete(chain);
        return false;
    }

    // One pass over the chain: every VORBIS_COMMENT goes, and the walk ends
    // parked on the final block, which is where the replacement is inserted.
    // STREAMINFO always leads the chain, so a deletion never empties it.
    FLAC__metadata_iterator_init(it, chain);
    do {
        if (FLAC__metadata_iterator_get_block_type(it) == FLAC__METADATA_TYPE_VORBIS_COMMENT) {
            FLAC__metadata_iterator_delete_block(it, false);
        }
    } while (FLAC__metadata_iterator_next(it));

    FLAC__StreamMetadata* vorbis = build_vorbis_comments(tags);
    if (!vorbis) {
        err = "Failed to build Vorbis comments";
        FLAC__metadata_iterator_delete(it);
        FLAC__metadata_chain_delete(chain);
        return false;
    }
    if (!FLAC__metadata_iterator_insert_block_after(it, vorbis)) {
        FLAC__metadata_object_delete(vorbis);
        err = "Failed to insert Vorbis comment block";
        FLAC__metadata_iterator_delete(it);
        FLAC__metadata_chain_delete(chain);
        return false;
    }

    FLAC__metadata_chain_sort_padding(chain);
    if (!FLAC__metadata_chain_write(chain, true, true)) {
        err = "Failed to write FLAC metadata: " + path;
        FLAC__metadata_iterator_delete(it);
        FLAC__metadata_chain_delete(chain);
        return false;
    }

    FLAC__metadata_iterator_delete(it);
    FLAC__metadata_chain_delete(chain);
    return true;
}

}  // namespace cuesplit::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

int cuesplit_tag_flac_file(
    const char* path,
    const CueSplitCueMetadata* meta,
    int track_number,
    int track_total,
    bool has_disc,
    int disc_number,
    const char** error) {

    clear_error(error);
    if (!path) {
        set_error(error, "Invalid arguments to cuesplit_tag_flac_file");
        return 0;
    }
    CueMetadata m;
    if (meta) {
        if (meta->artist) m.artist = meta->artist;
        if (meta->album) m.album = meta->album;
        if (meta->year) m.year = meta->year;
    }
    const std::optional<int> disc = has_disc ? std::optional<int>{disc_number} : std::nullopt;
    std::string err;
    if (!tag_flac_file(path, m, track_number, track_total, disc, err)) {
        set_error(error, err);
        return 0;
    }
    return 1;
}

};
