// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <filesystem>
#include <optional>
#include <string>
#include <unistd.h>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static bool is_writable(
    const std::string& path) {

    return ::access(path.c_str(), W_OK) == 0;
}

static CueMetadata from_public_metadata(
    const CueSplitCueMetadata* meta) {

    CueMetadata out;
    if (!meta) return out;
    if (meta->artist) out.artist = meta->artist;
    if (meta->album) out.album = meta->album;
    if (meta->year) out.year = meta->year;
    return out;
}

namespace cuesplit::detail {

std::string compose_folder_name(
    const CueMetadata& meta,
    std::optional<int> disc) {

    const std::string artist = (meta.artist && !meta.artist->empty())
        ? *meta.artist : std::string{"Unknown Artist"};
    const std::string album = (meta.album && !meta.album->empty())
        ? *meta.album : std::string{"Unknown Album"};
    const std::string year = meta.year.value_or(std::string{});

    std::string folder = year.empty()
        ? artist + " - " + album
        : artist + " - " + year + " - " + album;

    // Album titles like "Foo (Disc 2)" or "Foo CD1" keep their own marker.
    if (disc && !has_disc_tag(folder)) {
        folder += " (Disc " + std::to_string(*disc) + ")";
    }
    return sanitize_dirname(folder);
}

bool ensure_writable_dir(const std::string& dir, std::string& err) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        ec.clear();
        std::filesystem::create_directories(dir, ec);
        if (ec || !std::filesystem::is_directory(dir, ec)) {
            err = "Cannot create output directory: " + dir;
            return false;
        }
    }
    if (!is_writable(dir)) {
        err = "Output directory not writable: " + dir;
        return false;
    }
    return true;
}

}  // namespace cuesplit::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* cuesplit_compose_folder_name(
    const CueSplitCueMetadata* meta,
    bool has_disc,
    int disc_number) {

    const std::optional<int> disc = has_disc ? std::optional<int>{disc_number} : std::nullopt;
    return make_mutable_cstr_copy(compose_folder_name(from_public_metadata(meta), disc));
}

CueSplitStatus cuesplit_compose_output_dir(
    const CueSplit* h,
    const char* audio_dir,
    const char* cue_path,
    const char* audio_path,
    char** out_dir,
    const char** error) {

    clear_error(error);
    if (out_dir) *out_dir = nullptr;
    if (!h || !audio_dir || !cue_path || !audio_path || !out_dir) {
        set_error(error, "Invalid arguments to cuesplit_compose_output_dir");
        return CUESPLIT_STATUS_FAILED;
    }

    CueMetadata meta;
    std::string err;
    if (!read_cue_metadata(cue_path, meta, err)) {
        set_error(error, err);
        return CUESPLIT_STATUS_FAILED;
    }

    const auto disc = resolve_disc_number(audio_path, cue_path, audio_dir);
    const std::string folder = compose_folder_name(meta, disc);
    if (disc) {
        log_verbose(h, "Disc number: " + std::to_string(*disc));
    }

    std::filesystem::path dest;
    if (h->output_root.empty()) {
        // Never write next to the source without the user's say-so when the
        // album directory is read-only.
        if (!is_writable(audio_dir)) {
            set_error(error,
                "Source directory '" + std::string(audio_dir) + "' is read-only. Use -o DIR.");
            return CUESPLIT_STATUS_FATAL;
        }
        dest = std::filesystem::path(audio_dir) / folder;
    } else {
        if (!h->dry_run && !ensure_writable_dir(h->output_root, err)) {
            set_error(error, err);
            return CUESPLIT_STATUS_FATAL;
        }
        dest = std::filesystem::path(h->output_root) / folder;
    }

    *out_dir = make_mutable_cstr_copy(dest.string());
    return CUESPLIT_STATUS_OK;
}

};
