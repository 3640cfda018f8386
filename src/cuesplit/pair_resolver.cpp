// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static bool is_regular_file(
    const std::filesystem::path& path) {

    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

// Extension without the dot, lower-cased. Empty when the name has none.
static std::string lower_extension(
    const std::filesystem::path& path) {

    const std::string ext = path.extension().string();
    if (ext.size() <= 1) return {};
    return to_lower(ext.substr(1));
}

static std::vector<std::filesystem::path> cue_candidates(
    const std::filesystem::path& audio) {

    const std::filesystem::path dir = audio.parent_path();
    const std::string file = audio.filename().string();
    const std::string stem = audio.stem().string();

    std::vector<std::filesystem::path> out;
    // File.ext.cue wins over File.cue.
    out.push_back(dir / (file + ".cue"));
    out.push_back(dir / (stem + ".cue"));
    // "Album.cue.flac" also pairs with "Album.cue".
    if (ends_with(stem, ".cue")) {
        out.push_back(dir / (stem.substr(0, stem.size() - 4) + ".cue"));
    }
    return out;
}

namespace cuesplit::detail {

bool is_supported_audio_extension(const std::string& ext_lower) {
    static const std::unordered_set<std::string> kAudioExtensions = {
        "flac", "ape", "wav", "wv", "tta", "mp3", "ogg",
    };
    return kAudioExtensions.count(ext_lower) > 0;
}

}  // namespace cuesplit::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

int cuesplit_is_audio_file(const char* path) {
    if (!path) return 0;
    return is_supported_audio_extension(lower_extension(std::filesystem::path(path))) ? 1 : 0;
}

CueSplitAlbumPair* cuesplit_resolve_pair(
    const char* audio_path) {

    if (!audio_path) return nullptr;
    const std::filesystem::path audio(audio_path);
    const std::string ext = lower_extension(audio);
    if (!is_supported_audio_extension(ext)) return nullptr;

    for (const auto& candidate : cue_candidates(audio)) {
        if (!is_regular_file(candidate)) continue;
        auto* pair = new CueSplitAlbumPair{};
        pair->audio_path = make_cstr_copy(audio.string());
        pair->cue_path = make_cstr_copy(candidate.string());
        pair->audio_extension = make_cstr_copy(ext);
        return pair;
    }
    return nullptr;
}

void cuesplit_release_album_pair(
    CueSplitAlbumPair* p) {

    if (!p) return;
    release_cstr(p->audio_path);
    release_cstr(p->cue_path);
    release_cstr(p->audio_extension);
    delete p;
}

};
