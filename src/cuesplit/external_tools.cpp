// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <glib.h>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static std::string join_argv(
    const std::vector<std::string>& argv) {

    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        if (a.find_first_of(" \t'\"") != std::string::npos) {
            gchar* quoted = g_shell_quote(a.c_str());
            out += to_string_or_empty(quoted);
            g_free(quoted);
        } else {
            out += a;
        }
    }
    return out;
}

static bool check_wait_status(
    gint wait_status,
    GError** gerr) {

#if GLIB_CHECK_VERSION(2, 70, 0)
    return g_spawn_check_wait_status(wait_status, gerr);
#else
    return g_spawn_check_exit_status(wait_status, gerr);
#endif
}

// Resolve every command the family needs up front so a missing tool stops
// the run before anything is written.
static bool require_commands(
    const std::vector<std::string>& names,
    std::vector<std::string>& resolved,
    std::string& err) {

    resolved.clear();
    for (const auto& name : names) {
        auto path = find_command(name);
        if (!path) {
            err = "Required command not found: " + name;
            return false;
        }
        resolved.push_back(*path);
    }
    return true;
}

namespace cuesplit::detail {

AudioFamily audio_family(const std::string& ext_lower) {
    if (ext_lower == "flac" || ext_lower == "ape" || ext_lower == "wav" ||
        ext_lower == "wv" || ext_lower == "tta") {
        return AudioFamily::Lossless;
    }
    if (ext_lower == "mp3" || ext_lower == "ogg") {
        return AudioFamily::Lossy;
    }
    return AudioFamily::Unsupported;
}

std::string split_output_extension(const std::string& ext_lower) {
    // Lossless images are re-encoded to FLAC; lossy ones are cut in place.
    switch (audio_family(ext_lower)) {
        case AudioFamily::Lossy:
            return ext_lower;
        default:
            return "flac";
    }
}

std::optional<std::string> find_command(const std::string& name) {
    if (name.empty()) return std::nullopt;
    gchar* path = g_find_program_in_path(name.c_str());
    if (!path) return std::nullopt;
    std::string out = path;
    g_free(path);
    return out;
}

bool run_command(
    const std::vector<std::string>& argv,
    std::string& err) {

    if (argv.empty()) {
        err = "Empty command line";
        return false;
    }
    std::vector<gchar*> raw_argv;
    raw_argv.reserve(argv.size() + 1);
    for (const auto& a : argv) raw_argv.push_back(const_cast<gchar*>(a.c_str()));
    raw_argv.push_back(nullptr);

    GError* gerr = nullptr;
    gint wait_status = 0;
    // Child output goes straight to our terminal.
    if (!g_spawn_sync(
            nullptr,
            raw_argv.data(),
            nullptr,
            static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_CHILD_INHERITS_STDIN),
            nullptr,
            nullptr,
            nullptr,
            nullptr,
            &wait_status,
            &gerr)) {
        err = "Failed to run " + argv.front() + ": " + gerror_message(gerr, "unknown error");
        g_clear_error(&gerr);
        return false;
    }
    if (!check_wait_status(wait_status, &gerr)) {
        err = argv.front() + " failed: " + gerror_message(gerr, "non-zero exit status");
        g_clear_error(&gerr);
        return false;
    }
    return true;
}

CueSplitStatus split_audio(
    CueSplit* h,
    const CueSplitAlbumPair& pair,
    const std::string& work_dir,
    std::string& err) {

    const std::string ext = to_string_or_empty(pair.audio_extension);
    const std::string audio = to_string_or_empty(pair.audio_path);
    const std::string cue = to_string_or_empty(pair.cue_path);

    std::vector<std::string> resolved;
    std::vector<std::string> argv;
    switch (audio_family(ext)) {
        case AudioFamily::Lossless:
            if (!require_commands({h->tools.shnsplit, h->tools.flac}, resolved, err)) {
                return CUESPLIT_STATUS_FATAL;
            }
            log_info("  Splitting (lossless)...");
            argv = {
                resolved[0],
                "-d", work_dir,
                "-f", cue,
                "-o", "flac " + resolved[1] + " -V --best -o %f -",
                audio,
                "-t", "%n %p - %t",
            };
            break;
        case AudioFamily::Lossy:
            if (!require_commands({h->tools.mp3splt}, resolved, err)) {
                return CUESPLIT_STATUS_FATAL;
            }
            log_info("  Splitting (mp3/ogg)...");
            argv = {
                resolved[0],
                "-d", work_dir,
                "-o", "@n. @p - @t",
                "-c", cue,
                audio,
            };
            break;
        default:
            err = "Unsupported format '" + ext + "'";
            return CUESPLIT_STATUS_SKIPPED;
    }

    log_verbose(h, "Running: " + join_argv(argv));
    if (!run_command(argv, err)) {
        return CUESPLIT_STATUS_FAILED;
    }
    return CUESPLIT_STATUS_OK;
}

size_t remove_pregap_tracks(const std::string& work_dir) {
    size_t removed = 0;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(work_dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("00", 0) != 0) continue;
        if (name.find("pregap") == std::string::npos) continue;
        std::error_code rm_ec;
        if (std::filesystem::remove(entry.path(), rm_ec)) ++removed;
    }
    return removed;
}

std::vector<std::string> glob_extension(
    const std::string& dir,
    const std::string& ext_lower) {

    std::vector<std::string> out;
    const std::string suffix = "." + ext_lower;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') continue;
        if (!ends_with(name, suffix)) continue;
        out.push_back(entry.path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<int> leading_track_number(const std::string& file_name) {
    size_t digits = 0;
    while (digits < file_name.size() &&
        std::isdigit(static_cast<unsigned char>(file_name[digits]))) {
        ++digits;
    }
    if (digits == 0) return std::nullopt;
    try {
        return std::stoi(file_name.substr(0, digits));
    } catch (...) {
        return std::nullopt;
    }
}

}  // namespace cuesplit::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* cuesplit_find_command(
    const char* name) {

    if (!name) return nullptr;
    const auto path = find_command(name);
    return path ? make_mutable_cstr_copy(*path) : nullptr;
}

};
