// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

#include <gio/gio.h>
#include <glib.h>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static std::string tool_or_default(
    const char* configured,
    const std::string& fallback) {

    return (configured && configured[0]) ? std::string{configured} : fallback;
}

static bool validate_temp_root(
    const std::string& root,
    std::string& err) {

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        err = "Temp dir '" + root + "' does not exist";
        return false;
    }
    if (::access(root.c_str(), W_OK) != 0) {
        err = "Temp dir '" + root + "' not writable";
        return false;
    }
    return true;
}

static std::string parent_dir(
    const std::filesystem::path& audio) {

    const auto parent = audio.parent_path();
    return parent.empty() ? std::string{"."} : parent.string();
}

static CueSplitStatus compose_destination(
    const CueSplit* h,
    const std::string& audio_dir,
    const std::string& cue_path,
    const std::string& audio_path,
    std::string& out_dir,
    std::string& err) {

    const char* compose_err = nullptr;
    char* raw = nullptr;
    const CueSplitStatus status = cuesplit_compose_output_dir(
        h, audio_dir.c_str(), cue_path.c_str(), audio_path.c_str(), &raw, &compose_err);
    if (status != CUESPLIT_STATUS_OK) {
        err = to_string_or_empty(compose_err);
        cuesplit_release_error(compose_err);
        return status;
    }
    out_dir = to_string_or_empty(raw);
    cuesplit_release_string(raw);
    return CUESPLIT_STATUS_OK;
}

static bool move_file(
    const std::string& from,
    const std::string& to,
    std::string& err) {

    GFile* src = g_file_new_for_path(from.c_str());
    GFile* dst = g_file_new_for_path(to.c_str());
    GError* gerr = nullptr;
    // Falls back to copy+delete when the temp root sits on another filesystem.
    const bool ok = g_file_move(
        src,
        dst,
        G_FILE_COPY_OVERWRITE,
        nullptr,
        nullptr,
        nullptr,
        &gerr);
    if (!ok) {
        err = "Failed to move '" + from + "' to '" + to + "': " + gerror_message(gerr, "unknown error");
        g_clear_error(&gerr);
    }
    g_object_unref(src);
    g_object_unref(dst);
    return ok;
}

static CueSplitStatus tag_tracks(
    CueSplit* h,
    const std::string& cue_path,
    const std::string& track_ext,
    const std::vector<std::string>& tracks,
    const std::optional<int>& disc,
    std::string& err) {

    if (auto cuetag = find_command(h->tools.cuetag)) {
        std::vector<std::string> argv = {*cuetag, cue_path};
        argv.insert(argv.end(), tracks.begin(), tracks.end());
        log_verbose(h, "Tagging " + std::to_string(tracks.size()) + " file(s) with " + *cuetag);
        return run_command(argv, err) ? CUESPLIT_STATUS_OK : CUESPLIT_STATUS_FAILED;
    }

    if (track_ext != "flac" || !h->builtin_tagger) {
        log_verbose(h, "Tagger '" + h->tools.cuetag + "' not found; skipping tags");
        return CUESPLIT_STATUS_OK;
    }

    CueMetadata meta;
    if (!read_cue_metadata(cue_path, meta, err)) {
        return CUESPLIT_STATUS_FAILED;
    }
    log_verbose(h, "Tagger '" + h->tools.cuetag + "' not found; writing album tags directly");
    const int total = static_cast<int>(tracks.size());
    for (const auto& track : tracks) {
        const auto number = leading_track_number(std::filesystem::path(track).filename().string());
        if (!tag_flac_file(track, meta, number.value_or(0), total, disc, err)) {
            return CUESPLIT_STATUS_FAILED;
        }
    }
    return CUESPLIT_STATUS_OK;
}

static CueSplitStatus move_and_sanitize_files(
    CueSplit* h,
    const std::vector<std::string>& tracks,
    const std::string& target,
    std::string& err) {

    if (!ensure_writable_dir(target, err)) {
        return CUESPLIT_STATUS_FATAL;
    }
    for (const auto& track : tracks) {
        const std::string clean = sanitize_filename(std::filesystem::path(track).filename().string());
        const std::string dest = (std::filesystem::path(target) / clean).string();
        log_verbose(h, "Moving '" + track + "' -> '" + dest + "'");
        if (!move_file(track, dest, err)) {
            return CUESPLIT_STATUS_FAILED;
        }
    }
    return CUESPLIT_STATUS_OK;
}

static CueSplitStatus run_pair(
    CueSplit* h,
    const CueSplitAlbumPair& pair,
    std::string& err) {

    const std::filesystem::path audio_path(to_string_or_empty(pair.audio_path));
    const std::string audio = audio_path.string();
    const std::string cue = to_string_or_empty(pair.cue_path);
    const std::string ext = to_string_or_empty(pair.audio_extension);
    const std::string audio_dir = parent_dir(audio_path);

    log_info("Processing:");
    log_info("  Audio: " + audio);
    log_info("  Cue:   " + cue);
    log_info("  Type:  " + ext);

    std::string outdir;
    CueSplitStatus status = compose_destination(h, audio_dir, cue, audio, outdir, err);
    if (status != CUESPLIT_STATUS_OK) return status;
    log_info("  Output: " + outdir);

    if (h->dry_run) {
        log_info("DRY-RUN: would split '" + audio + "' under " + select_temp_root(h->temp_root));
        log_info("DRY-RUN: would move tracks into '" + outdir + "'");
        if (h->delete_source) {
            log_info("DRY-RUN: would delete '" + audio + "'");
        }
        log_info("Done.");
        return CUESPLIT_STATUS_OK;
    }

    std::string work_dir;
    if (!make_temp_dir(h, work_dir, err)) {
        return CUESPLIT_STATUS_FATAL;
    }
    TempDirLease lease(h, work_dir);
    log_info("  Temp:   " + work_dir);

    status = split_audio(h, pair, work_dir, err);
    if (status != CUESPLIT_STATUS_OK) return status;
    if (h->interrupted.load()) {
        err = "Interrupted";
        return CUESPLIT_STATUS_FATAL;
    }

    const size_t pregaps = remove_pregap_tracks(work_dir);
    if (pregaps > 0) {
        log_verbose(h, "Removed " + std::to_string(pregaps) + " pregap track(s)");
    }

    const std::string track_ext = split_output_extension(ext);
    const std::vector<std::string> tracks = glob_extension(work_dir, track_ext);
    if (tracks.empty()) {
        err = "Splitter produced no ." + track_ext + " files for " + audio;
        return CUESPLIT_STATUS_FAILED;
    }

    const auto disc = resolve_disc_number(audio, cue, audio_dir);
    status = tag_tracks(h, cue, track_ext, tracks, disc, err);
    if (status != CUESPLIT_STATUS_OK) return status;

    status = move_and_sanitize_files(h, tracks, outdir, err);
    if (status != CUESPLIT_STATUS_OK) return status;

    if (h->delete_source) {
        std::error_code ec;
        if (!std::filesystem::remove(audio_path, ec) || ec) {
            err = "Failed to delete source '" + audio + "'" + (ec ? ": " + ec.message() : std::string{});
            return CUESPLIT_STATUS_FAILED;
        }
        log_verbose(h, "Deleted source '" + audio + "'");
    }

    log_info("Done.");
    return CUESPLIT_STATUS_OK;
}

static std::vector<std::string> collect_audio_files(
    const CueSplit* h,
    const std::string& root) {

    std::vector<std::string> found;
    std::error_code ec;
    auto it = std::filesystem::recursive_directory_iterator(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    const auto end = std::filesystem::recursive_directory_iterator();
    while (!ec && it != end) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            const std::string path = it->path().string();
            if (cuesplit_is_audio_file(path.c_str())) found.push_back(path);
        }
        it.increment(ec);
    }
    if (ec) {
        log_warn("Directory walk stopped early under " + root + ": " + ec.message());
    }
    // Collected before processing so tracks written into the tree are never rediscovered.
    std::sort(found.begin(), found.end());
    log_verbose(h, "Found " + std::to_string(found.size()) + " audio file(s)");
    return found;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

CueSplit* cuesplit_open(
    const CueSplitSettings* settings,
    const char** error) {

    clear_error(error);
    auto h = std::make_unique<CueSplit>();
    if (settings) {
        h->output_root = to_string_or_empty(settings->output_root);
        h->temp_root = to_string_or_empty(settings->temp_root);
        h->delete_source = settings->delete_source;
        h->dry_run = settings->dry_run;
        h->verbose = settings->verbose;
        h->builtin_tagger = settings->builtin_tagger;
        const Tools defaults;
        h->tools.shnsplit = tool_or_default(settings->tools.shnsplit, defaults.shnsplit);
        h->tools.flac = tool_or_default(settings->tools.flac, defaults.flac);
        h->tools.mp3splt = tool_or_default(settings->tools.mp3splt, defaults.mp3splt);
        h->tools.cuetag = tool_or_default(settings->tools.cuetag, defaults.cuetag);
    }

    std::string err;
    if (!validate_temp_root(select_temp_root(h->temp_root), err)) {
        set_error(error, err);
        return nullptr;
    }

    if (!h->output_root.empty()) {
        std::error_code ec;
        if (h->dry_run) {
            if (std::filesystem::exists(h->output_root, ec) &&
                ::access(h->output_root.c_str(), W_OK) != 0) {
                set_error(error, "Output directory not writable: " + h->output_root);
                return nullptr;
            }
        } else if (!ensure_writable_dir(h->output_root, err)) {
            set_error(error, err);
            return nullptr;
        }
    }
    return h.release();
}

void cuesplit_close(
    CueSplit* h) {

    if (!h) return;
    remove_all_temp_dirs(h);
    delete h;
}

void cuesplit_interrupt(
    CueSplit* h) {

    if (h) h->interrupted.store(true);
}

CueSplitStatus cuesplit_process_pair(
    CueSplit* h,
    const CueSplitAlbumPair* pair,
    const char** error) {

    clear_error(error);
    if (!h || !pair || !pair->audio_path || !pair->cue_path || !pair->audio_extension) {
        set_error(error, "Invalid arguments to cuesplit_process_pair");
        return CUESPLIT_STATUS_FAILED;
    }
    if (h->interrupted.load()) {
        set_error(error, "Interrupted");
        return CUESPLIT_STATUS_FATAL;
    }

    std::string err;
    const CueSplitStatus status = run_pair(h, *pair, err);
    // A signal also kills the running tool, which surfaces as an ordinary
    // pair failure. The stop request outranks whatever the pair reported.
    if (h->interrupted.load()) {
        set_error(error, "Interrupted");
        return CUESPLIT_STATUS_FATAL;
    }
    if (status != CUESPLIT_STATUS_OK) set_error(error, err);
    return status;
}

CueSplitStatus cuesplit_process_tree(
    CueSplit* h,
    const char* root_dir,
    CueSplitRunSummary* summary,
    const char** error) {

    clear_error(error);
    if (summary) *summary = CueSplitRunSummary{};
    if (!h || !root_dir) {
        set_error(error, "Invalid arguments to cuesplit_process_tree");
        return CUESPLIT_STATUS_FATAL;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(root_dir, ec)) {
        set_error(error, "Not a directory: " + std::string(root_dir));
        return CUESPLIT_STATUS_FATAL;
    }

    log_info("Scanning under: " + std::string(root_dir));
    CueSplitRunSummary counts{};
    for (const auto& audio : collect_audio_files(h, root_dir)) {
        if (h->interrupted.load()) {
            if (summary) *summary = counts;
            set_error(error, "Interrupted");
            return CUESPLIT_STATUS_FATAL;
        }
        ++counts.discovered;

        std::unique_ptr<CueSplitAlbumPair, decltype(&cuesplit_release_album_pair)> pair(
            cuesplit_resolve_pair(audio.c_str()), &cuesplit_release_album_pair);
        if (!pair) {
            log_verbose(h, "Skipping '" + audio + "' - no matching cue sheet");
            ++counts.skipped;
            continue;
        }

        const char* pair_err = nullptr;
        const CueSplitStatus status = cuesplit_process_pair(h, pair.get(), &pair_err);
        const std::string message = to_string_or_empty(pair_err);
        cuesplit_release_error(pair_err);
        switch (status) {
            case CUESPLIT_STATUS_OK:
                ++counts.processed;
                break;
            case CUESPLIT_STATUS_SKIPPED:
                log_warn(message + " - skipping '" + audio + "'");
                ++counts.skipped;
                break;
            case CUESPLIT_STATUS_FAILED:
                log_warn("Failed: " + message);
                ++counts.failed;
                break;
            case CUESPLIT_STATUS_FATAL:
            default:
                if (summary) *summary = counts;
                set_error(error, message);
                return CUESPLIT_STATUS_FATAL;
        }
    }

    if (summary) *summary = counts;
    return CUESPLIT_STATUS_OK;
}

};
