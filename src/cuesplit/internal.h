#pragma once

// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#include <atomic>
#include <cctype>
#include <cstring>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glib.h>

#include "cuesplit/cuesplit.h"

/* ------------------------------------------------------------------- */

namespace cuesplit::detail {

// Owned copy of the external command names.
struct Tools {
    std::string shnsplit{"shnsplit"};
    std::string flac{"flac"};
    std::string mp3splt{"mp3splt"};
    std::string cuetag{"cuetag"};
};

}  // namespace cuesplit::detail

struct CueSplit {
    std::string output_root;
    std::string temp_root;
    bool delete_source{false};
    bool dry_run{false};
    bool verbose{false};
    bool builtin_tagger{true};
    cuesplit::detail::Tools tools;
    // Temporary directories created by this run and not yet removed.
    std::vector<std::string> temp_dirs;
    std::atomic<bool> interrupted{false};
};

/* ------------------------------------------------------------------- */

namespace cuesplit::detail {

static inline const char* make_cstr_copy(const std::string& s) {
    auto* buf = new char[s.size() + 1];
    std::memcpy(buf, s.c_str(), s.size() + 1);
    return buf;
}

static inline char* make_mutable_cstr_copy(const std::string& s) {
    auto* buf = new char[s.size() + 1];
    std::memcpy(buf, s.c_str(), s.size() + 1);
    return buf;
}

static inline const char* make_cstr_copy_nullable(const std::optional<std::string>& s) {
    return s ? make_cstr_copy(*s) : nullptr;
}

static inline std::string to_string_or_empty(const char* s) {
    return s ? std::string{s} : std::string{};
}

static inline std::string to_lower(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (unsigned char c : s) r.push_back(static_cast<char>(std::tolower(c)));
    return r;
}

static inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

static inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static inline void release_cstr(const char*& s) {
    delete[] s;
    s = nullptr;
}

static inline void set_error(const char** error, const std::string& message) {
    if (!error || *error) return;
    *error = make_cstr_copy(message);
}

static inline void clear_error(const char** error) {
    if (!error) return;
    cuesplit_release_error(*error);
    *error = nullptr;
}

static inline std::string gerror_message(const GError* gerr, const char* fallback) {
    return (gerr && gerr->message) ? std::string{gerr->message} : std::string{fallback};
}

/* ------------------------------------------------------------------- */
/* Console output. Everything goes to stderr; stdout belongs to the child tools. */

static inline void log_info(const std::string& message) {
    std::cerr << "[*] " << message << "\n";
}

static inline void log_verbose(const CueSplit* h, const std::string& message) {
    if (h && h->verbose) std::cerr << "[v] " << message << "\n";
}

static inline void log_warn(const std::string& message) {
    std::cerr << "[!] " << message << "\n";
}

/* ------------------------------------------------------------------- */

// GRegex handle compiled in raw byte mode; file names and CUE sheets are not
// guaranteed to be UTF-8.
using RegexPtr = std::unique_ptr<GRegex, decltype(&g_regex_unref)>;

RegexPtr compile_regex(const char* pattern, bool caseless);

// First capture group of the first match, if any.
std::optional<std::string> match_group(
    const GRegex* re,
    const std::string& text,
    int group);

std::string sanitize_filename(const std::string& name);
std::string sanitize_dirname(const std::string& name);

struct CueMetadata {
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> year;
};

bool read_cue_metadata(
    const std::string& cue_path,
    CueMetadata& out,
    std::string& err);

std::optional<int> detect_disc_number(const std::string& text);
bool has_disc_tag(const std::string& text);
std::optional<int> resolve_disc_number(
    const std::string& audio_path,
    const std::string& cue_path,
    const std::string& audio_dir);

bool is_supported_audio_extension(const std::string& ext_lower);

std::string compose_folder_name(
    const CueMetadata& meta,
    std::optional<int> disc);

bool ensure_writable_dir(const std::string& dir, std::string& err);

std::string select_temp_root(const std::string& configured);

// Removes the registered directory when it goes out of scope, whichever way
// process_pair leaves.
class TempDirLease {
public:
    TempDirLease(CueSplit* h, std::string path);
    ~TempDirLease();
    TempDirLease(const TempDirLease&) = delete;
    TempDirLease& operator=(const TempDirLease&) = delete;

    const std::string& path() const { return path_; }

private:
    CueSplit* h_;
    std::string path_;
};

bool make_temp_dir(CueSplit* h, std::string& out_path, std::string& err);
bool remove_temp_dir(CueSplit* h, const std::string& path);
void remove_all_temp_dirs(CueSplit* h);

enum class AudioFamily { Lossless, Lossy, Unsupported };

AudioFamily audio_family(const std::string& ext_lower);
// Extension of the files the splitter leaves in the working directory.
std::string split_output_extension(const std::string& ext_lower);

std::optional<std::string> find_command(const std::string& name);

bool run_command(
    const std::vector<std::string>& argv,
    std::string& err);

CueSplitStatus split_audio(
    CueSplit* h,
    const CueSplitAlbumPair& pair,
    const std::string& work_dir,
    std::string& err);

size_t remove_pregap_tracks(const std::string& work_dir);

std::vector<std::string> glob_extension(
    const std::string& dir,
    const std::string& ext_lower);

std::optional<int> leading_track_number(const std::string& file_name);

bool tag_flac_file(
    const std::string& path,
    const CueMetadata& meta,
    int track_number,
    int track_total,
    std::optional<int> disc,
    std::string& err);

}  // namespace cuesplit::detail
