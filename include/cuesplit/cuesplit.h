#pragma once

// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#ifndef __CUESPLIT_H
#define __CUESPLIT_H

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
void cuesplit_release_error(const char* p);

/**
 * Release a string returned by library functions.
 * @param p Pointer to free (nullable).
 */
void cuesplit_release_string(char* p);

/* ------------------------------------------------------------------- */

/**
 * Sanitize a file name for restrictive filesystems.
 * Forbidden characters in the base name are substituted, dots in the base
 * name become spaces, whitespace is collapsed. The extension is kept verbatim.
 * @param name File name (nullable => empty).
 * @return Newly allocated string; free with cuesplit_release_string.
 */
char* cuesplit_sanitize_filename(const char* name);
/**
 * Sanitize a directory name: path separators become '-', whitespace is collapsed.
 * @param name Directory name (nullable => empty).
 * @return Newly allocated string; free with cuesplit_release_string.
 */
char* cuesplit_sanitize_dirname(const char* name);

/* ------------------------------------------------------------------- */

/** Album-level metadata read from a CUE sheet. */
typedef struct CueSplitCueMetadata {
    /** First PERFORMER value (nullable). */
    const char* artist;
    /** First TITLE value (nullable). */
    const char* album;
    /** Four digit year from REM DATE / DATE (nullable). */
    const char* year;
} CueSplitCueMetadata;

/**
 * Read artist, album and year from a CUE sheet.
 * Missing fields are left null; only an unreadable file is an error.
 * @param cue_path CUE sheet path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated metadata; free with cuesplit_release_cue_metadata. Null on I/O error.
 */
CueSplitCueMetadata* cuesplit_read_cue_metadata(
    const char* cue_path,
    const char** error /* nullable */);
/**
 * Release CUE metadata.
 * @param p Metadata pointer (nullable).
 */
void cuesplit_release_cue_metadata(
    CueSplitCueMetadata* p);

/* ------------------------------------------------------------------- */

/**
 * Detect a disc number in an arbitrary string (file or directory name).
 * @param text Input string (nullable).
 * @param out_number Receives the disc number when detected (nullable).
 * @return Non-zero when a disc number was detected.
 */
int cuesplit_detect_disc_number(
    const char* text,
    int* out_number /* nullable */);
/**
 * Check whether a string already carries a disc/volume indicator.
 * @param text Input string (nullable).
 * @return Non-zero when a disc tag token is present.
 */
int cuesplit_has_disc_tag(
    const char* text);
/**
 * Detect the disc number of a pair: audio file name, then CUE file name,
 * then the base name of the containing directory.
 * @param audio_path Audio file path (nullable).
 * @param cue_path CUE sheet path (nullable).
 * @param audio_dir Directory containing the audio file (nullable).
 * @param out_number Receives the disc number when detected (nullable).
 * @return Non-zero when a disc number was detected.
 */
int cuesplit_resolve_disc_number(
    const char* audio_path,
    const char* cue_path,
    const char* audio_dir,
    int* out_number /* nullable */);

/* ------------------------------------------------------------------- */

/** Audio image and its CUE sheet. */
typedef struct CueSplitAlbumPair {
    /** Audio image path. */
    const char* audio_path;
    /** Matched CUE sheet path. */
    const char* cue_path;
    /** Lower-cased audio extension without the dot (e.g. "flac"). */
    const char* audio_extension;
} CueSplitAlbumPair;

/**
 * Check whether a path has one of the supported audio extensions
 * (flac, ape, wav, wv, tta, mp3, ogg; case-insensitive).
 * @param path File path (nullable).
 * @return Non-zero when supported.
 */
int cuesplit_is_audio_file(const char* path);

/**
 * Locate the CUE sheet of an audio image.
 * Candidates in order: File.ext.cue, File.cue, and File.cue with a trailing
 * ".cue" stem segment stripped.
 * @param audio_path Audio file path.
 * @return Newly allocated pair; null when no CUE sheet matches (skip).
 */
CueSplitAlbumPair* cuesplit_resolve_pair(
    const char* audio_path);
/**
 * Release album pair.
 * @param p Pair pointer (nullable).
 */
void cuesplit_release_album_pair(
    CueSplitAlbumPair* p);

/* ------------------------------------------------------------------- */

/**
 * Compose the album folder name "{artist} - {year} - {album}" with an
 * optional " (Disc N)" suffix, sanitized as a directory name.
 * @param meta CUE metadata (nullable => all defaults).
 * @param has_disc True when disc_number is valid.
 * @param disc_number Disc number.
 * @return Newly allocated string; free with cuesplit_release_string.
 */
char* cuesplit_compose_folder_name(
    const CueSplitCueMetadata* meta /* nullable */,
    bool has_disc,
    int disc_number);

/* ------------------------------------------------------------------- */

/** Outcome of pipeline operations. */
typedef enum CueSplitStatus {
    /** Completed. */
    CUESPLIT_STATUS_OK = 0,
    /** Nothing to do for this item; continue with the next. */
    CUESPLIT_STATUS_SKIPPED = 1,
    /** This item failed; continue with the next. */
    CUESPLIT_STATUS_FAILED = 2,
    /** Unrecoverable; abort the whole run. */
    CUESPLIT_STATUS_FATAL = 3,
} CueSplitStatus;

/** External command names (nullable members => defaults). */
typedef struct CueSplitTools {
    /** Lossless splitter (default "shnsplit"). */
    const char* shnsplit;
    /** FLAC encoder used by the lossless splitter (default "flac"). */
    const char* flac;
    /** MP3/Ogg splitter (default "mp3splt"). */
    const char* mp3splt;
    /** CUE tagger (default "cuetag"). */
    const char* cuetag;
} CueSplitTools;

/** Per-run settings. */
typedef struct CueSplitSettings {
    /** Output root directory (nullable => next to the source images). */
    const char* output_root;
    /** Root for temporary split directories (nullable => $TMPDIR or system temp). */
    const char* temp_root;
    /** Delete source audio images after a successful split. */
    bool delete_source;
    /** Log operations without touching the filesystem. */
    bool dry_run;
    /** Verbose logging. */
    bool verbose;
    /** Write FLAC tags in-process when the external tagger is absent. */
    bool builtin_tagger;
    /** External commands. */
    CueSplitTools tools;
} CueSplitSettings;

/** Counters for one tree walk. */
typedef struct CueSplitRunSummary {
    /** Supported audio files found. */
    size_t discovered;
    /** Pairs processed successfully. */
    size_t processed;
    /** Files skipped (no CUE, unsupported). */
    size_t skipped;
    /** Pairs that failed. */
    size_t failed;
} CueSplitRunSummary;

/** Opaque run handle. */
typedef struct CueSplit CueSplit;

/**
 * Open a run handle.
 * Validates the temp root and, when configured, creates/validates the output root.
 * @param settings Run settings (nullable for defaults).
 * @param error Optional error string out-parameter.
 * @return Handle on success; null on a fatal configuration problem.
 */
CueSplit* cuesplit_open(
    const CueSplitSettings* settings /* nullable */,
    const char** error /* nullable */);
/**
 * Close the handle. Removes every temporary directory still registered.
 * @param h Handle (nullable).
 */
void cuesplit_close(
    CueSplit* h);
/**
 * Request the running pipeline to stop. Safe to call from a signal handler.
 * @param h Handle (nullable).
 */
void cuesplit_interrupt(
    CueSplit* h);

/**
 * Compute the destination directory of a pair.
 * @param h Run handle.
 * @param audio_dir Directory containing the audio image.
 * @param cue_path CUE sheet path.
 * @param audio_path Audio image path.
 * @param out_dir Receives newly allocated path on success; free with cuesplit_release_string.
 * @param error Optional error string out-parameter.
 * @return OK, FAILED (CUE unreadable) or FATAL (unwritable destination).
 */
CueSplitStatus cuesplit_compose_output_dir(
    const CueSplit* h,
    const char* audio_dir,
    const char* cue_path,
    const char* audio_path,
    char** out_dir,
    const char** error /* nullable */);

/**
 * Create a registered temporary working directory under the temp root.
 * @param h Run handle.
 * @param error Optional error string out-parameter.
 * @return Newly allocated path; free with cuesplit_release_string. Null on failure.
 */
char* cuesplit_make_temp_dir(
    CueSplit* h,
    const char** error /* nullable */);
/**
 * Remove a registered temporary directory recursively and unregister it.
 * @param h Run handle.
 * @param path Directory returned by cuesplit_make_temp_dir.
 * @return Non-zero when the directory was registered and removed.
 */
int cuesplit_remove_temp_dir(
    CueSplit* h,
    const char* path);
/**
 * Number of temporary directories currently registered.
 * @param h Run handle (nullable).
 */
size_t cuesplit_temp_dir_count(
    const CueSplit* h);

/**
 * Look up an external command on PATH (or as a path).
 * @param name Command name or path.
 * @return Newly allocated absolute path; null when not found.
 */
char* cuesplit_find_command(
    const char* name);

/**
 * Write album-level Vorbis comments into a FLAC file.
 * @param path FLAC file path.
 * @param meta CUE metadata (nullable).
 * @param track_number Track number (<= 0 => omitted).
 * @param track_total Track total (<= 0 => omitted).
 * @param has_disc True when disc_number is valid.
 * @param disc_number Disc number.
 * @param error Optional error string out-parameter.
 * @return Non-zero on success.
 */
int cuesplit_tag_flac_file(
    const char* path,
    const CueSplitCueMetadata* meta /* nullable */,
    int track_number,
    int track_total,
    bool has_disc,
    int disc_number,
    const char** error /* nullable */);

/**
 * Split, tag and move one album pair.
 * @param h Run handle.
 * @param pair Album pair.
 * @param error Optional error string out-parameter.
 * @return Processing status.
 */
CueSplitStatus cuesplit_process_pair(
    CueSplit* h,
    const CueSplitAlbumPair* pair,
    const char** error /* nullable */);
/**
 * Walk a directory tree and process every audio image with a matching CUE sheet.
 * @param h Run handle.
 * @param root_dir Root directory.
 * @param summary Receives counters (nullable).
 * @param error Optional error string out-parameter.
 * @return OK when the walk completed (individual pairs may have failed), FATAL otherwise.
 */
CueSplitStatus cuesplit_process_tree(
    CueSplit* h,
    const char* root_dir,
    CueSplitRunSummary* summary /* nullable */,
    const char** error /* nullable */);

/* ------------------------------------------------------------------- */

/** Global configuration loaded from INI or defaults. */
typedef struct CueSplitConfig {
    /** Output root (nullable). */
    const char* output_root;
    /** Temp root (nullable). */
    const char* temp_root;
    /** Delete source images after splitting. */
    bool delete_source;
    /** Verbose logging. */
    bool verbose;
    /** Built-in FLAC tagger fallback. */
    bool builtin_tagger;
    /** External commands (owned, never null members). */
    CueSplitTools tools;
    /** Loaded config file path, or null when defaults. */
    const char* config_path;
} CueSplitConfig;

/**
 * Load configuration from INI file.
 * Search order when path is null: ./cuesplit.conf then ~/.cuesplit.conf.
 * Returns defaults if no file found; returns null on parse/load error.
 * @param path Optional explicit config path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated config, must free with cuesplit_release_config; null on failure.
 */
CueSplitConfig* cuesplit_load_config(
    const char* path /* nullable */,
    const char** error /* nullable */);
/**
 * Release configuration and owned members.
 * @param cfg Config pointer (nullable).
 */
void cuesplit_release_config(
    CueSplitConfig* cfg);

#ifdef __cplusplus
}
#endif

#endif
