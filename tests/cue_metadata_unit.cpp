// Unit coverage for album-level CUE sheet field extraction.
#include <iostream>
#include <string>

#include "cuesplit/cuesplit.h"
#include "test_utils.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[cue_metadata_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::string view(const char *s) { return s ? std::string{s} : std::string{"<null>"}; }

bool test_full_sheet(const test_utils::TempDir &tmp) {
    const std::string cue = tmp.join("Kapital.cue");
    bool ok = check(test_utils::write_file(cue,
                                           "REM GENRE Industrial\r\n"
                                           "REM DATE 1992\r\n"
                                           "PERFORMER \"Laibach\"\r\n"
                                           "TITLE \"Kapital\"\r\n"
                                           "FILE \"Kapital.flac\" WAVE\r\n"
                                           "  TRACK 01 AUDIO\r\n"
                                           "    TITLE \"Decade Null\"\r\n"
                                           "    PERFORMER \"Someone Else\"\r\n"
                                           "    INDEX 01 00:00:00\r\n"),
                    "write cue fixture");
    const char *err = nullptr;
    CueSplitCueMetadata *meta = cuesplit_read_cue_metadata(cue.c_str(), &err);
    ok &= check(meta != nullptr, "read succeeds");
    ok &= check(err == nullptr, "no error on success");
    if (meta) {
        ok &= check(view(meta->artist) == "Laibach", "album performer, got " + view(meta->artist));
        ok &= check(view(meta->album) == "Kapital", "album title, got " + view(meta->album));
        ok &= check(view(meta->year) == "1992", "REM DATE year, got " + view(meta->year));
    }
    cuesplit_release_cue_metadata(meta);
    cuesplit_release_error(err);
    return ok;
}

bool test_missing_fields(const test_utils::TempDir &tmp) {
    const std::string cue = tmp.join("bare.cue");
    bool ok = check(test_utils::write_file(cue, "FILE \"bare.wav\" WAVE\n  TRACK 01 AUDIO\n"),
                    "write bare fixture");
    CueSplitCueMetadata *meta = cuesplit_read_cue_metadata(cue.c_str(), nullptr);
    ok &= check(meta != nullptr, "missing fields are not an error");
    if (meta) {
        ok &= check(meta->artist == nullptr, "artist absent");
        ok &= check(meta->album == nullptr, "album absent");
        ok &= check(meta->year == nullptr, "year absent");
    }
    cuesplit_release_cue_metadata(meta);
    return ok;
}

bool test_first_title_and_plain_date(const test_utils::TempDir &tmp) {
    // Track title listed before any album title: the first TITLE line is taken.
    const std::string cue = tmp.join("odd.cue");
    bool ok = check(test_utils::write_file(cue,
                                           "\xEF\xBB\xBFPERFORMER \"Quote \"Inside\" Band\"\n"
                                           "DATE 2001-05-04\n"
                                           "FILE \"odd.flac\" WAVE\n"
                                           "  TRACK 01 AUDIO\n"
                                           "    TITLE \"First Track\"\n"
                                           "TITLE \"Real Album\"\n"),
                    "write odd fixture");
    CueSplitCueMetadata *meta = cuesplit_read_cue_metadata(cue.c_str(), nullptr);
    ok &= check(meta != nullptr, "read succeeds");
    if (meta) {
        ok &= check(view(meta->artist) == "Quote \"Inside\" Band",
                    "artist spans first to last quote after BOM, got " + view(meta->artist));
        ok &= check(view(meta->album) == "First Track", "first TITLE line wins, got " + view(meta->album));
        ok &= check(view(meta->year) == "2001", "plain DATE keyword, got " + view(meta->year));
    }
    cuesplit_release_cue_metadata(meta);
    return ok;
}

bool test_unreadable(const test_utils::TempDir &tmp) {
    const std::string missing = tmp.join("missing.cue");
    const char *err = nullptr;
    CueSplitCueMetadata *meta = cuesplit_read_cue_metadata(missing.c_str(), &err);
    bool ok = check(meta == nullptr, "missing file returns null");
    ok &= check(err != nullptr, "missing file reports an error");
    cuesplit_release_cue_metadata(meta);
    cuesplit_release_error(err);
    return ok;
}

}  // namespace

int main() {
    test_utils::TempDir tmp;
    if (!tmp.valid()) {
        std::cerr << "[cue_metadata_unit] cannot create temp dir\n";
        return 1;
    }
    bool ok = true;
    ok &= test_full_sheet(tmp);
    ok &= test_missing_fields(tmp);
    ok &= test_first_title_and_plain_date(tmp);
    ok &= test_unreadable(tmp);
    if (ok) {
        std::cout << "[cue_metadata_unit] all checks passed\n";
    }
    return ok ? 0 : 1;
}
