// Unit coverage for file and directory name sanitization.
#include <iostream>
#include <string>

#include "cuesplit/cuesplit.h"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[sanitize_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::string sanitize_file(const char *name) {
    char *raw = cuesplit_sanitize_filename(name);
    std::string out = raw ? raw : "";
    cuesplit_release_string(raw);
    return out;
}

std::string sanitize_dir(const char *name) {
    char *raw = cuesplit_sanitize_dirname(name);
    std::string out = raw ? raw : "";
    cuesplit_release_string(raw);
    return out;
}

bool test_filename_forbidden_chars() {
    bool ok = check(sanitize_file("Track: One (Live)*.flac") == "Track - One (Live)-.flac",
                    "colon and asterisk replaced, extension kept");
    ok &= check(sanitize_file("Who|What?.flac") == "Who-What-.flac", "pipe and question mark");
    ok &= check(sanitize_file("<Intro>.mp3") == "(Intro(.mp3", "angle brackets become parens");
    ok &= check(sanitize_file("Say \"Hi\".flac") == "Say Hi.flac", "double quotes removed");
    ok &= check(sanitize_file("AC\\DC.flac") == "ACDC.flac", "backslash removed");
    return ok;
}

bool test_filename_dots_and_spaces() {
    bool ok = check(sanitize_file("01. Track.Name.flac") == "01 Track Name.flac",
                    "dots in base become single spaces");
    ok &= check(sanitize_file("  spaced   out  .flac") == "spaced out.flac",
                "whitespace collapsed and trimmed");
    ok &= check(sanitize_file("no extension") == "no extension", "no dot keeps whole base");
    ok &= check(sanitize_file("02 Laibach - Le.Privilege.flac") == "02 Laibach - Le Privilege.flac",
                "splitter output name");
    ok &= check(sanitize_file("Track.FLAC") == "Track.FLAC", "extension case preserved");
    return ok;
}

bool test_dirname() {
    bool ok = check(sanitize_dir("AC/DC - 1980 - Back In Black") == "AC-DC - 1980 - Back In Black",
                    "slash becomes dash");
    ok &= check(sanitize_dir("A\\B") == "A-B", "backslash becomes dash");
    ok &= check(sanitize_dir("What? - Live: 1999.1") == "What? - Live: 1999.1",
                "dirname keeps other characters and dots");
    ok &= check(sanitize_dir("  Artist   -  Album ") == "Artist - Album", "dirname collapses whitespace");
    return ok;
}

bool test_idempotent() {
    const std::string once = sanitize_file("Track: One (Live)*.flac");
    bool ok = check(sanitize_file(once.c_str()) == once, "filename sanitization is idempotent");
    const std::string dir_once = sanitize_dir("AC/DC  Live");
    ok &= check(sanitize_dir(dir_once.c_str()) == dir_once, "dirname sanitization is idempotent");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_filename_forbidden_chars();
    ok &= test_filename_dots_and_spaces();
    ok &= test_dirname();
    ok &= test_idempotent();
    if (ok) {
        std::cout << "[sanitize_unit] all checks passed\n";
    }
    return ok ? 0 : 1;
}
