// Unit coverage for disc number detection and disc tag recognition.
#include <iostream>
#include <string>

#include "cuesplit/cuesplit.h"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[disc_tag_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// -1 when no disc number is detected.
int detect(const char *text) {
    int n = -1;
    return cuesplit_detect_disc_number(text, &n) ? n : -1;
}

bool test_detect_basic() {
    bool ok = check(detect("Album (Disc 2)") == 2, "(Disc 2)");
    ok &= check(detect("Album CD1") == 1, "CD1");
    ok &= check(detect("Album Disc One.flac") == 1, "Disc One spelled out");
    ok &= check(detect("Single Album") == -1, "no disc marker");
    ok &= check(detect("Album (disc two)") == 2, "(disc two)");
    ok &= check(detect("Album cd 3") == 3, "cd with space");
    ok &= check(detect("Album Disc 4.flac") == 4, "disc digits before extension dot");
    ok &= check(detect("Album Disc 5") == 5, "disc digits at end");
    ok &= check(detect("Album - disc three bonus") == 3, "disc three anywhere");
    ok &= check(detect("Album (Disc 0)") == 0, "disc zero is still a detected number");
    ok &= check(detect(nullptr) == -1, "null input");
    return ok;
}

bool test_detect_precedence() {
    bool ok = check(detect("Album (Disc 3) CD1") == 3, "parenthesized disc wins over cd");
    ok &= check(detect("CD 4 (Disc One)") == 1, "(disc one) wins over cd digits");
    ok &= check(detect("Album CD2 Disc 7.flac") == 2, "cd wins over disc digits");
    ok &= check(detect("Disc 6 extra") == -1, "disc digits mid-string without dot are ignored");
    return ok;
}

bool test_has_disc_tag() {
    bool ok = check(cuesplit_has_disc_tag("Artist - 2020 - Album (Disc 1)") != 0, "(Disc 1) is tagged");
    ok &= check(cuesplit_has_disc_tag("Laibach - 1992 - Kapital") == 0, "plain album");
    ok &= check(cuesplit_has_disc_tag("Album CD2") != 0, "fused cd2 token");
    ok &= check(cuesplit_has_disc_tag("Album_disk3") != 0, "underscore separates tokens");
    ok &= check(cuesplit_has_disc_tag("Album Disc6") == 0, "disc6 is not in the token set");
    ok &= check(cuesplit_has_disc_tag("Compact Discography") == 0, "partial words do not count");
    ok &= check(cuesplit_has_disc_tag("Only One") != 0, "spelled number anywhere counts");
    ok &= check(cuesplit_has_disc_tag(nullptr) == 0, "null input");
    return ok;
}

bool test_resolve_precedence() {
    int n = -1;
    bool ok = check(cuesplit_resolve_disc_number(
                        "/m/Album CD1.flac", "/m/Album CD1.flac.cue", "/m/Album (Disc 3)", &n) != 0 &&
                        n == 1,
                    "audio file name wins");
    n = -1;
    ok &= check(cuesplit_resolve_disc_number(
                    "/m/Album.flac", "/m/Album CD2.cue", "/m/Album (Disc 3)", &n) != 0 &&
                    n == 2,
                "cue file name before directory");
    n = -1;
    ok &= check(cuesplit_resolve_disc_number(
                    "/m/Laibach - Kapital (Disc 2)/Kapital.flac", "/m/Laibach - Kapital (Disc 2)/Kapital.cue",
                    "/m/Laibach - Kapital (Disc 2)", &n) != 0 &&
                    n == 2,
                "directory base name as last resort");
    ok &= check(cuesplit_resolve_disc_number(
                    "/m/CD1/Album.flac", "/m/CD1/Album.cue", "/m/Rock", nullptr) == 0,
                "only base names are considered");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_detect_basic();
    ok &= test_detect_precedence();
    ok &= test_has_disc_tag();
    ok &= test_resolve_precedence();
    if (ok) {
        std::cout << "[disc_tag_unit] all checks passed\n";
    }
    return ok ? 0 : 1;
}
