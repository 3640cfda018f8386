// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <optional>
#include <sstream>
#include <string>

#include <glib.h>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

struct CueFieldRule {
    const char* pattern;
    std::optional<std::string> CueMetadata::*field;
};

// Only album-level fields are read. Each one takes the first matching line.
// TITLE deliberately takes the first TITLE line, which is the album title
// only when the sheet lists it before the track entries.
static const CueFieldRule cue_field_rules[] = {
    {"^\\s*PERFORMER\\s*\"(.*)\"", &CueMetadata::artist},
    {"^\\s*TITLE\\s*\"(.*)\"", &CueMetadata::album},
    {"^\\s*(?:REM\\s+DATE|DATE)\\s+([0-9]{4})", &CueMetadata::year},
};

static std::string strip_utf8_bom(
    const std::string& text) {

    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF) {
        return text.substr(3);
    }
    return text;
}

namespace cuesplit::detail {

bool read_cue_metadata(
    const std::string& cue_path,
    CueMetadata& out,
    std::string& err) {

    out = CueMetadata{};

    gchar* contents = nullptr;
    gsize length = 0;
    GError* gerr = nullptr;
    if (!g_file_get_contents(cue_path.c_str(), &contents, &length, &gerr)) {
        err = "Cannot read cue sheet " + cue_path + ": " + gerror_message(gerr, "unknown error");
        g_clear_error(&gerr);
        return false;
    }
    const std::string text = strip_utf8_bom(std::string(contents, length));
    g_free(contents);

    std::vector<RegexPtr> compiled;
    for (const auto& rule : cue_field_rules) {
        compiled.push_back(compile_regex(rule.pattern, /*caseless=*/false));
    }

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        bool all_found = true;
        for (size_t i = 0; i < compiled.size(); ++i) {
            auto& slot = out.*(cue_field_rules[i].field);
            if (slot) continue;
            if (auto value = match_group(compiled[i].get(), line, 1)) {
                slot = std::move(value);
            } else {
                all_found = false;
            }
        }
        if (all_found) break;
    }
    return true;
}

}  // namespace cuesplit::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

CueSplitCueMetadata* cuesplit_read_cue_metadata(
    const char* cue_path,
    const char** error) {

    clear_error(error);
    if (!cue_path) {
        set_error(error, "Cue sheet path is null");
        return nullptr;
    }

    CueMetadata meta;
    std::string err;
    if (!read_cue_metadata(cue_path, meta, err)) {
        set_error(error, err);
        return nullptr;
    }

    auto* p = new CueSplitCueMetadata{};
    p->artist = make_cstr_copy_nullable(meta.artist);
    p->album = make_cstr_copy_nullable(meta.album);
    p->year = make_cstr_copy_nullable(meta.year);
    return p;
}

void cuesplit_release_cue_metadata(
    CueSplitCueMetadata* p) {

    if (!p) return;
    release_cstr(p->artist);
    release_cstr(p->album);
    release_cstr(p->year);
    delete p;
}

};
