// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <string>

#include <glib.h>

#include "internal.h"

namespace cuesplit::detail {

RegexPtr compile_regex(const char* pattern, bool caseless) {
    int flags = G_REGEX_RAW | G_REGEX_OPTIMIZE;
    if (caseless) flags |= G_REGEX_CASELESS;
    GError* gerr = nullptr;
    GRegex* re = g_regex_new(
        pattern,
        static_cast<GRegexCompileFlags>(flags),
        static_cast<GRegexMatchFlags>(0),
        &gerr);
    if (!re) {
        // Patterns are compile-time constants; a failure here is a programming error.
        std::cerr << "Invalid built-in regex \"" << pattern << "\": "
                  << gerror_message(gerr, "unknown error") << "\n";
        g_clear_error(&gerr);
    }
    return RegexPtr(re, &g_regex_unref);
}

std::optional<std::string> match_group(
    const GRegex* re,
    const std::string& text,
    int group) {

    if (!re) return std::nullopt;
    GMatchInfo* info = nullptr;
    // Length-aware match: raw bytes may contain anything but NUL.
    const bool matched = g_regex_match_full(
        re, text.c_str(), static_cast<gssize>(text.size()), 0,
        static_cast<GRegexMatchFlags>(0), &info, nullptr);
    std::optional<std::string> result;
    if (matched) {
        gint start = -1;
        gint end = -1;
        if (g_match_info_fetch_pos(info, group, &start, &end) && start >= 0 && end >= start) {
            result = text.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
        }
    }
    g_match_info_free(info);
    return result;
}

}  // namespace cuesplit::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

void cuesplit_release_error(const char* p) {
    delete[] p;
}

void cuesplit_release_string(char* p) {
    delete[] p;
}

};
