// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <cctype>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <glib.h>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

struct DiscRule {
    const char* pattern;
    // 0 => take the number from capture group 1.
    int fixed_number;
};

// Evaluated top to bottom, first hit wins. The order is not "tightest match
// first"; folder naming downstream depends on it staying exactly like this.
static const DiscRule disc_rules[] = {
    {"\\(disc\\s*([0-9]+)\\)", 0},
    {"\\(disc\\s*one\\)", 1},
    {"\\(disc\\s*two\\)", 2},
    {"\\(disc\\s*three\\)", 3},
    {"cd\\s*([0-9]+)", 0},
    {"disc\\s*([0-9]+)\\.", 0},
    {"disc\\s*([0-9]+)$", 0},
    {"disc one", 1},
    {"disc two", 2},
    {"disc three", 3},
};

static const std::vector<RegexPtr>& compiled_disc_rules() {
    static const std::vector<RegexPtr> compiled = [] {
        std::vector<RegexPtr> v;
        for (const auto& rule : disc_rules) {
            v.push_back(compile_regex(rule.pattern, /*caseless=*/true));
        }
        return v;
    }();
    return compiled;
}

static std::optional<int> parse_disc_digits(
    const std::string& digits) {

    try {
        return std::stoi(digits);
    } catch (...) {
        return std::nullopt;
    }
}

static std::string base_name(
    const std::string& path) {

    if (path.empty()) return {};
    gchar* raw = g_path_get_basename(path.c_str());
    std::string out = to_string_or_empty(raw);
    g_free(raw);
    return out;
}

namespace cuesplit::detail {

std::optional<int> detect_disc_number(const std::string& text) {
    const auto& compiled = compiled_disc_rules();
    for (size_t i = 0; i < compiled.size(); ++i) {
        const DiscRule& rule = disc_rules[i];
        if (rule.fixed_number > 0) {
            if (match_group(compiled[i].get(), text, 0)) return rule.fixed_number;
            continue;
        }
        const auto digits = match_group(compiled[i].get(), text, 1);
        if (!digits) continue;
        if (auto number = parse_disc_digits(*digits)) return number;
    }
    return std::nullopt;
}

bool has_disc_tag(const std::string& text) {
    // Spelled-out numbers count anywhere in the name, not only after a
    // disc/disk/cd token. "Four Seasons" is therefore reported as tagged.
    static const std::unordered_set<std::string> kDiscTokens = {
        "disc", "disk", "cd",
        "disc1", "disc2", "disc3", "disc4", "disc5",
        "disk1", "disk2", "disk3", "disk4", "disk5",
        "cd1", "cd2", "cd3", "cd4", "cd5",
        "one", "two", "three", "four", "five",
    };

    std::string normalized;
    normalized.reserve(text.size());
    for (unsigned char ch : text) {
        const unsigned char lower = static_cast<unsigned char>(std::tolower(ch));
        const bool alnum = (lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9');
        normalized.push_back(alnum ? static_cast<char>(lower) : ' ');
    }

    size_t pos = 0;
    while (pos < normalized.size()) {
        while (pos < normalized.size() && normalized[pos] == ' ') ++pos;
        size_t end = pos;
        while (end < normalized.size() && normalized[end] != ' ') ++end;
        if (end > pos && kDiscTokens.count(normalized.substr(pos, end - pos)) > 0) {
            return true;
        }
        pos = end;
    }
    return false;
}

std::optional<int> resolve_disc_number(
    const std::string& audio_path,
    const std::string& cue_path,
    const std::string& audio_dir) {

    for (const auto& candidate : {audio_path, cue_path, audio_dir}) {
        if (candidate.empty()) continue;
        if (auto disc = detect_disc_number(base_name(candidate))) return disc;
    }
    return std::nullopt;
}

}  // namespace cuesplit::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

int cuesplit_detect_disc_number(
    const char* text,
    int* out_number) {

    const auto disc = detect_disc_number(to_string_or_empty(text));
    if (!disc) return 0;
    if (out_number) *out_number = *disc;
    return 1;
}

int cuesplit_has_disc_tag(
    const char* text) {

    return has_disc_tag(to_string_or_empty(text)) ? 1 : 0;
}

int cuesplit_resolve_disc_number(
    const char* audio_path,
    const char* cue_path,
    const char* audio_dir,
    int* out_number) {

    const auto disc = resolve_disc_number(
        to_string_or_empty(audio_path),
        to_string_or_empty(cue_path),
        to_string_or_empty(audio_dir));
    if (!disc) return 0;
    if (out_number) *out_number = *disc;
    return 1;
}

};
