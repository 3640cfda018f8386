// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <cctype>
#include <string>
#include <utility>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

// VFAT-hostile characters and their replacements, applied in this order.
static const std::pair<char, const char*> filename_substitutions[] = {
    {':', " - "},
    {'"', ""},
    {'/', "-"},
    {'\\', ""},
    {'|', "-"},
    {'?', "-"},
    {'*', "-"},
    {'<', "("},
    {'>', "("},
};

static std::string replace_all(
    const std::string& input,
    char from,
    const char* to) {

    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        if (ch == from) {
            out += to;
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

static std::string collapse_whitespace(
    const std::string& input) {

    std::string out;
    out.reserve(input.size());
    bool pending_space = false;
    for (unsigned char uch : input) {
        if (std::isspace(uch)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) out.push_back(' ');
        pending_space = false;
        out.push_back(static_cast<char>(uch));
    }
    return out;
}

namespace cuesplit::detail {

std::string sanitize_filename(const std::string& name) {
    std::string base;
    std::string ext;
    const size_t dot = name.rfind('.');
    if (dot == std::string::npos) {
        base = name;
    } else {
        base = name.substr(0, dot);
        ext = name.substr(dot);
    }

    for (const auto& [from, to] : filename_substitutions) {
        base = replace_all(base, from, to);
    }
    for (char& ch : base) {
        if (ch == '.') ch = ' ';
    }
    return collapse_whitespace(base) + ext;
}

std::string sanitize_dirname(const std::string& name) {
    std::string s = replace_all(name, '/', "-");
    s = replace_all(s, '\\', "-");
    return collapse_whitespace(s);
}

}  // namespace cuesplit::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* cuesplit_sanitize_filename(const char* name) {
    return make_mutable_cstr_copy(sanitize_filename(to_string_or_empty(name)));
}

char* cuesplit_sanitize_dirname(const char* name) {
    return make_mutable_cstr_copy(sanitize_dirname(to_string_or_empty(name)));
}

};
