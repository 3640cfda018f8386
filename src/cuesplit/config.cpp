// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <glib.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static void replace_cstr(
    const char*& target,
    const std::string& value) {

    release_cstr(target);
    target = make_cstr_copy(value);
}

static std::string strip_inline_comment_value(
    const std::string& raw) {

    bool in_single = false;
    bool in_double = false;
    bool escaped = false;
    for (size_t i = 0; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (ch == '\\') {
            escaped = true;
            continue;
        }
        if (ch == '\'' && !in_double) {
            in_single = !in_single;
            continue;
        }
        if (ch == '"' && !in_single) {
            in_double = !in_double;
            continue;
        }
        if (!in_single && !in_double && (ch == '#' || ch == ';')) {
            if (i == 0 || std::isspace(static_cast<unsigned char>(raw[i - 1]))) {
                return trim(raw.substr(0, i));
            }
        }
    }
    return trim(raw);
}

static bool parse_bool_value(
    const std::string& raw,
    bool& out) {

    const std::string value = to_lower(trim(raw));
    if (value == "true" || value == "1" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        out = false;
        return true;
    }
    return false;
}

static void release_tools(
    CueSplitTools& tools) {

    release_cstr(tools.shnsplit);
    release_cstr(tools.flac);
    release_cstr(tools.mp3splt);
    release_cstr(tools.cuetag);
}

static CueSplitConfig* make_default_config() {
    const Tools defaults;
    auto* cfg = new CueSplitConfig{};
    cfg->output_root = nullptr;
    cfg->temp_root = nullptr;
    cfg->delete_source = false;
    cfg->verbose = false;
    cfg->builtin_tagger = true;
    cfg->tools.shnsplit = make_cstr_copy(defaults.shnsplit);
    cfg->tools.flac = make_cstr_copy(defaults.flac);
    cfg->tools.mp3splt = make_cstr_copy(defaults.mp3splt);
    cfg->tools.cuetag = make_cstr_copy(defaults.cuetag);
    cfg->config_path = nullptr;
    return cfg;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

CueSplitConfig* cuesplit_load_config(
    const char* path,
    const char** error) {

    clear_error(error);

    auto* cfg = make_default_config();
    GKeyFile* key_file = g_key_file_new();
    bool loaded = false;
    std::string loaded_path;

    auto fail = [&](const std::string& message) -> CueSplitConfig* {
        set_error(error, message);
        cuesplit_release_config(cfg);
        g_key_file_unref(key_file);
        return nullptr;
    };

    auto fail_gerror = [&](GError* gerr, const char* fallback) -> CueSplitConfig* {
        const std::string msg = gerror_message(gerr, fallback);
        if (gerr) g_error_free(gerr);
        return fail(msg);
    };

    std::vector<std::string> candidates;
    if (path) {
        candidates.emplace_back(path);
    } else {
        candidates.emplace_back("cuesplit.conf");
        const char* home = std::getenv("HOME");
        if (home) {
            const std::filesystem::path home_path = std::filesystem::path(home) / ".cuesplit.conf";
            candidates.emplace_back(home_path.string());
        }
    }

    for (const auto& candidate : candidates) {
        GError* gerr = nullptr;
        if (g_key_file_load_from_file(key_file, candidate.c_str(), G_KEY_FILE_NONE, &gerr)) {
            loaded = true;
            loaded_path = candidate;
            break;
        }
        if (gerr) {
            if (path) {
                return fail_gerror(gerr, "Failed to load config");
            }
            g_error_free(gerr);
        }
    }

    if (!loaded) {
        g_key_file_unref(key_file);
        return cfg;
    }

    // Reads one string key; returns false only on a GLib error.
    auto read_string = [&](const char* group, const char* key, std::string& out, bool& present) -> bool {
        present = false;
        if (!g_key_file_has_key(key_file, group, key, nullptr)) return true;
        GError* gerr = nullptr;
        char* value = g_key_file_get_string(key_file, group, key, &gerr);
        if (!value) {
            fail_gerror(gerr, "Failed to parse config value");
            return false;
        }
        out = strip_inline_comment_value(value);
        g_free(value);
        present = true;
        return true;
    };

    struct StringKey {
        const char* group;
        const char* key;
        const char** target;
        bool allow_empty;
    };
    const StringKey string_keys[] = {
        {"cuesplit", "output", &cfg->output_root, true},
        {"cuesplit", "temp_dir", &cfg->temp_root, true},
        {"tools", "shnsplit", &cfg->tools.shnsplit, false},
        {"tools", "flac", &cfg->tools.flac, false},
        {"tools", "mp3splt", &cfg->tools.mp3splt, false},
        {"tools", "cuetag", &cfg->tools.cuetag, false},
    };
    for (const auto& sk : string_keys) {
        std::string value;
        bool present = false;
        if (!read_string(sk.group, sk.key, value, present)) return nullptr;
        if (!present) continue;
        if (!value.empty()) {
            replace_cstr(*sk.target, value);
        } else if (sk.allow_empty) {
            release_cstr(*sk.target);
        }
    }

    struct BoolKey {
        const char* key;
        bool* target;
    };
    const BoolKey bool_keys[] = {
        {"delete_source", &cfg->delete_source},
        {"verbose", &cfg->verbose},
        {"builtin_tagger", &cfg->builtin_tagger},
    };
    for (const auto& bk : bool_keys) {
        std::string value;
        bool present = false;
        if (!read_string("cuesplit", bk.key, value, present)) return nullptr;
        if (!present) continue;
        bool parsed = false;
        if (!parse_bool_value(value, parsed)) {
            return fail(std::string("Invalid ") + bk.key + " value: " + value);
        }
        *bk.target = parsed;
    }

    g_key_file_unref(key_file);
    cfg->config_path = make_cstr_copy(loaded_path);
    return cfg;
}

void cuesplit_release_config(
    CueSplitConfig* cfg) {

    if (!cfg) return;
    release_cstr(cfg->output_root);
    release_cstr(cfg->temp_root);
    release_cstr(cfg->config_path);
    release_tools(cfg->tools);
    delete cfg;
}

};
