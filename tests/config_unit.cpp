// Unit coverage for INI configuration loading.
#include <iostream>
#include <string>

#include <glib.h>
#include <unistd.h>

#include "cuesplit/cuesplit.h"
#include "test_utils.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[config_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::string view(const char *s) { return s ? std::string{s} : std::string{"<null>"}; }

bool test_defaults_when_nothing_found(const test_utils::TempDir &tmp) {
    // Neither ./cuesplit.conf nor ~/.cuesplit.conf exists here.
    const std::string empty_home = tmp.join("home");
    bool ok = check(test_utils::write_file(empty_home + "/.keep", ""), "prepare home");
    g_setenv("HOME", empty_home.c_str(), TRUE);
    ok &= check(::chdir(empty_home.c_str()) == 0, "chdir");

    const char *err = nullptr;
    CueSplitConfig *cfg = cuesplit_load_config(nullptr, &err);
    ok &= check(cfg != nullptr, "defaults load");
    ok &= check(err == nullptr, "no error for defaults");
    if (cfg) {
        ok &= check(cfg->config_path == nullptr, "no config path");
        ok &= check(cfg->output_root == nullptr, "no output root");
        ok &= check(cfg->temp_root == nullptr, "no temp root");
        ok &= check(!cfg->delete_source, "delete_source false");
        ok &= check(!cfg->verbose, "verbose false");
        ok &= check(cfg->builtin_tagger, "builtin tagger on");
        ok &= check(view(cfg->tools.shnsplit) == "shnsplit", "shnsplit default");
        ok &= check(view(cfg->tools.flac) == "flac", "flac default");
        ok &= check(view(cfg->tools.mp3splt) == "mp3splt", "mp3splt default");
        ok &= check(view(cfg->tools.cuetag) == "cuetag", "cuetag default");
    }
    cuesplit_release_config(cfg);
    cuesplit_release_error(err);
    return ok;
}

bool test_home_config_found(const test_utils::TempDir &tmp) {
    const std::string home = tmp.join("home2");
    bool ok = check(test_utils::write_file(home + "/.cuesplit.conf",
                                           "[cuesplit]\nverbose = yes\n"),
                    "write home config");
    g_setenv("HOME", home.c_str(), TRUE);
    ok &= check(::chdir(tmp.path().c_str()) == 0, "chdir");

    CueSplitConfig *cfg = cuesplit_load_config(nullptr, nullptr);
    ok &= check(cfg != nullptr, "home config loads");
    if (cfg) {
        ok &= check(view(cfg->config_path) == home + "/.cuesplit.conf", "path recorded: " + view(cfg->config_path));
        ok &= check(cfg->verbose, "verbose from home config");
    }
    cuesplit_release_config(cfg);
    return ok;
}

bool test_explicit_file(const test_utils::TempDir &tmp) {
    const std::string path = tmp.join("explicit.conf");
    bool ok = check(test_utils::write_file(path,
                                           "[cuesplit]\n"
                                           "output = /music/split   # default output root\n"
                                           "temp_dir = /var/tmp ; scratch\n"
                                           "delete_source = true\n"
                                           "verbose = 1\n"
                                           "builtin_tagger = no\n"
                                           "\n"
                                           "[tools]\n"
                                           "shnsplit = /opt/bin/shnsplit\n"
                                           "cuetag = cuetag.sh\n"
                                           "mp3splt =\n"),
                    "write explicit config");
    const char *err = nullptr;
    CueSplitConfig *cfg = cuesplit_load_config(path.c_str(), &err);
    ok &= check(cfg != nullptr, "explicit config loads: " + view(err));
    if (cfg) {
        ok &= check(view(cfg->config_path) == path, "path recorded");
        ok &= check(view(cfg->output_root) == "/music/split", "inline # comment stripped: " + view(cfg->output_root));
        ok &= check(view(cfg->temp_root) == "/var/tmp", "inline ; comment stripped: " + view(cfg->temp_root));
        ok &= check(cfg->delete_source, "delete_source true");
        ok &= check(cfg->verbose, "verbose 1");
        ok &= check(!cfg->builtin_tagger, "builtin_tagger no");
        ok &= check(view(cfg->tools.shnsplit) == "/opt/bin/shnsplit", "shnsplit override");
        ok &= check(view(cfg->tools.flac) == "flac", "flac keeps default");
        ok &= check(view(cfg->tools.mp3splt) == "mp3splt", "empty tool value keeps default");
        ok &= check(view(cfg->tools.cuetag) == "cuetag.sh", "cuetag override");
    }
    cuesplit_release_config(cfg);
    cuesplit_release_error(err);
    return ok;
}

bool test_invalid_bool(const test_utils::TempDir &tmp) {
    const std::string path = tmp.join("bad.conf");
    bool ok = check(test_utils::write_file(path, "[cuesplit]\ndelete_source = maybe\n"), "write bad config");
    const char *err = nullptr;
    CueSplitConfig *cfg = cuesplit_load_config(path.c_str(), &err);
    ok &= check(cfg == nullptr, "invalid boolean rejected");
    ok &= check(view(err).find("delete_source") != std::string::npos, "error names the key: " + view(err));
    cuesplit_release_config(cfg);
    cuesplit_release_error(err);
    return ok;
}

bool test_missing_explicit_file(const test_utils::TempDir &tmp) {
    const std::string path = tmp.join("absent.conf");
    const char *err = nullptr;
    CueSplitConfig *cfg = cuesplit_load_config(path.c_str(), &err);
    bool ok = check(cfg == nullptr, "missing explicit config is an error");
    ok &= check(err != nullptr, "error reported");
    cuesplit_release_config(cfg);
    cuesplit_release_error(err);
    return ok;
}

}  // namespace

int main() {
    test_utils::TempDir tmp;
    if (!tmp.valid()) {
        std::cerr << "[config_unit] cannot create temp dir\n";
        return 1;
    }
    bool ok = true;
    ok &= test_defaults_when_nothing_found(tmp);
    ok &= test_home_config_found(tmp);
    ok &= test_explicit_file(tmp);
    ok &= test_invalid_bool(tmp);
    ok &= test_missing_explicit_file(tmp);
    // Leave the scratch tree before it is removed.
    if (::chdir("/") != 0) {
        std::cerr << "[config_unit] chdir / failed\n";
    }
    if (ok) {
        std::cout << "[config_unit] all checks passed\n";
    }
    return ok ? 0 : 1;
}
