// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <glib.h>

#include "internal.h"

using namespace cuesplit::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static void remove_tree_quietly(
    const std::string& path) {

    if (path.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        log_warn("Failed to remove temporary directory " + path + ": " + ec.message());
    }
}

namespace cuesplit::detail {

std::string select_temp_root(const std::string& configured) {
    if (!configured.empty()) return configured;
    const char* env = g_getenv("TMPDIR");
    if (env && env[0]) return env;
    return to_string_or_empty(g_get_tmp_dir());
}

bool make_temp_dir(CueSplit* h, std::string& out_path, std::string& err) {
    if (!h) {
        err = "Handle is null";
        return false;
    }
    const std::string root = select_temp_root(h->temp_root);
    std::string templ = (std::filesystem::path(root) / "cuesplit.XXXXXX").string();
    std::vector<gchar> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (!g_mkdtemp(buf.data())) {
        err = "Failed to create temporary directory under " + root + ": " + std::strerror(errno);
        return false;
    }
    out_path = buf.data();
    h->temp_dirs.push_back(out_path);
    return true;
}

bool remove_temp_dir(CueSplit* h, const std::string& path) {
    if (!h) return false;
    auto it = std::find(h->temp_dirs.begin(), h->temp_dirs.end(), path);
    if (it == h->temp_dirs.end()) return false;
    h->temp_dirs.erase(it);
    remove_tree_quietly(path);
    return true;
}

void remove_all_temp_dirs(CueSplit* h) {
    if (!h) return;
    std::vector<std::string> pending;
    pending.swap(h->temp_dirs);
    for (const auto& d : pending) {
        remove_tree_quietly(d);
    }
}

TempDirLease::TempDirLease(CueSplit* h, std::string path)
    : h_(h), path_(std::move(path)) {}

TempDirLease::~TempDirLease() {
    if (!path_.empty()) remove_temp_dir(h_, path_);
}

}  // namespace cuesplit::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* cuesplit_make_temp_dir(
    CueSplit* h,
    const char** error) {

    clear_error(error);
    std::string path;
    std::string err;
    if (!make_temp_dir(h, path, err)) {
        set_error(error, err);
        return nullptr;
    }
    return make_mutable_cstr_copy(path);
}

int cuesplit_remove_temp_dir(
    CueSplit* h,
    const char* path) {

    if (!path) return 0;
    return remove_temp_dir(h, path) ? 1 : 0;
}

size_t cuesplit_temp_dir_count(
    const CueSplit* h) {

    return h ? h->temp_dirs.size() : 0;
}

};
