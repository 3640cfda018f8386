// cuesplit - split single-file album images using CUE sheets
// Under MIT.

#include "cuesplit/cuesplit.h"
#include "version.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <signal.h>

namespace {

std::string view_string(const char* s) {
    return s ? std::string{s} : std::string{};
}

// Handle observed by the signal handler; null outside a run.
std::atomic<CueSplit*> g_active_handle{nullptr};

extern "C" void on_terminate_signal(int) {
    CueSplit* h = g_active_handle.load();
    if (h) cuesplit_interrupt(h);
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_terminate_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage() {
    std::cout << "Usage: cuesplit [-o dir] [--temp-dir dir] [--delete-source] [-n] [-v] [-i config] [ROOT_DIR]\n";
    std::cout << "  -o / --output: Output root directory (default: next to each album image)\n";
    std::cout << "       --temp-dir: Directory for scratch splitting work (default: $TMPDIR)\n";
    std::cout << "       --delete-source: Delete the album image after a successful split\n";
    std::cout << "  -n / --dry-run: Show what would be done without touching any file\n";
    std::cout << "  -v / --verbose: Verbose logging\n";
    std::cout << "  -i / --input: cuesplit config file path (default search: ./cuesplit.conf --> ~/.cuesplit.conf)\n";
    std::cout << "  -h / --help: Show this help\n";
    std::cout << "  ROOT_DIR: Directory tree to scan (default: .)\n";
    std::cout << "\n";
    std::cout << "CUE lookup order for Album.flac: Album.flac.cue, then Album.cue.\n";
    std::cout << "Supported images: flac, ape, wav, wv, tta (re-encoded to FLAC), mp3, ogg (cut in place).\n";
}

[[noreturn]] void fail_usage(const std::string& message) {
    std::cerr << "[ERROR] " << message << "\n";
    std::cerr << "Try 'cuesplit --help' for more information.\n";
    std::exit(1);
}

}  // namespace

struct Options {
    std::optional<std::string> output_root;
    std::optional<std::string> temp_root;
    std::optional<bool> delete_source;
    std::optional<bool> verbose;
    bool dry_run = false;
    std::string config_file;
    std::string root_dir = ".";
};

Options parse_args(int argc, char** argv) {
    Options opts;
    bool root_seen = false;

    auto require_value = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            fail_usage("Option " + arg + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-o" || arg == "--output") {
            opts.output_root = require_value(i, arg);
        } else if (arg == "--temp-dir") {
            opts.temp_root = require_value(i, arg);
        } else if (arg == "--delete-source") {
            opts.delete_source = true;
        } else if (arg == "-n" || arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-i" || arg == "--input") {
            opts.config_file = require_value(i, arg);
        } else if (arg == "-?" || arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(0);
        } else if (arg.size() > 1 && arg[0] == '-') {
            fail_usage("Unknown option: " + arg);
        } else if (!root_seen) {
            opts.root_dir = arg;
            root_seen = true;
        } else {
            fail_usage("Unexpected argument: " + arg);
        }
    }
    return opts;
}

int main(int argc, char** argv) {
    std::cerr << "\ncuesplit [" << VERSION << "-" << COMMIT_ID << "]\n";
    std::cerr << "Licence: Under MIT.\n\n";

    Options cli_opts = parse_args(argc, argv);

    const char* config_err = nullptr;
    CueSplitConfig* cfg_raw = cuesplit_load_config(
        cli_opts.config_file.empty() ? nullptr : cli_opts.config_file.c_str(),
        &config_err);
    if (!cfg_raw) {
        std::cerr << "[ERROR] " << (config_err ? view_string(config_err) : "Failed to load config") << "\n";
        cuesplit_release_error(config_err);
        return 1;
    }
    cuesplit_release_error(config_err);
    std::unique_ptr<CueSplitConfig, decltype(&cuesplit_release_config)> cfg(cfg_raw, &cuesplit_release_config);

    const std::string output_root = cli_opts.output_root.value_or(view_string(cfg->output_root));
    const std::string temp_root = cli_opts.temp_root.value_or(view_string(cfg->temp_root));
    const bool delete_source = cli_opts.delete_source.value_or(cfg->delete_source);
    const bool verbose = cli_opts.verbose.value_or(cfg->verbose);

    if (verbose && cfg->config_path) {
        std::cerr << "[v] Config: " << cfg->config_path << "\n";
    }

    CueSplitSettings settings{};
    settings.output_root = output_root.empty() ? nullptr : output_root.c_str();
    settings.temp_root = temp_root.empty() ? nullptr : temp_root.c_str();
    settings.delete_source = delete_source;
    settings.dry_run = cli_opts.dry_run;
    settings.verbose = verbose;
    settings.builtin_tagger = cfg->builtin_tagger;
    settings.tools = cfg->tools;

    const char* err = nullptr;
    CueSplit* handle_raw = cuesplit_open(&settings, &err);
    if (!handle_raw) {
        std::cerr << "[ERROR] " << (err ? view_string(err) : "Failed to initialize") << "\n";
        cuesplit_release_error(err);
        return 1;
    }
    cuesplit_release_error(err);
    err = nullptr;
    std::unique_ptr<CueSplit, decltype(&cuesplit_close)> handle(handle_raw, &cuesplit_close);

    g_active_handle.store(handle.get());
    install_signal_handlers();

    CueSplitRunSummary summary{};
    const CueSplitStatus status = cuesplit_process_tree(
        handle.get(), cli_opts.root_dir.c_str(), &summary, &err);

    g_active_handle.store(nullptr);

    std::cerr << "\n[*] Discovered: " << summary.discovered
              << ", processed: " << summary.processed
              << ", skipped: " << summary.skipped
              << ", failed: " << summary.failed << "\n";

    if (status == CUESPLIT_STATUS_FATAL) {
        std::cerr << "[ERROR] " << (err ? view_string(err) : "Aborted") << "\n";
        cuesplit_release_error(err);
        return 1;
    }
    cuesplit_release_error(err);
    return 0;
}
