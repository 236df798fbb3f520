#include <cxxopts.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>
#include "jpatch/Commands.hpp"
#include "jpatch/Logging.hpp"
#include "jpatch/Settings.hpp"

using namespace jpatch;

namespace {

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) {
    g_interrupted = true;
}

// No SA_RESTART: the watcher's poll() must return early on Ctrl-C
void install_interrupt_handler() {
    struct sigaction sa {};
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

const char* kCommands =
    "Commands:\n"
    "  diff FROM TO            Print the JSON (RFC 6902) patch turning FROM into TO\n"
    "  apply INPUT -p PATCH    Print INPUT with PATCH applied\n"
    "  edit INPUT -p PATCH     Edit PATCH by editing the patched INPUT in an editor\n";

} // anonymous namespace

int main(int argc, char** argv) {
    cxxopts::Options options("jpatch", "Compute, apply and edit JSON (RFC 6902) patches");
    options.positional_help("COMMAND [ARGS]");

    options.add_options()
        ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
        ("p,patch", "Patch file (apply, edit)", cxxopts::value<std::string>())
        ("e,editor", "Editor command (edit)", cxxopts::value<std::string>())
        ("w,watch", "Rewrite the patch on every save while the editor is open (edit)")
        ("apply-failure", "When the stored patch does not apply: edit|fail (edit)",
         cxxopts::value<std::string>())
        ("indent", "Indentation of printed and written JSON", cxxopts::value<int>())
        ("no-color", "Disable colored output")
        ("v,verbose", "Log debug messages")
        ("q,quiet", "Log errors only")
        ("h,help", "Show help");

    options.add_options()
        ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"command"});

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n" << kCommands;
            return result.count("help") ? kExitOk : kExitUsage;
        }

        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (result.count("editor")) load.overrides["editor"] = result["editor"].as<std::string>();
        if (result.count("apply-failure")) {
            load.overrides["apply_failure"] = result["apply-failure"].as<std::string>();
        }
        if (result.count("indent")) load.overrides["indent"] = result["indent"].as<int>();
        if (result.count("verbose")) load.overrides["log.level"] = "debug";
        if (result.count("quiet")) load.overrides["log.level"] = "error";

        const Settings settings = load_settings(load);
        init_logging(settings.log_level);

        CommandOptions opts;
        if (result.count("patch")) opts.patch_path = result["patch"].as<std::string>();
        opts.watch = result.count("watch") > 0;
        opts.color = !result.count("no-color") && ::isatty(STDOUT_FILENO);
        opts.cancel = &g_interrupted;
        if (opts.watch) {
            install_interrupt_handler();
        }

        return run_command(result["command"].as<std::vector<std::string>>(), opts,
                           settings, std::cout, std::cerr);

    } catch (const std::exception& ex) {
        return report_error(ex, std::cerr);
    }
}
