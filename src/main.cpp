// ═══════════════════════════════════════════════════════════════════
//  main.cpp — forgepp-build command line
// ═══════════════════════════════════════════════════════════════════
//
//  forgepp-build [--project-root DIR] [--clean] [--jobs N] [--verbose]
//
//  Exit status: 0 when every unit built, 1 when anything failed or the
//  run was interrupted, 2 on a usage error.
//
// ═══════════════════════════════════════════════════════════════════

#include "forgepp/config.h"
#include "forgepp/console.h"
#include "forgepp/errors.h"
#include "forgepp/lifecycle.h"
#include "forgepp/orchestrator.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace forgepp;

namespace {

struct Options {
    std::optional<std::filesystem::path> projectRoot;
    bool cleanOnly = false;
    bool verbose = false;
    std::optional<unsigned> jobs;
    bool help = false;
};

void usage(std::ostream& os) {
    os << "Usage: forgepp-build [options]\n"
          "\n"
          "Packages Lambda layers, Lambda functions and AppSync schemas.\n"
          "\n"
          "Options:\n"
          "  --project-root DIR   Project to build (default: detected from the current directory)\n"
          "  --clean              Remove build artifacts and exit\n"
          "  -j, --jobs N         Units built in parallel within a phase (default: 1)\n"
          "  -v, --verbose        Print debug output\n"
          "  -h, --help           Show this help\n";
}

// Throws std::invalid_argument on a usage error
Options parseArgs(int argc, char** argv) {
    Options opts;
    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--project-root") {
            opts.projectRoot = value(i, arg);
        } else if (arg == "--clean") {
            opts.cleanOnly = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-j" || arg == "--jobs") {
            auto raw = value(i, arg);
            std::size_t consumed = 0;
            int n = 0;
            try {
                n = std::stoi(raw, &consumed);
            } catch (const std::exception&) {
                throw std::invalid_argument("invalid value for " + arg + ": " + raw);
            }
            if (consumed != raw.size() || n < 1) {
                throw std::invalid_argument("invalid value for " + arg + ": " + raw);
            }
            opts.jobs = static_cast<unsigned>(n);
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
    return opts;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "forgepp-build: " << e.what() << "\n\n";
        usage(std::cerr);
        return 2;
    }
    if (opts.help) {
        usage(std::cout);
        return 0;
    }

    console::setVerbose(opts.verbose);

    Config config;
    try {
        auto root = opts.projectRoot ? *opts.projectRoot
                                     : Config::detectProjectRoot(std::filesystem::current_path());
        config = Config::load(root);
    } catch (const EnvironmentError& e) {
        console::error(e.what());
        return 1;
    }
    if (opts.jobs) config.jobs = *opts.jobs;
    if (opts.verbose) config.verbose = true;
    console::setVerbose(config.verbose);

    lifecycle::CancellationToken token;
    lifecycle::enableInterruptHandling(token);

    BuildOrchestrator build(config, token);

    if (opts.cleanOnly) {
        try {
            build.cleanOnly();
        } catch (const EnvironmentError& e) {
            console::error(e.what());
            lifecycle::disableInterruptHandling();
            return 1;
        }
        console::success("Build artifacts cleaned");
        lifecycle::disableInterruptHandling();
        return 0;
    }

    console::info("Building project:", config.projectRoot.string());
    auto summary = build.run();
    lifecycle::disableInterruptHandling();

    if (int sig = lifecycle::interruptSignal()) {
        console::warn("Interrupted by signal", sig);
    }
    return summary.exitCode();
}
