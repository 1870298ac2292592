#include "quire/config.hpp"
#include "quire/invalidation.hpp"
#include "quire/lock.hpp"
#include "quire/log.hpp"
#include "quire/manifest.hpp"
#include "quire/orchestrator.hpp"
#include "quire/renderer.hpp"
#include "quire/watch.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::seconds INVALIDATE_LOCK_TIMEOUT{30};

struct CliOptions {
    fs::path work_dir = ".";
    std::optional<fs::path> config_path;
    std::optional<quire::log::Level> log_level;
    std::string command;
    bool force = false;
    bool clean = false;
    bool dry_run = false;
    bool graph = false;
    bool drafts = false;
    std::optional<size_t> jobs;
    std::vector<std::string> queries;
};

void print_help() {
    std::println("Usage: quire [options] <command> [command options]");
    std::println("Commands:");
    std::println("  build                  Render stale pages and update the cache");
    std::println("  invalidate [query]...  Force a rebuild of matching pages on the next build");
    std::println("                         (query: tag=<tag> or path=<glob>; none invalidates every page)");
    std::println("  watch                  Build, then rebuild affected pages on every change");
    std::println("Options:");
    std::println("  -h, --help             Show this help message");
    std::println("  --version              Show version");
    std::println("  -d <dir>               Change working directory before doing anything");
    std::println("  -c <file>              Use <file> as the configuration (default: quire.json)");
    std::println("  -v, --verbose          Log debug output");
    std::println("  -q, --quiet            Only log errors");
    std::println("Build options:");
    std::println("  --force                Re-render every page");
    std::println("  --clean                Discard the cache and the output directory first");
    std::println("  --dry-run              Report what would be rendered without rendering");
    std::println("  --graph                Print the dependency graph as Graphviz DOT");
    std::println("  -j, --jobs <N>         Set number of parallel jobs (default: auto)");
    std::println("  --drafts               Include pages marked as drafts");
}

void print_version() {
    std::println("quire {}", QUIRE_PROJ_VER);
}

// Returns an exit code when parsing ends the program early.
std::optional<int> parse_args(const int argc, const char *const *argv, CliOptions &opts) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-d" || arg == "-c") {
            if (i + 1 < argc) {
                if (arg == "-d")
                    opts.work_dir = argv[i + 1];
                else
                    opts.config_path = fs::path(argv[i + 1]);
                i++;
            } else {
                std::println(std::cerr, "Missing argument for {}", arg);
                return 1;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.log_level = quire::log::Level::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.log_level = quire::log::Level::Error;
        } else if (arg == "--force") {
            opts.force = true;
        } else if (arg == "--clean") {
            opts.clean = true;
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "--graph") {
            opts.graph = true;
        } else if (arg == "--drafts") {
            opts.drafts = true;
        } else if (arg == "-j" || arg == "--jobs") {
            if (i + 1 < argc) {
                size_t jobs = 0;
                auto res = std::from_chars(argv[i + 1], argv[i + 1] + strlen(argv[i + 1]), jobs);
                if (res.ec == std::errc() && res.ptr == argv[i + 1] + strlen(argv[i + 1])) {
                    opts.jobs = jobs;
                    i++;
                } else {
                    std::println(std::cerr, "Invalid job count: {}", argv[i + 1]);
                    return 1;
                }
            } else {
                std::println(std::cerr, "Missing argument for {}", arg);
                return 1;
            }
        } else if (opts.command.empty() && (arg == "build" || arg == "invalidate" || arg == "watch")) {
            opts.command = arg;
        } else if (opts.command == "invalidate" && !arg.starts_with('-')) {
            opts.queries.emplace_back(arg);
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (opts.command.empty()) {
        print_help();
        return 1;
    }
    return std::nullopt;
}

int run_invalidate(const quire::SiteConfig &config, const fs::path &root, const std::vector<std::string> &queries) {
    // Reject the whole batch before recording anything.
    for (const auto &query : queries) {
        if (auto res = quire::parse_invalidation_query(query, quire::system_now()); !res) {
            std::println(std::cerr, "Invalid query {}: {}", query, res.error());
            return 1;
        }
    }

    auto store = quire::ManifestStore::open(root / config.cache_dir);
    if (!store) {
        std::println(std::cerr, "{}", store.error());
        return 1;
    }
    auto lock = quire::BuildLock::acquire(store->cache_dir(), INVALIDATE_LOCK_TIMEOUT);
    if (!lock) {
        std::println(std::cerr, "{}", lock.error());
        return 1;
    }

    quire::InvalidationGateway gateway(*store);
    if (queries.empty()) {
        if (auto res = gateway.invalidate_all(); !res) {
            std::println(std::cerr, "Failed to invalidate all pages: {}", res.error());
            return 1;
        }
        return 0;
    }
    for (const auto &query : queries) {
        if (auto res = gateway.invalidate(query); !res) {
            std::println(std::cerr, "Failed to record {}: {}", query, res.error());
            return 1;
        }
    }
    return 0;
}

// Turns SIGINT/SIGTERM into a stop request. The signals must already be blocked.
void wait_for_signal(std::stop_source source, std::stop_token token) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);

    const timespec interval{0, 200'000'000};
    while (!token.stop_requested()) {
        if (sigtimedwait(&signals, nullptr, &interval) > 0) {
            source.request_stop();
            return;
        }
    }
}

} // namespace

int main(const int argc, const char *const *argv) {
    CliOptions opts;
    if (auto code = parse_args(argc, argv, opts))
        return *code;

    if (opts.work_dir != ".") {
        std::error_code ec;
        fs::current_path(opts.work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", opts.work_dir.string(), ec.message());
            return 1;
        }
    }
    const fs::path root = fs::current_path();

    auto config = quire::load_config(root, opts.config_path);
    if (!config) {
        std::println(std::cerr, "{}", config.error());
        return 1;
    }
    quire::log::set_level(opts.log_level.value_or(config->log_level));
    if (opts.jobs)
        config->jobs = *opts.jobs;

    if (opts.command == "invalidate")
        return run_invalidate(*config, root, opts.queries);

    auto store = quire::ManifestStore::open(root / config->cache_dir);
    if (!store) {
        std::println(std::cerr, "{}", store.error());
        return 1;
    }
    auto renderer = quire::RendererRegistry::with_builtins().create(*config, root);
    if (!renderer) {
        std::println(std::cerr, "{}", renderer.error());
        return 1;
    }

    quire::ExecutionContext ctx;
    ctx.now = quire::system_now();
    ctx.force = opts.force;
    ctx.clean = opts.clean;
    ctx.dry_run = opts.dry_run;
    ctx.include_drafts = opts.drafts || config->include_drafts;

    quire::Orchestrator orchestrator{*config, root, *store, **renderer};

    if (opts.command == "watch") {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        std::stop_source stop;
        std::jthread signal_thread([&stop](std::stop_token token) { wait_for_signal(stop, token); });

        quire::WatchSession session(orchestrator, ctx);
        if (auto res = session.run(stop.get_token()); !res) {
            std::println(std::cerr, "Watch failed: {}", res.error());
            return 1;
        }
        return 0;
    }

    if (opts.graph) {
        if (auto res = orchestrator.emit_graph(ctx, std::cout); !res) {
            std::println(std::cerr, "Failed to emit graph: {}", res.error());
            return 1;
        }
        return 0;
    }

    auto stats = orchestrator.run(ctx);
    if (!stats) {
        std::println(std::cerr, "Build failed: {}", stats.error());
        return 1;
    }
    quire::report_stats(*stats, ctx);
    return stats->failed > 0 ? 1 : 0;
}
