#include "quire/process_exec.hpp"

#include "quire/log.hpp"

#include <expected>
#include <format>
#include <reproc++/reproc.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace quire {

namespace {

constexpr reproc::milliseconds POLL_INTERVAL{50};
constexpr reproc::milliseconds GRACE_PERIOD{2000};

void stop_process(reproc::process &process, const reproc::stop_actions &actions, std::string_view name) {
    if (auto [status, ec] = process.stop(actions); ec)
        log::warn("Failed to stop {}: {}", name, ec.message());
}

} // namespace

Result<int> process_exec(std::vector<std::string> &&args, const ProcessOptions &opts, std::stop_token stop) {
    if (args.empty()) {
        return std::unexpected("Cannot execute empty command");
    }

    reproc::options options;
    options.redirect.out.type = reproc::redirect::parent;
    options.redirect.err.type = reproc::redirect::parent;
    options.stop.first = {reproc::stop::terminate, GRACE_PERIOD};
    options.stop.second = {reproc::stop::kill, GRACE_PERIOD};

    if (opts.working_dir) {
        options.working_directory = opts.working_dir->c_str();
    }

    std::vector<std::string> env_strings;
    std::vector<const char *> env_ptrs;
    if (opts.env) {
        options.env.behavior = reproc::env::extend;
        for (const auto &[key, value] : *opts.env) {
            env_strings.push_back(key + "=" + value);
        }
        for (const auto &s : env_strings) {
            env_ptrs.push_back(s.c_str());
        }
        env_ptrs.push_back(nullptr);
        options.env.extra = env_ptrs.data();
    }

    reproc::process process;
    if (std::error_code ec = process.start(args, options)) {
        return std::unexpected(std::format("Failed to start {}: {}", args.front(), ec.message()));
    }

    const auto deadline = std::chrono::steady_clock::now() + opts.timeout;
    while (true) {
        auto [status, ec] = process.wait(POLL_INTERVAL);
        if (!ec)
            return status;
        if (ec != std::errc::timed_out)
            return std::unexpected(std::format("Failed to wait for {}: {}", args.front(), ec.message()));

        if (stop.stop_requested()) {
            stop_process(process, options.stop, args.front());
            return std::unexpected(std::format("{} was cancelled", args.front()));
        }
        if (opts.timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
            stop_process(process, options.stop, args.front());
            return std::unexpected(std::format("{} timed out after {}", args.front(), opts.timeout));
        }
    }
}

} // namespace quire
