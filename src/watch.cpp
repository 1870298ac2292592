#include "quire/watch.hpp"

#include "quire/log.hpp"
#include "quire/templates.hpp"

#include <future>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

namespace quire {

std::string_view to_string(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::Added:
        return "added";
    case ChangeKind::Modified:
        return "modified";
    case ChangeKind::Removed:
        return "removed";
    }
    return "unknown";
}

SourceSnapshot SourceSnapshot::scan(const fs::path &project_root, const fs::path &dir) {
    SourceSnapshot snapshot;
    const fs::path root = project_root.lexically_normal();
    const fs::path base = dir.is_absolute() ? dir : root / dir;

    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(base, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec))
            continue;
        auto mtime = it->last_write_time(entry_ec);
        if (entry_ec)
            continue;
        snapshot.files_.emplace(it->path().lexically_normal().lexically_relative(root).generic_string(), mtime);
    }
    return snapshot;
}

std::vector<FileChange> SourceSnapshot::diff(const SourceSnapshot &newer) const {
    std::vector<FileChange> changes;
    auto old_it = files_.begin();
    auto new_it = newer.files_.begin();
    while (old_it != files_.end() || new_it != newer.files_.end()) {
        if (new_it == newer.files_.end() || (old_it != files_.end() && old_it->first < new_it->first)) {
            changes.push_back({old_it->first, ChangeKind::Removed});
            ++old_it;
        } else if (old_it == files_.end() || new_it->first < old_it->first) {
            changes.push_back({new_it->first, ChangeKind::Added});
            ++new_it;
        } else {
            if (old_it->second != new_it->second)
                changes.push_back({new_it->first, ChangeKind::Modified});
            ++old_it;
            ++new_it;
        }
    }
    return changes;
}

void Debouncer::add(const FileChange &change, Clock::time_point at) {
    last_event_ = at;

    auto [it, inserted] = pending_.try_emplace(change.path, change.kind);
    if (inserted)
        return;

    const ChangeKind before = it->second;
    if (before == ChangeKind::Added && change.kind == ChangeKind::Removed) {
        pending_.erase(it);
    } else if (before == ChangeKind::Added) {
        // still a new file
    } else if (before == ChangeKind::Removed && change.kind == ChangeKind::Added) {
        it->second = ChangeKind::Modified;
    } else {
        it->second = change.kind;
    }
}

bool Debouncer::ready(Clock::time_point now) const {
    return !pending_.empty() && now - last_event_ >= quiet_;
}

std::vector<FileChange> Debouncer::take() {
    std::vector<FileChange> batch;
    batch.reserve(pending_.size());
    for (const auto &[path, kind] : pending_) {
        batch.push_back({path, kind});
    }
    pending_.clear();
    return batch;
}

AffectedPages affected_pages(const std::vector<FileChange> &changes,
                             const std::map<std::string, std::string> &page_sources,
                             const DependencyGraph &graph,
                             const ContentLoader &loader) {
    AffectedPages affected;
    for (const auto &change : changes) {
        if (change.kind != ChangeKind::Modified) {
            const fs::path path(change.path);
            if (loader.is_page_source(path) || path.extension() == TEMPLATE_EXTENSION ||
                graph.reverse.contains(change.path)) {
                affected.full = true;
            }
            continue;
        }
        if (auto it = page_sources.find(change.path); it != page_sources.end()) {
            affected.urls.insert(it->second);
        }
        for (const auto &url : graph.dependents_of(change.path)) {
            affected.urls.insert(url);
        }
    }
    return affected;
}

WatchSession::WatchSession(Orchestrator &orchestrator, ExecutionContext base, ClockFn clock)
    : orchestrator_(orchestrator), base_(base), clock_(std::move(clock)) {
    base_.mode = BuildMode::Watch;
    base_.clean = false;
    base_.dry_run = false;
}

Result<void> WatchSession::run(std::stop_token stop) {
    const SiteConfig &config = orchestrator_.config();
    const fs::path &root = orchestrator_.project_root();
    const fs::path src = orchestrator_.loader().src_dir();
    const auto poll = std::chrono::milliseconds(config.watch_poll_ms);

    SourceSnapshot snapshot = SourceSnapshot::scan(root, src);
    Debouncer debouncer(std::chrono::milliseconds(config.watch_debounce_ms));

    DependencyGraph graph;
    std::map<std::string, std::string> sources;
    std::optional<std::future<Result<BuildStats>>> cycle;
    std::set<std::string> in_cycle; // pages the running cycle may render; empty means all
    bool pending_full = true;
    std::set<std::string> pending_urls;

    auto start_cycle = [&] {
        ExecutionContext ctx = base_;
        ctx.now = clock_();
        if (pending_full) {
            in_cycle.clear();
            cycle = std::async(std::launch::async, [this, ctx, stop] { return orchestrator_.run(ctx, stop); });
        } else {
            in_cycle = pending_urls;
            cycle = std::async(std::launch::async, [this, ctx, urls = pending_urls, stop] {
                return orchestrator_.run_subset(ctx, urls, stop);
            });
        }
        pending_full = false;
        pending_urls.clear();
    };

    auto finish_cycle = [&] {
        auto stats = cycle->get();
        cycle.reset();
        graph = orchestrator_.tracker().snapshot();
        sources = orchestrator_.page_sources();
        if (!stats) {
            log::error("Build failed: {}", stats.error());
            return;
        }
        report_stats(*stats, base_);
        for (const auto &url : stats->cancelled_pages) {
            pending_urls.insert(url);
        }
    };

    log::info("Watching {} for changes", src.string());
    start_cycle();

    while (!stop.stop_requested()) {
        std::this_thread::sleep_for(poll);

        SourceSnapshot next = SourceSnapshot::scan(root, src);
        const auto now = Debouncer::Clock::now();
        for (const auto &change : snapshot.diff(next)) {
            log::debug("{} {}", to_string(change.kind), change.path);
            debouncer.add(change, now);
        }
        snapshot = std::move(next);

        if (cycle && cycle->wait_for(std::chrono::seconds(0)) == std::future_status::ready)
            finish_cycle();

        if (debouncer.ready(now)) {
            AffectedPages affected = affected_pages(debouncer.take(), sources, graph, orchestrator_.loader());
            if (affected.full) {
                pending_full = true;
            } else if (affected.urls.empty()) {
                log::debug("Change affects no pages");
            }
            pending_urls.insert(affected.urls.begin(), affected.urls.end());

            if (cycle) {
                // Last write wins: in-flight renders of these pages are already out of date.
                std::set<std::string> superseded;
                for (const auto &url : affected.urls) {
                    if (in_cycle.empty() || in_cycle.contains(url))
                        superseded.insert(url);
                }
                orchestrator_.cancel_renders(superseded);
            }
        }

        if (!cycle && (pending_full || !pending_urls.empty()))
            start_cycle();
    }

    if (cycle)
        finish_cycle();
    log::info("Stopped watching");
    return {};
}

} // namespace quire
