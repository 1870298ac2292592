#include "quire/orchestrator.hpp"

#include "quire/atomic_file.hpp"
#include "quire/hash.hpp"
#include "quire/invalidation.hpp"
#include "quire/lock.hpp"
#include "quire/log.hpp"

#include <algorithm>
#include <functional>
#include <print>
#include <queue>
#include <thread>

namespace fs = std::filesystem;

namespace quire {

namespace {

constexpr std::chrono::seconds LOCK_TIMEOUT{60};

fs::path absolute_normal(const fs::path &p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    return (ec ? p : abs).lexically_normal();
}

// Runs task(i) for every i in [0, count) on up to `jobs` threads.
void parallel_for(size_t count, size_t jobs, const std::function<void(size_t)> &task) {
    if (count == 0)
        return;

    std::queue<size_t> ready_queue;
    for (size_t i = 0; i < count; ++i) {
        ready_queue.push(i);
    }
    std::mutex mtx;

    auto worker = [&]() {
        while (true) {
            size_t idx;
            {
                std::lock_guard lock(mtx);
                if (ready_queue.empty())
                    return;
                idx = ready_queue.front();
                ready_queue.pop();
            }
            task(idx);
        }
    };

    const size_t thread_count = std::min(jobs, count);
    if (thread_count <= 1) {
        worker();
        return;
    }

    std::vector<std::jthread> pool;
    pool.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        pool.emplace_back(worker);
    }
}

std::string dot_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

enum class Outcome : uint8_t { Failed, Cancelled, Rendered };

struct RenderOutcome {
    Outcome outcome = Outcome::Failed;
    std::string output_hash;
};

} // namespace

Result<std::string> HashCache::get_or_compute(const std::string &key) {
    {
        std::shared_lock lock(cache_mtx);
        if (auto it = cache.find(key); it != cache.end())
            return it->second;
    }

    Result<std::string> hash = file_hash(root / key);

    std::unique_lock lock(cache_mtx);
    return cache.try_emplace(key, std::move(hash)).first->second;
}

Result<DependencyHashes> HashCache::get_all(const std::vector<std::string> &keys) {
    DependencyHashes out;
    for (const auto &key : keys) {
        auto hash = get_or_compute(key);
        if (!hash)
            return std::unexpected(std::format("Cannot hash {}: {}", key, hash.error()));
        out.emplace(key, std::move(*hash));
    }
    return out;
}

double BuildStats::hit_rate() const {
    if (evaluated == 0)
        return 0.0;
    return static_cast<double>(cached) / static_cast<double>(evaluated);
}

Orchestrator::Orchestrator(SiteConfig config, fs::path project_root, ManifestStore &store, Renderer &renderer)
    : config_(std::move(config)), root_(absolute_normal(project_root)), store_(store), renderer_(renderer),
      loader_(root_, config_.src_dir), resolver_(root_, config_.src_dir) {
}

fs::path Orchestrator::out_dir() const {
    if (config_.out_dir.is_absolute())
        return config_.out_dir.lexically_normal();
    return (root_ / config_.out_dir).lexically_normal();
}

std::map<std::string, std::string> Orchestrator::page_sources() const {
    std::lock_guard lock(state_mtx_);
    return page_sources_;
}

size_t Orchestrator::jobs() const {
    size_t thread_count = config_.jobs;
    if (thread_count == 0)
        thread_count = std::thread::hardware_concurrency();
    if (thread_count == 0)
        thread_count = 1;
    return thread_count;
}

void Orchestrator::resolve_dependencies(const std::vector<PageRecord> &pages) {
    tracker_.clear();
    parallel_for(pages.size(), jobs(), [&](size_t i) {
        const PageRecord &page = pages[i];
        tracker_.register_page(page.url);

        auto deps = resolver_.resolve(page);
        if (!deps) {
            log::warn("Cannot resolve dependencies of {}: {}", page.url, deps.error());
            tracker_.mark_failed(page.url, deps.error());
            return;
        }
        for (const auto &dep : *deps) {
            tracker_.register_dependency(page.url, dep);
        }
    });
}

void Orchestrator::evaluate_pages(const ExecutionContext &ctx, CyclePlan &cycle) {
    HashCache hashes(root_);
    const auto &pages = cycle.content.pages;
    cycle.plans.assign(pages.size(), PagePlan{});

    parallel_for(pages.size(), jobs(), [&](size_t i) {
        const PageRecord &page = pages[i];
        PagePlan &plan = cycle.plans[i];
        plan.page = &page;
        plan.content_hash = content_hash(page.body, page.front_matter_json);

        if (cycle.graph.is_failed(page.url)) {
            plan.failure = cycle.graph.failed.at(page.url);
        } else if (auto deps = hashes.get_all(cycle.graph.dependencies_of(page.url)); !deps) {
            log::warn("{} ({})", deps.error(), page.url);
            plan.failure = deps.error();
        } else {
            plan.dependency_hashes = std::move(*deps);
        }

        const auto entry = cycle.manifest.entries.find(page.url);
        EvaluationInput input{
            .entry = entry == cycle.manifest.entries.end() ? nullptr : &entry->second,
            .url = page.url,
            .source_path = page.source_path,
            .current_content_hash = plan.content_hash,
            .current_dependencies = &plan.dependency_hashes,
            .policy = &config_.isg,
            .pending = cycle.manifest.pending_invalidations,
            .now = ctx.now,
            .force = ctx.force || !plan.failure.empty(),
        };
        plan.verdict = evaluate_freshness(input);
        if (plan.verdict.clock_anomaly) {
            log::warn("Clock anomaly for {}: {}", page.url, plan.verdict.detail);
        }
    });
}

Orchestrator::CyclePlan Orchestrator::plan_cycle(const ExecutionContext &ctx, Manifest manifest) {
    CyclePlan cycle;
    cycle.manifest = std::move(manifest);
    cycle.content = loader_.load(ctx.include_drafts || config_.include_drafts);

    {
        std::lock_guard lock(state_mtx_);
        page_sources_.clear();
        for (const auto &page : cycle.content.pages) {
            page_sources_.emplace(page.source_path, page.url);
        }
    }

    resolve_dependencies(cycle.content.pages);
    cycle.graph = tracker_.snapshot();
    evaluate_pages(ctx, cycle);
    return cycle;
}

size_t Orchestrator::prune_orphans(const ExecutionContext &ctx, CyclePlan &cycle) {
    std::set<std::string_view> live;
    for (const auto &page : cycle.content.pages) {
        live.insert(page.url);
    }
    // A page that exists but could not be read this time is not an orphan.
    for (const auto &[url, _] : cycle.content.failed) {
        live.insert(url);
    }

    const fs::path out = out_dir();
    size_t pruned = 0;
    auto &entries = cycle.manifest.entries;
    for (auto it = entries.begin(); it != entries.end();) {
        if (live.contains(it->first)) {
            ++it;
            continue;
        }
        const fs::path output = output_path_for(out, it->first);
        std::error_code ec;
        fs::remove(output, ec);
        if (ec) {
            log::warn("Failed to remove {}: {}", output.string(), ec.message());
        }
        log::debug("Pruned orphan {}", it->first);
        it = entries.erase(it);
        pruned++;
    }
    if (pruned > 0 && ctx.mode == BuildMode::Build) {
        log::info("Pruned {} orphaned page{}", pruned, pruned == 1 ? "" : "s");
    }
    return pruned;
}

bool Orchestrator::begin_render(const std::string &url, std::stop_source &source) {
    std::lock_guard lock(state_mtx_);
    if (cancel_requested_.erase(url) > 0)
        return false;
    in_flight_.insert_or_assign(url, source);
    return true;
}

void Orchestrator::end_render(const std::string &url) {
    std::lock_guard lock(state_mtx_);
    in_flight_.erase(url);
}

void Orchestrator::cancel_renders(const std::set<std::string> &urls) {
    std::lock_guard lock(state_mtx_);
    for (const auto &url : urls) {
        if (auto it = in_flight_.find(url); it != in_flight_.end()) {
            it->second.request_stop();
        } else {
            cancel_requested_.insert(url);
        }
    }
}

Result<std::string> Orchestrator::render_page(const PagePlan &plan, std::stop_token stop) {
    const PageRecord &page = *plan.page;
    const fs::path final_path = output_path_for(out_dir(), page.url);

    std::error_code ec;
    fs::create_directories(final_path.parent_path(), ec);
    if (ec)
        return std::unexpected(std::format("Cannot create {}: {}", final_path.parent_path().string(), ec.message()));

    RenderJob job;
    job.page = &page;
    job.source_file = root_ / page.source_path;
    job.output_path = temp_path_for(final_path);

    auto discard_temp = [&job] {
        std::error_code rm_ec;
        fs::remove(job.output_path, rm_ec);
    };

    if (auto res = renderer_.render(job, stop); !res) {
        discard_temp();
        return std::unexpected(res.error());
    }
    if (stop.stop_requested()) {
        discard_temp();
        return std::unexpected("cancelled");
    }

    auto hash = file_hash(job.output_path);
    if (!hash) {
        discard_temp();
        return std::unexpected(hash.error());
    }
    if (auto res = commit_file(job.output_path, final_path); !res)
        return std::unexpected(res.error());
    return *hash;
}

Result<BuildStats> Orchestrator::run(const ExecutionContext &ctx, std::stop_token stop) {
    return run_cycle(ctx, nullptr, std::move(stop));
}

Result<BuildStats> Orchestrator::run_subset(const ExecutionContext &ctx,
                                            const std::set<std::string> &urls,
                                            std::stop_token stop) {
    return run_cycle(ctx, &urls, std::move(stop));
}

Result<BuildStats> Orchestrator::run_cycle(const ExecutionContext &ctx,
                                           const std::set<std::string> *only,
                                           std::stop_token stop) {
    const auto start = std::chrono::steady_clock::now();

    auto build_lock = BuildLock::acquire(store_.cache_dir(), LOCK_TIMEOUT);
    if (!build_lock)
        return std::unexpected(build_lock.error());

    {
        std::lock_guard lock(state_mtx_);
        in_flight_.clear();
        cancel_requested_.clear();
    }

    Manifest manifest;
    if (ctx.clean && !ctx.dry_run) {
        log::info("Cleaning {} and the cache manifest", out_dir().string());
        if (auto res = store_.discard(); !res) {
            log::warn("{}", res.error());
        }
        std::error_code ec;
        fs::remove_all(out_dir(), ec);
        if (ec) {
            log::warn("Failed to remove {}: {}", out_dir().string(), ec.message());
        }
        manifest = ManifestStore::empty_manifest();
    } else if (ctx.clean) {
        manifest = ManifestStore::empty_manifest();
    } else {
        manifest = store_.load();
    }

    CyclePlan cycle = plan_cycle(ctx, std::move(manifest));

    BuildStats stats;
    stats.pages = cycle.content.pages.size();
    stats.drafts_skipped = cycle.content.drafts_skipped;
    stats.unresolved = cycle.graph.failed.size();
    for (const auto &[url, _] : cycle.content.failed) {
        stats.failed_pages.insert(url);
    }

    // Pages that cannot be rendered keep their output and entry; the entry is marked so
    // that the next cycle rebuilds them even if nothing else changed.
    std::vector<size_t> stale;
    std::vector<size_t> blocked;
    for (size_t i = 0; i < cycle.plans.size(); ++i) {
        const PagePlan &plan = cycle.plans[i];
        if (only && !only->contains(plan.page->url))
            continue;
        stats.evaluated++;
        if (!plan.failure.empty()) {
            blocked.push_back(i);
            stats.failed_pages.insert(plan.page->url);
        } else if (plan.verdict.fresh()) {
            stats.cached++;
        } else {
            stale.push_back(i);
            stats.reasons[plan.verdict.reason]++;
        }
    }

    if (ctx.dry_run) {
        for (size_t idx : stale) {
            const PagePlan &plan = cycle.plans[idx];
            std::println("[DRY RUN] {:<18} -> {}", to_string(plan.verdict.reason), plan.page->url);
        }
        for (size_t idx : blocked) {
            std::println("[DRY RUN] {:<18} -> {}", "unbuildable", cycle.plans[idx].page->url);
        }
        stats.failed = stats.failed_pages.size();
        stats.invalidations_pending = cycle.manifest.pending_invalidations.size();
        stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        return stats;
    }

    for (size_t idx : blocked) {
        const PagePlan &plan = cycle.plans[idx];
        log::error("Skipping {}: {}", plan.page->url, plan.failure);
        if (auto it = cycle.manifest.entries.find(plan.page->url); it != cycle.manifest.entries.end())
            it->second.force_rebuild = true;
    }

    std::vector<RenderOutcome> outcomes(stale.size());
    std::mutex progress_mtx;
    size_t done = 0;

    parallel_for(stale.size(), jobs(), [&](size_t k) {
        const PagePlan &plan = cycle.plans[stale[k]];
        const std::string &url = plan.page->url;

        std::stop_source source;
        if (!begin_render(url, source)) {
            outcomes[k].outcome = Outcome::Cancelled;
            return;
        }
        std::stop_callback forward_stop(stop, [&source] { source.request_stop(); });

        auto res = render_page(plan, source.get_token());
        const bool cancelled = source.stop_requested();
        end_render(url);

        std::lock_guard lock(progress_mtx);
        done++;
        if (res) {
            outcomes[k] = {Outcome::Rendered, std::move(*res)};
            std::println("[{}/{}] {:<18} -> {}", done, stale.size(), to_string(plan.verdict.reason), url);
        } else if (cancelled) {
            outcomes[k].outcome = Outcome::Cancelled;
            log::debug("Cancelled render of {}", url);
        } else {
            outcomes[k].outcome = Outcome::Failed;
            log::error("Failed to render {}: {}", url, res.error());
        }
    });

    for (size_t k = 0; k < stale.size(); ++k) {
        const PagePlan &plan = cycle.plans[stale[k]];
        const PageRecord &page = *plan.page;
        switch (outcomes[k].outcome) {
        case Outcome::Rendered: {
            PageCacheEntry entry;
            entry.content_hash = plan.content_hash;
            entry.dependency_hashes = plan.dependency_hashes;
            entry.built_at = ctx.now;
            entry.published_at = page.published_at;
            entry.ttl_seconds_override = page.ttl_seconds;
            entry.max_age_cap_days_override = page.max_age_cap_days;
            entry.tags = page.tags;
            entry.source_path = page.source_path;
            entry.output_hash = std::move(outcomes[k].output_hash);
            cycle.manifest.entries.insert_or_assign(page.url, std::move(entry));
            stats.rendered++;
            break;
        }
        case Outcome::Cancelled:
            stats.cancelled_pages.insert(page.url);
            break;
        case Outcome::Failed:
            stats.failed_pages.insert(page.url);
            break;
        }
    }
    stats.failed = stats.failed_pages.size();
    stats.cancelled = stats.cancelled_pages.size();

    stats.orphans_pruned = prune_orphans(ctx, cycle);

    const SweepStats sweep = sweep_pending_invalidations(cycle.manifest, cycle.content.pages, config_.isg, ctx.now);
    stats.invalidations_consumed = sweep.consumed;
    stats.invalidations_expired = sweep.expired;
    stats.invalidations_pending = cycle.manifest.pending_invalidations.size();

    cycle.manifest.generated_at = ctx.now;
    if (auto res = store_.save(cycle.manifest); !res) {
        log::error("Failed to save the cache manifest: {}", res.error());
    } else {
        stats.manifest_saved = true;
    }

    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    return stats;
}

Result<void> Orchestrator::emit_graph(const ExecutionContext &ctx, std::ostream &out) {
    Manifest manifest = ctx.clean ? ManifestStore::empty_manifest() : store_.load();
    CyclePlan cycle = plan_cycle(ctx, std::move(manifest));

    std::println(out, "digraph quire_site {{");
    std::println(out, "  rankdir=LR;");
    std::println(out, "  node [shape=box, style=filled, fontname=\"Helvetica\"];");

    std::map<std::string_view, size_t> file_ids;
    for (const auto &[path, _] : cycle.graph.reverse) {
        const size_t id = file_ids.size();
        file_ids.emplace(path, id);
        std::println(out, "  f{} [label=\"{}\", fillcolor=\"0.9 0.9 0.9\"];", id, dot_escape(path));
    }

    for (size_t i = 0; i < cycle.plans.size(); ++i) {
        const PagePlan &plan = cycle.plans[i];
        const std::string &url = plan.page->url;

        std::string color = "white";
        if (!plan.failure.empty()) {
            color = "red";
        } else if (!plan.verdict.fresh()) {
            color = "green";
        }
        std::println(out,
                     "  p{} [label=\"{}\\n{}\", fillcolor=\"{}\"];",
                     i,
                     dot_escape(url),
                     to_string(plan.verdict.reason),
                     color);

        for (const auto &dep : cycle.graph.dependencies_of(url)) {
            std::println(out, "  f{} -> p{};", file_ids.at(dep), i);
        }
    }
    std::println(out, "}}");
    return {};
}

void report_stats(const BuildStats &stats, const ExecutionContext &ctx) {
    if (ctx.mode == BuildMode::Watch) {
        log::info("Rebuilt {} of {} page{} ({} failed) in {}",
                  stats.rendered,
                  stats.evaluated,
                  stats.evaluated == 1 ? "" : "s",
                  stats.failed,
                  stats.elapsed);
        return;
    }

    log::info("{} pages: {} {}, {} cached, {} failed ({:.1f}% cache hits) in {}",
              stats.pages,
              ctx.dry_run ? stats.evaluated - stats.cached : stats.rendered,
              ctx.dry_run ? "stale" : "rendered",
              stats.cached,
              stats.failed,
              stats.hit_rate() * 100.0,
              stats.elapsed);
    for (const auto &[reason, count] : stats.reasons) {
        log::debug("  {:<18} {}", to_string(reason), count);
    }
    if (stats.unresolved > 0)
        log::warn("{} page{} had unresolved dependencies", stats.unresolved, stats.unresolved == 1 ? "" : "s");
    if (stats.drafts_skipped > 0)
        log::debug("Skipped {} draft{}", stats.drafts_skipped, stats.drafts_skipped == 1 ? "" : "s");
    if (stats.invalidations_consumed > 0 || stats.invalidations_expired > 0)
        log::info("Applied {} invalidation{}, expired {}, {} still pending",
                  stats.invalidations_consumed,
                  stats.invalidations_consumed == 1 ? "" : "s",
                  stats.invalidations_expired,
                  stats.invalidations_pending);
}

} // namespace quire
