#pragma once

#include "quire/config.hpp"
#include "quire/content.hpp"
#include "quire/evaluator.hpp"
#include "quire/graph.hpp"
#include "quire/manifest.hpp"
#include "quire/renderer.hpp"
#include "quire/templates.hpp"
#include "quire/utility.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace quire {

/**
 * @brief Per-cycle memo of file hashes.
 *
 * Many pages share the same layout and partials; each file is read and hashed once per cycle.
 */
class HashCache {
    std::map<std::string, Result<std::string>, std::less<>> cache;
    std::shared_mutex cache_mtx;
    std::filesystem::path root;

public:
    explicit HashCache(std::filesystem::path root) : root(std::move(root)) {
    }

    /** @brief Hash of the project-relative file @p key, computed on first use. */
    Result<std::string> get_or_compute(const std::string &key);

    /** @brief Hashes of all @p keys, or the first error; a partial map is never returned. */
    Result<DependencyHashes> get_all(const std::vector<std::string> &keys);
};

enum class BuildMode : uint8_t { Build, Watch };

/** @brief Everything a cycle needs to know about how it was invoked. */
struct ExecutionContext {
    BuildMode mode = BuildMode::Build;
    Timestamp now{}; ///< Cycle start; becomes builtAt of every page rendered in the cycle.
    bool force = false;
    bool clean = false;
    bool dry_run = false;
    bool include_drafts = false;
};

struct BuildStats {
    size_t pages = 0;
    size_t evaluated = 0;
    size_t rendered = 0;
    size_t cached = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    size_t unresolved = 0; ///< Pages whose dependency resolution failed (not rendered, counted as failed).
    size_t orphans_pruned = 0;
    size_t drafts_skipped = 0;
    size_t invalidations_consumed = 0;
    size_t invalidations_expired = 0;
    size_t invalidations_pending = 0;
    bool manifest_saved = false;
    std::map<StaleReason, size_t> reasons;
    std::set<std::string> failed_pages;
    std::set<std::string> cancelled_pages;
    std::chrono::milliseconds elapsed{0};

    /** @brief Share of evaluated pages served from cache, 0 when nothing was evaluated. */
    double hit_rate() const;
};

/**
 * @brief Runs build cycles: discover, resolve, evaluate, render, commit, prune, sweep, save.
 *
 * Resolution, hashing and rendering are spread over a worker pool; the manifest is only
 * touched by the calling thread. A failing page never fails the build; its previous output
 * and cache entry stay as they were.
 */
class Orchestrator {
public:
    Orchestrator(SiteConfig config, std::filesystem::path project_root, ManifestStore &store, Renderer &renderer);

    /**
     * @brief Runs one cycle over every page.
     * @return Statistics, or an error only if the cycle could not start (lock or cache dir).
     */
    Result<BuildStats> run(const ExecutionContext &ctx, std::stop_token stop = {});

    /**
     * @brief Runs one cycle that only evaluates and renders the pages in @p urls.
     *
     * All pages are still discovered and resolved so the dependency index, orphan pruning
     * and the invalidation sweep see the whole site.
     */
    Result<BuildStats> run_subset(const ExecutionContext &ctx, const std::set<std::string> &urls, std::stop_token stop = {});

    /**
     * @brief Prints the page/dependency graph as Graphviz DOT; stale pages are highlighted.
     */
    Result<void> emit_graph(const ExecutionContext &ctx, std::ostream &out);

    /**
     * @brief Cancels queued or running renders of @p urls in the current cycle.
     *
     * A cancelled render never reaches its final output path and leaves the cache entry
     * untouched.
     */
    void cancel_renders(const std::set<std::string> &urls);

    /** @brief Dependency index of the last cycle. */
    const DependencyTracker &tracker() const {
        return tracker_;
    }

    /** @brief Source path -> URL of every page discovered by the last cycle. */
    std::map<std::string, std::string> page_sources() const;

    const SiteConfig &config() const {
        return config_;
    }

    const std::filesystem::path &project_root() const {
        return root_;
    }

    const ContentLoader &loader() const {
        return loader_;
    }

    /** @brief Absolute output directory. */
    std::filesystem::path out_dir() const;

private:
    struct PagePlan {
        const PageRecord *page = nullptr;
        std::string content_hash;
        DependencyHashes dependency_hashes;
        Verdict verdict;
        std::string failure; ///< Why the page cannot be rendered this cycle; empty if it can.
    };

    struct CyclePlan {
        Manifest manifest;
        LoadedContent content;
        DependencyGraph graph;
        std::vector<PagePlan> plans; ///< Parallel to content.pages.
    };

    Result<BuildStats> run_cycle(const ExecutionContext &ctx, const std::set<std::string> *only, std::stop_token stop);
    CyclePlan plan_cycle(const ExecutionContext &ctx, Manifest manifest);
    void resolve_dependencies(const std::vector<PageRecord> &pages);
    void evaluate_pages(const ExecutionContext &ctx, CyclePlan &cycle);
    size_t prune_orphans(const ExecutionContext &ctx, CyclePlan &cycle);
    size_t jobs() const;

    /** @brief Renders one page into place. Returns the output hash. */
    Result<std::string> render_page(const PagePlan &plan, std::stop_token stop);

    bool begin_render(const std::string &url, std::stop_source &source);
    void end_render(const std::string &url);

    SiteConfig config_;
    std::filesystem::path root_;
    ManifestStore &store_;
    Renderer &renderer_;
    ContentLoader loader_;
    TemplateResolver resolver_;
    DependencyTracker tracker_;

    mutable std::mutex state_mtx_;
    std::map<std::string, std::string> page_sources_;
    std::map<std::string, std::stop_source> in_flight_;
    std::set<std::string> cancel_requested_;
};

/** @brief Logs the end-of-build report. */
void report_stats(const BuildStats &stats, const ExecutionContext &ctx);

} // namespace quire
