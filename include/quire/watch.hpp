#pragma once

#include "quire/graph.hpp"
#include "quire/orchestrator.hpp"
#include "quire/timestamp.hpp"
#include "quire/utility.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

enum class ChangeKind : uint8_t { Added, Modified, Removed };

std::string_view to_string(ChangeKind kind);

struct FileChange {
    std::string path; ///< Project-relative, forward slashes.
    ChangeKind kind = ChangeKind::Modified;

    bool operator==(const FileChange &) const = default;
};

/** @brief Modification times of every file under a directory at one point in time. */
class SourceSnapshot {
public:
    static SourceSnapshot scan(const std::filesystem::path &project_root, const std::filesystem::path &dir);

    /** @brief What changed going from this snapshot to @p newer, sorted by path. */
    std::vector<FileChange> diff(const SourceSnapshot &newer) const;

    size_t size() const {
        return files_.size();
    }

private:
    std::map<std::string, std::filesystem::file_time_type> files_;
};

/**
 * @brief Coalesces bursts of file events.
 *
 * Events for the same file are merged (created then modified is still a creation, created
 * then removed cancels out). The batch becomes ready once no event has arrived for the
 * quiet period.
 */
class Debouncer {
public:
    using Clock = std::chrono::steady_clock;

    explicit Debouncer(std::chrono::milliseconds quiet) : quiet_(quiet) {
    }

    void add(const FileChange &change, Clock::time_point at);
    bool ready(Clock::time_point now) const;
    bool empty() const {
        return pending_.empty();
    }

    /** @brief Returns the coalesced batch, sorted by path, and resets. */
    std::vector<FileChange> take();

private:
    std::chrono::milliseconds quiet_;
    std::map<std::string, ChangeKind> pending_;
    Clock::time_point last_event_{};
};

struct AffectedPages {
    bool full = false; ///< Pages were added or removed, or the template set changed.
    std::set<std::string> urls;
};

/**
 * @brief Pages to rebuild after @p changes.
 *
 * A modified page maps to itself; a modified template maps to its dependents in @p graph.
 * Adding or removing a page source, a template or a known dependency calls for a full
 * cycle since it can change which pages exist or which partials they see. Other files
 * (assets, notes) never trigger a rebuild.
 */
AffectedPages affected_pages(const std::vector<FileChange> &changes,
                             const std::map<std::string, std::string> &page_sources,
                             const DependencyGraph &graph,
                             const ContentLoader &loader);

/**
 * @brief Development loop: build once, then rebuild affected pages whenever sources change.
 *
 * Cycles run on a background thread while the source tree keeps being polled. A change to
 * a page whose render is still in flight cancels that render and queues the page again.
 */
class WatchSession {
public:
    WatchSession(Orchestrator &orchestrator, ExecutionContext base, ClockFn clock = system_now);

    /** @brief Runs until @p stop is requested. */
    Result<void> run(std::stop_token stop);

private:
    Orchestrator &orchestrator_;
    ExecutionContext base_;
    ClockFn clock_;
};

} // namespace quire
