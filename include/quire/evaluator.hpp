#pragma once

#include "quire/domain.hpp"
#include "quire/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace quire {

enum class StaleReason : uint8_t {
    None,
    Cold,
    Forced,
    ContentChanged,
    DependencyChanged,
    Invalidated,
    TtlExpired,
};

std::string_view to_string(StaleReason reason);

/** @brief Everything the freshness decision depends on. Nothing here is mutated. */
struct EvaluationInput {
    const PageCacheEntry *entry = nullptr; ///< Prior cache entry, or nullptr if absent.
    std::string_view url;
    std::string_view source_path;
    std::string_view current_content_hash;
    const DependencyHashes *current_dependencies = nullptr;
    const IsgPolicy *policy = nullptr;
    std::span<const PendingInvalidation> pending;
    Timestamp now{};
    bool force = false;
};

struct Verdict {
    StaleReason reason = StaleReason::None;
    bool clock_anomaly = false; ///< builtAt lies beyond `now` plus the drift tolerance.
    bool capped = false;
    int64_t effective_ttl_seconds = 0;
    std::optional<Timestamp> next_rebuild_at; ///< Absent when capped or not computed.
    std::string detail;                       ///< Which dependency or invalidation fired, if any.

    bool fresh() const {
        return reason == StaleReason::None;
    }
};

/**
 * @brief Decides whether a page's cached output can be reused.
 *
 * Checks run in order and the first hit wins: no entry (cold), force or an entry marked for
 * rebuild, content hash, dependency hashes, pending invalidations newer than the entry, a
 * builtAt in the future beyond the drift tolerance (forced), then TTL expiry. Pages older than their max-age cap
 * never expire by TTL. The drift tolerance is added to the TTL so small clock disagreements
 * between machines do not cause rebuilds.
 */
Verdict evaluate_freshness(const EvaluationInput &input);

} // namespace quire
