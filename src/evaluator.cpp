#include "quire/evaluator.hpp"

#include "quire/aging.hpp"
#include "quire/invalidation.hpp"

#include <format>

namespace quire {

namespace {

Verdict stale(StaleReason reason, std::string detail = {}) {
    Verdict v;
    v.reason = reason;
    v.detail = std::move(detail);
    return v;
}

// Returns the first dependency that differs, or nullopt.
std::optional<std::string> changed_dependency(const DependencyHashes &recorded, const DependencyHashes &current) {
    for (const auto &[path, hash] : current) {
        auto it = recorded.find(path);
        if (it == recorded.end())
            return std::format("new dependency {}", path);
        if (it->second != hash)
            return std::format("{} changed", path);
    }
    for (const auto &[path, _] : recorded) {
        if (!current.contains(path))
            return std::format("{} is no longer a dependency", path);
    }
    return std::nullopt;
}

} // namespace

std::string_view to_string(StaleReason reason) {
    switch (reason) {
    case StaleReason::None:
        return "fresh";
    case StaleReason::Cold:
        return "cold";
    case StaleReason::Forced:
        return "forced";
    case StaleReason::ContentChanged:
        return "content-changed";
    case StaleReason::DependencyChanged:
        return "dependency-changed";
    case StaleReason::Invalidated:
        return "invalidated";
    case StaleReason::TtlExpired:
        return "ttl-expired";
    }
    return "unknown";
}

Verdict evaluate_freshness(const EvaluationInput &input) {
    static const DependencyHashes no_dependencies;
    static const IsgPolicy default_policy;

    const PageCacheEntry *entry = input.entry;
    const DependencyHashes &current_deps = input.current_dependencies ? *input.current_dependencies : no_dependencies;
    const IsgPolicy &policy = input.policy ? *input.policy : default_policy;

    if (!entry)
        return stale(StaleReason::Cold);

    if (input.force)
        return stale(StaleReason::Forced);
    if (entry->force_rebuild)
        return stale(StaleReason::Forced, "previous rebuild failed");

    if (input.current_content_hash != entry->content_hash)
        return stale(StaleReason::ContentChanged);

    if (auto changed = changed_dependency(entry->dependency_hashes, current_deps))
        return stale(StaleReason::DependencyChanged, std::move(*changed));

    const PageIdentity identity{input.url,
                                input.source_path.empty() ? std::string_view(entry->source_path) : input.source_path,
                                &entry->tags};
    for (const auto &record : input.pending) {
        if (record.requested_at > entry->built_at && invalidation_matches(record, identity)) {
            return stale(StaleReason::Invalidated, std::format("{}={}", to_string(record.kind), record.value));
        }
    }

    const std::chrono::seconds drift{policy.clock_drift_tolerance_seconds};
    if (entry->built_at > input.now + drift) {
        Verdict v = stale(StaleReason::Forced,
                          std::format("builtAt {} is ahead of now {}",
                                      format_iso8601(entry->built_at),
                                      format_iso8601(input.now)));
        v.clock_anomaly = true;
        return v;
    }

    const EffectiveTtl ttl = compute_effective_ttl(*entry, policy, input.now);

    Verdict v;
    v.capped = ttl.capped;
    v.effective_ttl_seconds = ttl.ttl_seconds;
    if (ttl.capped)
        return v;

    const std::chrono::seconds ttl_duration{ttl.ttl_seconds};
    v.next_rebuild_at = entry->built_at + ttl_duration;
    if (input.now - entry->built_at > ttl_duration + drift) {
        v.reason = StaleReason::TtlExpired;
        v.detail = std::format("ttl {}s", ttl.ttl_seconds);
    }
    return v;
}

} // namespace quire
