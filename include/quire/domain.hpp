#pragma once

#include "quire/timestamp.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

/** Upper bound for any TTL, global or per page: one year. */
inline constexpr int64_t MAX_TTL_SECONDS = 365LL * 24 * 60 * 60;

/** Upper bound for any maximum-age cap, in days. */
inline constexpr int64_t MAX_AGE_CAP_DAYS = 3650;

/** Dependency path -> hash at the time it was recorded. Sorted for reproducible output. */
using DependencyHashes = std::map<std::string, std::string>;

struct PageCacheEntry {
    std::string content_hash;
    DependencyHashes dependency_hashes;
    Timestamp built_at{};
    std::optional<Timestamp> published_at;
    std::optional<int64_t> ttl_seconds_override;
    std::optional<int64_t> max_age_cap_days_override;
    std::set<std::string> tags;
    std::string source_path;
    std::string output_hash;
    bool force_rebuild = false; ///< Set when the page could not be rebuilt; cleared by the next successful render.

    bool operator==(const PageCacheEntry &) const = default;
};

enum class InvalidationKind : uint8_t { Tag, Path };

struct PendingInvalidation {
    InvalidationKind kind = InvalidationKind::Tag;
    std::string value;
    Timestamp requested_at{};

    bool operator==(const PendingInvalidation &) const = default;
};

std::string_view to_string(InvalidationKind kind);
std::optional<InvalidationKind> parse_invalidation_kind(std::string_view text);

struct Manifest {
    std::string schema_version;
    Timestamp generated_at{};
    std::map<std::string, PageCacheEntry> entries; ///< Keyed by normalized page URL.
    std::vector<PendingInvalidation> pending_invalidations;
};

struct AgingRule {
    int64_t until_days = 0;
    int64_t ttl_seconds = 0;

    bool operator==(const AgingRule &) const = default;
};

/** @brief Global freshness policy, built from the `isg` section of the configuration. */
struct IsgPolicy {
    int64_t default_ttl_seconds = 21600;
    std::optional<int64_t> max_age_cap_days;
    std::vector<AgingRule> aging; ///< Ascending by until_days.
    int64_t clock_drift_tolerance_seconds = 30;
    std::optional<int64_t> pending_invalidation_ttl_seconds;
};

/**
 * @brief A page as supplied by the content loader. Read-only for the cache engine.
 */
struct PageRecord {
    std::string url;         ///< Normalized URL, e.g. `/`, `/blog/`, `/blog/post`.
    std::string source_path; ///< Relative to the project root, forward slashes.
    std::string body;
    std::string front_matter_json; ///< Canonical (sorted-key) JSON of the front matter.
    std::set<std::string> tags;
    std::optional<Timestamp> published_at;
    std::optional<int64_t> ttl_seconds;
    std::optional<int64_t> max_age_cap_days;
    std::optional<std::string> layout;
    bool draft = false;
};

} // namespace quire
