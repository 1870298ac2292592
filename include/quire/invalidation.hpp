#pragma once

#include "quire/domain.hpp"
#include "quire/manifest.hpp"
#include "quire/timestamp.hpp"
#include "quire/utility.hpp"

#include <set>
#include <span>
#include <string>
#include <string_view>

namespace quire {

/** @brief Path pattern that matches every page URL. */
inline constexpr std::string_view MATCH_ALL_PATTERN = "**";

/** @brief The parts of a page an invalidation can match against. */
struct PageIdentity {
    std::string_view url;
    std::string_view source_path;
    const std::set<std::string> *tags = nullptr;
};

/**
 * @brief True when @p record targets the page.
 *
 * Tag records match on tag membership. Path records are globs matched against the page URL
 * and, failing that, the page source path.
 */
bool invalidation_matches(const PendingInvalidation &record, const PageIdentity &page);

/**
 * @brief Checks a tag or path argument before anything is recorded.
 */
Result<void> validate_invalidation(InvalidationKind kind, std::string_view value);

/**
 * @brief Parses a CLI query of the form `tag=<value>` or `path=<pattern>`.
 */
Result<PendingInvalidation> parse_invalidation_query(std::string_view query, Timestamp requested_at);

/**
 * @brief Accepts manual invalidation requests and records them durably.
 *
 * Requests are validated first; a rejected request leaves the manifest untouched.
 */
class InvalidationGateway {
public:
    explicit InvalidationGateway(ManifestStore &store, ClockFn clock = system_now)
        : store(store), clock(std::move(clock)) {
    }

    Result<PendingInvalidation> invalidate_by_tag(std::string_view tag);
    Result<PendingInvalidation> invalidate_by_path(std::string_view pattern);

    /** @brief Dispatches a `tag=` / `path=` query. */
    Result<PendingInvalidation> invalidate(std::string_view query);

    /** @brief Invalidates every page, recorded as the path pattern `**`. */
    Result<PendingInvalidation> invalidate_all();

private:
    Result<PendingInvalidation> record(InvalidationKind kind, std::string_view value);

    ManifestStore &store;
    ClockFn clock;
};

struct SweepStats {
    size_t consumed = 0; ///< Applied to every matching page.
    size_t expired = 0;  ///< Older than the pending-record TTL with nothing applied.
};

/**
 * @brief Removes pending records that this cycle fully applied.
 *
 * A record is consumed when at least one discovered page matches it and every matching page
 * has an entry built at or after the request. Records without matches stay, unless they are
 * older than @p policy's pending-record TTL.
 */
SweepStats sweep_pending_invalidations(Manifest &manifest,
                                       std::span<const PageRecord> pages,
                                       const IsgPolicy &policy,
                                       Timestamp now);

} // namespace quire
