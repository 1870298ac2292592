#pragma once

#include "quire/domain.hpp"
#include "quire/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace quire {

/** @brief TTL that applies to an entry at a given instant. */
struct EffectiveTtl {
    int64_t ttl_seconds = 0;
    bool capped = false; ///< Older than the max-age cap: TTL expiry no longer applies.
    double age_days = 0.0;
};

/**
 * @brief Instant from which a page's age is measured.
 *
 * The published date when the page has one, otherwise the last render. Invalidations
 * never move this.
 */
Timestamp aging_origin(const PageCacheEntry &entry);

/**
 * @brief Picks the TTL for a page of the given age.
 *
 * The first rule (ascending `until_days`) with `age_days <= until_days` wins. When no rule
 * matches, the page-level override applies, then @p default_ttl.
 */
int64_t ttl_for_age(std::span<const AgingRule> rules,
                    double age_days,
                    std::optional<int64_t> ttl_override,
                    int64_t default_ttl);

/** @brief True when @p age_days exceeds a configured cap. */
bool exceeds_age_cap(double age_days, std::optional<int64_t> max_age_cap_days);

EffectiveTtl compute_effective_ttl(const PageCacheEntry &entry, const IsgPolicy &policy, Timestamp now);

} // namespace quire
