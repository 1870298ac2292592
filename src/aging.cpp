#include "quire/aging.hpp"

#include <algorithm>

namespace quire {

Timestamp aging_origin(const PageCacheEntry &entry) {
    return entry.published_at.value_or(entry.built_at);
}

int64_t ttl_for_age(std::span<const AgingRule> rules,
                    double age_days,
                    std::optional<int64_t> ttl_override,
                    int64_t default_ttl) {
    for (const auto &rule : rules) {
        if (age_days <= static_cast<double>(rule.until_days))
            return rule.ttl_seconds;
    }
    return ttl_override.value_or(default_ttl);
}

bool exceeds_age_cap(double age_days, std::optional<int64_t> max_age_cap_days) {
    return max_age_cap_days.has_value() && age_days > static_cast<double>(*max_age_cap_days);
}

EffectiveTtl compute_effective_ttl(const PageCacheEntry &entry, const IsgPolicy &policy, Timestamp now) {
    EffectiveTtl out;
    out.age_days = days_between(aging_origin(entry), now);
    // Bounded so that built_at + ttl always fits a Timestamp.
    out.ttl_seconds = std::clamp(
        ttl_for_age(policy.aging, out.age_days, entry.ttl_seconds_override, policy.default_ttl_seconds),
        int64_t{0},
        MAX_TTL_SECONDS);

    auto cap = entry.max_age_cap_days_override ? entry.max_age_cap_days_override : policy.max_age_cap_days;
    out.capped = exceeds_age_cap(out.age_days, cap);
    return out;
}

} // namespace quire
