#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace quire {

/** @brief Wall-clock instant with millisecond precision, as stored in the manifest. */
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/** @brief Source of "now". Injected wherever a component records or compares times. */
using ClockFn = std::function<Timestamp()>;

Timestamp system_now();

/**
 * @brief Formats as `YYYY-MM-DDTHH:MM:SS.mmmZ` (always UTC).
 */
std::string format_iso8601(Timestamp ts);

/**
 * @brief Parses an ISO-8601 date or date-time.
 *
 * Accepted forms: `YYYY-MM-DD`, `YYYY-MM-DDTHH:MM`, `YYYY-MM-DDTHH:MM:SS` with an optional
 * fraction, each optionally followed by `Z` or a `+HH:MM` / `-HH:MM` offset. A space may
 * replace the `T`. Values without a zone are taken as UTC.
 *
 * @return The instant, or std::nullopt when the text is not a valid timestamp.
 */
std::optional<Timestamp> parse_iso8601(std::string_view text);

/** @brief Fractional days elapsed from @p since to @p now (negative if @p since is later). */
double days_between(Timestamp since, Timestamp now);

} // namespace quire
