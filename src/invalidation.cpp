#include "quire/invalidation.hpp"

#include "quire/glob.hpp"
#include "quire/log.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace quire {

std::string_view to_string(InvalidationKind kind) {
    switch (kind) {
    case InvalidationKind::Tag:
        return "tag";
    case InvalidationKind::Path:
        return "path";
    }
    return "unknown";
}

std::optional<InvalidationKind> parse_invalidation_kind(std::string_view text) {
    if (text == "tag")
        return InvalidationKind::Tag;
    if (text == "path")
        return InvalidationKind::Path;
    return std::nullopt;
}

bool invalidation_matches(const PendingInvalidation &record, const PageIdentity &page) {
    switch (record.kind) {
    case InvalidationKind::Tag:
        return page.tags != nullptr && page.tags->contains(record.value);
    case InvalidationKind::Path:
        if (glob_match(record.value, page.url))
            return true;
        return !page.source_path.empty() && glob_match(record.value, page.source_path);
    }
    return false;
}

Result<void> validate_invalidation(InvalidationKind kind, std::string_view value) {
    if (value.empty())
        return std::unexpected(std::format("Empty {} in invalidation request", to_string(kind)));

    for (char c : value) {
        if (std::iscntrl(static_cast<unsigned char>(c)))
            return std::unexpected(std::format("Control character in {} \"{}\"", to_string(kind), value));
    }

    if (kind == InvalidationKind::Tag) {
        if (std::ranges::any_of(value, [](char c) { return std::isspace(static_cast<unsigned char>(c)); }))
            return std::unexpected(std::format("Tag \"{}\" must not contain whitespace", value));
        return {};
    }

    if (value.front() != '/' && value.front() != '*')
        return std::unexpected(std::format("Path pattern \"{}\" must start with '/' or a wildcard", value));
    return validate_glob(value);
}

Result<PendingInvalidation> parse_invalidation_query(std::string_view query, Timestamp requested_at) {
    const size_t eq = query.find('=');
    if (eq == std::string_view::npos)
        return std::unexpected(std::format("Malformed invalidation \"{}\": expected tag=<value> or path=<value>", query));

    auto kind = parse_invalidation_kind(query.substr(0, eq));
    if (!kind)
        return std::unexpected(
            std::format("Unknown invalidation kind \"{}\": expected tag or path", query.substr(0, eq)));

    std::string_view value = query.substr(eq + 1);
    if (auto res = validate_invalidation(*kind, value); !res)
        return std::unexpected(res.error());

    return PendingInvalidation{*kind, std::string(value), requested_at};
}

Result<PendingInvalidation> InvalidationGateway::invalidate_by_tag(std::string_view tag) {
    return record(InvalidationKind::Tag, tag);
}

Result<PendingInvalidation> InvalidationGateway::invalidate_by_path(std::string_view pattern) {
    return record(InvalidationKind::Path, pattern);
}

Result<PendingInvalidation> InvalidationGateway::invalidate(std::string_view query) {
    auto parsed = parse_invalidation_query(query, clock());
    if (!parsed)
        return parsed;
    return record(parsed->kind, parsed->value);
}

Result<PendingInvalidation> InvalidationGateway::invalidate_all() {
    return record(InvalidationKind::Path, MATCH_ALL_PATTERN);
}

Result<PendingInvalidation> InvalidationGateway::record(InvalidationKind kind, std::string_view value) {
    if (auto res = validate_invalidation(kind, value); !res)
        return std::unexpected(res.error());

    PendingInvalidation pending{kind, std::string(value), clock()};
    if (auto res = store.append_pending_invalidation(pending); !res)
        return std::unexpected(res.error());

    log::info("Recorded invalidation {}={} at {}", to_string(kind), pending.value, format_iso8601(pending.requested_at));
    return pending;
}

SweepStats sweep_pending_invalidations(Manifest &manifest,
                                       std::span<const PageRecord> pages,
                                       const IsgPolicy &policy,
                                       Timestamp now) {
    SweepStats stats;

    auto fully_applied = [&](const PendingInvalidation &record) {
        size_t matched = 0;
        for (const auto &page : pages) {
            PageIdentity identity{page.url, page.source_path, &page.tags};
            if (!invalidation_matches(record, identity))
                continue;
            ++matched;
            auto it = manifest.entries.find(page.url);
            if (it == manifest.entries.end() || it->second.built_at < record.requested_at)
                return false;
        }
        return matched > 0;
    };

    stats.consumed = ManifestStore::consume_pending_invalidations(manifest, now, fully_applied);

    if (policy.pending_invalidation_ttl_seconds) {
        const auto ttl = std::chrono::seconds{*policy.pending_invalidation_ttl_seconds};
        auto &pending = manifest.pending_invalidations;
        const size_t before = pending.size();
        std::erase_if(pending, [&](const PendingInvalidation &record) {
            if (now - record.requested_at <= ttl)
                return false;
            log::info("Dropping expired invalidation {}={} requested at {}",
                      to_string(record.kind),
                      record.value,
                      format_iso8601(record.requested_at));
            return true;
        });
        stats.expired = before - pending.size();
    }
    return stats;
}

} // namespace quire
