#include "quire/manifest.hpp"

#include "quire/atomic_file.hpp"
#include "quire/log.hpp"
#include "quire/mmap.hpp"

#include <algorithm>
#include <format>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace quire {

namespace {

json entry_to_json(const PageCacheEntry &entry) {
    json j;
    j["contentHash"] = entry.content_hash;
    j["dependencyHashes"] = json::object();
    for (const auto &[path, hash] : entry.dependency_hashes)
        j["dependencyHashes"][path] = hash;
    j["builtAt"] = format_iso8601(entry.built_at);
    if (entry.published_at)
        j["publishedAt"] = format_iso8601(*entry.published_at);
    if (entry.ttl_seconds_override)
        j["ttlSeconds"] = *entry.ttl_seconds_override;
    if (entry.max_age_cap_days_override)
        j["maxAgeCapDays"] = *entry.max_age_cap_days_override;
    j["tags"] = json::array();
    for (const auto &tag : entry.tags)
        j["tags"].push_back(tag);
    if (!entry.source_path.empty())
        j["sourcePath"] = entry.source_path;
    if (!entry.output_hash.empty())
        j["outputHash"] = entry.output_hash;
    if (entry.force_rebuild)
        j["forceRebuild"] = true;
    return j;
}

// Integer in [min, max]; unsigned values beyond int64 are rejected before conversion.
Result<int64_t> bounded_integer(const json &value, std::string_view key, int64_t min, int64_t max) {
    if (!value.is_number_integer())
        return std::unexpected(std::format("\"{}\" must be an integer if present", key));
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(max))
        return std::unexpected(std::format("\"{}\" must be between {} and {}", key, min, max));
    const auto n = value.get<int64_t>();
    if (n < min || n > max)
        return std::unexpected(std::format("\"{}\" must be between {} and {}", key, min, max));
    return n;
}

Result<PageCacheEntry> entry_from_json(const json &j) {
    if (!j.is_object())
        return std::unexpected("not an object");

    PageCacheEntry entry;

    auto it = j.find("contentHash");
    if (it == j.end() || !it->is_string())
        return std::unexpected("\"contentHash\" must be a string");
    entry.content_hash = it->get<std::string>();

    it = j.find("dependencyHashes");
    if (it == j.end() || !it->is_object())
        return std::unexpected("\"dependencyHashes\" must be an object");
    for (const auto &[path, hash] : it->items()) {
        if (!hash.is_string())
            return std::unexpected(std::format("dependency hash for {} must be a string", path));
        entry.dependency_hashes.emplace(path, hash.get<std::string>());
    }

    it = j.find("builtAt");
    if (it == j.end() || !it->is_string())
        return std::unexpected("\"builtAt\" must be a string");
    auto built_at = parse_iso8601(it->get_ref<const std::string &>());
    if (!built_at)
        return std::unexpected("\"builtAt\" is not a valid date");
    entry.built_at = *built_at;

    if (it = j.find("publishedAt"); it != j.end() && !it->is_null()) {
        if (!it->is_string())
            return std::unexpected("\"publishedAt\" must be a string if present");
        auto published = parse_iso8601(it->get_ref<const std::string &>());
        if (!published)
            return std::unexpected("\"publishedAt\" is not a valid date");
        entry.published_at = *published;
    }

    if (it = j.find("ttlSeconds"); it != j.end() && !it->is_null()) {
        auto ttl = bounded_integer(*it, "ttlSeconds", 0, MAX_TTL_SECONDS);
        if (!ttl)
            return std::unexpected(ttl.error());
        entry.ttl_seconds_override = *ttl;
    }

    if (it = j.find("maxAgeCapDays"); it != j.end() && !it->is_null()) {
        auto cap = bounded_integer(*it, "maxAgeCapDays", 1, MAX_AGE_CAP_DAYS);
        if (!cap)
            return std::unexpected(cap.error());
        entry.max_age_cap_days_override = *cap;
    }

    it = j.find("tags");
    if (it == j.end() || !it->is_array())
        return std::unexpected("\"tags\" must be an array");
    for (const auto &tag : *it) {
        if (!tag.is_string())
            return std::unexpected("all \"tags\" must be strings");
        entry.tags.insert(tag.get<std::string>());
    }

    if (it = j.find("sourcePath"); it != j.end() && it->is_string())
        entry.source_path = it->get<std::string>();
    if (it = j.find("outputHash"); it != j.end() && it->is_string())
        entry.output_hash = it->get<std::string>();
    if (it = j.find("forceRebuild"); it != j.end() && it->is_boolean())
        entry.force_rebuild = it->get<bool>();

    return entry;
}

Result<PendingInvalidation> pending_from_json(const json &j) {
    if (!j.is_object())
        return std::unexpected("not an object");

    PendingInvalidation record;
    auto it = j.find("kind");
    if (it == j.end() || !it->is_string())
        return std::unexpected("\"kind\" must be a string");
    auto kind = parse_invalidation_kind(it->get_ref<const std::string &>());
    if (!kind)
        return std::unexpected(std::format("unknown kind \"{}\"", it->get<std::string>()));
    record.kind = *kind;

    it = j.find("value");
    if (it == j.end() || !it->is_string() || it->get_ref<const std::string &>().empty())
        return std::unexpected("\"value\" must be a non-empty string");
    record.value = it->get<std::string>();

    it = j.find("requestedAt");
    if (it == j.end() || !it->is_string())
        return std::unexpected("\"requestedAt\" must be a string");
    auto requested = parse_iso8601(it->get_ref<const std::string &>());
    if (!requested)
        return std::unexpected("\"requestedAt\" is not a valid date");
    record.requested_at = *requested;
    return record;
}

} // namespace

std::string_view to_string(LoadStatus status) {
    switch (status) {
    case LoadStatus::Loaded:
        return "loaded";
    case LoadStatus::Missing:
        return "missing";
    case LoadStatus::Corrupt:
        return "corrupt";
    case LoadStatus::SchemaMismatch:
        return "schema-mismatch";
    }
    return "unknown";
}

std::string serialize_manifest(const Manifest &manifest) {
    json j;
    j["schemaVersion"] = manifest.schema_version;
    j["generatedAt"] = format_iso8601(manifest.generated_at);
    j["entries"] = json::object();
    for (const auto &[url, entry] : manifest.entries)
        j["entries"][url] = entry_to_json(entry);
    j["pendingInvalidations"] = json::array();
    for (const auto &record : manifest.pending_invalidations) {
        j["pendingInvalidations"].push_back({
            {"kind", std::string(to_string(record.kind))},
            {"value", record.value},
            {"requestedAt", format_iso8601(record.requested_at)},
        });
    }
    return j.dump(2) + "\n";
}

Result<Manifest> parse_manifest(std::string_view text, LoadStatus &status) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error &err) {
        status = LoadStatus::Corrupt;
        return std::unexpected(std::format("invalid JSON: {}", err.what()));
    }

    if (!j.is_object()) {
        status = LoadStatus::Corrupt;
        return std::unexpected("manifest is not an object");
    }

    auto version = j.find("schemaVersion");
    if (version == j.end() || !version->is_string()) {
        status = LoadStatus::SchemaMismatch;
        return std::unexpected("missing \"schemaVersion\"");
    }
    if (version->get_ref<const std::string &>() != MANIFEST_SCHEMA_VERSION) {
        status = LoadStatus::SchemaMismatch;
        return std::unexpected(std::format("schema version {} does not match {}",
                                           version->get<std::string>(),
                                           MANIFEST_SCHEMA_VERSION));
    }

    Manifest manifest = ManifestStore::empty_manifest();

    if (auto it = j.find("generatedAt"); it != j.end() && it->is_string()) {
        if (auto generated = parse_iso8601(it->get_ref<const std::string &>()))
            manifest.generated_at = *generated;
    }

    auto entries = j.find("entries");
    if (entries == j.end() || !entries->is_object()) {
        status = LoadStatus::Corrupt;
        return std::unexpected("\"entries\" must be an object");
    }

    size_t dropped = 0;
    for (const auto &[url, value] : entries->items()) {
        auto entry = entry_from_json(value);
        if (!entry) {
            log::warn("Invalid cache entry for {}: {}", url, entry.error());
            ++dropped;
            continue;
        }
        manifest.entries.emplace(url, std::move(*entry));
    }

    if (auto pending = j.find("pendingInvalidations"); pending != j.end()) {
        if (!pending->is_array()) {
            status = LoadStatus::Corrupt;
            return std::unexpected("\"pendingInvalidations\" must be an array");
        }
        for (const auto &value : *pending) {
            auto record = pending_from_json(value);
            if (!record) {
                log::warn("Invalid pending invalidation: {}", record.error());
                ++dropped;
                continue;
            }
            manifest.pending_invalidations.push_back(std::move(*record));
        }
    }

    if (dropped > 0)
        log::warn("Removed {} invalid cache manifest records", dropped);

    status = LoadStatus::Loaded;
    return manifest;
}

ManifestStore::ManifestStore(fs::path cache_dir)
    : cache_dir_(std::move(cache_dir)), manifest_path_(cache_dir_ / "cache" / "manifest.json") {
}

Result<ManifestStore> ManifestStore::open(const fs::path &cache_dir) {
    std::error_code ec;
    fs::create_directories(cache_dir / "cache", ec);
    if (ec) {
        return std::unexpected(std::format("Cannot create cache directory {}: {}", cache_dir.string(), ec.message()));
    }
    if (!fs::is_directory(cache_dir / "cache", ec)) {
        return std::unexpected(std::format("Cache path {} is not a directory", (cache_dir / "cache").string()));
    }
    return ManifestStore(cache_dir);
}

Manifest ManifestStore::empty_manifest() {
    Manifest manifest;
    manifest.schema_version = std::string(MANIFEST_SCHEMA_VERSION);
    return manifest;
}

Manifest ManifestStore::load() {
    std::error_code ec;
    if (!fs::exists(manifest_path_, ec)) {
        last_status_ = LoadStatus::Missing;
        return empty_manifest();
    }

    auto file = MappedFile::open(manifest_path_);
    if (!file) {
        last_status_ = LoadStatus::Corrupt;
        log::warn("Cannot read cache manifest, starting with a fresh cache: {}", file.error());
        return empty_manifest();
    }

    std::string_view content = (*file)->content();
    if (content.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        last_status_ = LoadStatus::Corrupt;
        log::warn("Cache manifest is empty, starting with a fresh cache");
        return empty_manifest();
    }

    LoadStatus status = LoadStatus::Corrupt;
    auto manifest = parse_manifest(content, status);
    last_status_ = status;
    if (!manifest) {
        log::warn("Ignoring cache manifest {} ({}): {}", manifest_path_.string(), to_string(status), manifest.error());
        return empty_manifest();
    }
    return std::move(*manifest);
}

Result<void> ManifestStore::save(const Manifest &manifest) {
    if (auto res = write_file_atomic(manifest_path_, serialize_manifest(manifest)); !res) {
        return std::unexpected(std::format("Failed to save cache manifest: {}", res.error()));
    }
    return {};
}

Result<void> ManifestStore::append_pending_invalidation(const PendingInvalidation &record) {
    Manifest manifest = load();
    manifest.pending_invalidations.push_back(record);
    // The manifest is not regenerated by an append, but it is rewritten.
    if (last_status_ != LoadStatus::Loaded)
        manifest.generated_at = record.requested_at;
    return save(manifest);
}

size_t ManifestStore::consume_pending_invalidations(Manifest &manifest,
                                                    Timestamp as_of,
                                                    const std::function<bool(const PendingInvalidation &)> &applied) {
    auto &pending = manifest.pending_invalidations;
    const size_t before = pending.size();
    std::erase_if(pending, [&](const PendingInvalidation &record) {
        return record.requested_at <= as_of && applied(record);
    });
    return before - pending.size();
}

Result<void> ManifestStore::discard() {
    std::error_code ec;
    fs::remove(manifest_path_, ec);
    if (ec)
        return std::unexpected(std::format("Failed to remove {}: {}", manifest_path_.string(), ec.message()));
    last_status_ = LoadStatus::Missing;
    return {};
}

} // namespace quire
