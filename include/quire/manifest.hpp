#pragma once

#include "quire/domain.hpp"
#include "quire/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace quire {

/** Bumped whenever the on-disk layout changes; any other value discards the manifest. */
inline constexpr std::string_view MANIFEST_SCHEMA_VERSION = "1";

enum class LoadStatus : uint8_t { Loaded, Missing, Corrupt, SchemaMismatch };

std::string_view to_string(LoadStatus status);

/** @brief Serializes with sorted keys so identical manifests produce identical bytes. */
std::string serialize_manifest(const Manifest &manifest);

/**
 * @brief Parses manifest JSON.
 *
 * Malformed individual entries and pending records are dropped with a warning. Structural
 * problems fail the whole parse with @p status set to Corrupt or SchemaMismatch.
 */
Result<Manifest> parse_manifest(std::string_view text, LoadStatus &status);

/**
 * @brief Durable store for the cache manifest under `<cache-dir>/cache/manifest.json`.
 *
 * Only one process writes at a time (see BuildLock); within a process only the build
 * orchestrator calls `save`, once per cycle.
 */
class ManifestStore {
public:
    /**
     * @brief Opens the store, creating the cache directory if needed.
     *
     * Failing to create or access the directory is the only fatal cache error.
     */
    static Result<ManifestStore> open(const std::filesystem::path &cache_dir);

    static Manifest empty_manifest();

    /**
     * @brief Reads the manifest from disk.
     *
     * A missing file, invalid JSON or a schema version mismatch all yield an empty manifest
     * (a full rebuild) rather than an error; see `last_load_status`.
     */
    Manifest load();

    /**
     * @brief Writes the manifest to a temporary file and renames it over the current one.
     *
     * On failure the previous manifest on disk is untouched.
     */
    Result<void> save(const Manifest &manifest);

    /**
     * @brief Appends one pending invalidation and persists it immediately.
     *
     * Reads the current on-disk state first so a standalone `invalidate` does not need a
     * build. The caller holds the build lock.
     */
    Result<void> append_pending_invalidation(const PendingInvalidation &record);

    /**
     * @brief Removes pending records requested at or before @p as_of for which @p applied
     * returns true.
     * @return Number of records removed.
     */
    static size_t consume_pending_invalidations(Manifest &manifest,
                                                Timestamp as_of,
                                                const std::function<bool(const PendingInvalidation &)> &applied);

    /** @brief Deletes the manifest file. A missing file is not an error. */
    Result<void> discard();

    LoadStatus last_load_status() const {
        return last_status_;
    }

    const std::filesystem::path &cache_dir() const {
        return cache_dir_;
    }

    const std::filesystem::path &manifest_path() const {
        return manifest_path_;
    }

private:
    explicit ManifestStore(std::filesystem::path cache_dir);

    std::filesystem::path cache_dir_;
    std::filesystem::path manifest_path_;
    LoadStatus last_status_ = LoadStatus::Missing;
};

} // namespace quire
