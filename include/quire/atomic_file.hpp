#pragma once

#include "quire/utility.hpp"

#include <filesystem>
#include <string_view>

namespace quire {

/**
 * @brief Temporary sibling path used while @p target is being produced.
 *
 * Lives in the same directory so the final rename never crosses filesystems.
 */
std::filesystem::path temp_path_for(const std::filesystem::path &target);

/**
 * @brief Creates or truncates @p path, writes @p content and flushes it to disk.
 *
 * A partially written file is removed on failure.
 */
Result<void> write_file_synced(const std::filesystem::path &path, std::string_view content);

/**
 * @brief Writes @p content to a temporary sibling, flushes it, and renames it over @p target.
 *
 * Readers see either the previous file or the complete new one. On failure the previous
 * file is left untouched and the temporary is removed.
 */
Result<void> write_file_atomic(const std::filesystem::path &target, std::string_view content);

/**
 * @brief Moves an already written @p temp file into place at @p target.
 */
Result<void> commit_file(const std::filesystem::path &temp, const std::filesystem::path &target);

} // namespace quire
