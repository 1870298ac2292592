#pragma once

#include "quire/utility.hpp"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

namespace quire {

/**
 * @brief SHA-256 of the concatenation of @p parts, as `sha256-<hex>`.
 */
std::string sha256_hex(std::initializer_list<std::string_view> parts);

/**
 * @brief Hash identifying a page's own inputs: its body and its canonical front matter.
 *
 * The two parts are length-prefixed so that moving text between them changes the hash.
 */
std::string content_hash(std::string_view body, std::string_view front_matter_json);

/**
 * @brief Hash of a file's bytes.
 * @return The hash, or an error if the file cannot be opened or read.
 */
Result<std::string> file_hash(const std::filesystem::path &path);

} // namespace quire
