#pragma once

#include "quire/utility.hpp"

#include <string_view>

namespace quire {

/**
 * @brief Anchored glob match of @p text against @p pattern.
 *
 * `*` matches any run of characters except `/`, `**` matches across segments (and
 * `**` followed by `/` may also match zero segments), `?` matches one non-`/`
 * character, `[abc]`, `[a-z]` and `[!a-z]` match one character from a class, and a
 * backslash escapes the next character.
 */
bool glob_match(std::string_view pattern, std::string_view text);

/** @brief Rejects patterns with an unterminated character class or a dangling escape. */
Result<void> validate_glob(std::string_view pattern);

} // namespace quire
