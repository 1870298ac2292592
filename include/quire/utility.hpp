#pragma once

#include <expected>
#include <string>

namespace quire {

/**
 * @brief Return type of every fallible operation in quire.
 *
 * The error side carries a human readable message that callers either print or wrap
 * with more context.
 */
template <typename T>
using Result = std::expected<T, std::string>;

} // namespace quire
