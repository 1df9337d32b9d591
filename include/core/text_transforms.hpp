#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace kvtrace {

/**
 * @brief String transforms applied to attribute text before export
 */
namespace text {

inline constexpr std::string_view kEllipsis = "...";

/**
 * @brief Number of characters in @p text
 *
 * Each well-formed UTF-8 sequence counts once; every byte outside one counts
 * as a character of its own.
 */
[[nodiscard]] size_t char_count(std::string_view text);

/**
 * @brief Bound @p text to @p max_length characters
 *
 * Text within the limit is returned as-is. Longer text keeps its first
 * (max_length - 3) characters followed by "...", so the result is exactly
 * max_length characters. Limits shorter than the ellipsis keep a bare prefix.
 * Multibyte characters are never split.
 */
[[nodiscard]] std::string truncate(std::string_view text, size_t max_length);

/**
 * @brief Make @p text valid UTF-8
 *
 * Well-formed UTF-8 sequences are kept, every other byte is dropped
 * (stray continuation bytes, overlong forms, surrogates, code points above
 * U+10FFFF, and a sequence cut short by truncation).
 */
[[nodiscard]] std::string utf8_encode(std::string_view text);

/// True if @p text is well-formed UTF-8
[[nodiscard]] bool is_valid_utf8(std::string_view text);

} // namespace text

} // namespace kvtrace
