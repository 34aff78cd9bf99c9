#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::common {

/**
 * @brief Replace invalid UTF-8 with '?' so text is safe to emit as JSON.
 *
 * Overlong forms, UTF-16 surrogates (CESU-8) and code points above U+10FFFF
 * are invalid; each rejected byte becomes one '?'.
 */
std::string sanitizeUtf8(std::string_view input);

/**
 * @brief Lowercase UTF-8 text using simple one-to-one case mapping.
 *
 * Covers ASCII, Latin-1, Latin Extended-A, the Vietnamese letters of Latin
 * Extended Additional, basic Greek and Cyrillic. Code points outside those
 * ranges, and malformed bytes, are copied through unchanged.
 */
std::string toLowerUtf8(std::string_view input);

/// Split on ASCII whitespace, dropping empty tokens.
std::vector<std::string> splitWhitespace(std::string_view input);

/// Number of code points in `input` (malformed bytes count as one each).
std::size_t utf8Length(std::string_view input);

/// The first `maxChars` code points of `input`.
std::string utf8Prefix(std::string_view input, std::size_t maxChars);

} // namespace kgrag::common
