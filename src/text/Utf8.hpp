// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace readalong::utf8
{

/// @brief A decoded codepoint and the number of bytes it occupies.
struct Decoded
{
    char32_t codepoint = 0;
    std::size_t length = 1;
};

/// @brief Returns the byte offset of the first malformed sequence, or nullopt if the text is valid UTF-8.
///
/// Rejects truncated sequences, stray continuation bytes, overlong encodings,
/// UTF-16 surrogates and codepoints above U+10FFFF.
[[nodiscard]] auto findInvalid(std::string_view text) -> std::optional<std::size_t>;

/// @brief Decodes the codepoint starting at @p pos. The text must be valid UTF-8.
[[nodiscard]] auto decode(std::string_view text, std::size_t pos) -> Decoded;

/// @brief Returns the length of the UTF-8 sequence introduced by @p lead.
[[nodiscard]] constexpr auto sequenceLength(unsigned char lead) noexcept -> std::size_t
{
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 1;
}

/// @brief True for pictographic emoji and the joiners/selectors/modifiers that glue them together.
[[nodiscard]] auto isEmoji(char32_t cp) noexcept -> bool;

/// @brief True for ASCII whitespace (space, tab, CR, LF, FF, VT).
[[nodiscard]] constexpr auto isSpace(char ch) noexcept -> bool
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

} // namespace readalong::utf8
