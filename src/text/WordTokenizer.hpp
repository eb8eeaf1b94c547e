// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <text/OffsetMap.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace readalong
{

/// @brief A spoken word with its position in both the spoken text and the source document.
struct Word
{
    std::string text;
    TextRange normalizedRange;
    TextRange originalRange;
};

/// @brief Splits spoken text into words.
///
/// Words are whitespace-delimited tokens with leading and trailing ASCII
/// punctuation trimmed ("Hello," becomes "Hello"); tokens made only of
/// punctuation are not words. Inner punctuation is kept ("don't", "3.14").
/// @param spoken The normalized spoken text.
/// @param map The offset map of @p spoken; an empty map is treated as the identity.
[[nodiscard]] auto tokenizeWords(std::string_view spoken, const OffsetMap& map) -> std::vector<Word>;

} // namespace readalong
