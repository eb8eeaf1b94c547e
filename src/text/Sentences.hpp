// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string_view>

namespace readalong
{

/// @brief Finds the end of the sentence or paragraph that contains @p from.
///
/// A sentence ends after '.', '!' or '?' (plus any closing quotes or brackets)
/// when followed by whitespace or the end of text; a paragraph ends at a blank
/// line ("\n\n"). The returned position is exclusive and always greater than
/// @p from unless @p from is at the end of the text.
[[nodiscard]] auto nextSentenceEnd(std::string_view text, std::size_t from) -> std::size_t;

} // namespace readalong
