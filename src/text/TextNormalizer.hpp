// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <text/OffsetMap.hpp>

#include <string>
#include <string_view>

namespace readalong
{

/// @brief Switches controlling how markup is turned into speech.
struct NormalizerOptions
{
    /// @brief When false the input is treated as plain text: only validated and trimmed.
    bool markdown = true;

    /// @brief Prefix headings with "Title:", "Section:" or "Subsection:".
    bool headingContext = true;

    /// @brief Speak inline code as "code snippet: ..." and replace fenced blocks by "(code block omitted)".
    bool describeCode = true;

    /// @brief Drop emoji and their joiners/selectors.
    bool stripEmoji = true;
};

/// @brief Spoken text together with the map back into the source document.
struct NormalizedText
{
    std::string spoken;
    OffsetMap map;
};

/// @brief Strips Markdown structure from a document, producing the text to be spoken.
///
/// Removed markup is recorded as zero-width entries in the offset map so that
/// highlighting still lands on a sensible original position. Whitespace is
/// collapsed: runs of spaces become one space, single line breaks are kept,
/// blank lines become one paragraph break ("\n\n"), and the text is trimmed.
class TextNormalizer
{
  public:
    explicit TextNormalizer(NormalizerOptions options = {});

    /// @brief Normalizes a document.
    /// @param source Raw Markdown or plain text, UTF-8 encoded.
    /// @return The spoken text and its offset map, or NormalizationError on malformed UTF-8.
    [[nodiscard]] auto normalize(std::string_view source) const -> Result<NormalizedText>;

    [[nodiscard]] auto options() const noexcept -> const NormalizerOptions& { return _options; }

  private:
    NormalizerOptions _options;
};

} // namespace readalong
