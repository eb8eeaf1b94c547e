// SPDX-License-Identifier: Apache-2.0
#include "Utf8.hpp"

namespace readalong::utf8
{

namespace
{
    constexpr auto isContinuation(unsigned char ch) noexcept -> bool
    {
        return (ch & 0xC0) == 0x80;
    }
} // namespace

auto findInvalid(std::string_view text) -> std::optional<std::size_t>
{
    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto const lead = static_cast<unsigned char>(text[pos]);
        if (lead < 0x80)
        {
            ++pos;
            continue;
        }

        if (isContinuation(lead) || lead >= 0xF8)
            return pos;

        auto const length = sequenceLength(lead);
        if (pos + length > text.size())
            return pos;

        auto cp = static_cast<char32_t>(lead & (0x7F >> length));
        for (auto i = std::size_t { 1 }; i < length; ++i)
        {
            auto const ch = static_cast<unsigned char>(text[pos + i]);
            if (!isContinuation(ch))
                return pos;
            cp = (cp << 6) | (ch & 0x3F);
        }

        // Overlong encodings
        if ((length == 2 && cp < 0x80) || (length == 3 && cp < 0x800) || (length == 4 && cp < 0x10000))
            return pos;

        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return pos;

        pos += length;
    }
    return std::nullopt;
}

auto decode(std::string_view text, std::size_t pos) -> Decoded
{
    auto const lead = static_cast<unsigned char>(text[pos]);
    auto const length = sequenceLength(lead);
    if (length == 1 || pos + length > text.size())
        return Decoded { .codepoint = lead, .length = 1 };

    auto cp = static_cast<char32_t>(lead & (0x7F >> length));
    for (auto i = std::size_t { 1 }; i < length; ++i)
        cp = (cp << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);

    return Decoded { .codepoint = cp, .length = length };
}

auto isEmoji(char32_t cp) noexcept -> bool
{
    return (cp >= 0x1F300 && cp <= 0x1FAFF)  // pictographs, emoticons, transport, supplemental symbols
           || (cp >= 0x1F1E6 && cp <= 0x1F1FF) // regional indicators (flags)
           || (cp >= 0x2600 && cp <= 0x27BF)   // misc symbols, dingbats
           || (cp >= 0x1F000 && cp <= 0x1F2FF) // mahjong, domino, playing cards, enclosed
           || (cp >= 0x2B50 && cp <= 0x2B55)   // stars, circles
           || cp == 0x200D                     // zero width joiner
           || cp == 0xFE0F                     // variation selector-16
           || cp == 0x20E3;                    // combining enclosing keycap
}

} // namespace readalong::utf8
