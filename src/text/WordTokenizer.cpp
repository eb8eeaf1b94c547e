// SPDX-License-Identifier: Apache-2.0
#include <text/Utf8.hpp>
#include <text/WordTokenizer.hpp>

#include <optional>

namespace readalong
{

namespace
{
    auto isTrimmable(char ch) -> bool
    {
        return (ch >= '!' && ch <= '/') || (ch >= ':' && ch <= '@') || (ch >= '[' && ch <= '`')
               || (ch >= '{' && ch <= '~');
    }
} // namespace

auto tokenizeWords(std::string_view spoken, const OffsetMap& map) -> std::vector<Word>
{
    auto words = std::vector<Word> {};
    auto pos = std::size_t { 0 };

    while (pos < spoken.size())
    {
        while (pos < spoken.size() && utf8::isSpace(spoken[pos]))
            ++pos;
        auto tokenEnd = pos;
        while (tokenEnd < spoken.size() && !utf8::isSpace(spoken[tokenEnd]))
            ++tokenEnd;

        auto start = pos;
        auto end = tokenEnd;
        while (start < end && isTrimmable(spoken[start]))
            ++start;
        while (end > start && isTrimmable(spoken[end - 1]))
            --end;
        pos = tokenEnd;

        if (start == end)
            continue;

        auto const normalized = TextRange { .start = start, .end = end };
        auto original = map.empty() ? std::optional<TextRange>(normalized) : map.toOriginalRange(normalized);

        words.push_back(Word {
            .text = std::string(spoken.substr(start, end - start)),
            .normalizedRange = normalized,
            .originalRange = original.value_or(normalized),
        });
    }

    return words;
}

} // namespace readalong
