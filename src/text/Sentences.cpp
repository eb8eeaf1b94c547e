// SPDX-License-Identifier: Apache-2.0
#include <text/Sentences.hpp>
#include <text/Utf8.hpp>

namespace readalong
{

auto nextSentenceEnd(std::string_view text, std::size_t from) -> std::size_t
{
    auto pos = from;
    while (pos < text.size() && utf8::isSpace(text[pos]))
        ++pos;

    for (; pos < text.size(); ++pos)
    {
        auto const ch = text[pos];

        if (ch == '\n' && pos + 1 < text.size() && text[pos + 1] == '\n')
            return pos;

        if (ch != '.' && ch != '!' && ch != '?')
            continue;

        auto end = pos + 1;
        while (end < text.size()
               && (text[end] == '.' || text[end] == '!' || text[end] == '?' || text[end] == '"'
                   || text[end] == '\'' || text[end] == ')' || text[end] == ']'))
            ++end;

        if (end == text.size() || utf8::isSpace(text[end]))
            return end;
        pos = end - 1;
    }

    return text.size();
}

} // namespace readalong
