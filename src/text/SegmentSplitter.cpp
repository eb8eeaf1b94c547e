// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <text/SegmentSplitter.hpp>
#include <text/Sentences.hpp>
#include <text/Utf8.hpp>

#include <libunicode/utf8_grapheme_segmenter.h>

#include <format>

namespace readalong
{

namespace
{
    auto skipSpace(std::string_view text, std::size_t pos) -> std::size_t
    {
        while (pos < text.size() && utf8::isSpace(text[pos]))
            ++pos;
        return pos;
    }

    auto trimSpaceBack(std::string_view text, std::size_t start, std::size_t end) -> std::size_t
    {
        while (end > start && utf8::isSpace(text[end - 1]))
            --end;
        return end;
    }

    /// @brief Last grapheme cluster boundary of @p word that is within @p limit bytes (at least one cluster).
    auto graphemeCut(std::string_view word, std::size_t limit) -> std::size_t
    {
        auto segmenter = unicode::utf8_grapheme_segmenter(word);

        auto cut = std::size_t { 0 };
        for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        {
            auto const offset = static_cast<std::size_t>(it._clusterStart - word.data());
            if (offset == 0)
                continue;
            if (offset > limit && cut > 0)
                break;
            cut = offset;
            if (offset > limit)
                break;
        }

        return cut == 0 ? word.size() : cut;
    }
} // namespace

SegmentSplitter::SegmentSplitter(std::size_t maxChars): _maxChars(maxChars)
{
}

auto SegmentSplitter::split(std::string_view spoken) const -> Result<std::vector<Segment>>
{
    if (_maxChars == 0)
        return makeError(ErrorCode::InvalidArgument, "Segment length limit must be positive");

    auto segments = std::vector<Segment> {};
    auto chunkStart = skipSpace(spoken, 0);

    while (chunkStart < spoken.size())
    {
        // Pack whole sentences while they fit.
        auto cut = std::string_view::npos;
        auto scan = chunkStart;
        while (scan < spoken.size())
        {
            auto const sentenceEnd = nextSentenceEnd(spoken, scan);
            if (trimSpaceBack(spoken, chunkStart, sentenceEnd) - chunkStart > _maxChars)
                break;
            cut = sentenceEnd;
            scan = sentenceEnd;
        }

        if (cut == std::string_view::npos)
            cut = hardCut(spoken, chunkStart);

        auto const end = trimSpaceBack(spoken, chunkStart, cut);
        segments.push_back(Segment {
            .id = segments.size(),
            .text = std::string(spoken.substr(chunkStart, end - chunkStart)),
            .normalizedOffsetStart = chunkStart,
        });
        chunkStart = skipSpace(spoken, cut);
    }

    log::debug("Split {} spoken bytes into {} segment(s) (limit {})", spoken.size(), segments.size(), _maxChars);
    return segments;
}

auto SegmentSplitter::hardCut(std::string_view spoken, std::size_t start) const -> std::size_t
{
    auto const window = start + _maxChars;
    if (window >= spoken.size())
        return spoken.size();

    // Nearest whitespace at or before the window end keeps the last word whole.
    for (auto pos = window; pos > start; --pos)
    {
        if (utf8::isSpace(spoken[pos]))
            return pos;
    }

    auto wordEnd = start;
    while (wordEnd < spoken.size() && !utf8::isSpace(spoken[wordEnd]))
        ++wordEnd;

    auto const word = spoken.substr(start, wordEnd - start);
    auto const cut = start + graphemeCut(word, _maxChars);
    log::warning("Word of {} bytes at offset {} exceeds the segment limit of {}; cutting at byte {}",
                 word.size(),
                 start,
                 _maxChars,
                 cut);
    return cut;
}

} // namespace readalong
