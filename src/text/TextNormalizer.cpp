// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <text/TextNormalizer.hpp>
#include <text/Utf8.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <string>
#include <string_view>

namespace readalong
{

namespace
{
    /// @brief Checks if a line is a code fence (``` or ~~~, optionally with language tag).
    /// @param line The line to check.
    /// @return The fence string if it's a code fence, empty string otherwise.
    auto detectCodeFence(std::string_view line) -> std::string_view
    {
        auto pos = std::size_t { 0 };
        while (pos < line.size() && pos < 3 && line[pos] == ' ')
            ++pos;

        if (pos >= line.size())
            return {};

        auto const fenceChar = line[pos];
        if (fenceChar != '`' && fenceChar != '~')
            return {};

        auto const fenceStart = pos;
        while (pos < line.size() && line[pos] == fenceChar)
            ++pos;

        if (pos - fenceStart >= 3)
            return line.substr(fenceStart, pos - fenceStart);

        return {};
    }

    /// @brief Counts the heading level (number of leading '#' chars).
    /// @return Heading level (1-6), or 0 if not a heading.
    auto detectHeadingLevel(std::string_view line) -> int
    {
        auto level = 0;
        while (level < static_cast<int>(line.size()) && level < 6
               && line[static_cast<std::size_t>(level)] == '#')
            ++level;
        if (level == 0)
            return 0;
        if (level == static_cast<int>(line.size()))
            return level;
        auto const next = line[static_cast<std::size_t>(level)];
        if (next == ' ' || next == '\t')
            return level;
        return 0;
    }

    /// @brief Checks if a line starts with a list marker.
    /// @return The number of characters consumed by the marker and its trailing space (0 if not a list item).
    auto detectListMarker(std::string_view line) -> std::size_t
    {
        if (line.empty())
            return 0;

        // Unordered: - or * or +
        if ((line[0] == '-' || line[0] == '*' || line[0] == '+') && line.size() > 1
            && (line[1] == ' ' || line[1] == '\t'))
            return 2;

        // Ordered: digits followed by . or )
        auto pos = std::size_t { 0 };
        while (pos < line.size() && pos < 9 && line[pos] >= '0' && line[pos] <= '9')
            ++pos;
        if (pos > 0 && pos + 1 < line.size() && (line[pos] == '.' || line[pos] == ')')
            && (line[pos + 1] == ' ' || line[pos + 1] == '\t'))
            return pos + 2;

        return 0;
    }

    /// @brief Checks for a task list checkbox ("[ ] " or "[x] ") at the start of a list item.
    auto detectTaskBox(std::string_view line) -> std::size_t
    {
        if (line.size() >= 4 && line[0] == '[' && (line[1] == ' ' || line[1] == 'x' || line[1] == 'X')
            && line[2] == ']' && line[3] == ' ')
            return 4;
        return 0;
    }

    /// @brief Checks if a line starts with a blockquote marker (>).
    /// @return The number of characters consumed (0 if not a blockquote).
    auto detectBlockquote(std::string_view line) -> std::size_t
    {
        if (!line.empty() && line[0] == '>')
        {
            if (line.size() > 1 && line[1] == ' ')
                return 2;
            return 1;
        }
        return 0;
    }

    /// @brief Thematic breaks (---, ***, ___) and setext underlines (===).
    auto isRuleLine(std::string_view line) -> bool
    {
        auto marker = '\0';
        auto count = 0;
        for (auto const ch: line)
        {
            if (ch == ' ' || ch == '\t')
                continue;
            if (ch != '-' && ch != '*' && ch != '_' && ch != '=')
                return false;
            if (marker != '\0' && ch != marker)
                return false;
            marker = ch;
            ++count;
        }
        return count >= 3;
    }

    /// @brief Table delimiter rows such as "|---|:--:|".
    auto isTableDelimiterRow(std::string_view line) -> bool
    {
        auto hasPipe = false;
        auto hasDash = false;
        for (auto const ch: line)
        {
            if (ch == '|')
                hasPipe = true;
            else if (ch == '-')
                hasDash = true;
            else if (ch != ':' && ch != ' ' && ch != '\t')
                return false;
        }
        return hasPipe && hasDash;
    }

    auto isBlank(std::string_view line) -> bool
    {
        return std::ranges::all_of(line, [](char ch) { return utf8::isSpace(ch); });
    }

    auto isAsciiAlnum(char ch) -> bool
    {
        return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
    }

    auto isAsciiPunct(char ch) -> bool
    {
        return (ch >= '!' && ch <= '/') || (ch >= ':' && ch <= '@') || (ch >= '[' && ch <= '`')
               || (ch >= '{' && ch <= '~');
    }

    struct Entity
    {
        std::string_view name;
        std::string_view text;
    };

    constexpr auto Entities = std::array<Entity, 6> { {
        { .name = "&amp;", .text = "&" },
        { .name = "&lt;", .text = "<" },
        { .name = "&gt;", .text = ">" },
        { .name = "&quot;", .text = "\"" },
        { .name = "&#39;", .text = "'" },
        { .name = "&nbsp;", .text = " " },
    } };

    /// @brief Accumulates spoken text while recording the offset map.
    ///
    /// Whitespace is never written immediately: it is held as a pending break of
    /// a given strength (space < line break < paragraph break) and materialized
    /// only when the next visible character arrives. Leading and trailing
    /// whitespace therefore vanish, and markup removed between two words does
    /// not produce doubled spaces.
    class SpokenTextWriter
    {
      public:
        enum class Break
        {
            None,
            Space,
            Line,
            Paragraph,
        };

        /// @brief Copies source text, collapsing the whitespace it contains.
        void text(std::string_view source, std::size_t originalStart)
        {
            auto runStart = std::size_t { 0 };
            for (auto i = std::size_t { 0 }; i <= source.size(); ++i)
            {
                if (i < source.size() && !utf8::isSpace(source[i]))
                    continue;

                if (i > runStart)
                {
                    flushPending();
                    _out.append(source.substr(runStart, i - runStart));
                    _map.copy(originalStart + runStart, i - runStart);
                }
                if (i < source.size())
                    mark(Break::Space, TextRange { .start = originalStart + i, .end = originalStart + i + 1 });
                runStart = i + 1;
            }
        }

        /// @brief Writes words that do not exist in the source, attached at @p originalPosition.
        void insert(std::string_view words, std::size_t originalPosition)
        {
            auto const anchor = TextRange { .start = originalPosition, .end = originalPosition };
            auto runStart = std::size_t { 0 };
            for (auto i = std::size_t { 0 }; i <= words.size(); ++i)
            {
                if (i < words.size() && !utf8::isSpace(words[i]))
                    continue;

                if (i > runStart)
                {
                    flushPending();
                    _out.append(words.substr(runStart, i - runStart));
                    _map.insert(i - runStart, originalPosition);
                }
                if (i < words.size())
                    mark(Break::Space, anchor);
                runStart = i + 1;
            }
        }

        /// @brief Writes @p spoken in place of the whole @p original span (entities).
        void substitute(std::string_view spoken, TextRange original)
        {
            if (spoken.empty() || std::ranges::all_of(spoken, [](char ch) { return utf8::isSpace(ch); }))
            {
                mark(Break::Space, original);
                return;
            }
            flushPending();
            _out.append(spoken);
            _map.replace(spoken.size(), original);
        }

        /// @brief Drops a markup span.
        void skip(TextRange original)
        {
            if (original.empty())
                return;
            if (_pending != Break::None)
            {
                _pendingRange.end = std::max(_pendingRange.end, original.end);
                return;
            }
            _map.remove(original);
        }

        void mark(Break strength, TextRange original)
        {
            if (_out.empty())
            {
                _map.remove(original);
                return;
            }

            if (_pending == Break::None)
                _pendingRange = original;
            else
                _pendingRange.end = std::max(_pendingRange.end, original.end);

            _pending = std::max(_pending, strength);
        }

        [[nodiscard]] auto finish() && -> NormalizedText
        {
            if (_pending != Break::None)
                _map.remove(_pendingRange);
            _pending = Break::None;
            return NormalizedText { .spoken = std::move(_out), .map = std::move(_map).build() };
        }

      private:
        void flushPending()
        {
            if (_pending == Break::None)
                return;

            auto const separator = _pending == Break::Space  ? std::string_view { " " }
                                   : _pending == Break::Line ? std::string_view { "\n" }
                                                             : std::string_view { "\n\n" };
            _out.append(separator);
            _map.replace(separator.size(), _pendingRange);
            _pending = Break::None;
        }

        std::string _out;
        OffsetMapBuilder _map;
        Break _pending = Break::None;
        TextRange _pendingRange;
    };

    /// @brief Walks a Markdown document line by line and feeds a SpokenTextWriter.
    class MarkdownWalker
    {
      public:
        MarkdownWalker(std::string_view source, const NormalizerOptions& options, SpokenTextWriter& writer):
            _source(source), _options(options), _writer(writer)
        {
        }

        void run()
        {
            auto pos = std::size_t { 0 };
            while (pos < _source.size())
            {
                auto const newline = _source.find('\n', pos);
                auto const lineEnd = newline == std::string_view::npos ? _source.size() : newline;
                auto contentEnd = lineEnd;
                if (contentEnd > pos && _source[contentEnd - 1] == '\r')
                    --contentEnd;
                auto const breakRange = TextRange {
                    .start = contentEnd,
                    .end = newline == std::string_view::npos ? _source.size() : newline + 1,
                };

                processLine(pos, contentEnd, breakRange);
                pos = breakRange.end;
            }
        }

      private:
        auto slice(std::size_t start, std::size_t end) const -> std::string_view
        {
            return _source.substr(start, end - start);
        }

        void processLine(std::size_t start, std::size_t end, TextRange breakRange)
        {
            auto const line = slice(start, end);
            auto const whole = TextRange { .start = start, .end = breakRange.end };

            if (!_codeFence.empty())
            {
                auto const fence = detectCodeFence(line);
                _writer.skip(whole);
                if (!fence.empty() && fence.size() >= _codeFence.size() && fence[0] == _codeFence[0])
                {
                    _codeFence.clear();
                    _writer.mark(SpokenTextWriter::Break::Paragraph,
                                 TextRange { .start = whole.end, .end = whole.end });
                }
                return;
            }

            if (_inComment)
            {
                auto const close = line.find("-->");
                if (close == std::string_view::npos)
                {
                    _writer.skip(whole);
                    return;
                }
                _inComment = false;
                _writer.skip(TextRange { .start = start, .end = start + close + 3 });
                start += close + 3;
                processInlineLine(start, end, breakRange);
                return;
            }

            if (isBlank(line))
            {
                _writer.mark(SpokenTextWriter::Break::Paragraph, whole);
                return;
            }

            auto const fence = detectCodeFence(line);
            if (!fence.empty())
            {
                _codeFence = std::string(fence);
                _writer.mark(SpokenTextWriter::Break::Paragraph, TextRange { .start = start, .end = start });
                if (_options.describeCode)
                    _writer.insert("(code block omitted)", start);
                _writer.skip(whole);
                return;
            }

            if (isRuleLine(line) || isTableDelimiterRow(line))
            {
                _writer.skip(TextRange { .start = start, .end = end });
                _writer.mark(SpokenTextWriter::Break::Paragraph, breakRange);
                return;
            }

            auto const trimmed = line.find_first_not_of(" \t");
            if (trimmed != std::string_view::npos && line.substr(trimmed).starts_with("<!--")
                && line.find("-->", trimmed) == std::string_view::npos)
            {
                _inComment = true;
                _writer.skip(whole);
                return;
            }

            processInlineLine(start, end, breakRange);
        }

        /// @brief Strips container prefixes (indentation, quotes, list markers) and renders the rest.
        void processInlineLine(std::size_t start, std::size_t end, TextRange breakRange)
        {
            auto pos = start;
            auto consumeIndent = [&] {
                auto const from = pos;
                while (pos < end && (_source[pos] == ' ' || _source[pos] == '\t'))
                    ++pos;
                _writer.skip(TextRange { .start = from, .end = pos });
            };

            while (true)
            {
                consumeIndent();
                auto const quote = detectBlockquote(slice(pos, end));
                if (quote == 0)
                    break;
                _writer.skip(TextRange { .start = pos, .end = pos + quote });
                pos += quote;
            }

            auto const headingLevel = detectHeadingLevel(slice(pos, end));
            if (headingLevel > 0)
            {
                renderHeading(headingLevel, pos, end, breakRange);
                return;
            }

            auto const listLen = detectListMarker(slice(pos, end));
            if (listLen > 0)
            {
                _writer.skip(TextRange { .start = pos, .end = pos + listLen });
                pos += listLen;
                auto const task = detectTaskBox(slice(pos, end));
                _writer.skip(TextRange { .start = pos, .end = pos + task });
                pos += task;
            }

            renderInline(pos, end);
            _writer.mark(SpokenTextWriter::Break::Line, breakRange);
        }

        void renderHeading(int level, std::size_t start, std::size_t end, TextRange breakRange)
        {
            _writer.mark(SpokenTextWriter::Break::Paragraph, TextRange { .start = start, .end = start });

            auto textStart = start + static_cast<std::size_t>(level);
            while (textStart < end && (_source[textStart] == ' ' || _source[textStart] == '\t'))
                ++textStart;
            _writer.skip(TextRange { .start = start, .end = textStart });

            // Optional closing sequence: "## Title ##"
            auto textEnd = end;
            while (textEnd > textStart && (_source[textEnd - 1] == ' ' || _source[textEnd - 1] == '\t'))
                --textEnd;
            auto closeStart = textEnd;
            while (closeStart > textStart && _source[closeStart - 1] == '#')
                --closeStart;
            if (closeStart < textEnd
                && (closeStart == textStart || _source[closeStart - 1] == ' ' || _source[closeStart - 1] == '\t'))
                textEnd = closeStart;

            if (_options.headingContext && textStart < textEnd)
            {
                auto const context = level == 1   ? std::string_view { "Title: " }
                                     : level == 2 ? std::string_view { "Section: " }
                                                  : std::string_view { "Subsection: " };
                _writer.insert(context, textStart);
            }

            renderInline(textStart, textEnd);
            _writer.skip(TextRange { .start = textEnd, .end = end });
            _writer.mark(SpokenTextWriter::Break::Paragraph, breakRange);
        }

        /// @brief Renders inline markdown elements (code, images, links, emphasis, tags, entities).
        void renderInline(std::size_t begin, std::size_t end)
        {
            auto pos = begin;
            while (pos < end)
            {
                auto const ch = _source[pos];

                // Backslash escape: \* \_ \# ...
                if (ch == '\\' && pos + 1 < end && isAsciiPunct(_source[pos + 1]))
                {
                    _writer.skip(TextRange { .start = pos, .end = pos + 1 });
                    _writer.text(slice(pos + 1, pos + 2), pos + 1);
                    pos += 2;
                    continue;
                }

                // Inline code: `...` or ``...``
                if (ch == '`')
                {
                    pos = renderCodeSpan(pos, end);
                    continue;
                }

                // Image: ![alt](url)
                if (ch == '!' && pos + 1 < end && _source[pos + 1] == '[')
                {
                    if (auto const next = renderLink(pos + 1, end, true); next != pos + 1)
                    {
                        pos = next;
                        continue;
                    }
                }

                // Link: [text](url) or [text][ref]
                if (ch == '[')
                {
                    if (auto const next = renderLink(pos, end, false); next != pos)
                    {
                        pos = next;
                        continue;
                    }
                }

                // Emphasis and strikethrough markers
                if (ch == '*' || ch == '~' || ch == '_')
                {
                    auto runEnd = pos;
                    while (runEnd < end && _source[runEnd] == ch)
                        ++runEnd;

                    auto const intraword = ch == '_' && pos > begin && runEnd < end
                                           && isAsciiAlnum(_source[pos - 1]) && isAsciiAlnum(_source[runEnd]);
                    auto const lonelyTilde = ch == '~' && runEnd - pos < 2;
                    if (intraword || lonelyTilde)
                        _writer.text(slice(pos, runEnd), pos);
                    else
                        _writer.skip(TextRange { .start = pos, .end = runEnd });
                    pos = runEnd;
                    continue;
                }

                // HTML tags and autolinks
                if (ch == '<')
                {
                    if (auto const next = renderAngle(pos, end); next != pos)
                    {
                        pos = next;
                        continue;
                    }
                }

                if (ch == '&')
                {
                    if (auto const next = renderEntity(pos, end); next != pos)
                    {
                        pos = next;
                        continue;
                    }
                }

                // Table cell separator
                if (ch == '|')
                {
                    _writer.mark(SpokenTextWriter::Break::Space, TextRange { .start = pos, .end = pos + 1 });
                    ++pos;
                    continue;
                }

                if (static_cast<unsigned char>(ch) >= 0x80)
                {
                    auto const decoded = utf8::decode(_source, pos);
                    auto const next = std::min(end, pos + decoded.length);
                    if (_options.stripEmoji && utf8::isEmoji(decoded.codepoint))
                        _writer.skip(TextRange { .start = pos, .end = next });
                    else
                        _writer.text(slice(pos, next), pos);
                    pos = next;
                    continue;
                }

                // Plain run up to the next character that may start markup
                auto runEnd = pos + 1;
                while (runEnd < end)
                {
                    auto const c = _source[runEnd];
                    if (static_cast<unsigned char>(c) >= 0x80
                        || std::string_view { "\\`![*~_<&|" }.find(c) != std::string_view::npos)
                        break;
                    ++runEnd;
                }
                _writer.text(slice(pos, runEnd), pos);
                pos = runEnd;
            }
        }

        auto renderCodeSpan(std::size_t pos, std::size_t end) -> std::size_t
        {
            auto ticksEnd = pos;
            while (ticksEnd < end && _source[ticksEnd] == '`')
                ++ticksEnd;
            auto const ticks = slice(pos, ticksEnd);

            auto const close = slice(0, end).find(ticks, ticksEnd);
            if (close == std::string_view::npos)
            {
                _writer.skip(TextRange { .start = pos, .end = ticksEnd });
                return ticksEnd;
            }

            _writer.skip(TextRange { .start = pos, .end = ticksEnd });
            if (_options.describeCode && close > ticksEnd)
                _writer.insert("code snippet: ", ticksEnd);
            _writer.text(slice(ticksEnd, close), ticksEnd);
            _writer.skip(TextRange { .start = close, .end = close + ticks.size() });
            return close + ticks.size();
        }

        /// @brief Renders [text](url), [text][ref] or ![alt](url) starting at the '['.
        /// @return Position after the construct, or @p open if it is not a link.
        auto renderLink(std::size_t open, std::size_t end, bool image) -> std::size_t
        {
            auto depth = 0;
            auto close = std::string_view::npos;
            for (auto i = open; i < end; ++i)
            {
                if (_source[i] == '\\')
                {
                    ++i;
                    continue;
                }
                if (_source[i] == '[')
                    ++depth;
                else if (_source[i] == ']' && --depth == 0)
                {
                    close = i;
                    break;
                }
            }
            if (close == std::string_view::npos || close + 1 >= end)
                return open;

            auto const opener = _source[close + 1];
            auto const closer = opener == '(' ? ')' : opener == '[' ? ']' : '\0';
            if (closer == '\0')
                return open;

            auto const targetEnd = slice(0, end).find(closer, close + 2);
            if (targetEnd == std::string_view::npos)
                return open;

            auto const markupStart = image ? open - 1 : open;
            _writer.skip(TextRange { .start = markupStart, .end = open + 1 });
            if (image)
                _writer.insert("Image: ", open + 1);
            renderInline(open + 1, close);
            _writer.skip(TextRange { .start = close, .end = targetEnd + 1 });
            return targetEnd + 1;
        }

        auto renderAngle(std::size_t open, std::size_t end) -> std::size_t
        {
            if (open + 1 >= end)
                return open;
            auto const next = _source[open + 1];
            auto const isTagStart = (next >= 'a' && next <= 'z') || (next >= 'A' && next <= 'Z') || next == '/'
                                    || next == '!';
            if (!isTagStart)
                return open;

            auto const close = slice(0, end).find('>', open + 1);
            if (close == std::string_view::npos)
                return open;

            auto const inner = slice(open + 1, close);
            if (inner.starts_with("http://") || inner.starts_with("https://") || inner.starts_with("mailto:"))
            {
                _writer.skip(TextRange { .start = open, .end = open + 1 });
                _writer.text(inner, open + 1);
                _writer.skip(TextRange { .start = close, .end = close + 1 });
            }
            else
            {
                _writer.skip(TextRange { .start = open, .end = close + 1 });
            }
            return close + 1;
        }

        auto renderEntity(std::size_t pos, std::size_t end) -> std::size_t
        {
            auto const rest = slice(pos, end);
            for (auto const& entity: Entities)
            {
                if (rest.starts_with(entity.name))
                {
                    _writer.substitute(entity.text, TextRange { .start = pos, .end = pos + entity.name.size() });
                    return pos + entity.name.size();
                }
            }
            return pos;
        }

        std::string_view _source;
        const NormalizerOptions& _options;
        SpokenTextWriter& _writer;
        std::string _codeFence; ///< The fence that opened the current code block.
        bool _inComment = false;
    };

    auto normalizePlain(std::string_view source) -> NormalizedText
    {
        auto builder = OffsetMapBuilder {};
        auto const first = std::ranges::find_if_not(source, [](char ch) { return utf8::isSpace(ch); });
        if (first == source.end())
        {
            builder.remove(TextRange { .start = 0, .end = source.size() });
            return NormalizedText { .spoken = {}, .map = std::move(builder).build() };
        }

        auto const start = static_cast<std::size_t>(first - source.begin());
        auto end = source.size();
        while (end > start && utf8::isSpace(source[end - 1]))
            --end;

        builder.remove(TextRange { .start = 0, .end = start });
        builder.copy(start, end - start);
        builder.remove(TextRange { .start = end, .end = source.size() });
        return NormalizedText { .spoken = std::string(source.substr(start, end - start)),
                                .map = std::move(builder).build() };
    }

} // namespace

TextNormalizer::TextNormalizer(NormalizerOptions options): _options(options)
{
}

auto TextNormalizer::normalize(std::string_view source) const -> Result<NormalizedText>
{
    if (auto const invalid = utf8::findInvalid(source))
        return makeError(ErrorCode::NormalizationError,
                         std::format("Malformed UTF-8 sequence at byte {}", *invalid));

    if (!_options.markdown)
        return normalizePlain(source);

    auto writer = SpokenTextWriter {};
    auto walker = MarkdownWalker(source, _options, writer);
    walker.run();
    auto result = std::move(writer).finish();

    if (auto valid = result.map.validate(result.spoken.size()); !valid)
        return std::unexpected(valid.error());

    log::debug("Normalized {} source bytes into {} spoken bytes ({} map ranges)",
               source.size(),
               result.spoken.size(),
               result.map.ranges().size());
    return result;
}

} // namespace readalong
