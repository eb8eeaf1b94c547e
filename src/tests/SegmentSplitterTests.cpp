// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <text/SegmentSplitter.hpp>
#include <text/Sentences.hpp>
#include <text/Utf8.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>
#include <string_view>
#include <vector>

using namespace readalong;

namespace
{
/// @brief Every segment must sit at its recorded offset in the spoken text.
void checkOffsets(std::string_view spoken, const std::vector<Segment>& segments)
{
    for (auto i = std::size_t { 0 }; i < segments.size(); ++i)
    {
        auto const& segment = segments[i];
        CHECK(segment.id == i);
        CHECK(!segment.text.empty());
        CHECK(spoken.substr(segment.normalizedOffsetStart, segment.text.size()) == segment.text);
        if (i > 0)
            CHECK(segment.normalizedOffsetStart >= segments[i - 1].normalizedRange().end);
    }
}
} // namespace

TEST_CASE("nextSentenceEnd stops after terminal punctuation", "[splitter]")
{
    constexpr auto Text = std::string_view { "Hi there. \"Quoted!\" Done" };
    CHECK(nextSentenceEnd(Text, 0) == 9);
    CHECK(nextSentenceEnd(Text, 9) == 19);
    CHECK(nextSentenceEnd(Text, 19) == Text.size());
    CHECK(nextSentenceEnd("v1.2 is out", 0) == 11);
    CHECK(nextSentenceEnd("one\n\ntwo", 0) == 3);
}

TEST_CASE("Whole sentences are packed greedily up to the limit", "[splitter]")
{
    constexpr auto Spoken = std::string_view { "One two. Three four. Five six." };
    auto const segments = SegmentSplitter(20).split(Spoken);
    REQUIRE(segments.has_value());
    REQUIRE(segments->size() == 2);

    CHECK((*segments)[0].text == "One two. Three four.");
    CHECK((*segments)[0].normalizedOffsetStart == 0);
    CHECK((*segments)[1].text == "Five six.");
    CHECK((*segments)[1].normalizedOffsetStart == 21);
    checkOffsets(Spoken, *segments);
}

TEST_CASE("Text below the limit stays in one segment", "[splitter]")
{
    constexpr auto Spoken = std::string_view { "Hello world. Goodbye now." };
    auto const segments = SegmentSplitter(2000).split(Spoken);
    REQUIRE(segments.has_value());
    REQUIRE(segments->size() == 1);
    CHECK(segments->front().text == Spoken);
}

TEST_CASE("Paragraph breaks end a sentence", "[splitter]")
{
    constexpr auto Spoken = std::string_view { "First line\n\nSecond" };
    auto const segments = SegmentSplitter(12).split(Spoken);
    REQUIRE(segments.has_value());
    REQUIRE(segments->size() == 2);
    CHECK((*segments)[0].text == "First line");
    CHECK((*segments)[1].text == "Second");
    CHECK((*segments)[1].normalizedOffsetStart == 12);
}

TEST_CASE("An over-long sentence is cut at whitespace", "[splitter]")
{
    constexpr auto Spoken = std::string_view { "aaaa bbbb cccc dddd" };
    auto const segments = SegmentSplitter(10).split(Spoken);
    REQUIRE(segments.has_value());
    REQUIRE(segments->size() == 2);
    CHECK((*segments)[0].text == "aaaa bbbb");
    CHECK((*segments)[1].text == "cccc dddd");
    checkOffsets(Spoken, *segments);
}

TEST_CASE("A single word longer than the limit is cut at grapheme boundaries", "[splitter]")
{
    auto warnings = 0;
    auto const capture = log::ScopedCallback([&](log::Level level, std::string_view) {
        if (level == log::Level::Warning)
            ++warnings;
    });

    SECTION("ASCII")
    {
        constexpr auto Spoken = std::string_view { "abcdefghij" };
        auto const segments = SegmentSplitter(4).split(Spoken);
        REQUIRE(segments.has_value());
        REQUIRE(segments->size() == 3);
        CHECK((*segments)[0].text == "abcd");
        CHECK((*segments)[1].text == "efgh");
        CHECK((*segments)[2].text == "ij");
        CHECK(warnings == 2);
    }

    SECTION("multi-byte characters are never split")
    {
        constexpr auto Spoken = std::string_view { "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9" };
        auto const segments = SegmentSplitter(3).split(Spoken);
        REQUIRE(segments.has_value());
        CHECK(segments->size() == 5);
        for (auto const& segment: *segments)
            CHECK(!utf8::findInvalid(segment.text).has_value());
        checkOffsets(Spoken, *segments);
    }
}

TEST_CASE("Segmentation is deterministic and covers every word", "[splitter]")
{
    auto spoken = std::string {};
    for (auto i = 0; i < 40; ++i)
        spoken += std::format("Sentence number {} has a few words in it. ", i);
    while (!spoken.empty() && spoken.back() == ' ')
        spoken.pop_back();

    auto const splitter = SegmentSplitter(120);
    auto const first = splitter.split(spoken);
    auto const second = splitter.split(spoken);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->size() == second->size());

    auto rebuilt = std::string {};
    for (auto i = std::size_t { 0 }; i < first->size(); ++i)
    {
        CHECK((*first)[i].text == (*second)[i].text);
        CHECK((*first)[i].text.size() <= 120);
        if (!rebuilt.empty())
            rebuilt += ' ';
        rebuilt += (*first)[i].text;
    }
    CHECK(rebuilt == spoken);
    checkOffsets(spoken, *first);
}

TEST_CASE("Empty or blank text yields no segments", "[splitter]")
{
    CHECK(SegmentSplitter(10).split("").value().empty());
    CHECK(SegmentSplitter(10).split(" \n\n ").value().empty());
}

TEST_CASE("A zero limit is rejected", "[splitter]")
{
    auto const result = SegmentSplitter(0).split("text");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}
