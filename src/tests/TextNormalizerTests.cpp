// SPDX-License-Identifier: Apache-2.0
#include <text/TextNormalizer.hpp>
#include <text/WordTokenizer.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>

#include <array>
#include <random>
#include <string>
#include <string_view>

using namespace readalong;

namespace
{
/// @brief Normalizes @p source with default options and returns the spoken text.
auto spoken(std::string_view source, NormalizerOptions options = {}) -> std::string
{
    auto result = TextNormalizer(options).normalize(source);
    REQUIRE(result.has_value());
    return result->spoken;
}
} // namespace

TEST_CASE("Headings are spoken with their context word", "[normalizer]")
{
    CHECK(spoken("# Hello **world**") == "Title: Hello world");
    CHECK(spoken("## Setup") == "Section: Setup");
    CHECK(spoken("#### Details ####") == "Subsection: Details");
}

TEST_CASE("Heading context can be disabled", "[normalizer]")
{
    auto options = NormalizerOptions {};
    options.headingContext = false;
    CHECK(spoken("## Intro", options) == "Intro");
}

TEST_CASE("A heading ends its paragraph", "[normalizer]")
{
    CHECK(spoken("# Title\nBody text") == "Title: Title\n\nBody text");
}

TEST_CASE("Blank line runs collapse to one paragraph break", "[normalizer]")
{
    CHECK(spoken("Para one.\n\n\nPara two.") == "Para one.\n\nPara two.");
    CHECK(spoken("\n\n  Leading and trailing  \n\n\n") == "Leading and trailing");
    CHECK(spoken("many    spaces   here") == "many spaces here");
}

TEST_CASE("Links are replaced by their display text", "[normalizer]")
{
    CHECK(spoken("See [the docs](https://example.com/docs) now") == "See the docs now");
    CHECK(spoken("See [the docs][ref] now") == "See the docs now");
    CHECK(spoken("Visit <https://example.com> today") == "Visit https://example.com today");
}

TEST_CASE("Images are spoken by their alt text", "[normalizer]")
{
    CHECK(spoken("![A cat](cat.png)") == "Image: A cat");
}

TEST_CASE("Inline code is announced", "[normalizer]")
{
    CHECK(spoken("Run `make all` now") == "Run code snippet: make all now");

    auto options = NormalizerOptions {};
    options.describeCode = false;
    CHECK(spoken("Run `make` now", options) == "Run make now");
}

TEST_CASE("Fenced code blocks are replaced by a placeholder", "[normalizer]")
{
    CHECK(spoken("Intro\n```cpp\nint x;\n```\nOutro") == "Intro\n\n(code block omitted)\n\nOutro");

    auto options = NormalizerOptions {};
    options.describeCode = false;
    CHECK(spoken("Intro\n~~~\ncode\n~~~\nOutro", options) == "Intro\n\nOutro");
}

TEST_CASE("List markers, quotes and emphasis are removed", "[normalizer]")
{
    CHECK(spoken("- *first* item\n- second") == "first item\nsecond");
    CHECK(spoken("1. one\n2. two") == "one\ntwo");
    CHECK(spoken("- [x] done") == "done");
    CHECK(spoken("> Quoted text") == "Quoted text");
    CHECK(spoken("~~gone~~ kept") == "gone kept");
    CHECK(spoken("call my_function now") == "call my_function now");
}

TEST_CASE("HTML, entities and emoji are handled", "[normalizer]")
{
    CHECK(spoken("Hello <b>bold</b> world") == "Hello bold world");
    CHECK(spoken("Tom &amp; Jerry") == "Tom & Jerry");
    CHECK(spoken("Party \xF0\x9F\x8E\x89 time") == "Party time");
    CHECK(spoken("before\n<!--\nhidden\n-->\nafter") == "before\nafter");
}

TEST_CASE("Tables, rules, escapes and CRLF", "[normalizer]")
{
    CHECK(spoken("| a | b |\n|---|---|\n| 1 | 2 |") == "a b\n\n1 2");
    CHECK(spoken("Above\n\n---\n\nBelow") == "Above\n\nBelow");
    CHECK(spoken("Use \\*stars\\*") == "Use *stars*");
    CHECK(spoken("Line one\r\nLine two") == "Line one\nLine two");
}

TEST_CASE("Plain text mode only trims", "[normalizer]")
{
    auto options = NormalizerOptions {};
    options.markdown = false;
    CHECK(spoken("  # not a heading  \n", options) == "# not a heading");
    CHECK(spoken(" \n ", options).empty());
}

TEST_CASE("Malformed UTF-8 fails with NormalizationError", "[normalizer]")
{
    auto const result = TextNormalizer().normalize("abc\xff");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::NormalizationError);
}

TEST_CASE("Empty input produces empty spoken text", "[normalizer]")
{
    auto const result = TextNormalizer().normalize("");
    REQUIRE(result.has_value());
    CHECK(result->spoken.empty());
    CHECK(result->map.validate(0).has_value());
}

TEST_CASE("Spoken words map back onto their source text", "[normalizer]")
{
    constexpr auto Documents = std::array<std::string_view, 6> {
        "# Hello **world**",
        "See [the docs](https://example.com/docs) now",
        "- *first* item\n- second\n\n> quoted _words_ here",
        "Run `make all` now\n\n```\nskipped\n```\nDone.",
        "| a | b |\n|---|---|\n| one | two |",
        "Hello <b>bold</b> world, Tom &amp; Jerry.",
    };

    for (auto const document: Documents)
    {
        INFO(document);
        auto const result = TextNormalizer().normalize(document);
        REQUIRE(result.has_value());
        REQUIRE(result->map.validate(result->spoken.size()).has_value());

        auto previousEnd = std::size_t { 0 };
        for (auto const& word: tokenizeWords(result->spoken, result->map))
        {
            CHECK(word.originalRange.start >= previousEnd);
            previousEnd = word.originalRange.end;
            if (!word.originalRange.empty())
                CHECK(document.substr(word.originalRange.start, word.originalRange.size()) == word.text);
        }
    }
}

TEST_CASE("Offset map covers the spoken text for arbitrary markup mixes", "[normalizer]")
{
    // Markup fragments, including unterminated and malformed ones.
    constexpr auto Atoms = std::array<std::string_view, 40> {
        "word", " ", "  ", "\n", "\n\n", "\r\n", "# ", "### ", "**", "*", "_", "__", "~~", "`",
        "```\n", "[", "](", ")", "![", "<https://x.io>", "<b>", "</b>", "<!-- c -->", "<!--",
        "&amp;", "&nbsp;", "&bogus;", "\\*", "- ", "1. ", "> ", "- [x] ", "| a |", "|---|",
        "---\n", "caf\xC3\xA9", "\xF0\x9F\x98\x80", "end.", "Hi! ", "snake_case",
    };

    auto const seed = GENERATE(take(200, random(0u, 1'000'000u)));
    auto rng = std::mt19937(seed);
    auto pickAtom = std::uniform_int_distribution<std::size_t>(0, Atoms.size() - 1);
    auto pickLength = std::uniform_int_distribution<int>(0, 30);

    auto document = std::string {};
    for (auto count = pickLength(rng); count > 0; --count)
        document += Atoms[pickAtom(rng)];

    for (auto const markdown: { true, false })
    {
        INFO("seed " << seed << ", markdown " << markdown << ": " << document);
        auto const result = TextNormalizer(NormalizerOptions { .markdown = markdown }).normalize(document);
        REQUIRE(result.has_value());
        REQUIRE(result->map.validate(result->spoken.size()).has_value());

        for (auto i = std::size_t { 0 }; i < result->spoken.size(); ++i)
        {
            auto const* range = result->map.find(i);
            REQUIRE(range != nullptr);
            CHECK(range->normalizedStart <= i);
            CHECK(i < range->normalizedEnd);
            CHECK(range->originalEnd <= document.size());
        }

        auto previousStart = std::size_t { 0 };
        for (auto const& word: tokenizeWords(result->spoken, result->map))
        {
            CHECK(word.originalRange.start >= previousStart);
            CHECK(word.originalRange.end <= document.size());
            previousStart = word.originalRange.start;
        }
    }
}

TEST_CASE("Inserted context words map to the heading text position", "[normalizer]")
{
    auto const result = TextNormalizer().normalize("# Hello");
    REQUIRE(result.has_value());

    auto const words = tokenizeWords(result->spoken, result->map);
    REQUIRE(words.size() == 2);
    CHECK(words[0].text == "Title");
    CHECK(words[0].originalRange == TextRange { .start = 2, .end = 2 });
    CHECK(words[1].text == "Hello");
    CHECK(words[1].originalRange == TextRange { .start = 2, .end = 7 });
}
