// SPDX-License-Identifier: Apache-2.0
#include <sync/Session.hpp>
#include <synth/SynthesisPipeline.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <thread>

using namespace readalong;
using Catch::Matchers::WithinAbs;

namespace
{
constexpr auto FakeSampleRate = 1000u;

/// @brief Speaks every word for 0.1 seconds and reports a hint at each word start.
class FakeBackend final: public SynthesisBackend
{
  public:
    std::set<std::size_t> failingSegments;

    /// @brief Later segments finish first when true.
    bool reverseCompletion = false;

    /// @brief The first call blocks until its generation is cancelled.
    bool blockFirstCall = false;
    std::promise<void> firstCallEntered;

    std::atomic<int> active { 0 };
    std::atomic<int> maxActive { 0 };
    std::atomic<int> calls { 0 };

    auto synthesize(const Segment& segment, const VoiceSettings& /*voice*/, std::stop_token stopToken)
        -> Result<SynthesisOutput> override
    {
        auto const call = calls.fetch_add(1);
        auto const running = active.fetch_add(1) + 1;
        auto peak = maxActive.load();
        while (running > peak && !maxActive.compare_exchange_weak(peak, running))
            ;

        if (blockFirstCall && call == 0)
        {
            firstCallEntered.set_value();
            while (!stopToken.stop_requested())
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            active.fetch_sub(1);
            return makeError(ErrorCode::Cancelled, "cancelled");
        }

        if (reverseCompletion)
            std::this_thread::sleep_for(std::chrono::milliseconds(20 - std::min<std::size_t>(segment.id, 19)));
        else
            std::this_thread::sleep_for(std::chrono::milliseconds(2));

        active.fetch_sub(1);

        if (failingSegments.contains(segment.id))
            return makeError(ErrorCode::SynthesisError, std::format("segment {} failed", segment.id));

        auto output = SynthesisOutput {};
        output.audio.sampleRate = FakeSampleRate;
        auto wordCount = std::size_t { 0 };
        auto pos = std::size_t { 0 };
        auto const& text = segment.text;
        while (pos < text.size())
        {
            while (pos < text.size() && text[pos] == ' ')
                ++pos;
            if (pos >= text.size())
                break;
            output.hints.push_back(BoundaryHint { .segmentId = segment.id,
                                                  .chunkRelativeTextOffset = pos,
                                                  .chunkRelativeAudioTime = 0.1 * static_cast<double>(wordCount) });
            ++wordCount;
            while (pos < text.size() && text[pos] != ' ')
                ++pos;
        }
        output.audio.samples.assign(wordCount * FakeSampleRate / 10, 0.25f);
        return output;
    }

    [[nodiscard]] auto voices() const -> std::vector<std::string> override { return { "fake" }; }
};

auto options(std::size_t maxSegmentChars, std::size_t maxConcurrency) -> PipelineOptions
{
    auto result = PipelineOptions {};
    result.maxSegmentChars = maxSegmentChars;
    result.maxConcurrency = maxConcurrency;
    return result;
}

auto longDocument() -> std::string
{
    auto document = std::string { "# Chapter\n\n" };
    for (auto i = 0; i < 12; ++i)
        document += std::format("Sentence {} is here. ", i);
    return document;
}

const auto Voice = VoiceSettings { .voice = "fake", .rate = 1.0 };
} // namespace

TEST_CASE("The pipeline builds a complete generation", "[pipeline]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto const pipeline = SynthesisPipeline(backend, options(14, 2));
    auto tracker = GenerationTracker {};

    auto const result = pipeline.run("Hello **world**. Goodbye now.", Voice, tracker.begin());
    REQUIRE(result.has_value());

    CHECK(result->generation == 1);
    CHECK(result->text.spoken == "Hello world. Goodbye now.");
    REQUIRE(result->segments.size() == 2);
    REQUIRE(result->clips.size() == 2);
    CHECK(result->issues.empty());
    CHECK_THAT(result->audio.duration(), WithinAbs(0.4, 1e-9));
    CHECK_THAT(result->segmentStarts[1], WithinAbs(0.2, 1e-9));

    auto const& index = *result->index;
    REQUIRE(index.size() == 4);
    CHECK(index.interpolatedCount() == 0);
    for (auto i = std::size_t { 0 }; i < index.size(); ++i)
        CHECK_THAT(index[i].audioStart, WithinAbs(0.1 * static_cast<double>(i), 1e-9));
    CHECK(index[1].text == "world");
    CHECK(index[1].originalRange == TextRange { .start = 8, .end = 13 });
}

TEST_CASE("The result does not depend on concurrency or completion order", "[pipeline]")
{
    auto const document = longDocument();

    auto serialBackend = std::make_shared<FakeBackend>();
    auto tracker = GenerationTracker {};
    auto const serial = SynthesisPipeline(serialBackend, options(60, 1)).run(document, Voice, tracker.begin());

    auto parallelBackend = std::make_shared<FakeBackend>();
    parallelBackend->reverseCompletion = true;
    auto const parallel = SynthesisPipeline(parallelBackend, options(60, 4)).run(document, Voice, tracker.begin());

    REQUIRE(serial.has_value());
    REQUIRE(parallel.has_value());
    REQUIRE(serial->segments.size() > 2);
    REQUIRE(serial->index->size() == parallel->index->size());
    for (auto i = std::size_t { 0 }; i < serial->index->size(); ++i)
    {
        CHECK((*serial->index)[i].audioStart == (*parallel->index)[i].audioStart);
        CHECK((*serial->index)[i].audioEnd == (*parallel->index)[i].audioEnd);
    }
    CHECK(serial->audio.samples.size() == parallel->audio.samples.size());
}

TEST_CASE("Concurrent synthesis is bounded", "[pipeline]")
{
    auto backend = std::make_shared<FakeBackend>();
    backend->reverseCompletion = true;
    auto tracker = GenerationTracker {};

    auto const result = SynthesisPipeline(backend, options(30, 2)).run(longDocument(), Voice, tracker.begin());
    REQUIRE(result.has_value());
    CHECK(backend->calls.load() == static_cast<int>(result->segments.size()));
    CHECK(backend->maxActive.load() <= 2);
}

TEST_CASE("A failed segment degrades to interpolated words", "[pipeline]")
{
    auto backend = std::make_shared<FakeBackend>();
    backend->failingSegments = { 0 };
    auto tracker = GenerationTracker {};

    auto const result =
        SynthesisPipeline(backend, options(14, 2)).run("Hello world. Goodbye now.", Voice, tracker.begin());
    REQUIRE(result.has_value());

    REQUIRE(result->issues.size() == 1);
    CHECK(result->issues.front().code == ErrorCode::SynthesisError);
    CHECK(result->clips[0].empty());
    CHECK_THAT(result->audio.duration(), WithinAbs(0.2, 1e-9));

    auto const& index = *result->index;
    REQUIRE(index.size() == 4);
    REQUIRE(index.validate().has_value());
    CHECK(index[0].interpolated);
    CHECK(index[1].interpolated);
    CHECK(!index[2].interpolated);
    CHECK(!index[3].interpolated);
}

TEST_CASE("Every segment failing still yields a uniform index", "[pipeline]")
{
    auto backend = std::make_shared<FakeBackend>();
    backend->failingSegments = { 0, 1 };
    auto tracker = GenerationTracker {};

    auto const result =
        SynthesisPipeline(backend, options(14, 2)).run("Hello world. Goodbye now.", Voice, tracker.begin());
    REQUIRE(result.has_value());
    CHECK(result->issues.size() == 2);
    CHECK(result->index->size() == 4);
    CHECK(result->index->interpolatedCount() == 4);
    CHECK(result->index->validate().has_value());
}

TEST_CASE("Progress is reported once per segment", "[pipeline]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto tracker = GenerationTracker {};
    auto mutex = std::mutex {};
    auto reports = std::vector<std::pair<std::size_t, std::size_t>> {};

    auto const result = SynthesisPipeline(backend, options(30, 3))
                            .run(longDocument(), Voice, tracker.begin(), [&](std::size_t done, std::size_t total) {
                                auto lock = std::lock_guard(mutex);
                                reports.emplace_back(done, total);
                            });
    REQUIRE(result.has_value());
    REQUIRE(reports.size() == result->segments.size());
    CHECK(reports.back().first == reports.back().second);
    CHECK(reports.back().second == result->segments.size());
}

TEST_CASE("Invalid input is rejected before synthesis", "[pipeline]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto tracker = GenerationTracker {};
    auto const pipeline = SynthesisPipeline(backend);

    SECTION("synthesis rate outside (0, 2]")
    {
        for (auto const rate: { 0.0, -1.0, 2.5 })
        {
            auto const result = pipeline.run("text", VoiceSettings { .voice = "fake", .rate = rate }, tracker.begin());
            REQUIRE(!result.has_value());
            CHECK(result.error().code == ErrorCode::InvalidArgument);
        }
    }

    SECTION("malformed UTF-8")
    {
        auto const result = pipeline.run("bad \xC3", Voice, tracker.begin());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::NormalizationError);
    }

    CHECK(backend->calls.load() == 0);
}

TEST_CASE("A cancelled generation reports Cancelled", "[pipeline]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto tracker = GenerationTracker {};
    auto const ticket = tracker.begin();
    tracker.cancel();

    auto const result = SynthesisPipeline(backend).run("Hello world.", Voice, ticket);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);
    CHECK(backend->calls.load() == 0);
}

TEST_CASE("Session drops the result of a superseded generation", "[pipeline]")
{
    auto backend = std::make_shared<FakeBackend>();
    backend->blockFirstCall = true;
    auto entered = backend->firstCallEntered.get_future();

    auto session = Session(SynthesisPipeline(backend, options(2000, 1)));

    auto first = std::async(std::launch::async, [&] { return session.generate("First document.", Voice); });
    entered.wait();

    auto const second = session.generate("Second document.", Voice);
    auto const stale = first.get();

    REQUIRE(second.has_value());
    CHECK((*second)->generation == 2);
    CHECK((*second)->text.spoken == "Second document.");

    REQUIRE(!stale.has_value());
    CHECK(stale.error().code == ErrorCode::StaleGeneration);

    CHECK(session.engine().generation() == 2);
    CHECK(session.current() == *second);
    CHECK(session.engine().play().has_value());
}

TEST_CASE("Session never falls back to an older generation", "[pipeline]")
{
    auto backend = std::make_shared<FakeBackend>();
    auto session = Session(SynthesisPipeline(backend));

    auto const older = session.generate("Older text.", Voice);
    auto const newer = session.generate("Newer text.", Voice);
    REQUIRE(older.has_value());
    REQUIRE(newer.has_value());
    REQUIRE(session.current() == *newer);

    // The older generation completes its commit late.
    auto const late = session.adopt(*older);
    REQUIRE(!late.has_value());
    CHECK(late.error().code == ErrorCode::StaleGeneration);

    auto const again = session.adopt(*newer);
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::StaleGeneration);

    CHECK(session.current() == *newer);
    CHECK(session.engine().generation() == (*newer)->generation);
    CHECK(session.engine().index() == (*newer)->index);

    CHECK(session.adopt(nullptr).error().code == ErrorCode::InvalidArgument);
}
