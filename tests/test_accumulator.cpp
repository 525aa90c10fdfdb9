#include <catch2/catch_test_macros.hpp>
#include "fakes.hpp"
#include "transcript/transcript_accumulator.hpp"

using namespace std::chrono;

namespace {

TranscriptFragment final_fragment(const std::string& text, std::optional<int> speaker) {
    return TranscriptFragment{.text = text, .speaker = speaker, .is_final = true};
}

size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        n++;
    }
    return n;
}

} // namespace

TEST_CASE("TranscriptAccumulator", "[accumulator]") {
    Config::Transcript config;
    FakeTimers timers;
    std::vector<std::string> flushed;
    TranscriptAccumulator acc(config, timers, [&](const std::string& t) { flushed.push_back(t); });

    SECTION("DuplicateDropped") {
        REQUIRE(acc.accept(final_fragment("hello there", 0)) == AcceptResult::Appended);
        REQUIRE(acc.accept(final_fragment("hello there", 0)) == AcceptResult::Duplicate);

        auto text = acc.flush();
        REQUIRE(count_of(text, "hello there") == 1);
        REQUIRE(flushed.size() == 1);
        REQUIRE(flushed[0] == text);
    }

    SECTION("NearDuplicateDropped") {
        acc.accept(final_fragment("Hello there.", 0));
        REQUIRE(acc.accept(final_fragment("  hello there ", 0)) == AcceptResult::Duplicate);
        REQUIRE(acc.fragment_count() == 1);
    }

    SECTION("SpeakerChangeStartsLabelledTurn") {
        acc.accept(final_fragment("I'll take the lead", 0));
        acc.accept(final_fragment("sounds good", 1));

        REQUIRE(acc.flush() == "Speaker 0: I'll take the lead\nSpeaker 1: sounds good");
    }

    SECTION("SameSpeakerJoinedWithSpace") {
        acc.accept(final_fragment("first part", 2));
        acc.accept(final_fragment("second part", 2));
        acc.accept(final_fragment("no label here", std::nullopt));

        REQUIRE(acc.text() == "Speaker 2: first part second part no label here");
        REQUIRE(acc.last_speaker() == 2);
    }

    SECTION("InterimAndEmptyIgnored") {
        TranscriptFragment interim{.text = "partial", .speaker = 0, .is_final = false};
        REQUIRE(acc.accept(interim) == AcceptResult::Interim);
        REQUIRE(acc.accept(final_fragment("   ", 0)) == AcceptResult::Empty);
        REQUIRE(acc.text().empty());
        REQUIRE_FALSE(timers.active(TimerKind::FlushDwell));
    }

    SECTION("WindowEvictsOldest") {
        config.recent_window = 2;
        TranscriptAccumulator small(config, timers, nullptr);
        small.accept(final_fragment("alpha bravo", 0));
        small.accept(final_fragment("charlie delta", 0));
        small.accept(final_fragment("echo foxtrot", 0));

        // "alpha bravo" left the window, so it is accepted again.
        REQUIRE(small.accept(final_fragment("alpha bravo", 0)) == AcceptResult::Appended);
        REQUIRE(small.accept(final_fragment("echo foxtrot", 0)) == AcceptResult::Duplicate);
    }

    SECTION("FlushResetsLabels") {
        acc.accept(final_fragment("before", 3));
        acc.flush();
        REQUIRE_FALSE(acc.last_speaker().has_value());
        REQUIRE(acc.fragment_count() == 0);

        acc.accept(final_fragment("after", 3));
        REQUIRE(acc.text() == "Speaker 3: after");
    }

    SECTION("EmptyFlushSkipsHandler") {
        REQUIRE(acc.flush().empty());
        REQUIRE(flushed.empty());
    }

    SECTION("DwellTimerArmedAndFlushes") {
        acc.accept(final_fragment("waiting", 0));
        REQUIRE(timers.active(TimerKind::FlushDwell));
        REQUIRE(timers.slot(TimerKind::FlushDwell).delay == milliseconds(config.flush_dwell_ms));
        REQUIRE_FALSE(timers.slot(TimerKind::FlushDwell).periodic);

        acc.on_flush_timer();
        REQUIRE(flushed == std::vector<std::string>{"Speaker 0: waiting"});
        REQUIRE_FALSE(timers.active(TimerKind::FlushDwell));
    }
}
