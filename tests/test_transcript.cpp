#include <catch2/catch_test_macros.hpp>

#include "transcript/transcript_assembler.hpp"
#include "transcript/transcript_log.hpp"

#include <chrono>
#include <string>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("TranscriptAssembler", "[transcript]") {
    TranscriptLog log;
    TranscriptAssembler turn(log);

    SECTION("InputThenOutput") {
        turn.append(TextChannel::Output, "Bonjour ");
        turn.append(TextChannel::Input, "Good ");
        turn.append(TextChannel::Output, "à tous");
        turn.append(TextChannel::Input, "morning everyone");

        REQUIRE(turn.complete_turn() == 2);
        REQUIRE(log.size() == 2);
        REQUIRE(log.records()[0].role == TranscriptRole::User);
        REQUIRE(log.records()[0].text == "Good morning everyone");
        REQUIRE(log.records()[1].role == TranscriptRole::Model);
        REQUIRE(log.records()[1].text == "Bonjour à tous");
        REQUIRE(turn.empty());
    }

    SECTION("SkipsEmptySides") {
        turn.append(TextChannel::Input, "   \n");
        turn.append(TextChannel::Output, "  translated only ");
        REQUIRE(turn.complete_turn() == 1);
        REQUIRE(log.records()[0].role == TranscriptRole::Model);
        REQUIRE(log.records()[0].text == "translated only");
    }

    SECTION("EmptyTurnEmitsNothingButClears") {
        turn.append(TextChannel::Input, " ");
        REQUIRE(turn.complete_turn() == 0);
        REQUIRE(log.size() == 0);
        REQUIRE(turn.input().empty());
    }

    SECTION("NoDeduplication") {
        turn.append(TextChannel::Input, "again ");
        turn.append(TextChannel::Input, "again");
        turn.complete_turn();
        REQUIRE(log.records()[0].text == "again again");
    }

    SECTION("TurnsDoNotBleed") {
        turn.append(TextChannel::Input, "first");
        turn.complete_turn();
        turn.append(TextChannel::Output, "second");
        turn.complete_turn();
        REQUIRE(log.size() == 2);
        REQUIRE(log.records()[1].text == "second");
    }
}

TEST_CASE("TranscriptLog", "[transcript]") {
    TranscriptLog log;

    SECTION("SequentialIdsSurviveClear") {
        REQUIRE(log.append(TranscriptRole::User, "a").id == 1);
        REQUIRE(log.append(TranscriptRole::Model, "b").id == 2);
        log.clear();
        REQUIRE(log.size() == 0);
        REQUIRE(log.append(TranscriptRole::User, "c").id == 3);
    }

    SECTION("RecentReturnsTailInOrder") {
        for (int i = 0; i < 20; i++) {
            log.append(i % 2 ? TranscriptRole::Model : TranscriptRole::User, std::to_string(i));
        }
        auto tail = log.recent(15);
        REQUIRE(tail.size() == 15);
        REQUIRE(tail.front().text == "5");
        REQUIRE(tail.back().text == "19");

        REQUIRE(log.recent(100).size() == 20);
        REQUIRE(log.recent(0).empty());
    }

    SECTION("SpeakerLabel") {
        auto& rec = log.append(TranscriptRole::User, "[Participant 2] We agree.");
        REQUIRE(rec.speaker_label == std::optional<std::string>("Participant 2"));
        REQUIRE(rec.text == "[Participant 2] We agree.");

        REQUIRE_FALSE(extract_speaker_label("No tag here").has_value());
        REQUIRE_FALSE(extract_speaker_label("[] empty").has_value());
        REQUIRE_FALSE(extract_speaker_label("[unterminated").has_value());
        REQUIRE_FALSE(extract_speaker_label("[" + std::string(33, 'x') + "] long").has_value());
        REQUIRE(extract_speaker_label("[" + std::string(32, 'x') + "] ok").has_value());
    }

    SECTION("ContextSerialization") {
        auto ts = std::chrono::system_clock::now();
        log.append(TranscriptRole::User, "How are sales?", ts);
        log.append(TranscriptRole::Model, "销售情况如何？", ts);

        auto clock = format_clock(ts);
        REQUIRE(clock.size() == 8);
        REQUIRE(serialize_context(log.recent(15)) ==
                "[" + clock + "] Input: How are sales?\n[" + clock + "] Translation: 销售情况如何？");
        REQUIRE(serialize_context({}) == "");
    }

    SECTION("Minutes") {
        auto ts = std::chrono::system_clock::now();
        log.append(TranscriptRole::User, "Let's begin.", ts);
        log.append(TranscriptRole::Model, "我们开始吧。", ts);

        auto text = format_minutes(log.records(), "Q3 Review", ts);
        auto clock = format_clock(ts);
        REQUIRE(text.starts_with("MEETING MINUTES: Q3 Review\nDATE: "));
        REQUIRE(contains(text, "\n\n[" + clock + "] ORIGINAL: Let's begin.\n\n[" + clock +
                               "] TRANSLATED: 我们开始吧。"));
        REQUIRE_FALSE(text.ends_with("\n"));
    }
}
