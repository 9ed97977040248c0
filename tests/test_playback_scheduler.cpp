#include <catch2/catch_test_macros.hpp>

#include "audio/playback_scheduler.hpp"
#include "fakes.hpp"

#include <vector>

namespace {

DecodedAudio seconds_of_audio(double seconds) {
    DecodedAudio audio;
    audio.sample_rate = 1000;
    audio.channels = 1;
    audio.samples.assign(static_cast<size_t>(seconds * 1000), 0.1f);
    return audio;
}

} // namespace

TEST_CASE("PlaybackScheduler", "[playback]") {
    FakeAudioOutput output;
    PlaybackScheduler scheduler(output);

    SECTION("BackToBackWithoutGaps") {
        REQUIRE(scheduler.enqueue(seconds_of_audio(0.5)) == 0.0);
        output.clock = 0.1;
        REQUIRE(scheduler.enqueue(seconds_of_audio(0.25)) == 0.5);
        output.clock = 0.3;
        REQUIRE(scheduler.enqueue(seconds_of_audio(1.0)) == 0.75);
        REQUIRE(scheduler.next_free_time() == 1.75);

        REQUIRE(output.scheduled.size() == 3);
        for (size_t i = 1; i < output.scheduled.size(); i++) {
            auto& prev = output.scheduled[i - 1];
            double prev_end = prev.start_at + prev.samples.size() / 1000.0;
            REQUIRE(output.scheduled[i].start_at >= prev_end);
        }
        REQUIRE(scheduler.pending() == 3);
    }

    SECTION("LateArrivalStartsAtClock") {
        scheduler.enqueue(seconds_of_audio(0.5));
        output.clock = 2.0;
        REQUIRE(scheduler.enqueue(seconds_of_audio(0.5)) == 2.0);
        REQUIRE(scheduler.next_free_time() == 2.5);
    }

    SECTION("FinishedBuffersLeavePendingSet") {
        scheduler.enqueue(seconds_of_audio(0.5));
        scheduler.enqueue(seconds_of_audio(0.5));
        scheduler.on_finished(output.scheduled[0].id);
        REQUIRE(scheduler.pending() == 1);
        // Unknown or repeated ids are harmless.
        scheduler.on_finished(output.scheduled[0].id);
        scheduler.on_finished(999);
        REQUIRE(scheduler.pending() == 1);
    }

    SECTION("ResetCancelsPendingAndRewinds") {
        scheduler.enqueue(seconds_of_audio(0.5));
        scheduler.enqueue(seconds_of_audio(0.5));
        scheduler.on_finished(output.scheduled[0].id);

        scheduler.reset();
        REQUIRE(scheduler.pending() == 0);
        REQUIRE(scheduler.next_free_time() == 0.0);
        REQUIRE(output.cancelled == std::vector<uint64_t>{output.scheduled[1].id});

        REQUIRE(scheduler.enqueue(seconds_of_audio(0.25)) == 0.0);
    }

    SECTION("IdsAreUnique") {
        scheduler.enqueue(seconds_of_audio(0.1));
        scheduler.enqueue(seconds_of_audio(0.1));
        REQUIRE(output.scheduled[0].id != output.scheduled[1].id);
    }
}
