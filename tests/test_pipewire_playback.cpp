#include <catch2/catch_test_macros.hpp>

#include "platform/linux/pipewire_playback.hpp"

#include <array>
#include <cstdint>
#include <cmath>
#include <vector>

namespace {

bool near(float a, float b) {
    return std::abs(a - b) < 1e-6f;
}

} // namespace

// Exercises the mixer directly; no PipeWire daemon is needed.
TEST_CASE("PipeWirePlayback mixing", "[playback]") {
    PipeWirePlayback playback(100);
    std::array<float, 4> out{};

    SECTION("BufferSpanningCyclesContinues") {
        playback.schedule(1, {0.1f, 0.2f, 0.3f, 0.4f, 0.5f, 0.6f}, 0.0);

        playback.render(out.data(), 4);
        REQUIRE(near(out[0], 0.1f));
        REQUIRE(near(out[3], 0.4f));
        REQUIRE(playback.finished().empty());

        playback.render(out.data(), 4);
        REQUIRE(near(out[0], 0.5f));
        REQUIRE(near(out[1], 0.6f));
        REQUIRE(near(out[2], 0.0f));
        REQUIRE(playback.finished() == std::vector<uint64_t>{1});
        REQUIRE(playback.current_time() == 0.08);
    }

    SECTION("MixesAtStartFrameAndClamps") {
        playback.schedule(1, {0.5f, 0.5f, 0.5f, 0.5f}, 0.0);
        playback.schedule(2, {0.75f, 0.75f}, 0.02);

        playback.render(out.data(), 4);
        REQUIRE(near(out[1], 0.5f));
        REQUIRE(near(out[2], 1.0f));
        REQUIRE(near(out[3], 1.0f));
        REQUIRE(playback.finished() == std::vector<uint64_t>{1, 2});
    }

    SECTION("LateBufferStartsNow") {
        playback.render(out.data(), 4);
        playback.schedule(3, {0.25f, 0.25f}, 0.0);

        playback.render(out.data(), 4);
        REQUIRE(near(out[0], 0.25f));
        REQUIRE(near(out[1], 0.25f));
        REQUIRE(near(out[2], 0.0f));
        REQUIRE(playback.finished() == std::vector<uint64_t>{3});
    }

    SECTION("CancelledBufferNeverReported") {
        playback.schedule(4, {0.25f, 0.25f}, 0.0);
        playback.cancel(4);
        playback.render(out.data(), 4);
        REQUIRE(near(out[0], 0.0f));
        REQUIRE(playback.finished().empty());
    }

    SECTION("CompletionsCappedWithoutReallocating") {
        size_t total = PipeWirePlayback::kMaxFinishedPerCycle + 6;
        for (uint64_t id = 1; id <= total; id++) {
            playback.schedule(id, {0.0f}, 0.0);
        }

        playback.render(out.data(), 4);
        const uint64_t* storage = playback.finished().data();
        REQUIRE(playback.finished().size() == PipeWirePlayback::kMaxFinishedPerCycle);

        // The overflow is reported next cycle, not replayed.
        playback.render(out.data(), 4);
        REQUIRE(playback.finished().size() == 6);
        REQUIRE(playback.finished().front() == PipeWirePlayback::kMaxFinishedPerCycle + 1);
        REQUIRE(playback.finished().data() == storage);

        playback.render(out.data(), 4);
        REQUIRE(playback.finished().empty());
    }
}
