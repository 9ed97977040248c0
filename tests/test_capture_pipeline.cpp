#include <catch2/catch_test_macros.hpp>

#include "audio/capture_pipeline.hpp"
#include "ring_buffer.hpp"

#include <vector>

TEST_CASE("CapturePipeline", "[capture]") {
    SampleRing ring(64);
    std::vector<TransportFrame> delivered;
    bool session_active = true;

    CapturePipeline pipeline(ring, 16000, 16, [&](const TransportFrame& frame) {
        if (!session_active) return false;
        delivered.push_back(frame);
        return true;
    });

    SECTION("ForwardsWholeChunksOnly") {
        std::vector<float> samples(40, 0.5f);
        ring.write(samples);

        REQUIRE(pipeline.pump() == 2);
        REQUIRE(delivered.size() == 2);
        REQUIRE(pipeline.chunks_sent() == 2);
        REQUIRE(ring.available() == 8);

        auto raw = pcm::from_base64(delivered[0].data);
        REQUIRE(raw->size() == 16 * pcm::kBytesPerSample);
        REQUIRE(delivered[0].sample_rate == 16000);

        // The partial chunk waits for more samples.
        std::vector<float> more(8, 0.5f);
        ring.write(more);
        REQUIRE(pipeline.pump() == 1);
        REQUIRE(ring.available() == 0);
    }

    SECTION("DropsWhenNoSessionIsActive") {
        std::vector<float> samples(32, 0.1f);
        ring.write(samples);
        session_active = false;

        REQUIRE(pipeline.pump() == 2);
        REQUIRE(delivered.empty());
        REQUIRE(pipeline.chunks_dropped() == 2);
        REQUIRE(ring.available() == 0);

        // Dropped chunks are not replayed once a session is back.
        session_active = true;
        REQUIRE(pipeline.pump() == 0);
        REQUIRE(delivered.empty());
    }

    SECTION("DiscardEmptiesRing") {
        std::vector<float> samples(48, 0.1f);
        ring.write(samples);
        pipeline.discard();
        REQUIRE(ring.available() == 0);
        REQUIRE(pipeline.chunks_dropped() == 3);
        REQUIRE(delivered.empty());
    }

    SECTION("EmptyRingIsNoop") {
        REQUIRE(pipeline.pump() == 0);
        REQUIRE(pipeline.chunks_sent() == 0);
        REQUIRE(pipeline.chunks_dropped() == 0);
    }
}
