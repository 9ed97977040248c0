#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"

#include <numeric>
#include <vector>

TEST_CASE("SampleRing", "[ring_buffer]") {
    constexpr size_t cap = 256;
    SampleRing ring(cap);

    SECTION("WriteAndRead") {
        std::vector<float> data(64);
        std::iota(data.begin(), data.end(), 0.0f);

        REQUIRE(ring.write(data) == 64);
        REQUIRE(ring.available() == 64);

        std::vector<float> out(64);
        REQUIRE(ring.read_chunk(out));
        REQUIRE(out == data);
        REQUIRE(ring.available() == 0);
    }

    SECTION("Wraparound") {
        std::vector<float> fill(200, 1.0f);
        REQUIRE(ring.write(fill) == 200);
        std::vector<float> sink(200);
        REQUIRE(ring.read_chunk(sink));

        // Write position is at 200, so 128 samples wrap past the end.
        std::vector<float> wrap(128);
        std::iota(wrap.begin(), wrap.end(), 42.0f);
        REQUIRE(ring.write(wrap) == 128);

        std::vector<float> out(128);
        REQUIRE(ring.read_chunk(out));
        REQUIRE(out == wrap);
    }

    SECTION("OverflowDropsNewest") {
        std::vector<float> first(cap - 10, 0.25f);
        ring.write(first);

        std::vector<float> big(100, 0.75f);
        REQUIRE(ring.write(big) == 10);
        REQUIRE(ring.available() == cap);
        REQUIRE(ring.write(big) == 0);

        std::vector<float> out(cap);
        REQUIRE(ring.read_chunk(out));
        REQUIRE(out.front() == 0.25f);
        REQUIRE(out.back() == 0.75f);
    }

    SECTION("ReadChunkAllOrNothing") {
        std::vector<float> data(10, 0.5f);
        ring.write(data);

        std::vector<float> out(16, -1.0f);
        REQUIRE_FALSE(ring.read_chunk(out));
        REQUIRE(out[0] == -1.0f);
        REQUIRE(ring.available() == 10);
    }

    SECTION("EmptyChunkNeverReads") {
        std::vector<float> data(10, 0.5f);
        ring.write(data);
        std::vector<float> none;
        REQUIRE_FALSE(ring.read_chunk(none));
    }

    SECTION("Reset") {
        std::vector<float> data(100, 0.5f);
        ring.write(data);
        ring.reset();
        REQUIRE(ring.available() == 0);
        REQUIRE(ring.capacity() == cap);
    }
}
