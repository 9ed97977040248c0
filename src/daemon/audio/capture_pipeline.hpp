#pragma once

#include "audio/pcm_codec.hpp"
#include "ring_buffer.hpp"

#include <cstdint>
#include <functional>
#include <vector>

// Drains fixed-size chunks of captured samples, encodes them and hands them
// to whatever session is active. Chunks the sink refuses are dropped.
class CapturePipeline {
public:
    // Returns false if the frame was not sent (no active session).
    using Sink = std::function<bool(const TransportFrame&)>;

    CapturePipeline(SampleRing& ring, uint32_t sample_rate, size_t chunk_samples, Sink sink);

    // Forwards every complete chunk currently buffered. Returns chunks consumed.
    size_t pump();

    // Discards buffered samples without sending them.
    void discard();

    size_t chunk_samples() const { return chunk_.size(); }
    uint64_t chunks_sent() const { return sent_; }
    uint64_t chunks_dropped() const { return dropped_; }

private:
    SampleRing& ring_;
    uint32_t sample_rate_;
    std::vector<float> chunk_;
    Sink sink_;
    uint64_t sent_ = 0;
    uint64_t dropped_ = 0;
};
