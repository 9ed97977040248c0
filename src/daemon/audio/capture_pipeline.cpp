#include "audio/capture_pipeline.hpp"

CapturePipeline::CapturePipeline(SampleRing& ring, uint32_t sample_rate,
                                 size_t chunk_samples, Sink sink)
    : ring_(ring), sample_rate_(sample_rate), chunk_(chunk_samples),
      sink_(std::move(sink)) {}

size_t CapturePipeline::pump() {
    size_t consumed = 0;
    while (ring_.read_chunk(chunk_)) {
        consumed++;
        auto frame = pcm::encode_for_transport(chunk_, sample_rate_);
        if (sink_ && sink_(frame)) {
            sent_++;
        } else {
            dropped_++;
        }
    }
    return consumed;
}

void CapturePipeline::discard() {
    while (ring_.read_chunk(chunk_)) {
        dropped_++;
    }
}
