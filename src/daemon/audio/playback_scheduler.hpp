#pragma once

#include "audio/pcm_codec.hpp"
#include "platform/audio_output.hpp"

#include <cstdint>
#include <unordered_set>

// Queues decoded buffers back to back on the output clock.
class PlaybackScheduler {
public:
    explicit PlaybackScheduler(AudioOutput& output);

    // Returns the start timestamp the buffer was scheduled at.
    double enqueue(DecodedAudio audio);

    // Device reported the buffer as played out.
    void on_finished(uint64_t id);

    // Stops every pending buffer and rewinds the timeline.
    void reset();

    double next_free_time() const { return next_free_; }
    size_t pending() const { return pending_.size(); }

private:
    AudioOutput& output_;
    double next_free_ = 0.0;
    uint64_t next_id_ = 1;
    std::unordered_set<uint64_t> pending_;
};
