#include "audio/playback_scheduler.hpp"

#include <algorithm>

PlaybackScheduler::PlaybackScheduler(AudioOutput& output) : output_(output) {}

double PlaybackScheduler::enqueue(DecodedAudio audio) {
    double start_at = std::max(next_free_, output_.current_time());
    double duration = audio.duration();

    uint64_t id = next_id_++;
    pending_.insert(id);
    output_.schedule(id, std::move(audio.samples), start_at);

    next_free_ = start_at + duration;
    return start_at;
}

void PlaybackScheduler::on_finished(uint64_t id) {
    pending_.erase(id);
}

void PlaybackScheduler::reset() {
    for (uint64_t id : pending_) {
        output_.cancel(id);
    }
    pending_.clear();
    next_free_ = 0.0;
}
