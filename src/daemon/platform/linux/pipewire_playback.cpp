#include "platform/linux/pipewire_playback.hpp"

#include <algorithm>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWirePlayback::PipeWirePlayback(uint32_t sample_rate) : sample_rate_(sample_rate) {
    finished_.reserve(kMaxFinishedPerCycle);
    pw_init(nullptr, nullptr);
}

PipeWirePlayback::~PipeWirePlayback() {
    stop();
    pw_deinit();
}

bool PipeWirePlayback::start() {
    if (running_.load(std::memory_order_relaxed)) return true;

    loop_ = pw_thread_loop_new("live-interpreter-playback", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create playback thread loop");
        return false;
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "live-interpreter-out",
        PW_KEY_APP_NAME, "live-interpreter",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "live-interpreter-playback",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        std::println(stderr, "audio: failed to create playback stream");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_F32,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_OUTPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        std::println(stderr, "audio: playback connect failed: {}", spa_strerror(ret));
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    frames_rendered_.store(0, std::memory_order_relaxed);
    running_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        std::println(stderr, "audio: playback thread loop start failed: {}", spa_strerror(ret));
        running_.store(false, std::memory_order_release);
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    return true;
}

void PipeWirePlayback::stop() {
    if (!running_.load(std::memory_order_relaxed)) return;

    running_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }

    std::lock_guard lock(mutex_);
    scheduled_.clear();
}

double PipeWirePlayback::current_time() const {
    return static_cast<double>(frames_rendered_.load(std::memory_order_acquire)) / sample_rate_;
}

void PipeWirePlayback::schedule(uint64_t id, std::vector<float> samples, double start_at) {
    auto start_frame = static_cast<uint64_t>(std::max(0.0, start_at) * sample_rate_ + 0.5);
    std::lock_guard lock(mutex_);
    scheduled_.push_back(Scheduled{id, start_frame, std::move(samples)});
}

void PipeWirePlayback::cancel(uint64_t id) {
    std::lock_guard lock(mutex_);
    std::erase_if(scheduled_, [id](const Scheduled& s) { return s.id == id; });
}

void PipeWirePlayback::render(float* out, uint32_t n) {
    std::fill_n(out, n, 0.0f);
    finished_.clear();

    uint64_t frame = frames_rendered_.load(std::memory_order_relaxed);
    uint64_t end = frame + n;

    std::lock_guard lock(mutex_);
    for (auto& s : scheduled_) {
        // Buffers scheduled in the past start now rather than being skipped.
        if (!s.started && s.start_frame < frame) s.start_frame = frame;
        if (s.start_frame < end) s.started = true;

        uint64_t s_end = s.start_frame + s.samples.size();
        uint64_t from = std::max(frame, s.start_frame);
        uint64_t to = std::min(end, s_end);
        for (uint64_t f = from; f < to; f++) {
            out[f - frame] += s.samples[f - s.start_frame];
        }
        if (s_end <= end && finished_.size() < kMaxFinishedPerCycle) {
            finished_.push_back(s.id);
            s.done = true;
        }
    }
    std::erase_if(scheduled_, [](const Scheduled& s) { return s.done; });

    for (uint32_t i = 0; i < n; i++) {
        out[i] = std::clamp(out[i], -1.0f, 1.0f);
    }
    frames_rendered_.store(end, std::memory_order_release);
}

void PipeWirePlayback::on_process(void* userdata) {
    auto* self = static_cast<PipeWirePlayback*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    constexpr uint32_t stride = sizeof(float);
    uint32_t n = d->maxsize / stride;
    if (buf->requested) n = std::min<uint32_t>(n, static_cast<uint32_t>(buf->requested));

    self->render(static_cast<float*>(d->data), n);

    d->chunk->offset = 0;
    d->chunk->stride = stride;
    d->chunk->size = n * stride;
    pw_stream_queue_buffer(self->stream_, buf);

    if (self->on_finished_) {
        for (uint64_t id : self->finished_) self->on_finished_(id);
    }
}

void PipeWirePlayback::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                        enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: playback stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
