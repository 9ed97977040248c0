#pragma once

#include "platform/audio_output.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <vector>

// Mono F32 output stream. Scheduled buffers are mixed in at their start frame
// on a clock that counts rendered frames.
class PipeWirePlayback : public AudioOutput {
public:
    explicit PipeWirePlayback(uint32_t sample_rate = 24000);
    ~PipeWirePlayback() override;

    PipeWirePlayback(const PipeWirePlayback&) = delete;
    PipeWirePlayback& operator=(const PipeWirePlayback&) = delete;

    bool start() override;
    void stop() override;
    bool is_running() const override { return running_.load(std::memory_order_relaxed); }

    double current_time() const override;
    void schedule(uint64_t id, std::vector<float> samples, double start_at) override;
    void cancel(uint64_t id) override;
    void set_finished_callback(FinishedCallback cb) override { on_finished_ = std::move(cb); }

    // Mixes the next n frames into out and advances the clock. Runs on the
    // RT thread: no allocation. Completed ids land in finished().
    void render(float* out, uint32_t n);
    const std::vector<uint64_t>& finished() const { return finished_; }

    // Completions reported per cycle; the rest are reported next cycle.
    static constexpr size_t kMaxFinishedPerCycle = 64;

private:
    struct Scheduled {
        uint64_t id;
        uint64_t start_frame;
        std::vector<float> samples;
        bool started = false;
        bool done = false;
    };

    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    uint32_t sample_rate_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> frames_rendered_{0};
    FinishedCallback on_finished_;
    std::vector<uint64_t> finished_; // RT thread only

    std::mutex mutex_;
    std::vector<Scheduled> scheduled_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
