#pragma once

#include <cstdint>
#include <functional>
#include <vector>

class AudioOutput {
public:
    // Invoked once per buffer whose last frame was rendered. May be called
    // from the device thread.
    using FinishedCallback = std::function<void(uint64_t id)>;

    virtual ~AudioOutput() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    // Output clock in seconds, in the stream's own time base.
    virtual double current_time() const = 0;

    virtual void schedule(uint64_t id, std::vector<float> samples, double start_at) = 0;
    virtual void cancel(uint64_t id) = 0;
    virtual void set_finished_callback(FinishedCallback cb) = 0;
};
