#pragma once

#include <cstddef>
#include <functional>

class AudioCapture {
public:
    // Invoked from the capture thread once at least `chunk_samples` are buffered.
    // Must not block.
    using ReadyCallback = std::function<void()>;

    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
    virtual void set_ready_callback(ReadyCallback cb, size_t chunk_samples) = 0;
};
