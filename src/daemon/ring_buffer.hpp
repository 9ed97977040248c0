#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of float samples.
// Producer (PipeWire thread) calls write(). Consumer (event loop) calls read_chunk().
class SampleRing {
public:
    explicit SampleRing(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually written. Samples that don't fit are dropped.
    size_t write(std::span<const float> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        size_t to_write = std::min(samples.size(), avail);
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::copy_n(samples.begin(), first, buf_.begin() + offset);
        if (first < to_write) {
            std::copy_n(samples.begin() + first, to_write - first, buf_.begin());
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: fills `out` completely or not at all.
    bool read_chunk(std::span<float> out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);
        if (w - r < out.size() || out.empty()) return false;

        size_t offset = r % capacity_;
        size_t first = std::min(out.size(), capacity_ - offset);
        std::copy_n(buf_.begin() + offset, first, out.begin());
        if (first < out.size()) {
            std::copy_n(buf_.begin(), out.size() - first, out.begin() + first);
        }

        read_pos_.store(r + out.size(), std::memory_order_release);
        return true;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }

    // Only safe while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<float> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
};
