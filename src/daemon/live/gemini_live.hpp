#pragma once

#include "config.hpp"
#include "event_queue.hpp"
#include "live/backend.hpp"

#include <atomic>
#include <cstdint>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace live {

// Outbound messages waiting for the worker. Bounded: while the socket is
// stalled, new messages past the capacity are dropped instead of queued.
class Outbox {
public:
    // About 16s of 256ms capture chunks.
    static constexpr size_t kDefaultCapacity = 64;

    explicit Outbox(size_t capacity = kDefaultCapacity) : capacity_(capacity) {}

    // Returns false if the message was dropped.
    bool push(std::string message) {
        std::lock_guard lock(mutex_);
        if (messages_.size() >= capacity_) {
            dropped_++;
            return false;
        }
        messages_.push_back(std::move(message));
        return true;
    }

    std::vector<std::string> take() {
        std::vector<std::string> batch;
        std::lock_guard lock(mutex_);
        batch.swap(messages_);
        return batch;
    }

    uint64_t dropped() const {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    size_t capacity_;
    uint64_t dropped_ = 0;
};

// Writes all of `msg` through `send_fn`, which behaves like curl_ws_send:
// (data, len, &sent) -> CURLcode. `wait_fn` is called while it reports
// CURLE_AGAIN. Gives up with CURLE_ABORTED_BY_CALLBACK once stop is requested.
template <typename SendFn, typename WaitFn>
CURLcode send_fully(std::string_view msg, std::stop_token stop, SendFn&& send_fn,
                    WaitFn&& wait_fn) {
    size_t offset = 0;
    while (offset < msg.size()) {
        if (stop.stop_requested()) return CURLE_ABORTED_BY_CALLBACK;
        size_t sent = 0;
        CURLcode rc = send_fn(msg.data() + offset, msg.size() - offset, &sent);
        if (rc == CURLE_AGAIN) {
            wait_fn();
            continue;
        }
        if (rc != CURLE_OK) return rc;
        offset += sent;
    }
    return CURLE_OK;
}

} // namespace live

// Gemini Live over a libcurl websocket. Each session runs its own worker
// thread; events are posted to the event queue and delivered on the loop.
class GeminiLiveSession : public LiveSession {
public:
    GeminiLiveSession(uint64_t id, std::string url, std::string setup_message,
                      EventQueue& events, LiveConnector::EventSink sink);
    ~GeminiLiveSession() override;

    GeminiLiveSession(const GeminiLiveSession&) = delete;
    GeminiLiveSession& operator=(const GeminiLiveSession&) = delete;

    // Spawns the worker. Returns false if the wake fd could not be created.
    bool launch();

    uint64_t id() const override { return id_; }
    void send_audio(const TransportFrame& frame) override;
    void close() override;

    uint64_t dropped_messages() const { return outbox_.dropped(); }

private:
    void run(std::stop_token stop);
    void post(live::Event event);
    void wake();
    void drain_wake();

    uint64_t id_;
    std::string url_;
    std::string setup_message_;
    EventQueue& events_;
    LiveConnector::EventSink sink_;

    int wake_fd_ = -1;
    live::Outbox outbox_;
    std::atomic<bool> closing_{false};

    std::jthread worker_;
};

class GeminiLiveConnector : public LiveConnector {
public:
    GeminiLiveConnector(Config::Backend config, EventQueue& events);
    ~GeminiLiveConnector() override;

    std::expected<std::unique_ptr<LiveSession>, std::string>
        open(const live::SessionRequest& request, EventSink sink) override;

private:
    Config::Backend config_;
    EventQueue& events_;
    uint64_t next_id_ = 1;
};
