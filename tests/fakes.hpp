#pragma once

#include "live/backend.hpp"
#include "platform/audio_capture.hpp"
#include "platform/audio_output.hpp"
#include "timer_queue.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Output device whose clock is set by the test.
class FakeAudioOutput : public AudioOutput {
public:
    struct Scheduled {
        uint64_t id;
        std::vector<float> samples;
        double start_at;
    };

    bool start() override {
        starts++;
        if (!start_ok) return false;
        running = true;
        return true;
    }
    void stop() override {
        stops++;
        running = false;
    }
    bool is_running() const override { return running; }
    double current_time() const override { return clock; }
    void schedule(uint64_t id, std::vector<float> samples, double start_at) override {
        scheduled.push_back({id, std::move(samples), start_at});
    }
    void cancel(uint64_t id) override { cancelled.push_back(id); }
    void set_finished_callback(FinishedCallback cb) override { on_finished = std::move(cb); }

    bool start_ok = true;
    bool running = false;
    int starts = 0;
    int stops = 0;
    double clock = 0.0;
    std::vector<Scheduled> scheduled;
    std::vector<uint64_t> cancelled;
    FinishedCallback on_finished;
};

class FakeAudioCapture : public AudioCapture {
public:
    bool start() override {
        starts++;
        if (!start_ok) return false;
        capturing = true;
        return true;
    }
    void stop() override {
        stops++;
        capturing = false;
    }
    bool is_capturing() const override { return capturing; }
    void set_ready_callback(ReadyCallback cb, size_t chunk) override {
        on_ready = std::move(cb);
        chunk_samples = chunk;
    }

    bool start_ok = true;
    bool capturing = false;
    int starts = 0;
    int stops = 0;
    size_t chunk_samples = 0;
    ReadyCallback on_ready;
};

// What the test can observe about one opened connection, even after the
// controller has dropped it.
struct FakeSessionRecord {
    uint64_t id = 0;
    live::SessionRequest request;
    std::vector<TransportFrame> sent;
    int close_calls = 0;
    bool destroyed = false;
};

class FakeLiveSession : public LiveSession {
public:
    explicit FakeLiveSession(std::shared_ptr<FakeSessionRecord> record)
        : record_(std::move(record)) {}
    ~FakeLiveSession() override { record_->destroyed = true; }

    uint64_t id() const override { return record_->id; }
    void send_audio(const TransportFrame& frame) override { record_->sent.push_back(frame); }
    void close() override { record_->close_calls++; }

private:
    std::shared_ptr<FakeSessionRecord> record_;
};

// Scripted remote service. Events are delivered synchronously through
// emit(), standing in for the loop draining the task queue.
class FakeConnector : public LiveConnector {
public:
    std::expected<std::unique_ptr<LiveSession>, std::string>
    open(const live::SessionRequest& request, EventSink sink) override {
        if (fail_next_open) {
            auto msg = *fail_next_open;
            fail_next_open.reset();
            return std::unexpected(msg);
        }
        auto record = std::make_shared<FakeSessionRecord>();
        record->id = next_id_++;
        record->request = request;
        records.push_back(record);
        sink_ = std::move(sink);
        return std::make_unique<FakeLiveSession>(record);
    }

    void emit(uint64_t id, live::Event event) { sink_(id, std::move(event)); }

    // Remote side rejects the attempt: error followed by closed.
    void fail(uint64_t id, const std::string& message) {
        emit(id, live::Failed{message});
        emit(id, live::Closed{message});
    }

    size_t opens() const { return records.size(); }
    FakeSessionRecord& last() { return *records.back(); }
    FakeSessionRecord& session(uint64_t id) { return *records.at(id - 1); }

    std::optional<std::string> fail_next_open;
    std::vector<std::shared_ptr<FakeSessionRecord>> records;

private:
    EventSink sink_;
    uint64_t next_id_ = 1;
};

// Timer queue on a hand-advanced clock.
struct ManualClock {
    TimerQueue::TimePoint now{};
    TimerQueue timers{[this] { return now; }};

    void advance(std::chrono::milliseconds d) {
        now += d;
        timers.run_due();
    }
};
