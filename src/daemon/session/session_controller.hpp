#pragma once

#include "audio/playback_scheduler.hpp"
#include "errors.hpp"
#include "language.hpp"
#include "live/backend.hpp"
#include "session/system_instruction.hpp"
#include "timer_queue.hpp"
#include "transcript/transcript_assembler.hpp"
#include "transcript/transcript_log.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

enum class TranslationState { Idle, Connecting, Active, Reconnecting };

constexpr std::string_view to_string(TranslationState state) {
    switch (state) {
        case TranslationState::Idle: return "idle";
        case TranslationState::Connecting: return "connecting";
        case TranslationState::Active: return "active";
        case TranslationState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

enum class HandleRole { Opening, Active, Retiring };

// Owns the remote connection lifecycle: initial connect, proactive rotation
// before the service's session cap, and recovery from unexpected closure.
//
// At most one handle is Active. A rotation opens a second handle while the
// active one keeps serving; once the new one confirms, the old one is moved
// to Retiring and closed. All methods must run on the event loop thread.
class SessionController {
public:
    struct Options {
        std::string model;
        std::chrono::milliseconds max_duration{270'000};
        std::chrono::milliseconds retry_backoff{5'000};
        uint32_t max_retries = 3;
        size_t context_records = 15;
        uint32_t playback_rate = 24000;
        bool verbose = false;
    };

    struct Stats {
        uint64_t frames_sent = 0;
        uint64_t malformed_frames = 0;
        uint64_t rotations = 0;
        uint64_t reconnects = 0;
    };

    using StateCallback = std::function<void(TranslationState)>;

    SessionController(Options options, LiveConnector& connector, TimerQueue& timers,
                      PlaybackScheduler& playback, TranscriptLog& log);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Idle -> Connecting. Returns false if not Idle or the attempt could not
    // even be started (the error slot says why).
    bool start(Language source, Language target);

    // Any state -> Idle. Cancels timers, closes every handle, stops playback.
    void stop();

    // Routes to the active handle only. Returns false if the frame was dropped.
    bool send_audio(const TransportFrame& frame);

    TranslationState state() const { return state_; }
    bool rotating() const;
    Language source() const { return source_; }
    Language target() const { return target_; }

    const std::optional<Error>& last_error() const { return error_; }
    void report_error(Error error);
    void dismiss_error() { error_.reset(); }

    // Age of the currently active handle.
    double session_age_s() const;
    double conversation_age_s() const;
    std::chrono::milliseconds max_duration() const { return options_.max_duration; }

    std::optional<uint64_t> handle_id(HandleRole role) const;
    size_t handle_count(HandleRole role) const;

    const Stats& stats() const { return stats_; }

    void set_state_callback(StateCallback cb) { on_state_ = std::move(cb); }

private:
    enum class Purpose { Initial, Rotation, Recovery };

    struct Handle {
        explicit Handle(TranscriptLog& log) : turn(log) {}

        std::unique_ptr<LiveSession> session;
        HandleRole role = HandleRole::Opening;
        Purpose purpose = Purpose::Initial;
        TimerQueue::TimePoint created_at;
        TimerQueue::TimePoint opened_at;
        TranscriptAssembler turn;

        uint64_t id() const { return session->id(); }
    };

    void on_event(uint64_t handle_id, live::Event event);
    void on_opened(uint64_t handle_id);
    void on_audio(uint64_t handle_id, const TransportFrame& frame);
    void on_closed(uint64_t handle_id, const std::string& reason);
    void on_failed(uint64_t handle_id, const std::string& message);

    bool open_handle(Purpose purpose);
    void open_failed(Purpose purpose, const std::string& message);
    void promote_pending();
    void retire(std::unique_ptr<Handle> handle);
    void flush_turn(Handle& handle);

    void arm_rotation_timer();
    void on_rotation_due();
    void schedule_retry(Purpose purpose);
    void cancel_timers();

    void set_state(TranslationState state);
    bool is(const std::unique_ptr<Handle>& slot, uint64_t handle_id) const {
        return slot && slot->id() == handle_id;
    }
    static std::string_view purpose_name(Purpose purpose);
    void log(const std::string& msg);

    Options options_;
    LiveConnector& connector_;
    TimerQueue& timers_;
    PlaybackScheduler& playback_;
    TranscriptLog& log_;

    TranslationState state_ = TranslationState::Idle;
    bool stopped_ = true;
    Language source_ = Language::English;
    Language target_ = Language::Chinese;

    std::unique_ptr<Handle> active_;
    std::unique_ptr<Handle> retiring_;
    std::unique_ptr<Handle> pending_;

    std::optional<TimerQueue::TimerId> rotation_timer_;
    std::optional<TimerQueue::TimerId> retry_timer_;
    uint32_t failures_ = 0;

    TimerQueue::TimePoint conversation_start_;
    std::optional<Error> error_;
    Stats stats_;
    StateCallback on_state_;
};
