#include "session/session_controller.hpp"

#include <format>
#include <print>

SessionController::SessionController(Options options, LiveConnector& connector,
                                     TimerQueue& timers, PlaybackScheduler& playback,
                                     TranscriptLog& log)
    : options_(std::move(options)), connector_(connector), timers_(timers),
      playback_(playback), log_(log) {}

SessionController::~SessionController() {
    cancel_timers();
}

bool SessionController::start(Language source, Language target) {
    if (state_ != TranslationState::Idle) {
        std::println(stderr, "session: cannot start, state is {}", to_string(state_));
        return false;
    }

    stopped_ = false;
    failures_ = 0;
    error_.reset();
    stats_ = {};
    source_ = source;
    target_ = target;
    log_.clear();
    conversation_start_ = timers_.now();

    set_state(TranslationState::Connecting);
    log(std::format("Connecting ({} -> {})", to_string(source_), to_string(target_)));
    open_handle(Purpose::Initial);
    return state_ != TranslationState::Idle;
}

void SessionController::stop() {
    stopped_ = true;
    cancel_timers();

    // Closed events for these ids arrive later and match no slot.
    for (auto* slot : {&pending_, &active_, &retiring_}) {
        if (*slot) {
            (*slot)->session->close();
            slot->reset();
        }
    }

    playback_.reset();
    if (state_ != TranslationState::Idle) {
        log("Stopped");
    }
    set_state(TranslationState::Idle);
}

bool SessionController::send_audio(const TransportFrame& frame) {
    if (stopped_ || !active_) return false;
    active_->session->send_audio(frame);
    stats_.frames_sent++;
    return true;
}

bool SessionController::rotating() const {
    return pending_ && pending_->purpose == Purpose::Rotation;
}

void SessionController::report_error(Error error) {
    std::println(stderr, "session: {}: {}", to_string(error.kind), error.message);
    error_ = std::move(error);
}

double SessionController::session_age_s() const {
    if (!active_) return 0.0;
    return std::chrono::duration<double>(timers_.now() - active_->opened_at).count();
}

double SessionController::conversation_age_s() const {
    if (state_ == TranslationState::Idle) return 0.0;
    return std::chrono::duration<double>(timers_.now() - conversation_start_).count();
}

std::optional<uint64_t> SessionController::handle_id(HandleRole role) const {
    for (auto* slot : {&pending_, &active_, &retiring_}) {
        if (*slot && (*slot)->role == role) return (*slot)->id();
    }
    return std::nullopt;
}

size_t SessionController::handle_count(HandleRole role) const {
    size_t n = 0;
    for (auto* slot : {&pending_, &active_, &retiring_}) {
        if (*slot && (*slot)->role == role) n++;
    }
    return n;
}

// --- inbound events ---

void SessionController::on_event(uint64_t handle_id, live::Event event) {
    if (auto* text = std::get_if<live::PartialText>(&event)) {
        if (is(active_, handle_id)) active_->turn.append(text->channel, text->text);
    } else if (auto* chunk = std::get_if<live::AudioChunk>(&event)) {
        on_audio(handle_id, chunk->frame);
    } else if (std::holds_alternative<live::TurnComplete>(event)) {
        if (is(active_, handle_id)) active_->turn.complete_turn();
    } else if (std::holds_alternative<live::Opened>(event)) {
        on_opened(handle_id);
    } else if (auto* closed = std::get_if<live::Closed>(&event)) {
        on_closed(handle_id, closed->reason);
    } else if (auto* failed = std::get_if<live::Failed>(&event)) {
        on_failed(handle_id, failed->message);
    }
}

void SessionController::on_opened(uint64_t handle_id) {
    if (!is(pending_, handle_id)) {
        log(std::format("Ignoring open confirmation from handle {}", handle_id));
        return;
    }
    promote_pending();
}

void SessionController::on_audio(uint64_t handle_id, const TransportFrame& frame) {
    if (!is(active_, handle_id)) return;

    auto decoded = pcm::decode_from_transport(frame, options_.playback_rate, 1);
    if (!decoded) {
        stats_.malformed_frames++;
        std::println(stderr, "session: dropping audio chunk: {}", decoded.error().message);
        return;
    }
    playback_.enqueue(std::move(*decoded));
}

void SessionController::on_closed(uint64_t handle_id, const std::string& reason) {
    if (is(retiring_, handle_id)) {
        log(std::format("Retired handle {} closed", handle_id));
        retiring_.reset();
        return;
    }

    if (is(pending_, handle_id)) {
        open_failed(pending_->purpose,
                    "closed before setup completed" + (reason.empty() ? "" : ": " + reason));
        return;
    }

    if (!is(active_, handle_id) || stopped_) return;

    std::println(stderr, "session: active handle {} closed unexpectedly{}", handle_id,
                 reason.empty() ? "" : ": " + reason);
    flush_turn(*active_);
    active_.reset();
    if (rotation_timer_) {
        timers_.cancel(*rotation_timer_);
        rotation_timer_.reset();
    }
    set_state(TranslationState::Reconnecting);
    // Reconnect attempts are counted apart from earlier rotation failures.
    failures_ = 0;

    if (pending_) {
        // A rotation already in flight becomes the recovery attempt.
        pending_->purpose = Purpose::Recovery;
        return;
    }
    if (retry_timer_) {
        timers_.cancel(*retry_timer_);
        retry_timer_.reset();
    }
    open_handle(Purpose::Recovery);
}

void SessionController::on_failed(uint64_t handle_id, const std::string& message) {
    if (is(pending_, handle_id)) {
        open_failed(pending_->purpose, message);
        return;
    }
    if (is(active_, handle_id)) {
        // The transport follows up with Closed, which drives recovery.
        std::println(stderr, "session: active handle {} error: {}", handle_id, message);
        return;
    }
    log(std::format("Ignoring error from handle {}: {}", handle_id, message));
}

// --- handle lifecycle ---

bool SessionController::open_handle(Purpose purpose) {
    std::string context;
    auto framing = SessionFraming::NewMeeting;
    if (purpose != Purpose::Initial) {
        framing = SessionFraming::Continuation;
        context = serialize_context(log_.recent(options_.context_records));
    }

    live::SessionRequest request{
        .model = options_.model,
        .source = source_,
        .target = target_,
        .system_instruction = build_system_instruction(source_, target_, framing, context),
    };

    auto session = connector_.open(request, [this](uint64_t id, live::Event event) {
        on_event(id, std::move(event));
    });
    if (!session) {
        open_failed(purpose, session.error());
        return false;
    }

    auto handle = std::make_unique<Handle>(log_);
    handle->session = std::move(*session);
    handle->purpose = purpose;
    handle->created_at = timers_.now();
    log(std::format("Opening handle {} ({})", handle->id(), purpose_name(purpose)));
    pending_ = std::move(handle);
    return true;
}

void SessionController::open_failed(Purpose purpose, const std::string& message) {
    if (pending_ && pending_->purpose == purpose) {
        pending_->session->close();
        pending_.reset();
    }

    if (purpose == Purpose::Initial) {
        stopped_ = true;
        cancel_timers();
        report_error(Error{ErrorKind::ConnectionFailed, message});
        set_state(TranslationState::Idle);
        return;
    }

    failures_++;
    std::println(stderr, "session: {} attempt {} failed: {}", purpose_name(purpose),
                 failures_, message);
    if (failures_ == options_.max_retries) {
        if (purpose == Purpose::Rotation) {
            report_error(Error{ErrorKind::RotationFailed,
                std::format("rotation failed {} times: {}", failures_, message)});
        } else {
            report_error(Error{ErrorKind::UnexpectedClosure,
                std::format("reconnect failed {} times: {}", failures_, message)});
        }
    }
    schedule_retry(purpose);
}

void SessionController::promote_pending() {
    auto incoming = std::move(pending_);
    Purpose purpose = incoming->purpose;
    incoming->role = HandleRole::Active;
    incoming->opened_at = timers_.now();

    if (active_) {
        flush_turn(*active_);
        retire(std::move(active_));
    }
    active_ = std::move(incoming);

    failures_ = 0;
    if (retry_timer_) {
        timers_.cancel(*retry_timer_);
        retry_timer_.reset();
    }
    if (purpose == Purpose::Rotation) stats_.rotations++;
    if (purpose == Purpose::Recovery) stats_.reconnects++;

    log(std::format("Handle {} active ({})", active_->id(), purpose_name(purpose)));
    set_state(TranslationState::Active);
    arm_rotation_timer();
}

void SessionController::retire(std::unique_ptr<Handle> handle) {
    if (retiring_) {
        // Previous retiree never reported Closed; stop waiting for it.
        retiring_.reset();
    }
    handle->role = HandleRole::Retiring;
    retiring_ = std::move(handle);
    log(std::format("Closing retired handle {}", retiring_->id()));
    retiring_->session->close();
}

void SessionController::flush_turn(Handle& handle) {
    if (handle.turn.empty()) return;
    size_t n = handle.turn.complete_turn();
    if (n > 0) {
        log(std::format("Flushed {} record(s) from handle {}", n, handle.id()));
    }
}

// --- timers ---

void SessionController::arm_rotation_timer() {
    if (rotation_timer_) timers_.cancel(*rotation_timer_);
    rotation_timer_ = timers_.schedule(options_.max_duration, [this] {
        rotation_timer_.reset();
        on_rotation_due();
    });
}

void SessionController::on_rotation_due() {
    if (stopped_ || state_ != TranslationState::Active || !active_ || pending_) return;
    log(std::format("Rotating handle {} after {:.0f}s", active_->id(), session_age_s()));
    open_handle(Purpose::Rotation);
}

void SessionController::schedule_retry(Purpose purpose) {
    if (retry_timer_) timers_.cancel(*retry_timer_);
    retry_timer_ = timers_.schedule(options_.retry_backoff, [this, purpose] {
        retry_timer_.reset();
        if (stopped_ || pending_) return;
        // The active handle may have dropped while we waited.
        Purpose next = active_ ? Purpose::Rotation : Purpose::Recovery;
        if (purpose == Purpose::Recovery && active_) return;
        open_handle(next);
    });
}

void SessionController::cancel_timers() {
    if (rotation_timer_) {
        timers_.cancel(*rotation_timer_);
        rotation_timer_.reset();
    }
    if (retry_timer_) {
        timers_.cancel(*retry_timer_);
        retry_timer_.reset();
    }
}

// --- misc ---

void SessionController::set_state(TranslationState state) {
    if (state_ == state) return;
    state_ = state;
    if (on_state_) on_state_(state);
}

std::string_view SessionController::purpose_name(Purpose purpose) {
    switch (purpose) {
        case Purpose::Initial: return "initial";
        case Purpose::Rotation: return "rotation";
        case Purpose::Recovery: return "recovery";
    }
    return "unknown";
}

void SessionController::log(const std::string& msg) {
    if (options_.verbose) {
        std::println(stderr, "[live-interpreter] {}", msg);
    }
}
