#include "daemon_core.hpp"

#include <chrono>
#include <format>
#include <print>

namespace {

nlohmann::json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

nlohmann::json error_json(const std::optional<Error>& error) {
    if (!error) return nullptr;
    return {{"kind", to_string(error->kind)}, {"message", error->message}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       SampleRing& ring, AudioCapture& capture, AudioOutput& output,
                       LiveConnector& connector, TimerQueue& timers)
    : config_(std::move(config)), verbose_(verbose),
      ring_(ring), capture_(capture), output_(output),
      source_(config_.languages.source), target_(config_.languages.target),
      playback_(output_),
      controller_(controller_options(config_, verbose_), connector, timers, playback_, log_),
      pipeline_(ring_, config_.audio.capture_rate, config_.audio.chunk_samples,
                [this](const TransportFrame& frame) { return controller_.send_audio(frame); }) {
    controller_.set_state_callback([this](TranslationState state) { on_state_changed(state); });
}

DaemonCore::~DaemonCore() = default;

SessionController::Options DaemonCore::controller_options(const Config& config, bool verbose) {
    return SessionController::Options{
        .model = config.backend.model,
        .max_duration = std::chrono::seconds(config.session.max_duration_s),
        .retry_backoff = std::chrono::seconds(config.session.retry_backoff_s),
        .max_retries = config.session.max_retries,
        .context_records = config.session.context_records,
        .playback_rate = config.audio.playback_rate,
        .verbose = verbose,
    };
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    try {
        if (cmd_str == "start") return handle_start(cmd);
        if (cmd_str == "stop") return handle_stop(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "transcript") return handle_transcript(cmd);
        if (cmd_str == "languages") return handle_languages(cmd);
        if (cmd_str == "dismiss") return handle_dismiss(cmd);
        if (cmd_str == "minutes") return handle_minutes(cmd);
    } catch (const nlohmann::json::exception& e) {
        return error_response(std::string("bad request: ") + e.what());
    }
    return error_response("unknown command");
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& cmd) {
    if (controller_.state() != TranslationState::Idle) {
        return error_response(std::format("already {}", to_string(controller_.state())));
    }
    if (auto err = apply_languages(cmd)) return *err;

    if (!start_devices()) {
        return error_response(controller_.last_error() ? controller_.last_error()->message
                                                       : "audio device unavailable");
    }

    if (!controller_.start(source_, target_)) {
        // A failed initial open already moved the controller back to Idle,
        // which stopped the devices.
        stop_devices();
        const auto& err = controller_.last_error();
        return error_response(err ? err->message : "failed to start");
    }

    log(std::format("Translation started ({} -> {})", to_string(source_), to_string(target_)));
    return {{"status", "ok"}, {"state", to_string(controller_.state())}};
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& /*cmd*/) {
    controller_.stop();
    stop_devices();
    pipeline_.discard();
    return {
        {"status", "ok"},
        {"state", to_string(controller_.state())},
        {"transcript_count", log_.size()},
    };
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    const auto& stats = controller_.stats();
    return {
        {"status", "ok"},
        {"state", to_string(controller_.state())},
        {"rotating", controller_.rotating()},
        {"session_age", controller_.session_age_s()},
        {"max_duration",
         std::chrono::duration<double>(controller_.max_duration()).count()},
        {"conversation_age", controller_.conversation_age_s()},
        {"source", to_string(source_)},
        {"target", to_string(target_)},
        {"error", error_json(controller_.last_error())},
        {"chunks_sent", pipeline_.chunks_sent()},
        {"chunks_dropped", pipeline_.chunks_dropped()},
        {"rotations", stats.rotations},
        {"reconnects", stats.reconnects},
        {"frames_dropped", stats.malformed_frames},
        {"transcript_count", log_.size()},
        {"playback_pending", playback_.pending()},
    };
}

nlohmann::json DaemonCore::handle_transcript(const nlohmann::json& cmd) {
    size_t limit = log_.size();
    if (cmd.contains("limit")) {
        int64_t requested = cmd.at("limit").get<int64_t>();
        if (requested < 0) return error_response("limit must not be negative");
        if (requested > 0) limit = static_cast<size_t>(requested);
    }

    nlohmann::json resp = {{"status", "ok"}, {"records", nlohmann::json::array()}};
    for (const auto& r : log_.recent(limit)) {
        auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
            r.timestamp.time_since_epoch()).count();
        resp["records"].push_back({
            {"id", r.id},
            {"role", to_string(r.role)},
            {"text", r.text},
            {"timestamp", epoch},
            {"time", format_clock(r.timestamp)},
            {"speaker", r.speaker_label ? nlohmann::json(*r.speaker_label) : nlohmann::json()},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_languages(const nlohmann::json& cmd) {
    bool changing = cmd.contains("source") || cmd.contains("target");
    if (changing && controller_.state() != TranslationState::Idle) {
        return error_response("languages can only be changed while idle");
    }
    if (auto err = apply_languages(cmd)) return *err;

    nlohmann::json available = nlohmann::json::array();
    for (auto lang : kLanguages) available.push_back(to_string(lang));

    return {
        {"status", "ok"},
        {"source", to_string(source_)},
        {"target", to_string(target_)},
        {"available", available},
    };
}

nlohmann::json DaemonCore::handle_dismiss(const nlohmann::json& /*cmd*/) {
    controller_.dismiss_error();
    return {{"status", "ok"}};
}

nlohmann::json DaemonCore::handle_minutes(const nlohmann::json& cmd) {
    std::string title = cmd.value("title", config_.meeting.title);
    return {
        {"status", "ok"},
        {"text", format_minutes(log_.records(), title, std::chrono::system_clock::now())},
        {"count", log_.size()},
    };
}

std::optional<nlohmann::json> DaemonCore::apply_languages(const nlohmann::json& cmd) {
    Language source = source_;
    Language target = target_;

    if (cmd.contains("source")) {
        auto name = cmd.at("source").get<std::string>();
        auto lang = parse_language(name);
        if (!lang) return error_response("unknown language: " + name);
        source = *lang;
    }
    if (cmd.contains("target")) {
        auto name = cmd.at("target").get<std::string>();
        auto lang = parse_language(name);
        if (!lang) return error_response("unknown language: " + name);
        target = *lang;
    }

    source_ = source;
    target_ = target;
    return std::nullopt;
}

void DaemonCore::on_capture_ready() {
    pipeline_.pump();
}

void DaemonCore::on_playback_finished(uint64_t id) {
    playback_.on_finished(id);
}

bool DaemonCore::start_devices() {
    if (devices_running_) return true;

    ring_.reset();
    if (!capture_.start()) {
        controller_.report_error(Error{ErrorKind::DeviceUnavailable,
                                       "failed to start audio capture"});
        return false;
    }
    if (!output_.start()) {
        capture_.stop();
        controller_.report_error(Error{ErrorKind::DeviceUnavailable,
                                       "failed to start audio playback"});
        return false;
    }

    devices_running_ = true;
    log("Audio devices started");
    return true;
}

void DaemonCore::stop_devices() {
    if (!devices_running_) return;
    devices_running_ = false;

    capture_.stop();
    playback_.reset();
    output_.stop();
    log(std::format("Audio devices stopped ({} chunks sent, {} dropped)",
                    pipeline_.chunks_sent(), pipeline_.chunks_dropped()));
}

void DaemonCore::on_state_changed(TranslationState state) {
    log(std::format("State: {}", to_string(state)));
    if (state == TranslationState::Idle) {
        stop_devices();
    }
}

void DaemonCore::shutdown() {
    if (controller_.state() != TranslationState::Idle) {
        log("Stopping translation for shutdown");
    }
    controller_.stop();
    stop_devices();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[live-interpreter] {}", msg);
    }
}
