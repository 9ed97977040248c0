#pragma once

#include "audio/capture_pipeline.hpp"
#include "audio/playback_scheduler.hpp"
#include "config.hpp"
#include "language.hpp"
#include "live/backend.hpp"
#include "platform/audio_capture.hpp"
#include "platform/audio_output.hpp"
#include "ring_buffer.hpp"
#include "session/session_controller.hpp"
#include "timer_queue.hpp"
#include "transcript/transcript_log.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Portable daemon logic: command handling plus ownership of the core pipeline.
// Everything here runs on the event loop thread.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose,
               SampleRing& ring, AudioCapture& capture, AudioOutput& output,
               LiveConnector& connector, TimerQueue& timers);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Capture device has whole chunks buffered.
    void on_capture_ready();

    // Output device finished playing a scheduled buffer.
    void on_playback_finished(uint64_t id);

    TranslationState state() const { return controller_.state(); }
    const TranscriptLog& transcript() const { return log_; }
    const CapturePipeline& capture_pipeline() const { return pipeline_; }

    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_transcript(const nlohmann::json& cmd);
    nlohmann::json handle_languages(const nlohmann::json& cmd);
    nlohmann::json handle_dismiss(const nlohmann::json& cmd);
    nlohmann::json handle_minutes(const nlohmann::json& cmd);

    // Reads optional "source"/"target" into the selection. Returns an error
    // response if either names an unknown language.
    std::optional<nlohmann::json> apply_languages(const nlohmann::json& cmd);

    bool start_devices();
    void stop_devices();
    void on_state_changed(TranslationState state);

    void log(const std::string& msg);

    static SessionController::Options controller_options(const Config& config, bool verbose);

    Config config_;
    bool verbose_;

    SampleRing& ring_;
    AudioCapture& capture_;
    AudioOutput& output_;

    Language source_;
    Language target_;
    bool devices_running_ = false;

    TranscriptLog log_;
    PlaybackScheduler playback_;
    SessionController controller_;
    CapturePipeline pipeline_;
};
