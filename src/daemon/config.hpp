#pragma once

#include "language.hpp"

#include <cstdint>
#include <string>

struct Config {
    struct Backend {
        std::string url = "wss://generativelanguage.googleapis.com/ws/"
                          "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
        std::string model = "models/gemini-2.5-flash-native-audio-preview-09-2025";
        std::string voice = "Zephyr";
        std::string api_key;
        std::string api_key_env = "GEMINI_API_KEY";

        // api_key if set, otherwise the value of the api_key_env variable.
        std::string resolve_api_key() const;
    } backend;

    struct Languages {
        Language source = Language::English;
        Language target = Language::Chinese;
    } languages;

    struct Session {
        uint32_t max_duration_s = 270;
        uint32_t retry_backoff_s = 5;
        uint32_t max_retries = 3;
        uint32_t context_records = 15;
    } session;

    struct Audio {
        uint32_t capture_rate = 16000;
        uint32_t chunk_samples = 4096;
        uint32_t playback_rate = 24000;
        uint32_t buffer_seconds = 4;

        // Computed from buffer_seconds and capture_rate (no independent config key).
        size_t ring_capacity_samples() const {
            return static_cast<size_t>(buffer_seconds) * capture_rate;
        }
    } audio;

    struct Meeting {
        std::string title = "Global Strategy Meeting";
    } meeting;

    static Config load(const std::string& path);
    static Config load_default();
};
