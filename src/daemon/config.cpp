#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::Backend::resolve_api_key() const {
    if (!api_key.empty()) return api_key;
    if (api_key_env.empty()) return {};
    const char* env = std::getenv(api_key_env.c_str());
    return env ? env : "";
}

static void read_language(const json& j, const char* key, Language& out) {
    if (!j.contains(key)) return;
    auto name = j[key].get<std::string>();
    if (auto lang = parse_language(name)) {
        out = *lang;
    } else {
        std::println(stderr, "config: unsupported language '{}', keeping {}", name, to_string(out));
    }
}

// Zero or out-of-range values fall back to the default.
static void check_nonzero(uint32_t& value, uint32_t fallback, const char* key) {
    if (value != 0) return;
    std::println(stderr, "config: {} must be positive, using {}", key, fallback);
    value = fallback;
}

static void validate(Config& cfg) {
    const Config defaults;
    check_nonzero(cfg.session.max_duration_s, defaults.session.max_duration_s,
                  "session.max_duration_s");
    check_nonzero(cfg.session.retry_backoff_s, defaults.session.retry_backoff_s,
                  "session.retry_backoff_s");
    check_nonzero(cfg.session.max_retries, defaults.session.max_retries, "session.max_retries");
    check_nonzero(cfg.audio.capture_rate, defaults.audio.capture_rate, "audio.capture_rate");
    check_nonzero(cfg.audio.playback_rate, defaults.audio.playback_rate, "audio.playback_rate");
    check_nonzero(cfg.audio.buffer_seconds, defaults.audio.buffer_seconds, "audio.buffer_seconds");

    // A chunk must fit in the capture ring or it is never delivered.
    auto capacity = cfg.audio.ring_capacity_samples();
    if (cfg.audio.chunk_samples == 0 || cfg.audio.chunk_samples > capacity) {
        auto fallback = static_cast<uint32_t>(
            std::min<size_t>(defaults.audio.chunk_samples, capacity));
        std::println(stderr, "config: audio.chunk_samples {} does not fit a {}-sample ring, using {}",
                     cfg.audio.chunk_samples, capacity, fallback);
        cfg.audio.chunk_samples = fallback;
    }
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("model")) cfg.backend.model = b["model"].get<std::string>();
            if (b.contains("voice")) cfg.backend.voice = b["voice"].get<std::string>();
            if (b.contains("api_key")) cfg.backend.api_key = b["api_key"].get<std::string>();
            if (b.contains("api_key_env")) cfg.backend.api_key_env = b["api_key_env"].get<std::string>();
        }

        if (j.contains("languages")) {
            auto& l = j["languages"];
            read_language(l, "source", cfg.languages.source);
            read_language(l, "target", cfg.languages.target);
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            if (s.contains("max_duration_s")) cfg.session.max_duration_s = s["max_duration_s"].get<uint32_t>();
            if (s.contains("retry_backoff_s")) cfg.session.retry_backoff_s = s["retry_backoff_s"].get<uint32_t>();
            if (s.contains("max_retries")) cfg.session.max_retries = s["max_retries"].get<uint32_t>();
            if (s.contains("context_records")) cfg.session.context_records = s["context_records"].get<uint32_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("capture_rate")) cfg.audio.capture_rate = a["capture_rate"].get<uint32_t>();
            if (a.contains("chunk_samples")) cfg.audio.chunk_samples = a["chunk_samples"].get<uint32_t>();
            if (a.contains("playback_rate")) cfg.audio.playback_rate = a["playback_rate"].get<uint32_t>();
            if (a.contains("buffer_seconds")) cfg.audio.buffer_seconds = a["buffer_seconds"].get<uint32_t>();
        }

        if (j.contains("meeting")) {
            auto& m = j["meeting"];
            if (m.contains("title")) cfg.meeting.title = m["title"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}, using defaults", e.what());
        return Config{};
    }

    validate(cfg);
    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
