#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "li_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.url.starts_with("wss://generativelanguage.googleapis.com/"));
        REQUIRE(cfg.backend.model == "models/gemini-2.5-flash-native-audio-preview-09-2025");
        REQUIRE(cfg.backend.voice == "Zephyr");
        REQUIRE(cfg.backend.api_key.empty());
        REQUIRE(cfg.backend.api_key_env == "GEMINI_API_KEY");
        REQUIRE(cfg.languages.source == Language::English);
        REQUIRE(cfg.languages.target == Language::Chinese);
        REQUIRE(cfg.session.max_duration_s == 270);
        REQUIRE(cfg.session.retry_backoff_s == 5);
        REQUIRE(cfg.session.max_retries == 3);
        REQUIRE(cfg.session.context_records == 15);
        REQUIRE(cfg.audio.capture_rate == 16000);
        REQUIRE(cfg.audio.chunk_samples == 4096);
        REQUIRE(cfg.audio.playback_rate == 24000);
        REQUIRE(cfg.audio.ring_capacity_samples() == 4 * 16000);
        REQUIRE(cfg.meeting.title == "Global Strategy Meeting");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "url": "wss://example.test/live",
                "model": "models/other",
                "voice": "Puck",
                "api_key": "k-123",
                "api_key_env": "OTHER_KEY"
            },
            "languages": { "source": "japanese", "target": "SPANISH" },
            "session": {
                "max_duration_s": 120,
                "retry_backoff_s": 2,
                "max_retries": 5,
                "context_records": 8
            },
            "audio": {
                "capture_rate": 48000,
                "chunk_samples": 1024,
                "playback_rate": 48000,
                "buffer_seconds": 2
            },
            "meeting": { "title": "Board Sync" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.url == "wss://example.test/live");
        REQUIRE(cfg.backend.model == "models/other");
        REQUIRE(cfg.backend.voice == "Puck");
        REQUIRE(cfg.backend.resolve_api_key() == "k-123");
        REQUIRE(cfg.backend.api_key_env == "OTHER_KEY");
        REQUIRE(cfg.languages.source == Language::Japanese);
        REQUIRE(cfg.languages.target == Language::Spanish);
        REQUIRE(cfg.session.max_duration_s == 120);
        REQUIRE(cfg.session.retry_backoff_s == 2);
        REQUIRE(cfg.session.max_retries == 5);
        REQUIRE(cfg.session.context_records == 8);
        REQUIRE(cfg.audio.capture_rate == 48000);
        REQUIRE(cfg.audio.chunk_samples == 1024);
        REQUIRE(cfg.audio.playback_rate == 48000);
        REQUIRE(cfg.audio.ring_capacity_samples() == 2 * 48000);
        REQUIRE(cfg.meeting.title == "Board Sync");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "session": { "max_duration_s": 60 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.session.max_duration_s == 60);
        // Other fields retain defaults
        REQUIRE(cfg.session.retry_backoff_s == 5);
        REQUIRE(cfg.backend.voice == "Zephyr");
        REQUIRE(cfg.languages.target == Language::Chinese);
        REQUIRE(cfg.audio.capture_rate == 16000);
    }

    SECTION("UnknownLanguageKeepsDefault") {
        TmpFile f(R"({ "languages": { "source": "Klingon", "target": "French" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.languages.source == Language::English);
        REQUIRE(cfg.languages.target == Language::French);
    }

    SECTION("ApiKeyFromEnvironment") {
        Config cfg;
        cfg.backend.api_key_env = "LIVE_INTERPRETER_TEST_KEY";
        ::setenv("LIVE_INTERPRETER_TEST_KEY", "from-env", 1);
        REQUIRE(cfg.backend.resolve_api_key() == "from-env");
        ::unsetenv("LIVE_INTERPRETER_TEST_KEY");
        REQUIRE(cfg.backend.resolve_api_key().empty());
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.session.max_duration_s == 270);
        REQUIRE(cfg.audio.capture_rate == 16000);
    }

    SECTION("WrongTypeFallsBackEntirely") {
        TmpFile f(R"({ "meeting": { "title": "Kept?" }, "session": { "max_retries": "three" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.session.max_retries == 3);
        REQUIRE(cfg.meeting.title == "Global Strategy Meeting");
    }

    SECTION("ZeroValuesFallBack") {
        TmpFile f(R"({
            "session": { "max_duration_s": 0, "retry_backoff_s": 0, "max_retries": 0 },
            "audio": { "capture_rate": 0, "playback_rate": 0, "buffer_seconds": 0, "chunk_samples": 0 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.session.max_duration_s == 270);
        REQUIRE(cfg.session.retry_backoff_s == 5);
        REQUIRE(cfg.session.max_retries == 3);
        REQUIRE(cfg.audio.capture_rate == 16000);
        REQUIRE(cfg.audio.playback_rate == 24000);
        REQUIRE(cfg.audio.buffer_seconds == 4);
        REQUIRE(cfg.audio.chunk_samples == 4096);
    }

    SECTION("ChunkLargerThanRingClamped") {
        TmpFile f(R"({ "audio": { "capture_rate": 16000, "buffer_seconds": 1, "chunk_samples": 20000 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.chunk_samples == 4096);
        REQUIRE(cfg.audio.chunk_samples <= cfg.audio.ring_capacity_samples());

        TmpFile tiny(R"({ "audio": { "capture_rate": 1000, "buffer_seconds": 1, "chunk_samples": 2000 } })");
        auto small = Config::load(tiny.path);
        REQUIRE(small.audio.chunk_samples == 1000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/li_test_nonexistent_config_file.json");
        REQUIRE(cfg.session.max_duration_s == 270);
        REQUIRE(cfg.audio.capture_rate == 16000);
    }
}
