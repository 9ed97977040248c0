#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--source L] [--target L]     Start translating");
    std::println(stderr, "  stop                                Stop translating");
    std::println(stderr, "  status                              Show session state");
    std::println(stderr, "  transcript [--limit N]              Show transcript records");
    std::println(stderr, "  languages [--source L] [--target L] Show or set languages (idle only)");
    std::println(stderr, "  dismiss                             Clear the current error");
    std::println(stderr, "  minutes [--title T]                 Print meeting minutes");
}

// Seconds as m:ss
static std::string clock_text(double seconds) {
    auto total = static_cast<long>(seconds < 0 ? 0 : seconds);
    return std::format("{}:{:02}", total / 60, total % 60);
}

static void print_status(const json& r) {
    std::string state = r.value("state", "unknown");
    if (r.value("rotating", false)) state += " (rotating)";
    std::println("State: {}", state);
    std::println("Languages: {} -> {}", r.value("source", "?"), r.value("target", "?"));

    if (r.value("state", "idle") != "idle") {
        std::println("Session: {} / {}", clock_text(r.value("session_age", 0.0)),
                     clock_text(r.value("max_duration", 0.0)));
        std::println("Conversation: {}", clock_text(r.value("conversation_age", 0.0)));
    }

    std::println("Audio: {} chunks sent, {} dropped, {} bad frames, {} queued",
                 r.value("chunks_sent", 0), r.value("chunks_dropped", 0),
                 r.value("frames_dropped", 0), r.value("playback_pending", 0));
    std::println("Rotations: {}, reconnects: {}",
                 r.value("rotations", 0), r.value("reconnects", 0));
    std::println("Transcript: {} records", r.value("transcript_count", 0));

    if (r.contains("error") && r["error"].is_object()) {
        std::println("Error: {}: {}", r["error"].value("kind", ""), r["error"].value("message", ""));
    }
}

static void print_transcript(const json& r) {
    if (!r.contains("records")) return;
    for (auto& rec : r["records"]) {
        bool user = rec.value("role", "") == "user";
        std::println("[{}] {}: {}", rec.value("time", ""), user ? "Input" : "Translation",
                     rec.value("text", ""));
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string source;
    std::string target;
    std::string title;
    int limit = 0;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--source" && i + 1 < argc) {
            source = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            target = argv[++i];
        } else if (arg == "--title" && i + 1 < argc) {
            title = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    // Build command JSON
    json cmd;
    if (command == "start" || command == "languages") {
        cmd = {{"cmd", command}};
        if (!source.empty()) cmd["source"] = source;
        if (!target.empty()) cmd["target"] = target;
    } else if (command == "stop" || command == "status" || command == "dismiss") {
        cmd = {{"cmd", command}};
    } else if (command == "transcript") {
        cmd = {{"cmd", "transcript"}};
        if (limit > 0) cmd["limit"] = limit;
    } else if (command == "minutes") {
        cmd = {{"cmd", "minutes"}};
        if (!title.empty()) cmd["title"] = title;
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is live-interpreter running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        print_status(response);
    } else if (command == "transcript") {
        print_transcript(response);
    } else if (command == "languages") {
        std::println("Source: {}", response.value("source", "?"));
        std::println("Target: {}", response.value("target", "?"));
        if (response.contains("available")) {
            std::string all;
            for (auto& l : response["available"]) {
                if (!all.empty()) all += ", ";
                all += l.get<std::string>();
            }
            std::println("Available: {}", all);
        }
    } else if (command == "minutes") {
        std::println("{}", response.value("text", ""));
    } else if (command == "start") {
        std::println("Translating ({})", response.value("state", "connecting"));
    } else if (command == "stop") {
        std::println("Stopped, {} transcript records kept", response.value("transcript_count", 0));
    } else {
        std::println("OK");
    }

    return 0;
}
