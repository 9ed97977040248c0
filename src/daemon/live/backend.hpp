#pragma once

#include "audio/pcm_codec.hpp"
#include "language.hpp"
#include "transcript/transcript_assembler.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace live {

struct Opened {};
struct PartialText {
    TextChannel channel;
    std::string text;
};
struct AudioChunk {
    TransportFrame frame;
};
struct TurnComplete {};
struct Closed {
    std::string reason;
};
struct Failed {
    std::string message;
};

using Event = std::variant<Opened, PartialText, AudioChunk, TurnComplete, Closed, Failed>;

struct SessionRequest {
    std::string model;
    Language source = Language::English;
    Language target = Language::Chinese;
    std::string system_instruction;
};

} // namespace live

// One underlying duplex connection.
class LiveSession {
public:
    virtual ~LiveSession() = default;
    virtual uint64_t id() const = 0;
    virtual void send_audio(const TransportFrame& frame) = 0;
    // Idempotent. A Closed event still follows.
    virtual void close() = 0;
};

class LiveConnector {
public:
    // Always invoked on the event loop thread.
    using EventSink = std::function<void(uint64_t handle_id, live::Event event)>;

    virtual ~LiveConnector() = default;

    // Starts opening a connection. Success only means the attempt started:
    // Opened, or Failed then Closed, arrive later through the sink.
    virtual std::expected<std::unique_ptr<LiveSession>, std::string>
        open(const live::SessionRequest& request, EventSink sink) = 0;
};
