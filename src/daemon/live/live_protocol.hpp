#pragma once

#include "live/backend.hpp"

#include <string>
#include <string_view>
#include <vector>

// JSON message shapes of the Gemini Live BidiGenerateContent stream.
namespace live::protocol {

std::string build_setup(const SessionRequest& request, std::string_view voice);

std::string build_audio(const TransportFrame& frame);

struct ParseResult {
    bool setup_complete = false;
    std::vector<Event> events;
};

// Returns an error for messages that are not JSON objects.
std::expected<ParseResult, std::string> parse_server_message(std::string_view text);

} // namespace live::protocol
