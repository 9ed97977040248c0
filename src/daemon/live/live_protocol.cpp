#include "live/live_protocol.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace live::protocol {

std::string build_setup(const SessionRequest& request, std::string_view voice) {
    json setup = {
        {"model", request.model},
        {"generationConfig", {
            {"responseModalities", json::array({"AUDIO"})},
            {"speechConfig", {
                {"voiceConfig", {{"prebuiltVoiceConfig", {{"voiceName", std::string(voice)}}}}},
            }},
        }},
        {"systemInstruction", {{"parts", json::array({{{"text", request.system_instruction}}})}}},
        {"inputAudioTranscription", json::object()},
        {"outputAudioTranscription", json::object()},
    };
    return json{{"setup", std::move(setup)}}.dump();
}

std::string build_audio(const TransportFrame& frame) {
    json chunk = {{"mimeType", frame.mime_type()}, {"data", frame.data}};
    return json{{"realtimeInput", {{"mediaChunks", json::array({std::move(chunk)})}}}}.dump();
}

std::expected<ParseResult, std::string> parse_server_message(std::string_view text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
    if (!j.is_object()) {
        return std::unexpected("server message is not an object");
    }

    ParseResult result;
    result.setup_complete = j.contains("setupComplete");

    if (!j.contains("serverContent")) return result;
    auto& content = j["serverContent"];
    if (!content.is_object()) return result;

    try {
        if (content.contains("modelTurn") && content["modelTurn"].contains("parts")) {
            for (auto& part : content["modelTurn"]["parts"]) {
                if (!part.contains("inlineData")) continue;
                auto& inline_data = part["inlineData"];
                auto data = inline_data.value("data", "");
                if (data.empty()) continue;
                auto mime = inline_data.value("mimeType", "audio/pcm");
                result.events.emplace_back(AudioChunk{TransportFrame{
                    .data = std::move(data),
                    .sample_rate = pcm::rate_from_mime(mime),
                    .channels = 1,
                }});
            }
        }

        if (content.contains("inputTranscription")) {
            auto t = content["inputTranscription"].value("text", "");
            if (!t.empty()) result.events.emplace_back(PartialText{TextChannel::Input, std::move(t)});
        }
        if (content.contains("outputTranscription")) {
            auto t = content["outputTranscription"].value("text", "");
            if (!t.empty()) result.events.emplace_back(PartialText{TextChannel::Output, std::move(t)});
        }

        if (content.value("turnComplete", false)) {
            result.events.emplace_back(TurnComplete{});
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("malformed serverContent: ") + e.what());
    }

    return result;
}

} // namespace live::protocol
