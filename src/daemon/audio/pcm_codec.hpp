#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// 16-bit little-endian PCM, base64-framed for the live protocol.
struct TransportFrame {
    std::string data;
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;

    std::string mime_type() const;
};

struct DecodedAudio {
    std::vector<float> samples; // interleaved
    uint32_t sample_rate = 0;
    uint16_t channels = 1;

    size_t frames() const { return channels ? samples.size() / channels : 0; }
    double duration() const {
        return sample_rate ? static_cast<double>(frames()) / sample_rate : 0.0;
    }
};

namespace pcm {

// Sample width on the wire.
constexpr size_t kBytesPerSample = 2;

// Payload framing via mbedtls. Decoding returns nullopt on malformed input.
std::string to_base64(std::span<const uint8_t> bytes);
std::optional<std::vector<uint8_t>> from_base64(std::string_view text);

TransportFrame encode_for_transport(std::span<const float> samples,
                                    uint32_t sample_rate, uint16_t channels = 1);

std::expected<DecodedAudio, Error>
    decode_from_transport(const TransportFrame& frame, uint32_t target_sample_rate,
                          uint16_t channel_count);

// Reads "audio/pcm;rate=24000". Falls back to `default_rate` when no rate is present.
uint32_t rate_from_mime(std::string_view mime, uint32_t default_rate = 24000);

} // namespace pcm
