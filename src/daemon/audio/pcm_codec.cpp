#include "audio/pcm_codec.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <mbedtls/base64.h>

std::string TransportFrame::mime_type() const {
    return std::format("audio/pcm;rate={}", sample_rate);
}

namespace pcm {

namespace {

std::vector<float> convert_channels(std::vector<float> in, uint16_t from, uint16_t to) {
    if (from == to || from == 0 || to == 0) return in;

    size_t frames = in.size() / from;
    std::vector<float> out(frames * to);
    for (size_t f = 0; f < frames; f++) {
        const float* src = in.data() + f * from;
        float* dst = out.data() + f * to;
        if (to < from) {
            // Downmix: average everything into each output channel.
            float sum = 0.0f;
            for (uint16_t c = 0; c < from; c++) sum += src[c];
            std::fill_n(dst, to, sum / from);
        } else {
            for (uint16_t c = 0; c < to; c++) dst[c] = src[c % from];
        }
    }
    return out;
}

std::vector<float> resample_linear(const std::vector<float>& in, uint16_t channels,
                                   uint32_t from_rate, uint32_t to_rate) {
    size_t in_frames = in.size() / channels;
    if (in_frames == 0) return {};

    auto out_frames = static_cast<size_t>(
        std::llround(static_cast<double>(in_frames) * to_rate / from_rate));
    std::vector<float> out(out_frames * channels);

    double step = static_cast<double>(from_rate) / to_rate;
    for (size_t f = 0; f < out_frames; f++) {
        double pos = f * step;
        auto i0 = static_cast<size_t>(pos);
        size_t i1 = std::min(i0 + 1, in_frames - 1);
        i0 = std::min(i0, in_frames - 1);
        auto frac = static_cast<float>(pos - static_cast<double>(i0));
        for (uint16_t c = 0; c < channels; c++) {
            float a = in[i0 * channels + c];
            float b = in[i1 * channels + c];
            out[f * channels + c] = a + (b - a) * frac;
        }
    }
    return out;
}

} // namespace

std::string to_base64(std::span<const uint8_t> bytes) {
    if (bytes.empty()) return {};

    // First call only reports the size needed, terminator included.
    size_t needed = 0;
    if (mbedtls_base64_encode(nullptr, 0, &needed, bytes.data(), bytes.size()) !=
        MBEDTLS_ERR_BASE64_BUFFER_TOO_SMALL) {
        return {};
    }

    std::string out(needed, '\0');
    size_t written = 0;
    if (mbedtls_base64_encode(reinterpret_cast<unsigned char*>(out.data()), out.size(),
                              &written, bytes.data(), bytes.size()) != 0) {
        return {};
    }
    out.resize(written);
    return out;
}

std::optional<std::vector<uint8_t>> from_base64(std::string_view text) {
    auto src = reinterpret_cast<const unsigned char*>(text.data());

    size_t needed = 0;
    int rc = mbedtls_base64_decode(nullptr, 0, &needed, src, text.size());
    if (rc == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) return std::nullopt;
    if (rc == 0) return std::vector<uint8_t>{};

    std::vector<uint8_t> out(needed);
    size_t written = 0;
    if (mbedtls_base64_decode(out.data(), out.size(), &written, src, text.size()) != 0) {
        return std::nullopt;
    }
    out.resize(written);
    return out;
}

TransportFrame encode_for_transport(std::span<const float> samples,
                                    uint32_t sample_rate, uint16_t channels) {
    std::vector<uint8_t> bytes(samples.size() * kBytesPerSample);
    for (size_t i = 0; i < samples.size(); i++) {
        float s = std::clamp(samples[i], -1.0f, 1.0f);
        auto v = static_cast<int16_t>(std::lround(s * 32767.0f));
        auto u = static_cast<uint16_t>(v);
        bytes[i * 2] = static_cast<uint8_t>(u & 0xFF);
        bytes[i * 2 + 1] = static_cast<uint8_t>(u >> 8);
    }

    return TransportFrame{
        .data = to_base64(bytes),
        .sample_rate = sample_rate,
        .channels = channels,
    };
}

std::expected<DecodedAudio, Error>
decode_from_transport(const TransportFrame& frame, uint32_t target_sample_rate,
                      uint16_t channel_count) {
    if (frame.channels == 0 || frame.sample_rate == 0) {
        return std::unexpected(Error{ErrorKind::MalformedFrame, "frame has no rate or channels"});
    }

    auto bytes = from_base64(frame.data);
    if (!bytes) {
        return std::unexpected(Error{ErrorKind::MalformedFrame, "invalid base64 payload"});
    }

    size_t frame_width = kBytesPerSample * frame.channels;
    if (bytes->size() % frame_width != 0) {
        return std::unexpected(Error{ErrorKind::MalformedFrame,
            std::format("{} bytes is not a multiple of the {}-byte sample frame",
                        bytes->size(), frame_width)});
    }

    std::vector<float> samples(bytes->size() / kBytesPerSample);
    for (size_t i = 0; i < samples.size(); i++) {
        auto u = static_cast<uint16_t>((*bytes)[i * 2] | ((*bytes)[i * 2 + 1] << 8));
        samples[i] = static_cast<float>(static_cast<int16_t>(u)) / 32768.0f;
    }

    uint16_t channels = channel_count ? channel_count : frame.channels;
    samples = convert_channels(std::move(samples), frame.channels, channels);

    uint32_t rate = target_sample_rate ? target_sample_rate : frame.sample_rate;
    if (rate != frame.sample_rate) {
        samples = resample_linear(samples, channels, frame.sample_rate, rate);
    }

    return DecodedAudio{
        .samples = std::move(samples),
        .sample_rate = rate,
        .channels = channels,
    };
}

uint32_t rate_from_mime(std::string_view mime, uint32_t default_rate) {
    auto pos = mime.find("rate=");
    if (pos == std::string_view::npos) return default_rate;

    auto digits = mime.substr(pos + 5);
    uint32_t rate = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), rate);
    if (ec != std::errc{} || rate == 0) return default_rate;
    return rate;
}

} // namespace pcm
