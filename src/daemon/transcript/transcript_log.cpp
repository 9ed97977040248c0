#include "transcript/transcript_log.hpp"

#include <algorithm>
#include <ctime>
#include <format>

const TranscriptRecord& TranscriptLog::append(TranscriptRole role, std::string text,
                                              Clock::time_point timestamp) {
    auto label = extract_speaker_label(text);
    records_.push_back(TranscriptRecord{
        .id = next_id_++,
        .role = role,
        .text = std::move(text),
        .timestamp = timestamp,
        .speaker_label = std::move(label),
    });
    return records_.back();
}

std::span<const TranscriptRecord> TranscriptLog::recent(size_t count) const {
    size_t n = std::min(count, records_.size());
    return std::span<const TranscriptRecord>(records_).last(n);
}

std::optional<std::string> extract_speaker_label(std::string_view text) {
    if (text.empty() || text.front() != '[') return std::nullopt;
    auto close = text.find(']');
    if (close == std::string_view::npos || close == 1 || close > 33) return std::nullopt;
    return std::string(text.substr(1, close - 1));
}

static std::string format_local(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string format_clock(std::chrono::system_clock::time_point tp) {
    return format_local(tp, "%H:%M:%S");
}

std::string serialize_context(std::span<const TranscriptRecord> records) {
    std::string out;
    for (auto& r : records) {
        if (!out.empty()) out += '\n';
        out += std::format("[{}] {}: {}", format_clock(r.timestamp),
                           r.role == TranscriptRole::User ? "Input" : "Translation", r.text);
    }
    return out;
}

std::string format_minutes(std::span<const TranscriptRecord> records, std::string_view title,
                           std::chrono::system_clock::time_point date) {
    std::string out = std::format("MEETING MINUTES: {}\nDATE: {}\n\n", title,
                                  format_local(date, "%Y-%m-%d"));
    bool first = true;
    for (auto& r : records) {
        if (!first) out += "\n\n";
        first = false;
        out += std::format("[{}] {}: {}", format_clock(r.timestamp),
                           r.role == TranscriptRole::User ? "ORIGINAL" : "TRANSLATED", r.text);
    }
    return out;
}
