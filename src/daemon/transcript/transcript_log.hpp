#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

enum class TranscriptRole { User, Model };

constexpr std::string_view to_string(TranscriptRole role) {
    return role == TranscriptRole::User ? "user" : "model";
}

struct TranscriptRecord {
    uint64_t id;
    TranscriptRole role;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::string> speaker_label;
};

// Append-only, insertion order is display order.
class TranscriptLog {
public:
    using Clock = std::chrono::system_clock;

    const TranscriptRecord& append(TranscriptRole role, std::string text,
                                   Clock::time_point timestamp = Clock::now());

    // Last `count` records, oldest first.
    std::span<const TranscriptRecord> recent(size_t count) const;
    const std::vector<TranscriptRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }

    // Starts an unrelated conversation. Ids keep increasing.
    void clear() { records_.clear(); }

private:
    std::vector<TranscriptRecord> records_;
    uint64_t next_id_ = 1;
};

// "[Participant] text" -> "Participant". Tags longer than 32 chars are not labels.
std::optional<std::string> extract_speaker_label(std::string_view text);

// "HH:MM:SS" in local time.
std::string format_clock(std::chrono::system_clock::time_point tp);

// Context handed to a replacement session, one line per record.
std::string serialize_context(std::span<const TranscriptRecord> records);

// Plain-text meeting minutes.
std::string format_minutes(std::span<const TranscriptRecord> records, std::string_view title,
                           std::chrono::system_clock::time_point date);
