#pragma once

#include "transcript/transcript_log.hpp"

#include <string>
#include <string_view>

enum class TextChannel { Input, Output };

// Turn Buffers for one session handle. Partial text is concatenated as
// received, without de-duplication.
class TranscriptAssembler {
public:
    explicit TranscriptAssembler(TranscriptLog& log);

    void append(TextChannel channel, std::string_view text);

    // Emits up to two records (input first, then output), skipping sides that
    // trim to empty, then clears both buffers. Returns records emitted.
    size_t complete_turn();

    bool empty() const { return input_.empty() && output_.empty(); }
    const std::string& input() const { return input_; }
    const std::string& output() const { return output_; }

private:
    TranscriptLog& log_;
    std::string input_;
    std::string output_;
};
