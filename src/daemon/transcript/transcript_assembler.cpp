#include "transcript/transcript_assembler.hpp"

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

TranscriptAssembler::TranscriptAssembler(TranscriptLog& log) : log_(log) {}

void TranscriptAssembler::append(TextChannel channel, std::string_view text) {
    if (channel == TextChannel::Input) {
        input_ += text;
    } else {
        output_ += text;
    }
}

size_t TranscriptAssembler::complete_turn() {
    auto user_text = trim(input_);
    auto model_text = trim(output_);
    input_.clear();
    output_.clear();

    size_t emitted = 0;
    auto now = TranscriptLog::Clock::now();
    if (!user_text.empty()) {
        log_.append(TranscriptRole::User, std::move(user_text), now);
        emitted++;
    }
    if (!model_text.empty()) {
        log_.append(TranscriptRole::Model, std::move(model_text), now);
        emitted++;
    }
    return emitted;
}
