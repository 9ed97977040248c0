#include "session/system_instruction.hpp"

#include <format>

std::string build_system_instruction(Language source, Language target,
                                     SessionFraming framing, std::string_view context) {
    std::string header = framing == SessionFraming::NewMeeting
        ? std::string("STARTING NEW MEETING.")
        : std::format("This is a session rotation. Continue translating naturally. "
                      "Previous context:\n{}", context);

    return std::format(
        "CONTEXT: {}\n"
        "ROLE: Meeting Secretary and Professional Simultaneous Interpreter.\n"
        "ENVIRONMENT: Multi-participant corporate meeting.\n"
        "SOURCE: {}. TARGET: {}.\n"
        "INSTRUCTIONS:\n"
        "1. Provide instant translation of all recognized speech.\n"
        "2. For multi-speaker detection, use prefixes like \"[Participant]\" if voice changes.\n"
        "3. Maintain formal, executive-level tone.\n"
        "4. If this is a rotation (see context), continue previous threads seamlessly.",
        header, to_string(source), to_string(target));
}
