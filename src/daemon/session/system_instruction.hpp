#pragma once

#include "language.hpp"

#include <string>
#include <string_view>

enum class SessionFraming { NewMeeting, Continuation };

// `context` is the serialized recent transcript, used only for Continuation.
std::string build_system_instruction(Language source, Language target,
                                     SessionFraming framing, std::string_view context = {});
