#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    ConnectionFailed,
    RotationFailed,
    UnexpectedClosure,
    MalformedFrame,
    DeviceUnavailable,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionFailed: return "connection_failed";
        case ErrorKind::RotationFailed: return "rotation_failed";
        case ErrorKind::UnexpectedClosure: return "unexpected_closure";
        case ErrorKind::MalformedFrame: return "malformed_frame";
        case ErrorKind::DeviceUnavailable: return "device_unavailable";
    }
    return "unknown";
}
