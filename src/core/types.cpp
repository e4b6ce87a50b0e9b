#include "types.hpp"

const char* mode_name(SessionMode mode) {
    switch (mode) {
        case SessionMode::Normal:    return "normal";
        case SessionMode::Auto:      return "auto";
        case SessionMode::Dangerous: return "dangerous";
    }
    return "normal";
}

std::optional<SessionMode> parse_mode(const std::string& name) {
    if (name == "normal") return SessionMode::Normal;
    if (name == "auto") return SessionMode::Auto;
    if (name == "dangerous" || name == "yolo") return SessionMode::Dangerous;
    return std::nullopt;
}
