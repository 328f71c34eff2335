#include "errors.hpp"

#include <cstdint>

namespace wayvox {

namespace {

// Unicode White_Space plus the ASCII separators 0x1C-0x1F
bool is_space(uint32_t code) {
    switch (code) {
        case 0x20: case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
    }
    return (code >= 0x09 && code <= 0x0D) ||
           (code >= 0x1C && code <= 0x1F) ||
           (code >= 0x2000 && code <= 0x200A);
}

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorKind::RecordingTooShort: return "RecordingTooShort";
        case ErrorKind::ConnectionFailure: return "ConnectionFailure";
        case ErrorKind::ApiError: return "ApiError";
        case ErrorKind::EmptyResult: return "EmptyResult";
        case ErrorKind::InjectionFailed: return "InjectionFailed";
        case ErrorKind::Unexpected: return "Unexpected";
    }
    return "Unknown";
}

std::string error_message(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceUnavailable: return "Microphone unavailable";
        case ErrorKind::RecordingTooShort: return "Recording too short";
        case ErrorKind::ConnectionFailure: return "API connection failed. Check internet/proxy.";
        case ErrorKind::ApiError: return "API error";
        case ErrorKind::EmptyResult: return "Empty transcription received";
        case ErrorKind::InjectionFailed: return "Failed to insert text. Check ydotool.";
        case ErrorKind::Unexpected: return "Unexpected error";
    }
    return "Unknown error";
}

std::string truncate_message(const std::string& message, std::size_t max) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < message.size(); ++i) {
        // Continuation bytes (10xxxxxx) belong to the previous character
        if ((static_cast<unsigned char>(message[i]) & 0xC0) == 0x80) continue;
        if (chars == max) return message.substr(0, i);
        ++chars;
    }
    return message;
}

bool is_blank(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 1;
        uint32_t code = lead;
        if (lead >= 0xF0) { length = 4; code = lead & 0x07; }
        else if (lead >= 0xE0) { length = 3; code = lead & 0x0F; }
        else if (lead >= 0xC0) { length = 2; code = lead & 0x1F; }
        else if (lead >= 0x80) return false;  // stray continuation byte

        if (i + length > text.size()) return false;
        for (std::size_t k = 1; k < length; ++k) {
            code = (code << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
        }
        if (!is_space(code)) return false;
        i += length;
    }
    return true;
}

} // namespace wayvox
