#pragma once

#include <string>
#include <cstddef>

namespace wayvox {

// Everything that can end a dictation cycle early. All of them are
// recoverable: the daemon shows the message and goes back to Idle.
enum class ErrorKind {
    DeviceUnavailable,
    RecordingTooShort,
    ConnectionFailure,
    ApiError,
    EmptyResult,
    InjectionFailed,
    Unexpected
};

constexpr std::size_t MAX_UI_MESSAGE = 50;

const char* error_kind_name(ErrorKind kind);

// Fixed user-facing message for a kind
std::string error_message(ErrorKind kind);

// Cut message to max characters (UTF-8 aware, never splits a code point)
std::string truncate_message(const std::string& message, std::size_t max = MAX_UI_MESSAGE);

// True if text has nothing but whitespace, including Unicode spaces
// such as U+00A0 and U+3000
bool is_blank(const std::string& text);

} // namespace wayvox
