#pragma once

#include "config.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace wayvox {

// Network never reached the API (DNS, connect, TLS, timeout)
struct ConnectionFailed {
    std::string detail;
};

// API answered with a non-success status
struct ApiError {
    long status = 0;
    std::string message;
};

// Anything else: bad response, missing key, unreadable audio
struct OtherError {
    std::string message;
};

using TranscriptionError = std::variant<ConnectionFailed, ApiError, OtherError>;

// Visitor built from lambdas, for std::visit over TranscriptionError
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Message shown to the user for an error
std::string describe(const TranscriptionError& error);

class TranscriptionResult {
public:
    static TranscriptionResult success(std::string text) {
        TranscriptionResult r;
        r.value_ = std::move(text);
        return r;
    }
    static TranscriptionResult failure(TranscriptionError error) {
        TranscriptionResult r;
        r.value_ = std::move(error);
        return r;
    }

    bool ok() const { return std::holds_alternative<std::string>(value_); }
    const std::string& text() const { return std::get<std::string>(value_); }
    const TranscriptionError& error() const { return std::get<TranscriptionError>(value_); }

private:
    TranscriptionResult() = default;
    std::variant<std::string, TranscriptionError> value_;
};

// Speech-to-text boundary. A single attempt, no retries.
class Transcriber {
public:
    virtual ~Transcriber() = default;

    // audio is a complete WAV file (16kHz mono 16-bit PCM).
    // language may be empty for auto-detection.
    virtual TranscriptionResult transcribe(const std::vector<char>& audio,
                                           const std::string& language) = 0;
};

// Multipart upload to an OpenAI-compatible /audio/transcriptions endpoint
class HttpTranscriber : public Transcriber {
public:
    explicit HttpTranscriber(const ApiConfig& config);
    ~HttpTranscriber() override;

    TranscriptionResult transcribe(const std::vector<char>& audio,
                                   const std::string& language) override;

    bool has_key() const { return !config_.key.empty(); }

    // Map an HTTP response to a result (public for testing)
    static TranscriptionResult parse_response(long http_code, const std::string& body);

private:
    ApiConfig config_;
};

} // namespace wayvox
