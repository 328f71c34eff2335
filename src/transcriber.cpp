#include "transcriber.hpp"
#include "errors.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>

namespace wayvox {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), total);
    return total;
}

// Failures where the request never got an HTTP answer
bool is_connection_error(CURLcode code) {
    return code == CURLE_COULDNT_RESOLVE_HOST ||
           code == CURLE_COULDNT_RESOLVE_PROXY ||
           code == CURLE_COULDNT_CONNECT ||
           code == CURLE_OPERATION_TIMEDOUT ||
           code == CURLE_GOT_NOTHING ||
           code == CURLE_SEND_ERROR ||
           code == CURLE_RECV_ERROR ||
           code == CURLE_SSL_CONNECT_ERROR;
}

// curl_global_init must run once per process before any handle is created
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

} // namespace

std::string describe(const TranscriptionError& error) {
    return std::visit(overloaded{
        [](const ConnectionFailed&) {
            return error_message(ErrorKind::ConnectionFailure);
        },
        [](const ApiError& api) {
            return "API Error " + std::to_string(api.status) + ": " + api.message;
        },
        [](const OtherError& other) {
            return "Transcription failed: " + other.message;
        },
    }, error);
}

HttpTranscriber::HttpTranscriber(const ApiConfig& config)
    : config_(config) {
    static CurlGlobal curl_global;
}

HttpTranscriber::~HttpTranscriber() = default;

TranscriptionResult HttpTranscriber::parse_response(long http_code, const std::string& body) {
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);

    if (http_code < 200 || http_code >= 300) {
        std::string message = body;
        // {"error": {"message": "...", "type": "..."}}
        if (!doc.is_discarded() && doc.is_object() && doc.contains("error")) {
            const auto& err = doc["error"];
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                message = err["message"].get<std::string>();
            } else if (err.is_string()) {
                message = err.get<std::string>();
            }
        }
        return TranscriptionResult::failure(ApiError{http_code, message});
    }

    if (doc.is_discarded() || !doc.is_object() || !doc.contains("text") || !doc["text"].is_string()) {
        return TranscriptionResult::failure(OtherError{"invalid response: " + truncate_message(body, 200)});
    }
    return TranscriptionResult::success(doc["text"].get<std::string>());
}

TranscriptionResult HttpTranscriber::transcribe(const std::vector<char>& audio,
                                                const std::string& language) {
    if (config_.key.empty()) {
        std::cerr << "[api] API key not configured" << std::endl;
        return TranscriptionResult::failure(OtherError{"API key not configured"});
    }
    if (audio.empty()) {
        return TranscriptionResult::failure(OtherError{"No audio data"});
    }

    std::cout << "[api] Transcribing " << audio.size() / 1024 << " KB"
              << " (model: " << config_.model
              << ", language: " << (language.empty() ? "auto-detect" : language) << ")" << std::endl;

    CURL* curl = curl_easy_init();
    if (!curl) {
        return TranscriptionResult::failure(OtherError{"curl_easy_init failed"});
    }

    std::string response_body;
    std::string auth = "Authorization: Bearer " + config_.key;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, auth.c_str());

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = nullptr;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, audio.data(), audio.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "model");
    curl_mime_data(part, config_.model.c_str(), CURL_ZERO_TERMINATED);

    if (!language.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language.c_str(), CURL_ZERO_TERMINATED);
    }

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "temperature");
    curl_mime_data(part, "0", CURL_ZERO_TERMINATED);

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "json", CURL_ZERO_TERMINATED);

    curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (!config_.proxy.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy.c_str());
    }

    auto start_time = std::chrono::steady_clock::now();
    const CURLcode rc = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_mime_free(mime);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        std::string detail = curl_easy_strerror(rc);
        if (is_connection_error(rc)) {
            std::cerr << "[api] Connection error: " << detail << std::endl;
            if (!config_.proxy.empty()) {
                std::cerr << "[api] Check your internet connection and proxy settings ("
                          << config_.proxy << ")" << std::endl;
            }
            return TranscriptionResult::failure(ConnectionFailed{detail});
        }
        std::cerr << "[api] Request failed: " << detail << std::endl;
        return TranscriptionResult::failure(OtherError{detail});
    }

    TranscriptionResult result = parse_response(http_code, response_body);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    if (result.ok()) {
        std::cout << "[api] Transcription complete in " << ms << " ms ("
                  << result.text().size() << " bytes)" << std::endl;
    } else {
        std::cerr << "[api] " << describe(result.error()) << std::endl;
    }
    return result;
}

} // namespace wayvox
