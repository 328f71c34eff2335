#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace wayvox {

// Transcription API settings (Groq / OpenAI compatible endpoint)
struct ApiConfig {
    std::string key;
    std::string model = "whisper-large-v3-turbo";
    std::string endpoint = "https://api.groq.com/openai/v1/audio/transcriptions";
    std::string proxy;              // e.g. "http://127.0.0.1:8080", empty = direct
    long timeout_seconds = 60;
};

struct LanguageConfig {
    bool auto_detect = true;
    std::vector<std::string> preferred = {"ru", "en"};
    std::string primary = "ru";     // Used when auto_detect is off
};

// Default trigger key: F24 (remapped from Ctrl+Space by keyd)
constexpr uint32_t DEFAULT_HOTKEY = 194;

struct HotkeyConfig {
    uint32_t keycode = DEFAULT_HOTKEY;
    int retry_backoff_ms = 1000;    // Wait before re-scanning devices after a failure
};

struct AudioConfig {
    int sample_rate = 16000;        // 16kHz mono 16-bit PCM
    int channels = 1;
    int chunk_size = 2048;          // Frames per read
    int max_duration = 30;          // Seconds before capture stops by itself
    double min_duration = 0.5;      // Shorter recordings are discarded
};

struct UiConfig {
    std::string theme = "dark";
    std::string position = "top-center";
    int success_hide_ms = 1500;
    int error_hide_ms = 3000;
    int tick_ms = 1000;             // Recording counter resolution
};

struct BehaviorConfig {
    bool auto_paste = true;
    bool copy_to_clipboard = true;
    bool show_notification = false;
    int insert_timeout_ms = 10000;
    int clipboard_timeout_ms = 5000;
};

struct Config {
    ApiConfig api;
    LanguageConfig languages;
    HotkeyConfig hotkey;
    AudioConfig audio;
    UiConfig ui;
    BehaviorConfig behavior;
    bool verbose = false;

    // Language sent with the request; empty lets the API detect it
    std::string language_hint() const {
        return languages.auto_detect ? std::string() : languages.primary;
    }
};

// ~/.config/wayvox/config.json (honours XDG_CONFIG_HOME)
std::string default_config_path();

// Load config from path. Writes defaults if the file does not exist.
// On parse errors the defaults are returned and error is filled in.
Config load_config(const std::string& path, std::string* error = nullptr);

bool save_config(const Config& config, const std::string& path);

// Serialization helpers (public for testing)
std::string config_to_json(const Config& config);
bool config_from_json(const std::string& text, Config& config, std::string* error = nullptr);

} // namespace wayvox
