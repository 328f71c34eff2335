#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace wayvox {

using json = nlohmann::json;

namespace {

// Read key into value if present; unknown keys are ignored
template <typename T>
void read_field(const json& object, const char* key, T& value) {
    auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        value = it->get<T>();
    }
}

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) return empty;
    return *it;
}

} // namespace

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/wayvox/config.json";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "config.json";
    return std::string(home) + "/.config/wayvox/config.json";
}

std::string config_to_json(const Config& config) {
    json root;
    root["api"] = {
        {"key", config.api.key},
        {"model", config.api.model},
        {"endpoint", config.api.endpoint},
        {"proxy", config.api.proxy},
        {"timeout_seconds", config.api.timeout_seconds},
    };
    root["languages"] = {
        {"auto_detect", config.languages.auto_detect},
        {"preferred", config.languages.preferred},
        {"primary", config.languages.primary},
    };
    root["hotkey"] = {
        {"keycode", config.hotkey.keycode},
        {"retry_backoff_ms", config.hotkey.retry_backoff_ms},
    };
    root["audio"] = {
        {"sample_rate", config.audio.sample_rate},
        {"channels", config.audio.channels},
        {"chunk_size", config.audio.chunk_size},
        {"max_duration", config.audio.max_duration},
        {"min_duration", config.audio.min_duration},
    };
    root["ui"] = {
        {"theme", config.ui.theme},
        {"position", config.ui.position},
        {"success_hide_ms", config.ui.success_hide_ms},
        {"error_hide_ms", config.ui.error_hide_ms},
        {"tick_ms", config.ui.tick_ms},
    };
    root["behavior"] = {
        {"auto_paste", config.behavior.auto_paste},
        {"copy_to_clipboard", config.behavior.copy_to_clipboard},
        {"show_notification", config.behavior.show_notification},
        {"insert_timeout_ms", config.behavior.insert_timeout_ms},
        {"clipboard_timeout_ms", config.behavior.clipboard_timeout_ms},
    };
    return root.dump(2);
}

bool config_from_json(const std::string& text, Config& config, std::string* error) {
    Config parsed;
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            if (error) *error = "top level is not an object";
            return false;
        }

        const json& api = section(root, "api");
        read_field(api, "key", parsed.api.key);
        read_field(api, "model", parsed.api.model);
        read_field(api, "endpoint", parsed.api.endpoint);
        read_field(api, "proxy", parsed.api.proxy);
        read_field(api, "timeout_seconds", parsed.api.timeout_seconds);

        const json& languages = section(root, "languages");
        read_field(languages, "auto_detect", parsed.languages.auto_detect);
        read_field(languages, "preferred", parsed.languages.preferred);
        read_field(languages, "primary", parsed.languages.primary);

        const json& hotkey = section(root, "hotkey");
        read_field(hotkey, "keycode", parsed.hotkey.keycode);
        read_field(hotkey, "retry_backoff_ms", parsed.hotkey.retry_backoff_ms);

        const json& audio = section(root, "audio");
        read_field(audio, "sample_rate", parsed.audio.sample_rate);
        read_field(audio, "channels", parsed.audio.channels);
        read_field(audio, "chunk_size", parsed.audio.chunk_size);
        read_field(audio, "max_duration", parsed.audio.max_duration);
        read_field(audio, "min_duration", parsed.audio.min_duration);

        const json& ui = section(root, "ui");
        read_field(ui, "theme", parsed.ui.theme);
        read_field(ui, "position", parsed.ui.position);
        read_field(ui, "success_hide_ms", parsed.ui.success_hide_ms);
        read_field(ui, "error_hide_ms", parsed.ui.error_hide_ms);
        read_field(ui, "tick_ms", parsed.ui.tick_ms);

        const json& behavior = section(root, "behavior");
        read_field(behavior, "auto_paste", parsed.behavior.auto_paste);
        read_field(behavior, "copy_to_clipboard", parsed.behavior.copy_to_clipboard);
        read_field(behavior, "show_notification", parsed.behavior.show_notification);
        read_field(behavior, "insert_timeout_ms", parsed.behavior.insert_timeout_ms);
        read_field(behavior, "clipboard_timeout_ms", parsed.behavior.clipboard_timeout_ms);
    } catch (const json::exception& e) {
        if (error) *error = e.what();
        return false;
    }

    config = parsed;
    return true;
}

Config load_config(const std::string& path, std::string* error) {
    Config config;

    if (!std::filesystem::exists(path)) {
        // First run: leave a file with defaults for the user to edit
        if (save_config(config, path)) {
            std::cout << "[config] Wrote default config to " << path << std::endl;
        }
        return config;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) *error = "cannot open " + path;
        return config;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string parse_error;
    if (!config_from_json(buffer.str(), config, &parse_error)) {
        if (error) *error = path + ": " + parse_error;
        return Config();
    }
    return config;
}

bool save_config(const Config& config, const std::string& path) {
    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            std::cerr << "[config] Cannot create " << p.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[config] Cannot write " << path << std::endl;
        return false;
    }
    file << config_to_json(config) << "\n";
    return file.good();
}

} // namespace wayvox
