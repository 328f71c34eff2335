#include "app.hpp"
#include "errors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <thread>

namespace wayvox {

namespace {

std::string random_hex(size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);

    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(digits[dist(gen)]);
    }
    return out;
}

bool read_file(const std::string& path, std::vector<char>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

ErrorKind classify(const TranscriptionError& error) {
    return std::visit(overloaded{
        [](const ConnectionFailed&) { return ErrorKind::ConnectionFailure; },
        [](const ApiError&) { return ErrorKind::ApiError; },
        [](const OtherError&) { return ErrorKind::Unexpected; },
    }, error);
}

} // namespace

const char* daemon_state_name(DaemonState state) {
    switch (state) {
        case DaemonState::Idle: return "Idle";
        case DaemonState::Recording: return "Recording";
        case DaemonState::Processing: return "Processing";
        case DaemonState::Inserting: return "Inserting";
    }
    return "Unknown";
}

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const Config& config, Components components) {
    if (initialized_.load()) return true;
    config_ = config;

    audio_ = std::move(components.audio);
    if (!audio_) {
        audio_ = std::make_unique<AudioCapture>(config_.audio);
    }
    std::cout << "[daemon] Audio capture initialized ("
              << config_.audio.sample_rate << " Hz, max " << config_.audio.max_duration << "s)" << std::endl;

    transcriber_ = std::move(components.transcriber);
    if (!transcriber_) {
        auto http = std::make_unique<HttpTranscriber>(config_.api);
        if (!http->has_key()) {
            std::cerr << "[daemon] API key not configured! Edit " << default_config_path()
                      << " or set WAYVOX_API_KEY" << std::endl;
        }
        transcriber_ = std::move(http);
    }

    injector_ = std::move(components.injector);
    if (!injector_) {
        injector_ = std::make_unique<SystemTextInjector>(config_.behavior.insert_timeout_ms,
                                                         config_.behavior.clipboard_timeout_ms);
    }

    hotkey_ = std::move(components.hotkey);
    if (!hotkey_) {
        hotkey_ = std::make_unique<HotkeyManager>();
    }
    hotkey_->set_hotkey(config_.hotkey.keycode);
    hotkey_->set_retry_backoff(config_.hotkey.retry_backoff_ms);
    hotkey_->set_callback([this]() { on_hotkey(); });

    auto renderer = std::move(components.renderer);
    if (!renderer) {
        renderer = std::make_unique<ConsoleRenderer>(config_.behavior.show_notification);
    }
    display_ = std::make_unique<StatusDisplay>(ui_loop_, config_.ui, std::move(renderer));

    ui_loop_.start();
    worker_.start();

    state_ = DaemonState::Idle;
    initialized_.store(true);
    return true;
}

void App::shutdown() {
    if (!initialized_.load() || shut_down_.exchange(true)) return;

    should_quit_.store(true);

    if (hotkey_) {
        hotkey_->stop();
    }

    // Lets an in-flight transcription finish; a queued stop is dropped
    worker_.stop();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session_) {
            std::cout << "[daemon] Abandoning recording in progress" << std::endl;
            if (audio_->is_open()) {
                audio_->stop();
            }
            std::error_code ec;
            std::filesystem::remove(session_->path, ec);
            session_.reset();
        }
        cancel_refresh_locked();
        state_ = DaemonState::Idle;
        stop_pending_ = false;
    }
    idle_cv_.notify_all();

    if (audio_) {
        audio_->release();
    }

    ui_loop_.stop();
    std::cout << "[daemon] Cleanup complete" << std::endl;
}

int App::run() {
    if (!hotkey_->start()) {
        std::cerr << "[daemon] Failed to start hotkey listener" << std::endl;
        return 1;
    }

    std::cout << "\n=== WayVox Ready ===" << std::endl;
    std::cout << "Press the hotkey to start recording, press it again to transcribe and insert.\n" << std::endl;

    while (!should_quit_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return 0;
}

DaemonState App::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string App::session_path() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_ ? session_->path : std::string();
}

void App::on_hotkey() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    switch (state_) {
        case DaemonState::Idle:
            start_recording_locked();
            break;
        case DaemonState::Recording:
            if (stop_pending_) {
                if (config_.verbose) std::cout << "[daemon] Stop already queued, trigger ignored" << std::endl;
                break;
            }
            stop_pending_ = true;
            worker_.post([this]() { stop_and_transcribe(); });
            break;
        case DaemonState::Processing:
        case DaemonState::Inserting:
            // Dropped, not queued
            if (config_.verbose) {
                std::cout << "[daemon] Trigger ignored while " << daemon_state_name(state_) << std::endl;
            }
            break;
    }
}

bool App::start_recording() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return start_recording_locked();
}

bool App::start_recording_locked() {
    if (state_ != DaemonState::Idle) {
        std::cerr << "[daemon] Cannot start recording while " << daemon_state_name(state_) << std::endl;
        return false;
    }

    std::string path = make_session_path();
    if (!audio_->start(path)) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        std::cerr << "[daemon] " << error_kind_name(ErrorKind::DeviceUnavailable) << ": could not start capture" << std::endl;
        display_->show_error(error_message(ErrorKind::DeviceUnavailable));
        return false;
    }

    const uint64_t session_id = next_session_id_++;
    session_ = RecordingSession{session_id, path};
    state_ = DaemonState::Recording;
    stop_pending_ = false;
    display_->show_recording(0);

    // Resync the counter with the real capture clock every tick. The timer
    // belongs to this session only.
    cancel_refresh_locked();
    refresh_timer_ = ui_loop_.add_timeout(config_.ui.tick_ms, [this, session_id]() {
        std::lock_guard<std::mutex> guard(state_mutex_);
        if (state_ != DaemonState::Recording || !session_ || session_->id != session_id) {
            return false;
        }
        if (!audio_->is_active()) {
            // Capture stopped itself at max duration; freeze the counter
            display_->show_capture_ended(static_cast<int>(audio_->duration()));
            refresh_timer_ = 0;
            return false;
        }
        display_->show_recording(static_cast<int>(audio_->elapsed()));
        return true;
    });

    std::cout << "[daemon] Recording started" << std::endl;
    return true;
}

void App::stop_and_transcribe() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != DaemonState::Recording || !session_) {
            std::cerr << "[daemon] Stop requested while " << daemon_state_name(state_) << ", ignoring" << std::endl;
            stop_pending_ = false;
            idle_cv_.notify_all();
            return;
        }
    }

    // Runs on every way out of this function
    struct CycleGuard {
        App* app;
        ~CycleGuard() { app->finish_cycle(); }
    } guard{this};

    try {
        bool file_ok = false;
        double duration = audio_->stop(&file_ok);
        std::cout << "[daemon] Recording stopped, duration: " << duration << "s" << std::endl;

        if (duration < config_.audio.min_duration) {
            std::cerr << "[daemon] Recording too short, discarding" << std::endl;
            report_error(error_message(ErrorKind::RecordingTooShort));
            return;
        }
        if (!file_ok) {
            throw std::runtime_error("could not save recording");
        }

        std::string path;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            path = session_->path;
        }
        set_state(DaemonState::Processing);
        display_->show_processing();

        std::vector<char> audio;
        if (!read_file(path, audio)) {
            throw std::runtime_error("cannot read " + path);
        }

        TranscriptionResult result = transcriber_->transcribe(audio, config_.language_hint());
        if (!result.ok()) {
            const TranscriptionError& error = result.error();
            std::cerr << "[daemon] Transcription failed (" << error_kind_name(classify(error))
                      << "): " << describe(error) << std::endl;
            report_error(describe(error));
            return;
        }

        const std::string& text = result.text();
        if (is_blank(text)) {
            std::cerr << "[daemon] " << error_kind_name(ErrorKind::EmptyResult) << std::endl;
            report_error(error_message(ErrorKind::EmptyResult));
            return;
        }
        std::cout << "[daemon] Transcription: " << truncate_message(text) << "..." << std::endl;

        set_state(DaemonState::Inserting);
        insert_transcription(text);
    } catch (const std::exception& e) {
        std::cerr << "[daemon] Unexpected error: " << e.what() << std::endl;
        report_error(std::string("Error: ") + e.what());
    }
}

void App::insert_transcription(const std::string& text) {
    bool inserted = false;
    bool copied = false;

    if (config_.behavior.auto_paste) {
        inserted = injector_->inject(text);
    }
    if (config_.behavior.copy_to_clipboard) {
        copied = injector_->copy_to_clipboard(text);
        if (!copied) std::cerr << "[daemon] Clipboard copy failed" << std::endl;
    }

    bool success = config_.behavior.auto_paste ? inserted : copied;
    if (success) {
        display_->show_success(text);
        std::cout << "[daemon] Text inserted successfully" << std::endl;
    } else {
        std::cerr << "[daemon] " << error_kind_name(ErrorKind::InjectionFailed) << std::endl;
        report_error(error_message(ErrorKind::InjectionFailed));
    }
}

void App::report_error(const std::string& message) {
    display_->show_error(truncate_message(message));
}

void App::set_state(DaemonState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
}

void App::finish_cycle() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (audio_->is_open()) {
            audio_->stop();
        }
        if (session_) {
            std::error_code ec;
            if (!std::filesystem::remove(session_->path, ec) && ec) {
                std::cerr << "[daemon] Failed to delete temp file: " << ec.message() << std::endl;
            }
            session_.reset();
        }
        cancel_refresh_locked();
        state_ = DaemonState::Idle;
        stop_pending_ = false;
    }
    idle_cv_.notify_all();
}

void App::cancel_refresh_locked() {
    if (refresh_timer_ != 0) {
        ui_loop_.remove_timeout(refresh_timer_);
        refresh_timer_ = 0;
    }
}

bool App::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return state_ == DaemonState::Idle && !stop_pending_;
    });
}

std::string App::make_session_path() const {
    std::filesystem::path dir = std::filesystem::temp_directory_path();
    return (dir / ("wayvox_" + random_hex(32) + ".wav")).string();
}

} // namespace wayvox
