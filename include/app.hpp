#pragma once

#include "config.hpp"
#include "audio_capture.hpp"
#include "transcriber.hpp"
#include "hotkey_manager.hpp"
#include "text_injector.hpp"
#include "status_display.hpp"
#include "event_loop.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace wayvox {

enum class DaemonState {
    Idle,
    Recording,
    Processing,
    Inserting
};

const char* daemon_state_name(DaemonState state);

// One microphone capture backed by one temporary WAV file
struct RecordingSession {
    uint64_t id = 0;
    std::string path;
};

// Collaborators the daemon drives. Anything left null is created from the
// config in initialize().
struct Components {
    std::unique_ptr<AudioCapture> audio;
    std::unique_ptr<Transcriber> transcriber;
    std::unique_ptr<TextInjector> injector;
    std::unique_ptr<HotkeyManager> hotkey;
    std::unique_ptr<StatusRenderer> renderer;
};

class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    bool initialize(const Config& config, Components components = Components());

    // Stop hotkeys, abandon any capture, delete the temp file and release
    // devices. Safe to call more than once.
    void shutdown();

    // Run until quit() (blocking)
    int run();
    void quit() { should_quit_.store(true); }

    DaemonState state() const;

    // Hotkey entry point. Never blocks on capture or network work.
    void on_hotkey();

    // Open a new session and start capturing. No-op (returns false) unless Idle.
    bool start_recording();

    // Stop capture and run transcribe -> insert on the calling thread.
    // Always ends in Idle with the session's temp file removed.
    void stop_and_transcribe();

    // Wait until the daemon is Idle with no stop queued
    bool wait_idle(int timeout_ms);

    // Path of the live session's file, empty when not recording
    std::string session_path() const;

    StatusDisplay& display() { return *display_; }
    EventLoop& ui_loop() { return ui_loop_; }

private:
    bool start_recording_locked();
    void insert_transcription(const std::string& text);
    void report_error(const std::string& message);
    void set_state(DaemonState state);
    void finish_cycle();
    void cancel_refresh_locked();
    std::string make_session_path() const;

    Config config_;
    std::unique_ptr<AudioCapture> audio_;
    std::unique_ptr<Transcriber> transcriber_;
    std::unique_ptr<TextInjector> injector_;
    std::unique_ptr<HotkeyManager> hotkey_;

    EventLoop ui_loop_{"display"};
    EventLoop worker_{"daemon"};
    std::unique_ptr<StatusDisplay> display_;

    mutable std::mutex state_mutex_;
    std::condition_variable idle_cv_;
    DaemonState state_ = DaemonState::Idle;
    std::optional<RecordingSession> session_;
    bool stop_pending_ = false;
    uint64_t next_session_id_ = 1;
    EventLoop::TimerId refresh_timer_ = 0;

    std::atomic<bool> should_quit_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shut_down_{false};
};

} // namespace wayvox
