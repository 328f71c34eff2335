#pragma once

#include "config.hpp"
#include "event_loop.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace wayvox {

enum class DisplayState {
    Hidden,
    Recording,
    Processing,
    Success,
    Error
};

const char* display_state_name(DisplayState state);

struct DisplaySnapshot {
    DisplayState state = DisplayState::Hidden;
    int seconds = 0;              // Recording
    bool capturing = false;       // Recording: false once capture ended on its own
    std::string text;             // Success preview or Error message
    bool auto_hide_pending = false;
};

// Presentation surface. render() is always called on the display loop thread.
class StatusRenderer {
public:
    virtual ~StatusRenderer() = default;
    virtual void render(const DisplaySnapshot& snapshot) = 0;
};

// Prints state changes to the console, optionally raising desktop
// notifications for finished dictations
class ConsoleRenderer : public StatusRenderer {
public:
    explicit ConsoleRenderer(bool notify = false, int notify_timeout_ms = 5000);
    void render(const DisplaySnapshot& snapshot) override;

private:
    void notify(const std::string& summary, const std::string& body);

    bool notify_;
    int notify_timeout_ms_;
    DisplayState last_state_ = DisplayState::Hidden;
    bool last_capturing_ = false;
};

// Status overlay state machine. All show_*() calls may come from any thread;
// they are marshalled onto the display loop.
class StatusDisplay {
public:
    StatusDisplay(EventLoop& loop, const UiConfig& config,
                  std::unique_ptr<StatusRenderer> renderer);
    ~StatusDisplay();

    StatusDisplay(const StatusDisplay&) = delete;
    StatusDisplay& operator=(const StatusDisplay&) = delete;

    void show_recording(int seconds);
    // Capture hit its length limit; keep showing Recording with the counter
    // frozen at seconds until the session is stopped
    void show_capture_ended(int seconds);
    void show_processing();
    void show_success(const std::string& text);
    void show_error(const std::string& message);
    void hide();

    DisplaySnapshot snapshot() const;

private:
    // Loop thread only
    void enter(DisplayState state, int seconds, const std::string& text);
    void start_tick();
    void stop_tick();
    void schedule_hide(int delay_ms);
    void cancel_hide();
    void publish();

    EventLoop& loop_;
    UiConfig config_;
    std::unique_ptr<StatusRenderer> renderer_;

    DisplaySnapshot current_;
    EventLoop::TimerId tick_timer_ = 0;
    EventLoop::TimerId hide_timer_ = 0;

    mutable std::mutex snapshot_mutex_;
    DisplaySnapshot published_;
};

} // namespace wayvox
