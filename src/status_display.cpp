#include "status_display.hpp"
#include "errors.hpp"
#include "process.hpp"
#include <iostream>

namespace wayvox {

const char* display_state_name(DisplayState state) {
    switch (state) {
        case DisplayState::Hidden: return "Hidden";
        case DisplayState::Recording: return "Recording";
        case DisplayState::Processing: return "Processing";
        case DisplayState::Success: return "Success";
        case DisplayState::Error: return "Error";
    }
    return "Unknown";
}

StatusDisplay::StatusDisplay(EventLoop& loop, const UiConfig& config,
                             std::unique_ptr<StatusRenderer> renderer)
    : loop_(loop)
    , config_(config)
    , renderer_(std::move(renderer)) {
    if (!renderer_) {
        renderer_ = std::make_unique<ConsoleRenderer>();
    }
}

StatusDisplay::~StatusDisplay() {
    // Pending timers capture this
    if (loop_.is_running() && !loop_.in_loop_thread()) {
        loop_.post([this]() {
            stop_tick();
            cancel_hide();
        });
        loop_.flush();
    }
}

void StatusDisplay::show_recording(int seconds) {
    loop_.post([this, seconds]() {
        cancel_hide();
        current_.state = DisplayState::Recording;
        current_.seconds = seconds;
        current_.capturing = true;
        current_.text.clear();
        if (tick_timer_ == 0) {
            start_tick();
        }
        publish();
    });
}

void StatusDisplay::show_capture_ended(int seconds) {
    loop_.post([this, seconds]() {
        enter(DisplayState::Recording, seconds, "");
        publish();
    });
}

void StatusDisplay::show_processing() {
    loop_.post([this]() {
        enter(DisplayState::Processing, 0, "");
        publish();
    });
}

void StatusDisplay::show_success(const std::string& text) {
    loop_.post([this, text]() {
        enter(DisplayState::Success, 0, truncate_message(text));
        schedule_hide(config_.success_hide_ms);
        publish();
    });
}

void StatusDisplay::show_error(const std::string& message) {
    loop_.post([this, message]() {
        enter(DisplayState::Error, 0, truncate_message(message));
        schedule_hide(config_.error_hide_ms);
        publish();
    });
}

void StatusDisplay::hide() {
    loop_.post([this]() {
        enter(DisplayState::Hidden, 0, "");
        publish();
    });
}

DisplaySnapshot StatusDisplay::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return published_;
}

void StatusDisplay::enter(DisplayState state, int seconds, const std::string& text) {
    stop_tick();
    cancel_hide();
    current_.state = state;
    current_.seconds = seconds;
    current_.capturing = false;
    current_.text = text;
}

void StatusDisplay::start_tick() {
    tick_timer_ = loop_.add_timeout(config_.tick_ms, [this]() {
        if (current_.state != DisplayState::Recording || !current_.capturing) {
            tick_timer_ = 0;
            return false;
        }
        ++current_.seconds;
        publish();
        return true;
    });
}

void StatusDisplay::stop_tick() {
    if (tick_timer_ != 0) {
        loop_.remove_timeout(tick_timer_);
        tick_timer_ = 0;
    }
}

void StatusDisplay::schedule_hide(int delay_ms) {
    cancel_hide();
    hide_timer_ = loop_.add_timeout(delay_ms, [this]() {
        hide_timer_ = 0;
        current_.state = DisplayState::Hidden;
        current_.seconds = 0;
        current_.capturing = false;
        current_.text.clear();
        publish();
        return false;
    });
}

void StatusDisplay::cancel_hide() {
    if (hide_timer_ != 0) {
        loop_.remove_timeout(hide_timer_);
        hide_timer_ = 0;
    }
}

void StatusDisplay::publish() {
    current_.auto_hide_pending = hide_timer_ != 0;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        published_ = current_;
    }
    renderer_->render(current_);
}

ConsoleRenderer::ConsoleRenderer(bool notify, int notify_timeout_ms)
    : notify_(notify)
    , notify_timeout_ms_(notify_timeout_ms) {
}

void ConsoleRenderer::render(const DisplaySnapshot& snapshot) {
    // Recording ticks every second; print only the start and the end of capture
    if (snapshot.state == last_state_ && snapshot.capturing == last_capturing_ &&
        snapshot.state == DisplayState::Recording) {
        return;
    }
    last_state_ = snapshot.state;
    last_capturing_ = snapshot.capturing;

    switch (snapshot.state) {
        case DisplayState::Hidden:
            std::cout << "[wayvox] Ready" << std::endl;
            break;
        case DisplayState::Recording:
            if (snapshot.capturing) {
                std::cout << "[wayvox] Recording " << snapshot.seconds << "s" << std::endl;
            } else {
                std::cout << "[wayvox] Recording limit reached (" << snapshot.seconds
                          << "s), press the hotkey to transcribe" << std::endl;
            }
            break;
        case DisplayState::Processing:
            std::cout << "[wayvox] Processing..." << std::endl;
            break;
        case DisplayState::Success:
            std::cout << "[wayvox] Done: " << snapshot.text << std::endl;
            if (notify_) notify("Dictation inserted", snapshot.text);
            break;
        case DisplayState::Error:
            std::cout << "[wayvox] Error: " << snapshot.text << std::endl;
            if (notify_) notify("Dictation failed", snapshot.text);
            break;
    }
}

void ConsoleRenderer::notify(const std::string& summary, const std::string& body) {
    if (!find_in_path("notify-send")) return;

    ProcessResult result = run_process({"notify-send", "-a", "wayvox", summary, body}, "", notify_timeout_ms_);
    if (!result.ok()) {
        std::cerr << "[display] notify-send failed" << std::endl;
    }
}

} // namespace wayvox
