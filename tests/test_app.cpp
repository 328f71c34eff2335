// Daemon state machine tests: full dictation cycles against fake devices

#include "app.hpp"
#include "errors.hpp"
#include "fakes.hpp"

#include <cassert>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <mutex>

using namespace wayvox;
using namespace wayvox::testing;

namespace {

Config test_config() {
    Config config;
    config.audio.chunk_size = 160;      // 10ms chunks
    config.audio.max_duration = 30;
    config.audio.min_duration = 0.5;
    config.ui.tick_ms = 50;
    config.ui.success_hide_ms = 10000;  // keep terminal states visible
    config.ui.error_hide_ms = 10000;
    return config;
}

struct Harness {
    std::shared_ptr<AudioStats> audio = std::make_shared<AudioStats>();
    std::shared_ptr<FakeTranscriber::Calls> calls = std::make_shared<FakeTranscriber::Calls>();
    std::shared_ptr<FakeInjector::Log> injected = std::make_shared<FakeInjector::Log>();
    std::shared_ptr<RecordingRenderer::Frames> frames = std::make_shared<RecordingRenderer::Frames>();

    FakeTranscriber* transcriber = nullptr;
    FakeInjector* injector = nullptr;
    App app;

    explicit Harness(TranscriptionResult result,
                     Config config = test_config(),
                     bool inject_ok = true,
                     bool fail_open = false) {
        Components components;
        components.audio = std::make_unique<AudioCapture>(
            config.audio, std::make_unique<FakeAudioSource>(audio, fail_open));

        auto fake_transcriber = std::make_unique<FakeTranscriber>(calls, std::move(result));
        transcriber = fake_transcriber.get();
        components.transcriber = std::move(fake_transcriber);

        auto fake_injector = std::make_unique<FakeInjector>(injected, inject_ok);
        injector = fake_injector.get();
        components.injector = std::move(fake_injector);

        components.renderer = std::make_unique<RecordingRenderer>(frames);

        bool ok = app.initialize(config, std::move(components));
        assert(ok);
    }

    DisplaySnapshot display() {
        app.ui_loop().flush();
        return app.display().snapshot();
    }

    int transcribe_calls() {
        std::lock_guard<std::mutex> lock(calls->mutex);
        return calls->count;
    }
};

bool file_exists(const std::string& path) {
    return std::filesystem::exists(path);
}

} // namespace

void test_successful_cycle() {
    std::cout << "Testing record -> transcribe -> insert cycle..." << std::endl;

    Harness h(TranscriptionResult::success("привет мир"));

    DaemonState during_transcribe = DaemonState::Idle;
    DaemonState during_inject = DaemonState::Idle;
    h.transcriber->on_call = [&]() { during_transcribe = h.app.state(); };
    h.injector->on_inject = [&]() { during_inject = h.app.state(); };

    h.app.on_hotkey();
    assert(h.app.state() == DaemonState::Recording);
    std::string path = h.app.session_path();
    assert(!path.empty() && file_exists(path));
    assert(h.display().state == DisplayState::Recording);

    sleep_ms(700);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    assert(h.transcribe_calls() == 1);
    assert(during_transcribe == DaemonState::Processing);
    assert(during_inject == DaemonState::Inserting);

    auto calls = h.injected->snapshot();
    assert(calls.size() == 2);
    assert(calls[0] == "inject:привет мир");
    assert(calls[1] == "copy:привет мир");

    DisplaySnapshot shown = h.display();
    assert(shown.state == DisplayState::Success);
    assert(shown.text == "привет мир");
    assert(shown.auto_hide_pending);

    assert(!file_exists(path));
    assert(h.app.session_path().empty());
    assert(h.app.state() == DaemonState::Idle);

    // Processing must have been shown between Recording and Success
    bool saw_processing = false;
    for (const auto& frame : h.frames->snapshot()) {
        if (frame.state == DisplayState::Processing) saw_processing = true;
    }
    assert(saw_processing);

    std::cout << "  PASS" << std::endl;
}

void test_short_recording_skips_api() {
    std::cout << "Testing recording shorter than minimum..." << std::endl;

    Harness h(TranscriptionResult::success("never used"));

    h.app.on_hotkey();
    std::string path = h.app.session_path();
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    assert(h.transcribe_calls() == 0);
    assert(h.injected->snapshot().empty());
    assert(h.app.state() == DaemonState::Idle);
    assert(!file_exists(path));

    DisplaySnapshot shown = h.display();
    assert(shown.state == DisplayState::Error);
    assert(shown.text == "Recording too short");

    std::cout << "  PASS" << std::endl;
}

void test_connection_failure() {
    std::cout << "Testing connection failure..." << std::endl;

    Harness h(TranscriptionResult::failure(ConnectionFailed{"Couldn't connect to server"}));

    h.app.on_hotkey();
    std::string path = h.app.session_path();
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    assert(h.transcribe_calls() == 1);
    assert(h.injected->snapshot().empty());
    assert(!file_exists(path));

    DisplaySnapshot shown = h.display();
    assert(shown.state == DisplayState::Error);
    assert(shown.text == "API connection failed. Check internet/proxy.");

    std::cout << "  PASS" << std::endl;
}

void test_api_error_message_truncated() {
    std::cout << "Testing API error message truncation..." << std::endl;

    std::string long_message(200, 'x');
    Harness h(TranscriptionResult::failure(ApiError{401, long_message}));

    h.app.on_hotkey();
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    DisplaySnapshot shown = h.display();
    assert(shown.state == DisplayState::Error);
    assert(shown.text.size() == MAX_UI_MESSAGE);
    assert(shown.text.rfind("API Error 401: ", 0) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_blank_text_is_an_error() {
    std::cout << "Testing whitespace-only transcription..." << std::endl;

    Harness h(TranscriptionResult::success("  \n\t "));

    h.app.on_hotkey();
    std::string path = h.app.session_path();
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    assert(h.injected->snapshot().empty());
    assert(!file_exists(path));
    DisplaySnapshot shown = h.display();
    assert(shown.state == DisplayState::Error);
    assert(shown.text == "Empty transcription received");

    std::cout << "  PASS" << std::endl;
}

void test_injection_failure() {
    std::cout << "Testing failed text injection..." << std::endl;

    Harness h(TranscriptionResult::success("hello"), test_config(), false);

    h.app.on_hotkey();
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    auto calls = h.injected->snapshot();
    assert(calls.size() == 2);
    assert(calls[0] == "inject:hello");
    assert(calls[1] == "copy:hello");

    DisplaySnapshot shown = h.display();
    assert(shown.state == DisplayState::Error);
    assert(shown.text == "Failed to insert text. Check ydotool.");
    assert(h.app.state() == DaemonState::Idle);

    std::cout << "  PASS" << std::endl;
}

void test_clipboard_only_mode() {
    std::cout << "Testing clipboard-only mode with fixed language..." << std::endl;

    Config config = test_config();
    config.behavior.auto_paste = false;
    config.languages.auto_detect = false;
    config.languages.primary = "ru";
    Harness h(TranscriptionResult::success("text"), config);

    h.app.on_hotkey();
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    auto calls = h.injected->snapshot();
    assert(calls.size() == 1);
    assert(calls[0] == "copy:text");
    {
        std::lock_guard<std::mutex> lock(h.calls->mutex);
        assert(h.calls->language == "ru");
    }
    assert(h.display().state == DisplayState::Success);

    std::cout << "  PASS" << std::endl;
}

void test_start_recording_is_idempotent() {
    std::cout << "Testing start_recording while already recording..." << std::endl;

    Harness h(TranscriptionResult::success("unused"));

    assert(h.app.start_recording());
    std::string path = h.app.session_path();
    assert(!h.app.start_recording());
    assert(h.app.session_path() == path);
    assert(h.audio->opens.load() == 1);

    // Synchronous stop right away: discarded as too short
    h.app.stop_and_transcribe();
    assert(h.app.state() == DaemonState::Idle);
    assert(!file_exists(path));
    assert(h.transcribe_calls() == 0);

    // Stop with nothing recording is a no-op
    h.app.stop_and_transcribe();
    assert(h.app.state() == DaemonState::Idle);

    std::cout << "  PASS" << std::endl;
}

void test_trigger_dropped_while_processing() {
    std::cout << "Testing triggers during processing are dropped..." << std::endl;

    Harness h(TranscriptionResult::success("done"));

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool entered = false;
    bool released = false;
    h.transcriber->on_call = [&]() {
        std::unique_lock<std::mutex> lock(gate_mutex);
        entered = true;
        gate_cv.notify_all();
        gate_cv.wait(lock, [&]() { return released; });
    };

    h.app.on_hotkey();
    sleep_ms(600);
    h.app.on_hotkey();

    {
        std::unique_lock<std::mutex> lock(gate_mutex);
        bool ok = gate_cv.wait_for(lock, std::chrono::seconds(5), [&]() { return entered; });
        assert(ok);
    }

    assert(h.app.state() == DaemonState::Processing);
    h.app.on_hotkey();
    h.app.on_hotkey();
    assert(h.app.state() == DaemonState::Processing);
    assert(h.audio->opens.load() == 1);

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        released = true;
    }
    gate_cv.notify_all();
    assert(h.app.wait_idle(5000));

    // Nothing was queued: the daemon is idle and the next trigger starts fresh
    sleep_ms(100);
    assert(h.app.state() == DaemonState::Idle);
    assert(h.transcribe_calls() == 1);

    h.app.on_hotkey();
    assert(h.app.state() == DaemonState::Recording);
    assert(h.audio->opens.load() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_trigger_dropped_while_inserting() {
    std::cout << "Testing triggers during insertion are dropped..." << std::endl;

    Harness h(TranscriptionResult::success("typed"));

    DaemonState before = DaemonState::Idle;
    DaemonState after = DaemonState::Idle;
    std::string session_during_insert = "unset";
    h.injector->on_inject = [&]() {
        before = h.app.state();
        h.app.on_hotkey();
        h.app.on_hotkey();
        after = h.app.state();
        session_during_insert = h.app.session_path();
    };

    h.app.on_hotkey();
    std::string path = h.app.session_path();
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    assert(before == DaemonState::Inserting);
    assert(after == DaemonState::Inserting);
    assert(session_during_insert == path);
    assert(h.audio->opens.load() == 1);

    // Nothing was queued behind the insertion
    sleep_ms(100);
    assert(h.app.state() == DaemonState::Idle);
    assert(h.app.session_path().empty());
    assert(h.audio->opens.load() == 1);
    assert(h.transcribe_calls() == 1);
    assert(h.display().state == DisplayState::Success);

    std::cout << "  PASS" << std::endl;
}

void test_unicode_blank_text_is_an_error() {
    std::cout << "Testing transcription of only Unicode spaces..." << std::endl;

    Harness h(TranscriptionResult::success("\u00a0\u3000\u00a0"));

    h.app.on_hotkey();
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    assert(h.injected->snapshot().empty());
    assert(h.display().text == "Empty transcription received");

    std::cout << "  PASS" << std::endl;
}

void test_refresh_timer_owned_by_session() {
    std::cout << "Testing recording refresh timer per session..." << std::endl;

    Harness h(TranscriptionResult::success("first"));

    h.app.on_hotkey();
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    // New session right away, before the old refresh could notice
    h.app.on_hotkey();
    assert(h.app.state() == DaemonState::Recording);
    h.app.ui_loop().flush();

    // Display counter tick plus exactly one refresh timer
    assert(h.app.ui_loop().timer_count() == 2);

    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));
    h.app.ui_loop().flush();
    // Only the Error auto-hide remains
    assert(h.app.ui_loop().timer_count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_max_duration_self_stop() {
    std::cout << "Testing capture stops itself at max duration..." << std::endl;

    Config config = test_config();
    config.audio.max_duration = 1;
    Harness h(TranscriptionResult::success("long"), config);

    h.app.on_hotkey();
    std::string path = h.app.session_path();
    sleep_ms(1400);

    // Capture ended on its own but the session waits for the next trigger
    assert(h.app.state() == DaemonState::Recording);
    assert(file_exists(path));

    // The counter is frozen at the captured length
    assert(wait_until([&]() { return !h.display().capturing; }, 2000));
    DisplaySnapshot frozen = h.display();
    assert(frozen.state == DisplayState::Recording);
    assert(frozen.seconds == 1);
    sleep_ms(300);
    assert(h.display().seconds == 1);

    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    assert(h.transcribe_calls() == 1);
    {
        std::lock_guard<std::mutex> lock(h.calls->mutex);
        // About one second of 16-bit mono audio plus the header
        assert(h.calls->audio_bytes > 44 + 20000);
        assert(h.calls->audio_bytes < 44 + 40000);
    }
    assert(!file_exists(path));
    assert(h.display().state == DisplayState::Success);

    std::cout << "  PASS" << std::endl;
}

void test_device_unavailable() {
    std::cout << "Testing missing microphone..." << std::endl;

    Harness h(TranscriptionResult::success("unused"), test_config(), true, true);

    h.app.on_hotkey();
    assert(h.app.state() == DaemonState::Idle);
    assert(h.app.session_path().empty());

    DisplaySnapshot shown = h.display();
    assert(shown.state == DisplayState::Error);
    assert(shown.text == error_message(ErrorKind::DeviceUnavailable));

    std::cout << "  PASS" << std::endl;
}

void test_exception_still_cleans_up() {
    std::cout << "Testing unexpected exception during transcription..." << std::endl;

    Harness h(TranscriptionResult::success("unused"));
    h.transcriber->throw_on_call = true;

    h.app.on_hotkey();
    std::string path = h.app.session_path();
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));

    assert(!file_exists(path));
    DisplaySnapshot shown = h.display();
    assert(shown.state == DisplayState::Error);
    assert(shown.text == "Error: boom");

    // The next cycle starts cleanly
    h.transcriber->throw_on_call = false;
    h.app.on_hotkey();
    assert(h.app.state() == DaemonState::Recording);
    sleep_ms(600);
    h.app.on_hotkey();
    assert(h.app.wait_idle(5000));
    assert(h.display().state == DisplayState::Success);

    std::cout << "  PASS" << std::endl;
}

void test_shutdown_is_idempotent() {
    std::cout << "Testing shutdown during recording..." << std::endl;

    Harness h(TranscriptionResult::success("unused"));

    h.app.on_hotkey();
    std::string path = h.app.session_path();
    assert(file_exists(path));

    h.app.shutdown();
    assert(h.app.state() == DaemonState::Idle);
    assert(!file_exists(path));
    assert(h.audio->closes.load() == 1);
    assert(h.audio->shut_down.load());

    h.app.shutdown();
    assert(h.app.state() == DaemonState::Idle);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Daemon Test Suite ===" << std::endl << std::endl;

    test_successful_cycle();
    test_short_recording_skips_api();
    test_connection_failure();
    test_api_error_message_truncated();
    test_blank_text_is_an_error();
    test_injection_failure();
    test_clipboard_only_mode();
    test_start_recording_is_idempotent();
    test_trigger_dropped_while_processing();
    test_trigger_dropped_while_inserting();
    test_unicode_blank_text_is_an_error();
    test_refresh_timer_owned_by_session();
    test_max_duration_self_stop();
    test_device_unavailable();
    test_exception_still_cleans_up();
    test_shutdown_is_idempotent();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
