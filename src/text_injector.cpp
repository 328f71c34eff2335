#include "text_injector.hpp"
#include "clipboard.hpp"
#include "process.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace wayvox {

SystemTextInjector::SystemTextInjector(int insert_timeout_ms, int clipboard_timeout_ms)
    : insert_timeout_ms_(insert_timeout_ms)
    , clipboard_timeout_ms_(clipboard_timeout_ms) {
}

bool SystemTextInjector::type_with_ydotool(const std::string& text) {
    if (!find_in_path("ydotool")) {
        std::cerr << "[insert] ydotool not found. Install with: sudo apt install ydotool" << std::endl;
        return false;
    }

    ProcessResult result = run_process({"ydotool", "type", "--", text}, "", insert_timeout_ms_);
    if (!result.ok()) {
        std::cerr << "[insert] ydotool failed"
                  << (result.timed_out ? " (timed out)" : "") << std::endl;
        return false;
    }
    return true;
}

bool SystemTextInjector::inject(const std::string& text) {
    if (text.empty()) {
        std::cerr << "[insert] Empty text, nothing to insert" << std::endl;
        return false;
    }

    bool ok = false;
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    if (wayland && *wayland) {
        ok = type_with_ydotool(text);
    } else if (Clipboard::set_text(text, clipboard_timeout_ms_)) {
        // Delay to ensure clipboard is fully set before pasting
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ok = Clipboard::paste();
    }

    if (ok) {
        std::cout << "[insert] Inserted " << text.size() << " bytes" << std::endl;
    }
    return ok;
}

bool SystemTextInjector::copy_to_clipboard(const std::string& text) {
    return Clipboard::set_text(text, clipboard_timeout_ms_);
}

} // namespace wayvox
