#include "clipboard.hpp"
#include "process.hpp"
#include <iostream>
#include <cstdlib>

#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace wayvox {

bool Clipboard::set_text(const std::string& text, int timeout_ms) {
    if (text.empty()) return false;

    // Wayland first, then the X11 tools
    const std::vector<std::vector<std::string>> tools = {
        {"wl-copy"},
        {"xclip", "-selection", "clipboard"},
        {"xsel", "--clipboard", "--input"},
    };

    for (const auto& cmd : tools) {
        if (!find_in_path(cmd[0])) continue;

        ProcessResult result = run_process(cmd, text, timeout_ms);
        if (result.ok()) return true;
        std::cerr << "[insert] " << cmd[0] << " failed (exit " << result.exit_code << ")" << std::endl;
    }

    std::cerr << "[insert] Failed to set clipboard. Install wl-clipboard, xclip or xsel." << std::endl;
    return false;
}

bool Clipboard::paste() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "[insert] Failed to open X display" << std::endl;
        return false;
    }

    // Simulate Ctrl+V
    KeyCode ctrl_keycode = XKeysymToKeycode(display, XK_Control_L);
    KeyCode v_keycode = XKeysymToKeycode(display, XK_v);

    if (ctrl_keycode == 0 || v_keycode == 0) {
        std::cerr << "[insert] Failed to get keycodes" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    bool ok = XTestFakeKeyEvent(display, ctrl_keycode, True, 0) &&
              XTestFakeKeyEvent(display, v_keycode, True, 0) &&
              XTestFakeKeyEvent(display, v_keycode, False, 0);
    // Always release Ctrl so it does not stay stuck
    ok = XTestFakeKeyEvent(display, ctrl_keycode, False, 0) && ok;
    XFlush(display);

    XCloseDisplay(display);
    return ok;
}

} // namespace wayvox
