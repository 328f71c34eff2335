#pragma once

#include <string>

namespace wayvox {

class Clipboard {
public:
    // Set text to clipboard (wl-copy, xclip or xsel)
    static bool set_text(const std::string& text, int timeout_ms);

    // Paste clipboard content by synthesizing Ctrl+V on the X display
    static bool paste();
};

} // namespace wayvox
