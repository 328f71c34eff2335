#pragma once

#include <string>

namespace wayvox {

// Puts text into the focused window / clipboard. Best effort, never throws.
class TextInjector {
public:
    virtual ~TextInjector() = default;

    virtual bool inject(const std::string& text) = 0;
    virtual bool copy_to_clipboard(const std::string& text) = 0;
};

// ydotool on Wayland, clipboard + XTest Ctrl+V on X11
class SystemTextInjector : public TextInjector {
public:
    SystemTextInjector(int insert_timeout_ms, int clipboard_timeout_ms);

    bool inject(const std::string& text) override;
    bool copy_to_clipboard(const std::string& text) override;

private:
    bool type_with_ydotool(const std::string& text);

    int insert_timeout_ms_;
    int clipboard_timeout_ms_;
};

} // namespace wayvox
