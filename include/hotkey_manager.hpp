#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace wayvox {

// Low-level keyboard input. Implementations own their device handles.
class KeyboardDevices {
public:
    enum class ReadStatus {
        Ok,        // zero or more key-down codes were appended
        Timeout,   // nothing arrived within the timeout
        Error      // a device went away or a read failed
    };

    virtual ~KeyboardDevices() = default;

    // Open all keyboards. Returns the number of devices opened (0 = none found).
    virtual size_t open_devices() = 0;

    // Wait up to timeout_ms and append the key codes of every key-down event
    virtual ReadStatus read_key_downs(int timeout_ms, std::vector<uint32_t>& codes) = 0;

    virtual void close_devices() = 0;
};

// /dev/input/event* keyboards via libevdev
class EvdevKeyboards : public KeyboardDevices {
public:
    explicit EvdevKeyboards(std::string input_dir = "/dev/input");
    ~EvdevKeyboards() override;

    size_t open_devices() override;
    ReadStatus read_key_downs(int timeout_ms, std::vector<uint32_t>& codes) override;
    void close_devices() override;

private:
    struct Device;

    size_t scan(uint32_t required_key);

    std::string input_dir_;
    std::vector<std::unique_ptr<Device>> devices_;
};

// Turns key-down events of the trigger key into callback invocations on a
// listener thread. Device failures are logged and retried after a backoff;
// they never reach the callback. Once stopped it cannot be restarted.
class HotkeyManager {
public:
    using TriggerCallback = std::function<void()>;

    explicit HotkeyManager(std::unique_ptr<KeyboardDevices> devices = nullptr);
    ~HotkeyManager();

    HotkeyManager(const HotkeyManager&) = delete;
    HotkeyManager& operator=(const HotkeyManager&) = delete;

    void set_hotkey(uint32_t keycode) { keycode_ = keycode; }
    uint32_t hotkey() const { return keycode_; }

    void set_retry_backoff(int ms) { backoff_ms_ = ms; }
    void set_callback(TriggerCallback callback) { callback_ = std::move(callback); }

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Number of triggers delivered so far
    uint64_t trigger_count() const { return triggers_.load(); }

private:
    void run_loop();
    void wait_backoff();

    std::unique_ptr<KeyboardDevices> devices_;
    uint32_t keycode_ = 0;
    int backoff_ms_ = 1000;
    TriggerCallback callback_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> triggers_{0};
    std::thread listener_thread_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace wayvox
