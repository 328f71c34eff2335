#include "hotkey_manager.hpp"
#include <chrono>
#include <exception>
#include <iostream>

namespace wayvox {

// How long a single device poll may block before re-checking running_
static constexpr int POLL_TIMEOUT_MS = 100;

HotkeyManager::HotkeyManager(std::unique_ptr<KeyboardDevices> devices)
    : devices_(std::move(devices)) {
    if (!devices_) {
        devices_ = std::make_unique<EvdevKeyboards>();
    }
}

HotkeyManager::~HotkeyManager() {
    stop();
}

bool HotkeyManager::start() {
    if (running_.load()) return true;
    if (stopped_.load()) {
        std::cerr << "[hotkey] Listener was stopped and cannot be restarted" << std::endl;
        return false;
    }

    running_.store(true);

    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    return true;
}

void HotkeyManager::stop() {
    stopped_.store(true);
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_.store(false);
    }
    wait_cv_.notify_all();

    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
}

void HotkeyManager::wait_backoff() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(backoff_ms_),
                      [this]() { return !running_.load(); });
}

void HotkeyManager::run_loop() {
    std::vector<uint32_t> codes;

    while (running_.load()) {
        size_t count = devices_->open_devices();
        if (count == 0) {
            std::cerr << "[hotkey] No input devices found. "
                      << "Add user to 'input' group: sudo usermod -aG input $USER" << std::endl;
            wait_backoff();
            continue;
        }
        std::cout << "[hotkey] Monitoring " << count << " device(s) for key " << keycode_ << std::endl;

        while (running_.load()) {
            codes.clear();
            auto status = devices_->read_key_downs(POLL_TIMEOUT_MS, codes);

            for (uint32_t code : codes) {
                if (code != keycode_ || !running_.load()) continue;
                triggers_.fetch_add(1);
                if (!callback_) continue;
                try {
                    callback_();
                } catch (const std::exception& e) {
                    std::cerr << "[hotkey] Trigger handler failed: " << e.what() << std::endl;
                }
            }

            if (status == KeyboardDevices::ReadStatus::Error) {
                std::cerr << "[hotkey] Error reading device, rescanning" << std::endl;
                break;
            }
        }

        devices_->close_devices();
        if (running_.load()) {
            wait_backoff();
        }
    }

    devices_->close_devices();
}

} // namespace wayvox
