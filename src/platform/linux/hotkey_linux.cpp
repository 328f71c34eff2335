#include "hotkey_manager.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <fcntl.h>
#include <unistd.h>
#include <poll.h>
#include <linux/input.h>
#include <libevdev/libevdev.h>

namespace wayvox {

struct EvdevKeyboards::Device {
    int fd = -1;
    struct libevdev* dev = nullptr;
    std::string path;

    ~Device() {
        if (dev) libevdev_free(dev);
        if (fd >= 0) close(fd);
    }
};

EvdevKeyboards::EvdevKeyboards(std::string input_dir)
    : input_dir_(std::move(input_dir)) {
}

EvdevKeyboards::~EvdevKeyboards() {
    close_devices();
}

size_t EvdevKeyboards::scan(uint32_t required_key) {
    std::vector<std::string> paths;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(input_dir_, ec)) {
        std::string name = entry.path().filename().string();
        if (name.rfind("event", 0) == 0) {
            paths.push_back(entry.path().string());
        }
    }
    if (ec) {
        std::cerr << "[hotkey] Cannot list " << input_dir_ << ": " << ec.message() << std::endl;
        return 0;
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) {
            // Usually EACCES when the user is not in the input group
            continue;
        }

        auto device = std::make_unique<Device>();
        device->fd = fd;
        device->path = path;

        int rc = libevdev_new_from_fd(fd, &device->dev);
        if (rc < 0) {
            device->dev = nullptr;
            continue;
        }

        // Check if it's a keyboard
        if (libevdev_has_event_type(device->dev, EV_KEY) &&
            libevdev_has_event_code(device->dev, EV_KEY, required_key)) {
            std::cout << "[hotkey] Using keyboard: " << libevdev_get_name(device->dev)
                      << " (" << path << ")" << std::endl;
            devices_.push_back(std::move(device));
        }
    }
    return devices_.size();
}

size_t EvdevKeyboards::open_devices() {
    close_devices();

    // Full keyboards expose the function key row
    if (scan(KEY_F9) > 0) return devices_.size();

    std::cerr << "[hotkey] No standard keyboards found. Checking all input devices." << std::endl;
    return scan(KEY_A);
}

KeyboardDevices::ReadStatus EvdevKeyboards::read_key_downs(int timeout_ms, std::vector<uint32_t>& codes) {
    if (devices_.empty()) return ReadStatus::Error;

    std::vector<struct pollfd> fds(devices_.size());
    for (size_t i = 0; i < devices_.size(); ++i) {
        fds[i].fd = devices_[i]->fd;
        fds[i].events = POLLIN;
        fds[i].revents = 0;
    }

    int ret = poll(fds.data(), fds.size(), timeout_ms);
    if (ret == 0) return ReadStatus::Timeout;
    if (ret < 0) {
        if (errno == EINTR) return ReadStatus::Timeout;
        std::cerr << "[hotkey] poll failed: " << std::strerror(errno) << std::endl;
        return ReadStatus::Error;
    }

    ReadStatus status = ReadStatus::Ok;
    for (size_t i = 0; i < devices_.size(); ++i) {
        if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            std::cerr << "[hotkey] Device disconnected: " << devices_[i]->path << std::endl;
            status = ReadStatus::Error;
            continue;
        }
        if (!(fds[i].revents & POLLIN)) continue;

        struct input_event ev;
        int rc;
        do {
            rc = libevdev_next_event(devices_[i]->dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                // Dropped events: drain the sync queue, the key state is rebuilt from it
                while (rc == LIBEVDEV_READ_STATUS_SYNC) {
                    rc = libevdev_next_event(devices_[i]->dev, LIBEVDEV_READ_FLAG_SYNC, &ev);
                }
                continue;
            }
            // value 1 = key down, 2 = autorepeat, 0 = release
            if (rc == LIBEVDEV_READ_STATUS_SUCCESS && ev.type == EV_KEY && ev.value == 1) {
                codes.push_back(ev.code);
            }
        } while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC);

        if (rc != -EAGAIN) {
            std::cerr << "[hotkey] Error reading " << devices_[i]->path << ": "
                      << std::strerror(-rc) << std::endl;
            status = ReadStatus::Error;
        }
    }
    return status;
}

void EvdevKeyboards::close_devices() {
    devices_.clear();
}

} // namespace wayvox
