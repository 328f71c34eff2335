#include "event_loop.hpp"
#include <future>
#include <iostream>

namespace wayvox {

EventLoop::EventLoop(std::string name)
    : name_(std::move(name)) {
}

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || stopped_) return;

    running_ = true;
    thread_ = std::thread([this]() {
        run();
    });
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        tasks_.clear();
        timers_.clear();
    }
    cv_.notify_all();

    if (thread_.joinable() && !in_loop_thread()) {
        thread_.join();
    }
}

bool EventLoop::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stopped_;
}

bool EventLoop::in_loop_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_all();
}

EventLoop::TimerId EventLoop::add_timeout(int interval_ms, TimeoutTask task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return 0;
        id = next_id_++;
        Timer timer;
        timer.due = std::chrono::steady_clock::now() + std::chrono::milliseconds(interval_ms);
        timer.interval_ms = interval_ms;
        timer.task = std::move(task);
        timers_.emplace(id, std::move(timer));
    }
    cv_.notify_all();
    return id;
}

void EventLoop::remove_timeout(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

size_t EventLoop::timer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EventLoop::flush() {
    if (!is_running() || in_loop_thread()) return;

    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();
    post([done]() { done->set_value(); });

    // stop() may drop the marker; don't wait forever in that case
    while (finished.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (!is_running()) return;
    }
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopped_) {
        if (!tasks_.empty()) {
            Task task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "[" << name_ << "] Task failed: " << e.what() << std::endl;
            }
            lock.lock();
            continue;
        }

        // Earliest timer
        auto next = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (next == timers_.end() || it->second.due < next->second.due) {
                next = it;
            }
        }

        if (next == timers_.end()) {
            cv_.wait(lock);
            continue;
        }

        const auto due = next->second.due;
        if (due > std::chrono::steady_clock::now()) {
            cv_.wait_until(lock, due);
            continue;
        }

        TimerId id = next->first;
        TimeoutTask task = next->second.task;
        lock.unlock();
        bool again = false;
        try {
            again = task();
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] Timer failed: " << e.what() << std::endl;
        }
        lock.lock();

        // The task may have removed itself or been replaced meanwhile
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;
        if (again) {
            it->second.due = std::chrono::steady_clock::now() +
                             std::chrono::milliseconds(it->second.interval_ms);
        } else {
            timers_.erase(it);
        }
    }
}

} // namespace wayvox
