#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace wayvox {

// Single-threaded task loop with timeouts. Everything posted runs on the
// loop thread in order, so state owned by the loop needs no locking.
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimeoutTask = std::function<bool()>;  // return true to fire again
    using TimerId = uint64_t;

    explicit EventLoop(std::string name = "loop");
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void start();

    // Finish the running task, drop the rest and join. Idempotent.
    void stop();

    bool is_running() const;

    // Queue a task. Tasks posted before start() run once the loop starts;
    // tasks posted after stop() are dropped.
    void post(Task task);

    // Run task every interval_ms on the loop thread until it returns false
    // or the timer is removed
    TimerId add_timeout(int interval_ms, TimeoutTask task);
    void remove_timeout(TimerId id);

    // Number of live timers
    size_t timer_count() const;

    // Block until everything queued so far has run
    void flush();

    bool in_loop_thread() const;

private:
    struct Timer {
        std::chrono::steady_clock::time_point due;
        int interval_ms;
        TimeoutTask task;
    };

    void run();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
    bool running_ = false;
    bool stopped_ = false;
    std::thread thread_;
};

} // namespace wayvox
