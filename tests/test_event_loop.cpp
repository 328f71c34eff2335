// EventLoop tests: ordering, timers, flush and shutdown

#include "event_loop.hpp"
#include "fakes.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace wayvox;
using namespace wayvox::testing;

void test_tasks_run_in_order() {
    std::cout << "Testing task ordering..." << std::endl;

    EventLoop loop("order");
    std::vector<int> seen;
    std::thread::id loop_thread;

    // Posted before start: queued, not dropped
    loop.post([&]() { seen.push_back(0); });
    loop.start();
    for (int i = 1; i <= 100; ++i) {
        loop.post([&, i]() {
            loop_thread = std::this_thread::get_id();
            seen.push_back(i);
        });
    }
    loop.flush();

    // flush() returned, so every write above happened-before this read
    assert(seen.size() == 101);
    for (int i = 0; i <= 100; ++i) {
        assert(seen[i] == i);
    }
    assert(loop_thread != std::this_thread::get_id());

    std::cout << "  PASS" << std::endl;
}

void test_repeating_timeout() {
    std::cout << "Testing repeating timeout..." << std::endl;

    EventLoop loop("timer");
    loop.start();

    std::atomic<int> fired{0};
    EventLoop::TimerId id = loop.add_timeout(20, [&]() {
        return ++fired < 3;
    });
    assert(id != 0);

    assert(wait_until([&]() { return fired.load() == 3; }, 2000));
    sleep_ms(100);
    assert(fired.load() == 3);
    assert(loop.timer_count() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_remove_timeout() {
    std::cout << "Testing timeout removal..." << std::endl;

    EventLoop loop("remove");
    loop.start();

    std::atomic<int> fired{0};
    EventLoop::TimerId id = loop.add_timeout(100, [&]() {
        ++fired;
        return true;
    });
    assert(loop.timer_count() == 1);
    loop.remove_timeout(id);
    assert(loop.timer_count() == 0);
    sleep_ms(250);
    assert(fired.load() == 0);

    // Removing an unknown id is harmless
    loop.remove_timeout(id);
    loop.remove_timeout(9999);

    std::cout << "  PASS" << std::endl;
}

void test_timer_removes_itself() {
    std::cout << "Testing timer removed from its own callback..." << std::endl;

    EventLoop loop("self");
    loop.start();

    std::atomic<int> fired{0};
    EventLoop::TimerId id = 0;
    std::mutex id_mutex;
    {
        std::lock_guard<std::mutex> lock(id_mutex);
        id = loop.add_timeout(10, [&]() {
            ++fired;
            std::lock_guard<std::mutex> inner(id_mutex);
            loop.remove_timeout(id);
            return true;  // ignored, the timer is gone
        });
    }

    sleep_ms(200);
    assert(fired.load() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_earliest_timer_first() {
    std::cout << "Testing timer ordering..." << std::endl;

    EventLoop loop("due");
    loop.start();

    std::mutex mutex;
    std::vector<int> order;
    loop.add_timeout(120, [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(2);
        return false;
    });
    loop.add_timeout(30, [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(1);
        return false;
    });

    assert(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return order.size() == 2;
    }, 2000));
    assert(order[0] == 1 && order[1] == 2);

    std::cout << "  PASS" << std::endl;
}

void test_task_exception_contained() {
    std::cout << "Testing exception in task..." << std::endl;

    EventLoop loop("throw");
    loop.start();

    std::atomic<bool> after{false};
    loop.post([]() { throw std::runtime_error("task failure"); });
    loop.post([&]() { after.store(true); });
    loop.flush();

    assert(after.load());
    assert(loop.is_running());

    std::cout << "  PASS" << std::endl;
}

void test_stop() {
    std::cout << "Testing stop..." << std::endl;

    EventLoop loop("stop");
    assert(!loop.is_running());
    loop.start();
    assert(loop.is_running());

    std::atomic<int> fired{0};
    loop.add_timeout(50, [&]() {
        ++fired;
        return true;
    });

    loop.stop();
    assert(!loop.is_running());
    loop.stop();

    // Everything after stop is dropped
    std::atomic<bool> ran{false};
    loop.post([&]() { ran.store(true); });
    assert(loop.add_timeout(10, [&]() { return true; }) == 0);
    loop.flush();
    loop.start();
    assert(!loop.is_running());

    sleep_ms(100);
    assert(!ran.load());
    assert(fired.load() == 0);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Event Loop Test Suite ===" << std::endl << std::endl;

    test_tasks_run_in_order();
    test_repeating_timeout();
    test_remove_timeout();
    test_timer_removes_itself();
    test_earliest_timer_first();
    test_task_exception_contained();
    test_stop();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
