#include <doctest/doctest.h>

#include <liveview/task/TimerQueue.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace LV;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
auto wait_until(Predicate predicate, std::chrono::milliseconds limit = 5000ms) -> bool {
    auto const deadline = std::chrono::steady_clock::now() + limit;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

TEST_SUITE("task.timerqueue") {
TEST_CASE("Timers fire in deadline order") {
    TimerQueue       queue;
    std::mutex       mutex;
    std::vector<int> order;
    auto record = [&](int value) {
        return [&, value]() {
            std::lock_guard const lock{mutex};
            order.push_back(value);
        };
    };

    REQUIRE(queue.scheduleAfter(60ms, record(3)).has_value());
    REQUIRE(queue.scheduleAfter(20ms, record(1)).has_value());
    REQUIRE(queue.scheduleAfter(40ms, record(2)).has_value());

    CHECK(wait_until([&]() {
        std::lock_guard const lock{mutex};
        return order.size() == 3;
    }));
    std::lock_guard const lock{mutex};
    CHECK(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("Cancelled timers never run") {
    TimerQueue        queue;
    std::atomic<bool> fired{false};
    auto              id = queue.scheduleAfter(50ms, [&]() { fired = true; });
    REQUIRE(id.has_value());
    CHECK(queue.pending() == 1);
    CHECK(queue.cancel(*id));
    CHECK_FALSE(queue.cancel(*id));
    CHECK(queue.pending() == 0);
    std::this_thread::sleep_for(100ms);
    CHECK_FALSE(fired.load());
}

TEST_CASE("Empty tasks and scheduling after shutdown are rejected") {
    TimerQueue queue;
    auto       empty = queue.scheduleAfter(1ms, TimerQueue::Task{});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == Error::Code::MalformedInput);

    queue.shutdown();
    auto late = queue.scheduleAfter(1ms, []() {});
    REQUIRE_FALSE(late.has_value());
    CHECK(late.error().code == Error::Code::Closed);
}

TEST_CASE("Tasks may schedule further timers and survive throwing siblings") {
    TimerQueue        queue;
    std::atomic<int>  ran{0};
    REQUIRE(queue.scheduleAfter(1ms, []() { throw std::runtime_error("timer failure"); }).has_value());
    REQUIRE(queue.scheduleAfter(5ms, [&]() {
                     ran.fetch_add(1);
                     (void)queue.scheduleAfter(5ms, [&]() { ran.fetch_add(1); });
                 })
                .has_value());
    CHECK(wait_until([&]() { return ran.load() == 2; }));
}

TEST_CASE("Shutdown drops pending timers") {
    std::atomic<bool> fired{false};
    {
        TimerQueue queue;
        REQUIRE(queue.scheduleAfter(10s, [&]() { fired = true; }).has_value());
        queue.shutdown();
        CHECK(queue.pending() == 0);
    }
    CHECK_FALSE(fired.load());
}
}
