#pragma once
#include <liveview/core/Error.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <utility>

namespace LV {

/**
 * Deferred, cancellable one-shot timers served by a single worker thread.
 *
 * Tasks run on the worker with no internal lock held, so a task may schedule or
 * cancel other timers. A task cancelled after it was dequeued still runs; callers
 * that race a timer against another event must make the task itself idempotent.
 */
class TimerQueue {
public:
    using Clock   = std::chrono::steady_clock;
    using TimerId = std::uint64_t;
    using Task    = std::function<void()>;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(TimerQueue const&)            = delete;
    TimerQueue& operator=(TimerQueue const&) = delete;

    auto scheduleAt(Clock::time_point deadline, Task task) -> Expected<TimerId>;
    auto scheduleAfter(Clock::duration delay, Task task) -> Expected<TimerId>;

    // Returns true when the timer was still pending.
    auto cancel(TimerId id) -> bool;

    auto pending() const -> std::size_t;
    auto shutdown() -> void;

private:
    auto workerFunction() -> void;

    mutable std::mutex                                    mutex;
    std::condition_variable                               timerCV;
    std::set<std::pair<Clock::time_point, TimerId>>       deadlines;
    std::map<TimerId, std::pair<Clock::time_point, Task>> tasks;
    TimerId                                               nextId{1};
    bool                                                  shuttingDown{false};
    std::thread                                           worker;
};

} // namespace LV
