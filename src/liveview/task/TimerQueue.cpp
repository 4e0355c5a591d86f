#include <liveview/task/TimerQueue.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <iostream>

namespace LV {

TimerQueue::TimerQueue() {
    lv_log("TimerQueue::TimerQueue spawning worker", "TimerQueue");
    this->worker = std::thread(&TimerQueue::workerFunction, this);
}

TimerQueue::~TimerQueue() {
    this->shutdown();
}

auto TimerQueue::scheduleAt(Clock::time_point deadline, Task task) -> Expected<TimerId> {
    if (!task) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Timer task is empty"});
    }
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            lv_log("TimerQueue::scheduleAt refused: shutting down", "TimerQueue");
            return std::unexpected(Error{Error::Code::Closed, "Timer queue shutting down"});
        }
        id = this->nextId++;
        this->deadlines.emplace(deadline, id);
        this->tasks.emplace(id, std::make_pair(deadline, std::move(task)));
    }
    this->timerCV.notify_one();
    return id;
}

auto TimerQueue::scheduleAfter(Clock::duration delay, Task task) -> Expected<TimerId> {
    return this->scheduleAt(Clock::now() + delay, std::move(task));
}

auto TimerQueue::cancel(TimerId id) -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto it = this->tasks.find(id);
    if (it == this->tasks.end()) {
        return false;
    }
    this->deadlines.erase({it->second.first, id});
    this->tasks.erase(it);
    this->timerCV.notify_one();
    return true;
}

auto TimerQueue::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->tasks.size();
}

auto TimerQueue::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->shuttingDown = true;
        this->deadlines.clear();
        this->tasks.clear();
    }
    this->timerCV.notify_all();
    if (this->worker.joinable() && this->worker.get_id() != std::this_thread::get_id()) {
        lv_log("TimerQueue::shutdown joining worker", "TimerQueue");
        this->worker.join();
    }
}

auto TimerQueue::workerFunction() -> void {
    std::unique_lock<std::mutex> lock(this->mutex);
    while (!this->shuttingDown) {
        if (this->deadlines.empty()) {
            this->timerCV.wait(lock, [this] { return this->shuttingDown || !this->deadlines.empty(); });
            continue;
        }
        auto const [deadline, id] = *this->deadlines.begin();
        if (Clock::now() < deadline) {
            this->timerCV.wait_until(lock, deadline);
            continue;
        }
        this->deadlines.erase(this->deadlines.begin());
        auto node = this->tasks.extract(id);
        if (node.empty()) {
            continue;
        }
        Task task = std::move(node.mapped().second);
        lock.unlock();
        try {
            task();
        } catch (std::exception const& ex) {
            std::cerr << "[liveview] timer task threw: " << ex.what() << "\n";
        }
        lock.lock();
    }
    lv_log("TimerQueue::workerFunction exiting", "TimerQueue");
}

} // namespace LV
