#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace LV::Live {

/**
 * Outbox: per-context FIFO of encoded patch batches.
 *
 * Producers are the registry's update pipeline (any thread). The single consumer is
 * whichever transport is attached to the context; until one attaches, frames simply
 * accumulate and are flushed in order on connect.
 */
class Outbox {
public:
    using WakeFn = std::function<void()>;

    // Returns false once the outbox is closed; the frame is dropped.
    auto push(std::string frame) -> bool;

    auto try_pop() -> std::optional<std::string>;

    // Blocks until a frame is available, the outbox closes, or the timeout elapses.
    auto wait_pop(std::chrono::milliseconds timeout) -> std::optional<std::string>;

    auto drain() -> std::vector<std::string>;

    void close();
    auto closed() const -> bool;
    auto size() const -> std::size_t;
    auto empty() const -> bool;

    // Invoked outside the lock after every successful push.
    void set_wake(WakeFn wake);

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    WakeFn                  wake_;
    bool                    closed_{false};
};

} // namespace LV::Live
