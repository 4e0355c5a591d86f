#include <liveview/live/Outbox.hpp>

#include "log/TaggedLogger.hpp"

namespace LV::Live {

auto Outbox::push(std::string frame) -> bool {
    WakeFn wake;
    {
        std::lock_guard const lock{mutex_};
        if (closed_) {
            lv_log("Outbox::push dropped frame on closed outbox", "Outbox");
            return false;
        }
        frames_.push_back(std::move(frame));
        wake = wake_;
    }
    cv_.notify_one();
    if (wake) {
        wake();
    }
    return true;
}

auto Outbox::try_pop() -> std::optional<std::string> {
    std::lock_guard const lock{mutex_};
    if (frames_.empty()) {
        return std::nullopt;
    }
    auto frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

auto Outbox::wait_pop(std::chrono::milliseconds timeout) -> std::optional<std::string> {
    std::unique_lock lock{mutex_};
    cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
    if (frames_.empty()) {
        return std::nullopt;
    }
    auto frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

auto Outbox::drain() -> std::vector<std::string> {
    std::lock_guard const lock{mutex_};
    std::vector<std::string> frames;
    frames.reserve(frames_.size());
    while (!frames_.empty()) {
        frames.push_back(std::move(frames_.front()));
        frames_.pop_front();
    }
    return frames;
}

void Outbox::close() {
    {
        std::lock_guard const lock{mutex_};
        closed_ = true;
        frames_.clear();
        wake_ = nullptr;
    }
    cv_.notify_all();
}

auto Outbox::closed() const -> bool {
    std::lock_guard const lock{mutex_};
    return closed_;
}

auto Outbox::size() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return frames_.size();
}

auto Outbox::empty() const -> bool {
    std::lock_guard const lock{mutex_};
    return frames_.empty();
}

void Outbox::set_wake(WakeFn wake) {
    bool pending = false;
    {
        std::lock_guard const lock{mutex_};
        if (closed_) {
            return;
        }
        wake_   = wake;
        pending = !frames_.empty();
    }
    if (pending && wake) {
        wake();
    }
}

} // namespace LV::Live
