#include <liveview/live/Source.hpp>

namespace LV::Live {

Subscription::Subscription(std::function<void()> cancel)
    : cancel_(std::move(cancel)) {}

Subscription::~Subscription() {
    cancel();
}

Subscription::Subscription(Subscription&& other) noexcept
    : cancel_(std::exchange(other.cancel_, nullptr)) {}

auto Subscription::operator=(Subscription&& other) noexcept -> Subscription& {
    if (this != &other) {
        cancel();
        cancel_ = std::exchange(other.cancel_, nullptr);
    }
    return *this;
}

void Subscription::cancel() {
    if (auto fn = std::exchange(cancel_, nullptr)) {
        fn();
    }
}

auto Subscription::active() const -> bool {
    return static_cast<bool>(cancel_);
}

} // namespace LV::Live
