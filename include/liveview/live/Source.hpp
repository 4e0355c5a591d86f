#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace LV::Live {

// Removal sentinel. A source emitting Removed asks for its component to be deleted
// and its resources released.
struct Removed {};

// One value pushed by a source: no change (monostate), a new value, or removal.
template <typename T>
using Emission = std::variant<std::monostate, T, Removed>;

/**
 * Subscription: move-only handle that detaches a listener from its source.
 *
 * cancel() is idempotent; the destructor cancels as well. A listener that is
 * already executing on another thread may still complete after cancel() returns,
 * so listeners must tolerate late delivery to a torn down owner.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel);
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    auto operator=(Subscription&& other) noexcept -> Subscription&;

    Subscription(Subscription const&)            = delete;
    auto operator=(Subscription const&) -> Subscription& = delete;

    void cancel();
    auto active() const -> bool;

private:
    std::function<void()> cancel_;
};

// Type independent part of a source so the registry can own and close it.
class SourceBase {
public:
    virtual ~SourceBase() = default;

    virtual void close()              = 0;
    virtual auto closed() const -> bool = 0;
};

template <typename T>
class Source : public SourceBase {
public:
    using value_type = T;
    using Listener   = std::function<void(Emission<T> const&)>;

    // Value used for the initial render, if the source holds one.
    virtual auto current() const -> std::optional<T> = 0;

    // Registers a listener. Listening on a closed source returns an inactive subscription.
    virtual auto listen(Listener listener) -> Subscription = 0;
};

namespace detail {

// Listener bookkeeping shared by the bundled sources. Listeners are invoked on a
// snapshot taken under the lock so a listener may cancel itself or emit again.
template <typename T>
class ListenerSet {
public:
    using Listener = typename Source<T>::Listener;

    auto add(Listener listener) -> std::optional<std::uint64_t> {
        std::lock_guard const lock{mutex_};
        if (closed_) {
            return std::nullopt;
        }
        auto id = next_id_++;
        listeners_.emplace_back(id, std::make_shared<Listener>(std::move(listener)));
        return id;
    }

    void remove(std::uint64_t id) {
        std::lock_guard const lock{mutex_};
        std::erase_if(listeners_, [id](auto const& entry) { return entry.first == id; });
    }

    void emit(Emission<T> const& emission) const {
        std::vector<std::shared_ptr<Listener>> snapshot;
        {
            std::lock_guard const lock{mutex_};
            if (closed_) {
                return;
            }
            snapshot.reserve(listeners_.size());
            for (auto const& entry : listeners_) {
                snapshot.push_back(entry.second);
            }
        }
        for (auto const& listener : snapshot) {
            (*listener)(emission);
        }
    }

    // Returns true only for the call that performed the close.
    auto close() -> bool {
        std::lock_guard const lock{mutex_};
        if (closed_) {
            return false;
        }
        closed_ = true;
        listeners_.clear();
        return true;
    }

    auto closed() const -> bool {
        std::lock_guard const lock{mutex_};
        return closed_;
    }

    auto size() const -> std::size_t {
        std::lock_guard const lock{mutex_};
        return listeners_.size();
    }

private:
    mutable std::mutex                                               mutex_;
    std::vector<std::pair<std::uint64_t, std::shared_ptr<Listener>>> listeners_;
    std::uint64_t                                                    next_id_{1};
    bool                                                             closed_{false};
};

} // namespace detail

} // namespace LV::Live
