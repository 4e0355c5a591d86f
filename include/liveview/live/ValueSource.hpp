#pragma once

#include <liveview/live/Source.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace LV::Live {

/**
 * ValueSource: mutable cell that pushes every assignment to its listeners.
 *
 * Application state shared by many components lives in a ValueSource. Components
 * should not subscribe to it directly because the registry closes a component's
 * source on teardown; hand each component its own view via watch() or map_source().
 */
template <typename T>
class ValueSource final : public Source<T>, public std::enable_shared_from_this<ValueSource<T>> {
public:
    using Listener = typename Source<T>::Listener;

    static auto Create(std::optional<T> initial = std::nullopt) -> std::shared_ptr<ValueSource<T>> {
        return std::shared_ptr<ValueSource<T>>(new ValueSource<T>(std::move(initial)));
    }

    auto current() const -> std::optional<T> override {
        std::lock_guard const lock{value_mutex_};
        return value_;
    }

    auto listen(Listener listener) -> Subscription override {
        auto id = listeners_.add(std::move(listener));
        if (!id) {
            return Subscription{};
        }
        std::weak_ptr<ValueSource<T>> weak = this->weak_from_this();
        return Subscription{[weak, listener_id = *id]() {
            if (auto self = weak.lock()) {
                self->listeners_.remove(listener_id);
            }
        }};
    }

    void close() override { listeners_.close(); }

    auto closed() const -> bool override { return listeners_.closed(); }

    void set(T value) {
        {
            std::lock_guard const lock{value_mutex_};
            value_ = value;
        }
        listeners_.emit(Emission<T>{std::in_place_index<1>, std::move(value)});
    }

    // Read-modify-write under the value lock; the resulting value is emitted.
    template <typename Fn>
    void update(Fn&& fn) {
        T next{};
        {
            std::lock_guard const lock{value_mutex_};
            if (!value_) {
                value_.emplace();
            }
            std::forward<Fn>(fn)(*value_);
            next = *value_;
        }
        listeners_.emit(Emission<T>{std::in_place_index<1>, std::move(next)});
    }

    // Tells every listener that its component should be removed.
    void remove() { listeners_.emit(Emission<T>{std::in_place_index<2>}); }

    auto listener_count() const -> std::size_t { return listeners_.size(); }

private:
    explicit ValueSource(std::optional<T> initial)
        : value_(std::move(initial)) {}

    mutable std::mutex        value_mutex_;
    std::optional<T>          value_;
    detail::ListenerSet<T>    listeners_;
};

/**
 * DerivedSource: per-component view over an upstream source.
 *
 * Values are mapped through `map` on the emitting thread. Closing the view only
 * detaches it from the upstream; the upstream keeps running.
 */
template <typename T, typename U>
class DerivedSource final : public Source<U>, public std::enable_shared_from_this<DerivedSource<T, U>> {
public:
    using Listener = typename Source<U>::Listener;
    using Mapper   = std::function<U(T const&)>;

    static auto Create(std::shared_ptr<Source<T>> upstream, Mapper map) -> std::shared_ptr<DerivedSource<T, U>> {
        auto self = std::shared_ptr<DerivedSource<T, U>>(new DerivedSource<T, U>(upstream, std::move(map)));
        std::weak_ptr<DerivedSource<T, U>> weak = self;
        auto subscription = upstream->listen([weak](Emission<T> const& emission) {
            if (auto derived = weak.lock()) {
                derived->forward(emission);
            }
        });
        std::lock_guard const lock{self->upstream_mutex_};
        self->upstream_subscription_ = std::move(subscription);
        return self;
    }

    auto current() const -> std::optional<U> override {
        auto value = upstream_->current();
        if (!value) {
            return std::nullopt;
        }
        return map_(*value);
    }

    auto listen(Listener listener) -> Subscription override {
        auto id = listeners_.add(std::move(listener));
        if (!id) {
            return Subscription{};
        }
        std::weak_ptr<DerivedSource<T, U>> weak = this->weak_from_this();
        return Subscription{[weak, listener_id = *id]() {
            if (auto self = weak.lock()) {
                self->listeners_.remove(listener_id);
            }
        }};
    }

    void close() override {
        if (!listeners_.close()) {
            return;
        }
        Subscription detached;
        {
            std::lock_guard const lock{upstream_mutex_};
            detached = std::move(upstream_subscription_);
        }
        detached.cancel();
    }

    auto closed() const -> bool override { return listeners_.closed(); }

private:
    DerivedSource(std::shared_ptr<Source<T>> upstream, Mapper map)
        : upstream_(std::move(upstream))
        , map_(std::move(map)) {}

    void forward(Emission<T> const& emission) {
        if (std::holds_alternative<Removed>(emission)) {
            listeners_.emit(Emission<U>{std::in_place_index<2>});
            return;
        }
        if (auto const* value = std::get_if<1>(&emission)) {
            listeners_.emit(Emission<U>{std::in_place_index<1>, map_(*value)});
            return;
        }
        listeners_.emit(Emission<U>{});
    }

    std::shared_ptr<Source<T>> upstream_;
    Mapper                     map_;
    detail::ListenerSet<U>     listeners_;
    std::mutex                 upstream_mutex_;
    Subscription               upstream_subscription_;
};

template <typename T>
auto watch(std::shared_ptr<Source<T>> upstream) -> std::shared_ptr<Source<T>> {
    return DerivedSource<T, T>::Create(std::move(upstream), [](T const& value) { return value; });
}

template <typename T>
auto watch(std::shared_ptr<ValueSource<T>> upstream) -> std::shared_ptr<Source<T>> {
    return watch(std::static_pointer_cast<Source<T>>(std::move(upstream)));
}

template <typename T, typename Fn>
auto map_source(std::shared_ptr<Source<T>> upstream, Fn fn)
    -> std::shared_ptr<Source<std::decay_t<std::invoke_result_t<Fn, T const&>>>> {
    using U = std::decay_t<std::invoke_result_t<Fn, T const&>>;
    return DerivedSource<T, U>::Create(std::move(upstream), std::function<U(T const&)>(std::move(fn)));
}

template <typename T, typename Fn>
auto map_source(std::shared_ptr<ValueSource<T>> upstream, Fn fn)
    -> std::shared_ptr<Source<std::decay_t<std::invoke_result_t<Fn, T const&>>>> {
    return map_source(std::static_pointer_cast<Source<T>>(std::move(upstream)), std::move(fn));
}

} // namespace LV::Live
