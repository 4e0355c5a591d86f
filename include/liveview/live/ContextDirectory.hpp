#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/live/LiveContext.hpp>
#include <liveview/task/TimerQueue.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <parallel_hashmap/phmap.h>

namespace LV::Live {

struct DirectoryConfig {
    std::chrono::seconds connect_timeout{30};
};

enum class DirectoryEvent : std::uint8_t {
    Rendered = 0,
    StaticPage,
    RenderFailed,
    Connected,
    Disconnected,
    TimedOut,
};

inline constexpr std::size_t kDirectoryEventCount = 6;

struct DirectoryHooks {
    std::function<void(DirectoryEvent)> on_event;
};

/**
 * ContextDirectory: process wide index of live contexts, owned by the server.
 *
 * Contexts enter at render time and leave on disconnect, connect timeout, render
 * failure or, for pages without sourced components, right after render. The
 * connect timeout is a cancellable timer; no thread waits on it.
 */
class ContextDirectory {
public:
    using Clock = LiveContext::Clock;

    explicit ContextDirectory(DirectoryConfig config = {}, DirectoryHooks hooks = {});
    ~ContextDirectory();

    ContextDirectory(ContextDirectory const&)            = delete;
    ContextDirectory& operator=(ContextDirectory const&) = delete;

    auto publish(std::shared_ptr<LiveContext> context) -> Expected<void>;
    auto lookup(std::string const& id) const -> std::shared_ptr<LiveContext>;
    // Drops the entry without closing the context; returns what was removed.
    auto remove(std::string const& id) -> std::shared_ptr<LiveContext>;

    // Creates, publishes and renders a context. The returned context is already
    // closed and unpublished when the page registered no sourced component.
    auto render(PageRenderer const& renderer, MarkupSink& sink) -> Expected<std::shared_ptr<LiveContext>>;

    auto connect(std::string const& id, std::shared_ptr<Transport> transport) -> Expected<std::shared_ptr<LiveContext>>;
    void disconnect(std::string const& id);

    // Expires every unconnected context whose deadline is at or before `now`.
    auto sweep(Clock::time_point now) -> std::size_t;

    auto size() const -> std::size_t;
    auto config() const -> DirectoryConfig const& { return config_; }
    void shutdown();

private:
    struct Entry {
        std::shared_ptr<LiveContext>       context;
        std::optional<TimerQueue::TimerId> timer;
    };

    using ContextMap = phmap::parallel_flat_hash_map<std::string,
                                                     Entry,
                                                     phmap::priv::hash_default_hash<std::string>,
                                                     phmap::priv::hash_default_eq<std::string>,
                                                     std::allocator<std::pair<const std::string, Entry>>,
                                                     4,
                                                     std::mutex>;

    void expire(std::string const& id);
    void notify(DirectoryEvent event) const;

    DirectoryConfig config_;
    DirectoryHooks  hooks_;
    ContextMap      contexts_;
    TimerQueue      timers_;
};

auto to_string(DirectoryEvent event) -> std::string_view;

} // namespace LV::Live
