#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/live/ComponentRegistry.hpp>
#include <liveview/live/Outbox.hpp>
#include <liveview/live/RenderScope.hpp>
#include <liveview/live/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace LV::Live {

using PageRenderer = std::function<void(RenderScope&)>;

enum class ContextStatus : std::uint8_t {
    NotConnected = 0,
    Connected,
    Closed,
};

auto to_string(ContextStatus status) -> std::string_view;

/**
 * LiveContext: one browser tab's live session.
 *
 * Composes the component registry, the outbox of encoded patch batches and the
 * attached transport. Status moves NotConnected -> Connected -> Closed or
 * NotConnected -> Closed; every transition happens at most once.
 */
class LiveContext : public std::enable_shared_from_this<LiveContext> {
public:
    using Clock = std::chrono::steady_clock;

    static auto Create() -> std::shared_ptr<LiveContext>;
    static auto Create(std::string id) -> std::shared_ptr<LiveContext>;
    static auto generate_id() -> std::string;

    ~LiveContext();

    LiveContext(LiveContext const&)            = delete;
    LiveContext& operator=(LiveContext const&) = delete;

    // Runs the page renderer with a root scope, then hands the markup to `sink`.
    // Source updates wait only for the render pass itself, never for the sink.
    auto render(PageRenderer const& renderer, MarkupSink& sink) -> Expected<void>;

    // First transport wins; buffered batches become visible to it through the outbox.
    auto attach(std::shared_ptr<Transport> transport) -> Expected<void>;

    // Returns true for the call that actually closed the context.
    auto close() -> bool;

    // Closes the context only if no transport ever attached.
    auto expire() -> bool;

    auto dispatch_callback(CallbackId id, nlohmann::json const& args) -> Expected<void>;

    auto id() const -> std::string const& { return id_; }
    auto status() const -> ContextStatus { return status_.load(std::memory_order_acquire); }
    auto registry() const -> std::shared_ptr<ComponentRegistry> const& { return registry_; }
    auto outbox() const -> std::shared_ptr<Outbox> const& { return outbox_; }
    auto created_at() const -> Clock::time_point { return created_at_; }

    auto connect_deadline() const -> std::optional<Clock::time_point>;
    void set_connect_deadline(Clock::time_point deadline);

private:
    explicit LiveContext(std::string id);

    auto finish_close() -> void;

    std::string                        id_;
    std::shared_ptr<Outbox>            outbox_;
    std::shared_ptr<ComponentRegistry> registry_;
    std::atomic<ContextStatus>         status_{ContextStatus::NotConnected};
    Clock::time_point                  created_at_;

    mutable std::mutex                 mutex_;
    std::shared_ptr<Transport>         transport_;
    std::optional<Clock::time_point>   connect_deadline_;
};

} // namespace LV::Live
