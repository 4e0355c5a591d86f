#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/live/ContextDirectory.hpp>
#include <liveview/live/Outbox.hpp>
#include <liveview/live/Transport.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct lws;
struct lws_context;

namespace LV::Web {

class MetricsCollector;

// Wakes the libwebsockets service loop from any thread. Outlives the endpoint when a
// transport is still referenced by a context after shutdown; wakes are then dropped.
class WebSocketServiceHandle {
public:
    void request_service();
    void bind(lws_context* context);
    void unbind();

private:
    std::mutex   mutex_;
    lws_context* context_{nullptr};
};

/**
 * WebSocketTransport: primary downstream for one context.
 *
 * Frames stay in the context's outbox until the service thread reports the socket
 * writable; wake() only nudges that thread. The lws handle itself is never touched
 * from here.
 */
class WebSocketTransport final : public Live::Transport {
public:
    WebSocketTransport(std::shared_ptr<Live::Outbox> outbox, std::shared_ptr<WebSocketServiceHandle> service);

    auto kind() const -> Live::TransportKind override { return Live::TransportKind::WebSocket; }
    void wake() override;
    void close() override;

    auto close_requested() const -> bool { return close_requested_.load(std::memory_order_acquire); }
    auto outbox() const -> std::shared_ptr<Live::Outbox> const& { return outbox_; }

private:
    std::shared_ptr<Live::Outbox>           outbox_;
    std::shared_ptr<WebSocketServiceHandle> service_;
    std::atomic<bool>                       close_requested_{false};
};

struct WebSocketEndpointConfig {
    std::string host{"127.0.0.1"};
    int         port{8081};
    std::string live_path{"/__live"};
    // Larger inbound messages are dropped; the connection stays open.
    std::size_t max_inbound_frame{1U << 20};
};

/**
 * WebSocketEndpoint: libwebsockets listener serving `ws://host:port<live_path>?id=<ctx>`.
 *
 * One service thread runs every lws callback. Connections are attached to their
 * context on ESTABLISHED, inbound "<id>:<args>" frames are dispatched as callbacks,
 * and closing the socket disconnects the context.
 */
class WebSocketEndpoint {
public:
    WebSocketEndpoint(WebSocketEndpointConfig config, Live::ContextDirectory& directory, MetricsCollector* metrics);
    ~WebSocketEndpoint();

    WebSocketEndpoint(WebSocketEndpoint const&)            = delete;
    WebSocketEndpoint& operator=(WebSocketEndpoint const&) = delete;

    auto start() -> Expected<void>;
    void stop();

    auto running() const -> bool { return running_.load(std::memory_order_acquire); }
    auto connection_count() const -> std::size_t;
    auto config() const -> WebSocketEndpointConfig const& { return config_; }

    // Entry point for the lws protocol callback; runs on the service thread.
    auto handle_event(lws* wsi, int reason, void* user, void* in, std::size_t len) -> int;

private:
    struct Connection {
        std::string                         context_id;
        std::shared_ptr<WebSocketTransport> transport;
        std::string                         inbound;
        bool                                oversized{false};
    };

    void service_loop();

    auto on_established(lws* wsi) -> int;
    auto on_receive(lws* wsi, void* in, std::size_t len) -> int;
    auto on_writeable(lws* wsi) -> int;
    void on_closed(lws* wsi);
    void on_service_cancelled();

    WebSocketEndpointConfig                 config_;
    Live::ContextDirectory&                 directory_;
    MetricsCollector*                       metrics_{nullptr};
    std::shared_ptr<WebSocketServiceHandle> service_;

    std::mutex          lifecycle_mutex_;
    lws_context*        context_{nullptr};
    std::thread         service_thread_;
    std::atomic<bool>   running_{false};
    std::atomic<bool>   stopping_{false};

    mutable std::mutex               connections_mutex_;
    std::map<lws*, Connection>       connections_;
};

} // namespace LV::Web
