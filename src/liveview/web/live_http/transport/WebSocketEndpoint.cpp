#include <liveview/web/live_http/transport/WebSocketEndpoint.hpp>

#include <liveview/web/live_http/FrameCodec.hpp>
#include <liveview/web/live_http/Metrics.hpp>

#include "log/TaggedLogger.hpp"

#include <cstring>
#include <iostream>
#include <string_view>
#include <utility>
#include <vector>

#include <libwebsockets.h>

namespace LV::Web {

namespace {

int live_protocol_callback(lws* wsi, lws_callback_reasons reason, void* user, void* in, size_t len) {
    auto* context  = lws_get_context(wsi);
    auto* endpoint = context != nullptr ? static_cast<WebSocketEndpoint*>(lws_context_user(context)) : nullptr;
    if (endpoint == nullptr) {
        return lws_callback_http_dummy(wsi, reason, user, in, len);
    }
    return endpoint->handle_event(wsi, static_cast<int>(reason), user, in, len);
}

lws_protocols const kProtocols[] = {
    {"liveview", live_protocol_callback, 0, 4096, 0, nullptr, 0},
    {nullptr, nullptr, 0, 0, 0, nullptr, 0},
};

auto query_argument(lws* wsi, std::string_view key) -> std::string {
    char fragment[256];
    int  index = 0;
    while (lws_hdr_copy_fragment(wsi, fragment, static_cast<int>(sizeof(fragment)), WSI_TOKEN_HTTP_URI_ARGS, index)
           > 0) {
        std::string_view view{fragment};
        if (view.size() > key.size() && view.substr(0, key.size()) == key && view[key.size()] == '=') {
            return std::string{view.substr(key.size() + 1)};
        }
        ++index;
    }
    return {};
}

auto request_path(lws* wsi) -> std::string {
    char uri[512];
    auto length = lws_hdr_copy(wsi, uri, static_cast<int>(sizeof(uri)), WSI_TOKEN_GET_URI);
    if (length <= 0) {
        return {};
    }
    return std::string{uri, static_cast<std::size_t>(length)};
}

} // namespace

void WebSocketServiceHandle::request_service() {
    std::lock_guard const lock{mutex_};
    if (context_ != nullptr) {
        lws_cancel_service(context_);
    }
}

void WebSocketServiceHandle::bind(lws_context* context) {
    std::lock_guard const lock{mutex_};
    context_ = context;
}

void WebSocketServiceHandle::unbind() {
    std::lock_guard const lock{mutex_};
    context_ = nullptr;
}

WebSocketTransport::WebSocketTransport(std::shared_ptr<Live::Outbox>           outbox,
                                       std::shared_ptr<WebSocketServiceHandle> service)
    : outbox_(std::move(outbox))
    , service_(std::move(service)) {}

void WebSocketTransport::wake() {
    if (service_) {
        service_->request_service();
    }
}

void WebSocketTransport::close() {
    close_requested_.store(true, std::memory_order_release);
    if (service_) {
        service_->request_service();
    }
}

WebSocketEndpoint::WebSocketEndpoint(WebSocketEndpointConfig config,
                                     Live::ContextDirectory& directory,
                                     MetricsCollector*       metrics)
    : config_(std::move(config))
    , directory_(directory)
    , metrics_(metrics)
    , service_(std::make_shared<WebSocketServiceHandle>()) {}

WebSocketEndpoint::~WebSocketEndpoint() {
    stop();
}

auto WebSocketEndpoint::start() -> Expected<void> {
    std::lock_guard const lock{lifecycle_mutex_};
    if (running_.load(std::memory_order_acquire)) {
        return std::unexpected(Error{Error::Code::InvalidState, "websocket endpoint already running"});
    }

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port      = config_.port;
    info.iface     = (config_.host.empty() || config_.host == "0.0.0.0") ? nullptr : config_.host.c_str();
    info.protocols = kProtocols;
    info.user      = this;
    info.gid       = -1;
    info.uid       = -1;

    auto* context = lws_create_context(&info);
    if (context == nullptr) {
        return std::unexpected(Error{Error::Code::UnknownError,
                                     "failed to start websocket listener on " + config_.host + ":"
                                         + std::to_string(config_.port)});
    }

    context_ = context;
    service_->bind(context);
    stopping_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    service_thread_ = std::thread([this]() { service_loop(); });
    return {};
}

void WebSocketEndpoint::stop() {
    lws_context* context = nullptr;
    std::thread  thread;
    {
        std::lock_guard const lock{lifecycle_mutex_};
        if (!running_.load(std::memory_order_acquire)) {
            return;
        }
        stopping_.store(true, std::memory_order_release);
        context = std::exchange(context_, nullptr);
        thread  = std::move(service_thread_);
    }

    service_->request_service();
    if (thread.joinable()) {
        thread.join();
    }
    service_->unbind();
    // Destroying the context closes every socket; the CLOSED callbacks disconnect their
    // contexts on this thread.
    lws_context_destroy(context);
    running_.store(false, std::memory_order_release);
}

auto WebSocketEndpoint::connection_count() const -> std::size_t {
    std::lock_guard const lock{connections_mutex_};
    return connections_.size();
}

void WebSocketEndpoint::service_loop() {
    lv_log("WebSocketEndpoint::service_loop started", "WebSocket");
    lws_context* context = nullptr;
    {
        std::lock_guard const lock{lifecycle_mutex_};
        context = context_;
    }
    while (context != nullptr && !stopping_.load(std::memory_order_acquire)) {
        if (lws_service(context, 250) < 0) {
            std::cerr << "[liveview] websocket service loop failed" << std::endl;
            break;
        }
    }
    lv_log("WebSocketEndpoint::service_loop exiting", "WebSocket");
}

auto WebSocketEndpoint::handle_event(lws* wsi, int reason, void* user, void* in, std::size_t len) -> int {
    switch (static_cast<lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_ESTABLISHED:
        return on_established(wsi);
    case LWS_CALLBACK_RECEIVE:
        return on_receive(wsi, in, len);
    case LWS_CALLBACK_SERVER_WRITEABLE:
        return on_writeable(wsi);
    case LWS_CALLBACK_CLOSED:
        on_closed(wsi);
        return 0;
    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        on_service_cancelled();
        return 0;
    default:
        return lws_callback_http_dummy(wsi, static_cast<lws_callback_reasons>(reason), user, in, len);
    }
}

auto WebSocketEndpoint::on_established(lws* wsi) -> int {
    auto path = request_path(wsi);
    if (path != config_.live_path) {
        std::cerr << "[liveview] websocket connection rejected: unexpected path " << path << std::endl;
        return -1;
    }
    auto context_id = query_argument(wsi, "id");
    if (context_id.empty()) {
        std::cerr << "[liveview] websocket connection rejected: missing context id" << std::endl;
        return -1;
    }

    auto context = directory_.lookup(context_id);
    if (!context) {
        std::cerr << "[liveview] websocket connection rejected: no such live context " << context_id << std::endl;
        return -1;
    }

    auto transport = std::make_shared<WebSocketTransport>(context->outbox(), service_);
    auto connected = directory_.connect(context_id, transport);
    if (!connected) {
        std::cerr << "[liveview] websocket connection rejected for context " << context_id << ": "
                  << describeError(connected.error()) << std::endl;
        return -1;
    }

    {
        std::lock_guard const lock{connections_mutex_};
        connections_[wsi] = Connection{.context_id = context_id, .transport = transport, .inbound = {}, .oversized = false};
    }
    if (metrics_ != nullptr) {
        metrics_->record_connection_open(Live::TransportKind::WebSocket);
    }
    lv_log("WebSocketEndpoint::on_established context " + context_id, "WebSocket");

    if (!transport->outbox()->empty()) {
        lws_callback_on_writable(wsi);
    }
    return 0;
}

auto WebSocketEndpoint::on_receive(lws* wsi, void* in, std::size_t len) -> int {
    std::string context_id;
    std::string frame;
    bool        dropped = false;
    {
        std::lock_guard const lock{connections_mutex_};
        auto it = connections_.find(wsi);
        if (it == connections_.end()) {
            return -1;
        }
        auto&      connection = it->second;
        bool const complete   = lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0;
        if (!connection.oversized && connection.inbound.size() + len > config_.max_inbound_frame) {
            std::cerr << "[liveview] websocket frame for context " << connection.context_id
                      << " exceeds the size limit, dropping it" << std::endl;
            connection.oversized = true;
            connection.inbound.clear();
        }
        if (connection.oversized) {
            if (!complete) {
                return 0;
            }
            connection.oversized = false;
            dropped              = true;
        } else {
            connection.inbound.append(static_cast<char const*>(in), len);
            if (!complete) {
                return 0;
            }
            frame = std::exchange(connection.inbound, std::string{});
        }
        context_id = connection.context_id;
    }

    if (dropped) {
        if (metrics_ != nullptr) {
            metrics_->record_callback(CallbackOutcome::Malformed);
        }
        return 0;
    }

    auto context = directory_.lookup(context_id);
    if (!context) {
        return -1;
    }
    auto result = dispatch_callback_frame(*context, frame);
    if (metrics_ != nullptr) {
        metrics_->record_callback(classify_callback_result(result));
    }
    if (!result) {
        std::cerr << "[liveview] websocket frame for context " << context_id << " rejected: "
                  << describeError(result.error()) << std::endl;
    }
    return 0;
}

auto WebSocketEndpoint::on_writeable(lws* wsi) -> int {
    std::shared_ptr<WebSocketTransport> transport;
    {
        std::lock_guard const lock{connections_mutex_};
        auto it = connections_.find(wsi);
        if (it == connections_.end()) {
            return 0;
        }
        transport = it->second.transport;
    }

    auto const& outbox = transport->outbox();
    auto        frame  = outbox->try_pop();
    if (!frame) {
        return transport->close_requested() ? -1 : 0;
    }

    std::vector<unsigned char> buffer(LWS_PRE + frame->size());
    std::memcpy(buffer.data() + LWS_PRE, frame->data(), frame->size());
    auto written = lws_write(wsi, buffer.data() + LWS_PRE, frame->size(), LWS_WRITE_TEXT);
    if (written < static_cast<int>(frame->size())) {
        return -1;
    }
    if (metrics_ != nullptr) {
        metrics_->record_frame_sent(Live::TransportKind::WebSocket);
    }
    if (!outbox->empty() || transport->close_requested()) {
        lws_callback_on_writable(wsi);
    }
    return 0;
}

void WebSocketEndpoint::on_closed(lws* wsi) {
    std::optional<Connection> connection;
    {
        std::lock_guard const lock{connections_mutex_};
        auto it = connections_.find(wsi);
        if (it == connections_.end()) {
            return;
        }
        connection = std::move(it->second);
        connections_.erase(it);
    }
    lv_log("WebSocketEndpoint::on_closed context " + connection->context_id, "WebSocket");
    directory_.disconnect(connection->context_id);
    if (metrics_ != nullptr) {
        metrics_->record_connection_close(Live::TransportKind::WebSocket);
    }
}

void WebSocketEndpoint::on_service_cancelled() {
    std::lock_guard const lock{connections_mutex_};
    for (auto const& [wsi, connection] : connections_) {
        if (!connection.transport->outbox()->empty() || connection.transport->close_requested()) {
            lws_callback_on_writable(wsi);
        }
    }
}

} // namespace LV::Web
