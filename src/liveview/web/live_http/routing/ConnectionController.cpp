#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <liveview/web/live_http/routing/ConnectionController.hpp>

#include <liveview/live/ContextDirectory.hpp>
#include <liveview/web/LiveOptions.hpp>
#include <liveview/web/live_http/FrameCodec.hpp>
#include <liveview/web/live_http/Metrics.hpp>
#include <liveview/web/live_http/routing/HttpHelpers.hpp>
#include <liveview/web/live_http/transport/EventStreamTransport.hpp>

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <iostream>
#include <string>

namespace LV::Web {

auto ConnectionController::Create(LiveRequestContext& ctx, std::atomic<bool>& should_stop)
    -> std::unique_ptr<ConnectionController> {
    return std::unique_ptr<ConnectionController>(new ConnectionController(ctx, should_stop));
}

ConnectionController::ConnectionController(LiveRequestContext& ctx, std::atomic<bool>& should_stop)
    : ctx_(ctx)
    , should_stop_(should_stop) {}

ConnectionController::~ConnectionController() = default;

void ConnectionController::register_routes(httplib::Server& server) {
    auto pattern = exact_route_pattern(ctx_.options.live_path);
    server.Get(pattern, [this](httplib::Request const& req, httplib::Response& res) { handle_stream(req, res); });
    server.Post(pattern, [this](httplib::Request const& req, httplib::Response& res) { handle_callback(req, res); });
}

void ConnectionController::handle_stream(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::LiveStream, res};

    auto context_id = req.get_param_value("id");
    if (context_id.empty()) {
        respond_text(res, 400, "Missing context id");
        return;
    }

    if (wants_websocket_upgrade(req) && ctx_.options.websocket_port > 0) {
        auto port = std::to_string(ctx_.options.websocket_port);
        res.set_header("X-Liveview-WebSocket-Port", port);
        respond_text(res, 426, "Connect via WebSocket on port " + port);
        return;
    }

    auto context = ctx_.directory.lookup(context_id);
    if (!context) {
        respond_text(res, 404, "No such live context");
        return;
    }

    auto transport = std::make_shared<EventStreamTransport>(context->outbox(),
                                                            std::chrono::milliseconds(ctx_.options.keepalive_ms),
                                                            &ctx_.metrics,
                                                            should_stop_);
    auto connected = ctx_.directory.connect(context_id, transport);
    if (!connected) {
        auto const code = connected.error().code;
        if (code == Error::Code::AlreadyConnected) {
            respond_text(res, 409, "Live context already connected");
        } else {
            respond_text(res, 404, "No such live context");
        }
        return;
    }

    lv_log("ConnectionController::handle_stream attached " + context_id + " from " + get_client_address(req),
           "Connection");
    res.set_header("Cache-Control", "no-store");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");
    ctx_.metrics.record_connection_open(Live::TransportKind::EventStream);
    res.set_chunked_content_provider(
        "text/event-stream",
        [transport](size_t, httplib::DataSink& sink) { return transport->pump(sink); },
        [transport, context_id, this](bool) {
            transport->cancel();
            ctx_.directory.disconnect(context_id);
            ctx_.metrics.record_connection_close(Live::TransportKind::EventStream);
        });
}

void ConnectionController::handle_callback(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::LiveCallback, res};

    auto context_id = req.get_param_value("id");
    if (context_id.empty()) {
        respond_text(res, 400, "Missing context id");
        return;
    }

    auto context = ctx_.directory.lookup(context_id);
    if (!context) {
        ctx_.metrics.record_callback(CallbackOutcome::Unknown);
        respond_text(res, 404, "No such live context");
        return;
    }

    if (req.body.size() > kMaxCallbackBodyBytes) {
        ctx_.metrics.record_callback(CallbackOutcome::Malformed);
        respond_text(res, 413, "Request body too large");
        return;
    }

    auto invocation = parse_callback_post_body(req.body);
    if (!invocation) {
        ctx_.metrics.record_callback(CallbackOutcome::Malformed);
        std::cerr << "[liveview] malformed callback request for context " << context_id << ": "
                  << describeError(invocation.error()) << std::endl;
        respond_text(res, 400, describeError(invocation.error()));
        return;
    }

    auto result = context->dispatch_callback(invocation->id, invocation->args);
    ctx_.metrics.record_callback(classify_callback_result(result));
    if (result) {
        respond_text(res, 200, "ok");
        return;
    }

    switch (result.error().code) {
    case Error::Code::NotFound:
        respond_text(res, 404, "Unknown callback");
        break;
    case Error::Code::Closed:
        respond_text(res, 404, "No such live context");
        break;
    default:
        respond_text(res, 500, "Callback failed");
        break;
    }
}

} // namespace LV::Web
