#include <doctest/doctest.h>

#include "LiveHttpTestHelpers.hpp"

#include <liveview/web/live_http/Metrics.hpp>

#include <chrono>
#include <string>

using namespace LV;
using namespace LV::Web;

TEST_SUITE("web.live.metrics") {
TEST_CASE("Callback results map onto outcomes") {
    CHECK(classify_callback_result(Expected<void>{}) == CallbackOutcome::Dispatched);
    CHECK(classify_callback_result(std::unexpected(Error{Error::Code::MalformedInput, "bad"}))
          == CallbackOutcome::Malformed);
    CHECK(classify_callback_result(std::unexpected(Error{Error::Code::CallbackFailed, "threw"}))
          == CallbackOutcome::Failed);
    CHECK(classify_callback_result(std::unexpected(Error{Error::Code::NotFound, "gone"})) == CallbackOutcome::Unknown);
    CHECK(classify_callback_result(std::unexpected(Error{Error::Code::Closed, "closed"})) == CallbackOutcome::Unknown);
}

TEST_CASE("Request scopes record status and latency") {
    MetricsCollector metrics;
    {
        httplib::Response res;
        RequestMetricsScope scope{metrics, RouteMetric::LiveCallback, res};
        res.status = 404;
    }
    {
        httplib::Response res;
        RequestMetricsScope scope{metrics, RouteMetric::LiveCallback, res};
        res.status = 200;
    }
    auto snapshot = metrics.capture_snapshot();
    auto const& route = snapshot.routes[static_cast<std::size_t>(RouteMetric::LiveCallback)];
    CHECK(route.total == 2);
    CHECK(route.errors == 1);
    CHECK(route.latency.count == 2);
}

TEST_CASE("Prometheus output covers every metric family") {
    MetricsCollector metrics;
    metrics.record_connection_open(Live::TransportKind::WebSocket);
    metrics.record_frame_sent(Live::TransportKind::WebSocket);
    metrics.record_frame_sent(Live::TransportKind::WebSocket);
    metrics.record_callback(CallbackOutcome::Dispatched);
    metrics.record_context_event(Live::DirectoryEvent::TimedOut);
    metrics.record_page_render_latency(std::chrono::milliseconds{3});
    metrics.record_request(RouteMetric::Page, 200, std::chrono::microseconds{500});

    auto text = metrics.render_prometheus();
    CHECK(text.find("liveview_connections{transport=\"websocket\"} 1") != std::string::npos);
    CHECK(text.find("liveview_connections{transport=\"event-stream\"} 0") != std::string::npos);
    CHECK(text.find("liveview_frames_sent_total{transport=\"websocket\"} 2") != std::string::npos);
    CHECK(text.find("liveview_callbacks_total{outcome=\"dispatched\"} 1") != std::string::npos);
    CHECK(text.find("liveview_context_events_total{event=\"timed_out\"} 1") != std::string::npos);
    CHECK(text.find("liveview_page_render_seconds_count 1") != std::string::npos);
    CHECK(text.find("liveview_requests_total{route=\"page\"} 1") != std::string::npos);
    CHECK(text.find("liveview_request_duration_seconds_bucket{route=\"page\",le=\"+Inf\"} 1") != std::string::npos);
    CHECK(text.find("liveview_metrics_scrapes_total 1") != std::string::npos);

    metrics.record_connection_close(Live::TransportKind::WebSocket);
    CHECK(metrics.capture_snapshot().transports[0].connections_current == 0);
}
}
