#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <liveview/web/live_http/Metrics.hpp>

#include <cmath>
#include <sstream>
#include <utility>

namespace LV::Web {

namespace {

constexpr std::array<std::pair<RouteMetric, char const*>, static_cast<std::size_t>(RouteMetric::Count)>
    kRouteMetricNames{{
        {RouteMetric::Page, "page"},
        {RouteMetric::LiveStream, "live_stream"},
        {RouteMetric::LiveCallback, "live_callback"},
        {RouteMetric::Healthz, "healthz"},
        {RouteMetric::Metrics, "metrics"},
    }};

constexpr std::array<char const*, static_cast<std::size_t>(CallbackOutcome::Count)> kCallbackOutcomeNames{
    "dispatched", "failed", "unknown", "malformed"};

auto transport_index(Live::TransportKind kind) -> std::size_t {
    return kind == Live::TransportKind::WebSocket ? 0 : 1;
}

auto bucket_label(double boundary_ms) -> std::string {
    return std::isinf(boundary_ms) ? std::string{"+Inf"} : std::to_string(boundary_ms / 1000.0);
}

} // namespace

auto classify_callback_result(Expected<void> const& result) -> CallbackOutcome {
    if (result) {
        return CallbackOutcome::Dispatched;
    }
    switch (result.error().code) {
    case Error::Code::MalformedInput:
        return CallbackOutcome::Malformed;
    case Error::Code::CallbackFailed:
        return CallbackOutcome::Failed;
    default:
        return CallbackOutcome::Unknown;
    }
}

void MetricsCollector::Histogram::observe(std::chrono::microseconds value) {
    auto const micros = static_cast<std::uint64_t>(value.count());
    sum_micros_.fetch_add(micros, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);
    double const millis = static_cast<double>(micros) / 1000.0;
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        if (millis <= kLatencyBucketsMs[i]) {
            buckets_[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    buckets_.back().fetch_add(1, std::memory_order_relaxed);
}

auto MetricsCollector::Histogram::snapshot() const -> HistogramSnapshot {
    HistogramSnapshot snapshot{};
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        snapshot.buckets[i] = buckets_[i].load(std::memory_order_relaxed);
    }
    snapshot.count      = count_.load(std::memory_order_relaxed);
    snapshot.sum_micros = sum_micros_.load(std::memory_order_relaxed);
    return snapshot;
}

auto MetricsCollector::Histogram::bucket_boundaries()
    -> std::array<double, HistogramSnapshot::kBucketCount> const& {
    return kLatencyBucketsMs;
}

void MetricsCollector::record_request(RouteMetric route, int status, std::chrono::microseconds latency) {
    auto const index = static_cast<std::size_t>(route);
    if (index >= routes_.size()) {
        return;
    }
    auto& counters = routes_[index];
    counters.latency.observe(latency);
    counters.total.fetch_add(1, std::memory_order_relaxed);
    int effective_status = status <= 0 ? 200 : status;
    if (effective_status >= 400) {
        counters.errors.fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_connection_open(Live::TransportKind kind) {
    auto& counters = transports_[transport_index(kind)];
    counters.connections_current.fetch_add(1, std::memory_order_relaxed);
    counters.connections_total.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_connection_close(Live::TransportKind kind) {
    transports_[transport_index(kind)].connections_current.fetch_sub(1, std::memory_order_relaxed);
}

void MetricsCollector::record_frame_sent(Live::TransportKind kind) {
    transports_[transport_index(kind)].frames_sent.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_callback(CallbackOutcome outcome) {
    auto const index = static_cast<std::size_t>(outcome);
    if (index < callbacks_.size()) {
        callbacks_[index].fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_context_event(Live::DirectoryEvent event) {
    auto const index = static_cast<std::size_t>(event);
    if (index < context_events_.size()) {
        context_events_[index].fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_page_render_latency(std::chrono::microseconds latency) {
    page_render_latency_.observe(latency);
}

auto MetricsCollector::capture_snapshot() const -> MetricsSnapshot {
    MetricsSnapshot snapshot;
    for (std::size_t i = 0; i < routes_.size(); ++i) {
        snapshot.routes[i].latency = routes_[i].latency.snapshot();
        snapshot.routes[i].total   = routes_[i].total.load(std::memory_order_relaxed);
        snapshot.routes[i].errors  = routes_[i].errors.load(std::memory_order_relaxed);
    }
    for (std::size_t i = 0; i < transports_.size(); ++i) {
        snapshot.transports[i].connections_current = transports_[i].connections_current.load(std::memory_order_relaxed);
        snapshot.transports[i].connections_total   = transports_[i].connections_total.load(std::memory_order_relaxed);
        snapshot.transports[i].frames_sent         = transports_[i].frames_sent.load(std::memory_order_relaxed);
    }
    for (std::size_t i = 0; i < callbacks_.size(); ++i) {
        snapshot.callbacks[i] = callbacks_[i].load(std::memory_order_relaxed);
    }
    for (std::size_t i = 0; i < context_events_.size(); ++i) {
        snapshot.context_events[i] = context_events_[i].load(std::memory_order_relaxed);
    }
    snapshot.page_render_latency = page_render_latency_.snapshot();
    return snapshot;
}

auto MetricsCollector::render_prometheus() const -> std::string {
    auto snapshot = capture_snapshot();
    return render_prometheus(snapshot);
}

auto MetricsCollector::render_prometheus(MetricsSnapshot const& snapshot) const -> std::string {
    metrics_scrapes_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream out;

    out << "# HELP liveview_request_duration_seconds Request latency histogram\n";
    out << "# TYPE liveview_request_duration_seconds histogram\n";
    auto const& buckets = Histogram::bucket_boundaries();
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const&   route_stats = snapshot.routes[i];
        auto const*   name        = kRouteMetricNames[i].second;
        std::uint64_t cumulative  = 0;
        for (std::size_t b = 0; b < buckets.size(); ++b) {
            cumulative += route_stats.latency.buckets[b];
            out << "liveview_request_duration_seconds_bucket{route=\"" << name << "\",le=\""
                << bucket_label(buckets[b]) << "\"} " << cumulative << "\n";
        }
        out << "liveview_request_duration_seconds_sum{route=\"" << name << "\"} "
            << (route_stats.latency.sum_micros / 1'000'000.0) << "\n";
        out << "liveview_request_duration_seconds_count{route=\"" << name << "\"} "
            << route_stats.latency.count << "\n";
    }

    out << "# HELP liveview_requests_total Total HTTP requests\n";
    out << "# TYPE liveview_requests_total counter\n";
    out << "# HELP liveview_request_errors_total HTTP requests returning >=400\n";
    out << "# TYPE liveview_request_errors_total counter\n";
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name = kRouteMetricNames[i].second;
        out << "liveview_requests_total{route=\"" << name << "\"} " << snapshot.routes[i].total << "\n";
        out << "liveview_request_errors_total{route=\"" << name << "\"} " << snapshot.routes[i].errors << "\n";
    }

    out << "# HELP liveview_connections Open live connections by transport\n";
    out << "# TYPE liveview_connections gauge\n";
    out << "# HELP liveview_connections_total Live connections opened by transport\n";
    out << "# TYPE liveview_connections_total counter\n";
    out << "# HELP liveview_frames_sent_total Patch batches written by transport\n";
    out << "# TYPE liveview_frames_sent_total counter\n";
    constexpr std::array<Live::TransportKind, 2> kinds{Live::TransportKind::WebSocket,
                                                       Live::TransportKind::EventStream};
    for (auto kind : kinds) {
        auto const& counters = snapshot.transports[transport_index(kind)];
        auto const  label    = Live::to_string(kind);
        out << "liveview_connections{transport=\"" << label << "\"} " << counters.connections_current << "\n";
        out << "liveview_connections_total{transport=\"" << label << "\"} " << counters.connections_total << "\n";
        out << "liveview_frames_sent_total{transport=\"" << label << "\"} " << counters.frames_sent << "\n";
    }

    out << "# HELP liveview_callbacks_total Client callback invocations by outcome\n";
    out << "# TYPE liveview_callbacks_total counter\n";
    for (std::size_t i = 0; i < snapshot.callbacks.size(); ++i) {
        out << "liveview_callbacks_total{outcome=\"" << kCallbackOutcomeNames[i] << "\"} " << snapshot.callbacks[i]
            << "\n";
    }

    out << "# HELP liveview_context_events_total Live context lifecycle events\n";
    out << "# TYPE liveview_context_events_total counter\n";
    for (std::size_t i = 0; i < snapshot.context_events.size(); ++i) {
        out << "liveview_context_events_total{event=\"" << Live::to_string(static_cast<Live::DirectoryEvent>(i))
            << "\"} " << snapshot.context_events[i] << "\n";
    }

    out << "# HELP liveview_page_render_seconds Page render duration\n";
    out << "# TYPE liveview_page_render_seconds histogram\n";
    auto const&   render_snapshot = snapshot.page_render_latency;
    std::uint64_t cumulative      = 0;
    for (std::size_t b = 0; b < buckets.size(); ++b) {
        cumulative += render_snapshot.buckets[b];
        out << "liveview_page_render_seconds_bucket{le=\"" << bucket_label(buckets[b]) << "\"} " << cumulative
            << "\n";
    }
    out << "liveview_page_render_seconds_sum " << (render_snapshot.sum_micros / 1'000'000.0) << "\n";
    out << "liveview_page_render_seconds_count " << render_snapshot.count << "\n";

    out << "# HELP liveview_metrics_scrapes_total Metrics scrapes\n";
    out << "# TYPE liveview_metrics_scrapes_total counter\n";
    out << "liveview_metrics_scrapes_total " << metrics_scrapes_.load(std::memory_order_relaxed) << "\n";

    return out.str();
}

RequestMetricsScope::RequestMetricsScope(MetricsCollector& metrics, RouteMetric route, httplib::Response& res)
    : metrics_{metrics}
    , route_{route}
    , response_{res}
    , start_{std::chrono::steady_clock::now()} {}

RequestMetricsScope::~RequestMetricsScope() {
    auto duration = std::chrono::steady_clock::now() - start_;
    metrics_.record_request(route_, response_.status,
                            std::chrono::duration_cast<std::chrono::microseconds>(duration));
}

} // namespace LV::Web
