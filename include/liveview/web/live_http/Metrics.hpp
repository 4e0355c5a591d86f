#pragma once

#include <liveview/live/ContextDirectory.hpp>
#include <liveview/live/Transport.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace httplib {
class Response;
}

namespace LV::Web {

enum class RouteMetric : std::size_t {
    Page = 0,
    LiveStream,
    LiveCallback,
    Healthz,
    Metrics,
    Count,
};

enum class CallbackOutcome : std::size_t {
    Dispatched = 0,
    Failed,
    Unknown,
    Malformed,
    Count,
};

// Maps the result of a callback dispatch onto the counter it increments.
auto classify_callback_result(Expected<void> const& result) -> CallbackOutcome;

class MetricsCollector {
public:
    struct HistogramSnapshot {
        static constexpr std::size_t kBucketCount = 10;
        std::array<std::uint64_t, kBucketCount>   buckets{};
        std::uint64_t                             count{0};
        std::uint64_t                             sum_micros{0};
    };

    struct MetricsSnapshot {
        struct RouteCounters {
            HistogramSnapshot latency;
            std::uint64_t     total{0};
            std::uint64_t     errors{0};
        };

        struct TransportCounters {
            std::int64_t  connections_current{0};
            std::uint64_t connections_total{0};
            std::uint64_t frames_sent{0};
        };

        std::array<RouteCounters, static_cast<std::size_t>(RouteMetric::Count)>          routes{};
        std::array<TransportCounters, 2>                                                 transports{};
        std::array<std::uint64_t, static_cast<std::size_t>(CallbackOutcome::Count)>      callbacks{};
        std::array<std::uint64_t, Live::kDirectoryEventCount>          context_events{};
        HistogramSnapshot                                                                page_render_latency;
    };

    void record_request(RouteMetric route, int status, std::chrono::microseconds latency);

    void record_connection_open(Live::TransportKind kind);
    void record_connection_close(Live::TransportKind kind);
    void record_frame_sent(Live::TransportKind kind);
    void record_callback(CallbackOutcome outcome);
    void record_context_event(Live::DirectoryEvent event);
    void record_page_render_latency(std::chrono::microseconds latency);

    auto capture_snapshot() const -> MetricsSnapshot;
    auto render_prometheus() const -> std::string;
    auto render_prometheus(MetricsSnapshot const& snapshot) const -> std::string;

private:
    class Histogram {
    public:
        void observe(std::chrono::microseconds value);
        auto snapshot() const -> HistogramSnapshot;
        static auto bucket_boundaries() -> std::array<double, HistogramSnapshot::kBucketCount> const&;

    private:
        static constexpr std::array<double, HistogramSnapshot::kBucketCount> kLatencyBucketsMs{
            1.0,   5.0,    20.0,   50.0,   100.0,
            250.0, 500.0,  1000.0, 2500.0, std::numeric_limits<double>::infinity()};

        std::array<std::atomic<std::uint64_t>, HistogramSnapshot::kBucketCount> buckets_{};
        std::atomic<std::uint64_t>                                               count_{0};
        std::atomic<std::uint64_t>                                               sum_micros_{0};
    };

    struct RouteCounters {
        Histogram                  latency;
        std::atomic<std::uint64_t> total{0};
        std::atomic<std::uint64_t> errors{0};
    };

    struct TransportCounters {
        std::atomic<std::int64_t>  connections_current{0};
        std::atomic<std::uint64_t> connections_total{0};
        std::atomic<std::uint64_t> frames_sent{0};
    };

    std::array<RouteCounters, static_cast<std::size_t>(RouteMetric::Count)>                routes_{};
    std::array<TransportCounters, 2>                                                       transports_{};
    std::array<std::atomic<std::uint64_t>, static_cast<std::size_t>(CallbackOutcome::Count)> callbacks_{};
    std::array<std::atomic<std::uint64_t>, Live::kDirectoryEventCount>             context_events_{};
    mutable std::atomic<std::uint64_t>                                                     metrics_scrapes_{0};
    Histogram                                                                              page_render_latency_;
};

class RequestMetricsScope {
public:
    RequestMetricsScope(MetricsCollector& metrics, RouteMetric route, httplib::Response& res);
    ~RequestMetricsScope();

private:
    MetricsCollector&                     metrics_;
    RouteMetric                           route_;
    httplib::Response&                    response_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace LV::Web
