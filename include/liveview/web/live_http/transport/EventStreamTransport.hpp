#pragma once

#include <liveview/live/Outbox.hpp>
#include <liveview/live/Transport.hpp>

#include <atomic>
#include <chrono>
#include <memory>

namespace httplib {
struct DataSink;
}

namespace LV::Web {

class MetricsCollector;

/**
 * EventStreamTransport: fallback downstream over text/event-stream.
 *
 * Driven by the chunked content provider of the stream request: each pump() call
 * writes whatever the context's outbox holds, or a keep-alive comment once the
 * connection has been idle for the keep-alive interval. Upstream callbacks arrive
 * separately as POST requests.
 */
class EventStreamTransport final : public Live::Transport {
public:
    EventStreamTransport(std::shared_ptr<Live::Outbox> outbox,
                         std::chrono::milliseconds     keepalive,
                         MetricsCollector*             metrics,
                         std::atomic<bool>&            should_stop);

    auto kind() const -> Live::TransportKind override { return Live::TransportKind::EventStream; }
    // The pump polls the outbox with a short timeout; nothing to wake.
    void wake() override {}
    void close() override;

    auto pump(httplib::DataSink& sink) -> bool;
    void cancel();
    auto closed() const -> bool;

private:
    static constexpr auto kWaitTimeout = std::chrono::milliseconds(250);

    auto write_frame(httplib::DataSink& sink, std::string const& frame) -> bool;
    auto write_keepalive(httplib::DataSink& sink) -> bool;
    auto finished() const -> bool;

    std::shared_ptr<Live::Outbox>         outbox_;
    std::chrono::milliseconds             keepalive_;
    MetricsCollector*                     metrics_{nullptr};
    std::atomic<bool>&                    should_stop_;
    bool                                  started_{false};
    std::atomic<bool>                     cancelled_{false};
    std::atomic<bool>                     closed_{false};
    std::chrono::steady_clock::time_point last_write_{std::chrono::steady_clock::now()};
};

} // namespace LV::Web
