#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <liveview/web/live_http/transport/EventStreamTransport.hpp>

#include <liveview/web/live_http/FrameCodec.hpp>
#include <liveview/web/live_http/Metrics.hpp>

#include <string>

namespace LV::Web {

EventStreamTransport::EventStreamTransport(std::shared_ptr<Live::Outbox> outbox,
                                           std::chrono::milliseconds     keepalive,
                                           MetricsCollector*             metrics,
                                           std::atomic<bool>&            should_stop)
    : outbox_(std::move(outbox))
    , keepalive_(keepalive)
    , metrics_(metrics)
    , should_stop_(should_stop) {}

void EventStreamTransport::close() {
    closed_.store(true, std::memory_order_release);
}

void EventStreamTransport::cancel() {
    cancelled_.store(true, std::memory_order_release);
}

auto EventStreamTransport::closed() const -> bool {
    return closed_.load(std::memory_order_acquire);
}

auto EventStreamTransport::finished() const -> bool {
    return cancelled_.load(std::memory_order_acquire) || should_stop_.load(std::memory_order_acquire);
}

auto EventStreamTransport::pump(httplib::DataSink& sink) -> bool {
    if (finished()) {
        return false;
    }

    if (!started_) {
        started_ = true;
        // Empty batch first so the client knows the stream is attached.
        if (!write_frame(sink, "[]")) {
            return false;
        }
        if (outbox_) {
            for (auto& frame : outbox_->drain()) {
                if (!write_frame(sink, frame)) {
                    return false;
                }
            }
        }
        return !closed();
    }

    if (!outbox_) {
        return false;
    }

    auto frame = outbox_->wait_pop(kWaitTimeout);
    if (finished()) {
        return false;
    }
    if (frame) {
        if (!write_frame(sink, *frame)) {
            return false;
        }
        while (auto next = outbox_->try_pop()) {
            if (!write_frame(sink, *next)) {
                return false;
            }
        }
        return true;
    }

    if (closed() || outbox_->closed()) {
        return false;
    }

    if (std::chrono::steady_clock::now() - last_write_ >= keepalive_) {
        return write_keepalive(sink);
    }
    return true;
}

auto EventStreamTransport::write_frame(httplib::DataSink& sink, std::string const& frame) -> bool {
    auto block = encode_event_stream_frame(frame);
    if (!sink.write(block.data(), block.size())) {
        cancel();
        return false;
    }
    last_write_ = std::chrono::steady_clock::now();
    if (metrics_ != nullptr) {
        metrics_->record_frame_sent(Live::TransportKind::EventStream);
    }
    return true;
}

auto EventStreamTransport::write_keepalive(httplib::DataSink& sink) -> bool {
    auto block = encode_event_stream_comment("keep-alive");
    if (!sink.write(block.data(), block.size())) {
        cancel();
        return false;
    }
    last_write_ = std::chrono::steady_clock::now();
    return true;
}

} // namespace LV::Web
