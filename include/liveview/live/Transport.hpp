#pragma once

#include <cstdint>
#include <string_view>

namespace LV::Live {

enum class TransportKind : std::uint8_t {
    WebSocket = 0,
    EventStream,
};

inline auto to_string(TransportKind kind) -> std::string_view {
    switch (kind) {
    case TransportKind::WebSocket:
        return "websocket";
    case TransportKind::EventStream:
        return "event-stream";
    }
    return "unknown";
}

/**
 * Transport: the live connection attached to one context.
 *
 * A transport owns the send loop for its context: it drains the context's Outbox and
 * writes frames in order. wake() is called from producer threads after a frame has
 * been queued; close() asks the transport to end the connection from the server side.
 * Both must be safe to call from any thread.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual auto kind() const -> TransportKind = 0;
    virtual void wake()                        = 0;
    virtual void close()                       = 0;
};

} // namespace LV::Live
