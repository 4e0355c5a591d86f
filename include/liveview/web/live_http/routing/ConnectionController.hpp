#pragma once

#include <atomic>
#include <memory>

namespace httplib {
class Server;
class Request;
class Response;
} // namespace httplib

namespace LV::Web {

struct LiveRequestContext;

/**
 * ConnectionController: HTTP side of the live connection on `live_path?id=<ctx>`.
 *
 * GET attaches an event stream transport to the context (or answers 426 pointing at
 * the WebSocket port when an upgrade was requested); POST carries a callback
 * invocation `[callbackId, ...args]` for clients without a WebSocket.
 */
class ConnectionController {
public:
    static auto Create(LiveRequestContext& ctx, std::atomic<bool>& should_stop)
        -> std::unique_ptr<ConnectionController>;

    void register_routes(httplib::Server& server);

    void handle_stream(httplib::Request const& req, httplib::Response& res);
    void handle_callback(httplib::Request const& req, httplib::Response& res);

    ~ConnectionController();

private:
    ConnectionController(LiveRequestContext& ctx, std::atomic<bool>& should_stop);

    LiveRequestContext& ctx_;
    std::atomic<bool>&  should_stop_;
};

} // namespace LV::Web
