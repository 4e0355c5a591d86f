#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <liveview/web/LiveServer.hpp>

#include <liveview/live/ContextDirectory.hpp>
#include <liveview/web/live_http/Metrics.hpp>
#include <liveview/web/live_http/routing/ConnectionController.hpp>
#include <liveview/web/live_http/routing/HttpHelpers.hpp>
#include <liveview/web/live_http/routing/PageController.hpp>
#include <liveview/web/live_http/transport/WebSocketEndpoint.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace LV::Web {

static std::atomic<bool> g_should_stop{false};

void RequestLiveServerStop() {
    g_should_stop.store(true);
}

void ResetLiveServerStopFlag() {
    g_should_stop.store(false);
}

int RunLiveServerWithStopFlag(std::vector<LivePage>               pages,
                              LiveOptions const&                  options,
                              std::atomic<bool>&                  should_stop,
                              LiveLogHooks const&                 log_hooks,
                              std::function<void(Expected<void>)> on_listen) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    std::atomic<bool> listen_reported{false};
    auto report_listen_status = [&](Expected<void> status) {
        if (!on_listen) {
            return;
        }
        bool expected = false;
        if (!listen_reported.compare_exchange_strong(expected, true)) {
            return;
        }
        on_listen(std::move(status));
    };

    if (auto invalid = ValidateLiveOptions(options)) {
        log_error("[liveview] " + *invalid);
        report_listen_status(std::unexpected(Error{Error::Code::MalformedInput, *invalid}));
        return EXIT_FAILURE;
    }

    MetricsCollector metrics;
    Live::ContextDirectory directory{
        Live::DirectoryConfig{.connect_timeout = std::chrono::seconds{options.connect_timeout_seconds}},
        Live::DirectoryHooks{.on_event = [&metrics](Live::DirectoryEvent event) { metrics.record_context_event(event); }}};

    LiveRequestContext http_context{
        .directory = directory,
        .options   = options,
        .metrics   = metrics,
    };

    std::optional<WebSocketEndpoint> websocket;
    if (options.websocket_port > 0) {
        websocket.emplace(WebSocketEndpointConfig{.host      = options.host,
                                                  .port      = options.websocket_port,
                                                  .live_path = options.live_path},
                          directory,
                          &metrics);
        if (auto started = websocket->start(); !started) {
            log_error("[liveview] " + describeError(started.error()));
            report_listen_status(std::unexpected(started.error()));
            directory.shutdown();
            return EXIT_FAILURE;
        }
    }

    httplib::Server server;

    server.Get("/healthz", [&](httplib::Request const&, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{metrics, RouteMetric::Healthz, res};
        res.status = 200;
        res.set_content("ok", "text/plain; charset=utf-8");
    });

    server.Get("/metrics", [&](httplib::Request const&, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{metrics, RouteMetric::Metrics, res};
        auto snapshot = metrics.capture_snapshot();
        auto body     = metrics.render_prometheus(snapshot);
        res.set_header("Cache-Control", "no-store");
        res.set_content(body, "text/plain; version=0.0.4");
    });

    auto connection_controller = ConnectionController::Create(http_context, should_stop);
    connection_controller->register_routes(server);

    auto page_controller = PageController::Create(http_context, std::move(pages));
    page_controller->register_routes(server);

    std::atomic<bool> listen_failed{false};
    std::thread server_thread([&]() {
        if (!server.listen(options.host.c_str(), options.port)) {
            if (!should_stop.load()) {
                listen_failed.store(true);
                should_stop.store(true);
                log_error(std::string{"[liveview] Failed to bind "} + options.host + ":"
                          + std::to_string(options.port));
            }
        }
    });

    log_info(std::string{"[liveview] Listening on http://"} + options.host + ":" + std::to_string(options.port));
    if (websocket) {
        log_info(std::string{"[liveview] WebSocket transport on ws://"} + options.host + ":"
                 + std::to_string(options.websocket_port) + options.live_path);
    }
    for (auto const& page : page_controller->pages()) {
        log_info(std::string{"[liveview] Serving http://"} + options.host + ":" + std::to_string(options.port)
                 + page.route);
    }

    while (!should_stop.load(std::memory_order_acquire) && !listen_failed.load(std::memory_order_acquire)) {
        if (!listen_reported.load(std::memory_order_acquire) && server.is_running()) {
            report_listen_status({});
        }
        directory.sweep(Live::ContextDirectory::Clock::now());
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!listen_reported.load(std::memory_order_acquire)) {
        if (listen_failed.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(Error{Error::Code::UnknownError, "failed to bind liveview listener"}));
        } else if (should_stop.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(Error{Error::Code::Closed, "liveview stop requested"}));
        }
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }
    if (websocket) {
        websocket->stop();
    }
    directory.shutdown();

    return listen_failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunLiveServer(std::vector<LivePage> pages, LiveOptions const& options) {
    return RunLiveServerWithStopFlag(std::move(pages), options, g_should_stop, {}, {});
}

} // namespace LV::Web
