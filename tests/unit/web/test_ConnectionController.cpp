#include <doctest/doctest.h>

#include "LiveHttpTestHelpers.hpp"

#include <liveview/live/ContextDirectory.hpp>
#include <liveview/live/ValueSource.hpp>
#include <liveview/web/LiveOptions.hpp>
#include <liveview/web/live_http/Metrics.hpp>
#include <liveview/web/live_http/routing/ConnectionController.hpp>
#include <liveview/web/live_http/routing/HttpHelpers.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace LV;
using namespace LV::Web;
using LV::Web::Testing::CollectingSink;

namespace {

struct ControllerFixture {
    ControllerFixture() {
        options.keepalive_ms = 5000;
        controller           = ConnectionController::Create(ctx, should_stop);
    }

    // Renders a page with one live counter and a few callbacks; returns its context id.
    auto render_live_page() -> std::string {
        Live::StringMarkupSink sink;
        auto                   rendered = directory.render(
            [this](Live::RenderScope& page) {
                page.live<int>(Live::watch(counter), [](Live::RenderScope& out, int const& value) {
                    out.write_text(std::to_string(value));
                });
                add_cb   = page.callback<int>([this](int delta) { counter->update([delta](int& v) { v += delta; }); });
                throw_cb = page.callback<>([]() { throw std::runtime_error("handler failed"); });
            },
            sink);
        REQUIRE(rendered.has_value());
        return (*rendered)->id();
    }

    static auto request_for(std::optional<std::string> const& id) -> httplib::Request {
        httplib::Request req;
        if (id) {
            req.params.emplace("id", *id);
        }
        return req;
    }

    LiveOptions                           options;
    Live::ContextDirectory                directory;
    MetricsCollector                      metrics;
    LiveRequestContext                    ctx{directory, options, metrics};
    std::atomic<bool>                     should_stop{false};
    std::unique_ptr<ConnectionController> controller;
    std::shared_ptr<Live::ValueSource<int>> counter = Live::ValueSource<int>::Create(0);
    Live::CallbackId                      add_cb{0};
    Live::CallbackId                      throw_cb{0};
};

} // namespace

TEST_SUITE("web.live.connection") {
TEST_CASE("Stream requests validate the context id") {
    ControllerFixture fixture;

    httplib::Response missing;
    fixture.controller->handle_stream(ControllerFixture::request_for(std::nullopt), missing);
    CHECK(missing.status == 400);

    httplib::Response unknown;
    fixture.controller->handle_stream(ControllerFixture::request_for("nope"), unknown);
    CHECK(unknown.status == 404);
    CHECK(unknown.body == "No such live context");
}

TEST_CASE("Upgrade requests are pointed at the WebSocket port") {
    ControllerFixture fixture;
    auto              id  = fixture.render_live_page();
    auto              req = ControllerFixture::request_for(id);
    req.headers.emplace("Upgrade", "WebSocket");

    httplib::Response res;
    fixture.controller->handle_stream(req, res);
    CHECK(res.status == 426);
    CHECK(res.get_header_value("X-Liveview-WebSocket-Port") == "8081");
    CHECK(fixture.directory.lookup(id)->status() == Live::ContextStatus::NotConnected);
}

TEST_CASE("An event stream attaches once and releases the context when it ends") {
    ControllerFixture fixture;
    auto              id = fixture.render_live_page();
    fixture.counter->set(4);

    {
        httplib::Response res;
        fixture.controller->handle_stream(ControllerFixture::request_for(id), res);
        CHECK(res.get_header_value("Content-Type") == "text/event-stream");
        REQUIRE(res.content_provider_);
        CHECK(fixture.directory.lookup(id)->status() == Live::ContextStatus::Connected);

        CollectingSink collector;
        CHECK(res.content_provider_(0, 0, collector.sink));
        CHECK(collector.buffer.starts_with("data: []\n\n"));
        CHECK(collector.buffer.find("\"payload\":\"4\"") != std::string::npos);

        httplib::Response second;
        fixture.controller->handle_stream(ControllerFixture::request_for(id), second);
        CHECK(second.status == 409);

        auto snapshot = fixture.metrics.capture_snapshot();
        CHECK(snapshot.transports[1].connections_current == 1);
    }

    CHECK(fixture.directory.lookup(id) == nullptr);
    CHECK(fixture.counter->listener_count() == 0);
    auto snapshot = fixture.metrics.capture_snapshot();
    CHECK(snapshot.transports[1].connections_current == 0);
    CHECK(snapshot.transports[1].connections_total == 1);
}

TEST_CASE("Callback posts map dispatch results to status codes") {
    ControllerFixture fixture;
    auto              id = fixture.render_live_page();

    auto post = [&](std::string const& body) {
        auto req = ControllerFixture::request_for(id);
        req.body = body;
        httplib::Response res;
        fixture.controller->handle_callback(req, res);
        return res.status;
    };

    CHECK(post("[" + std::to_string(fixture.add_cb) + ", 3]") == 200);
    CHECK(fixture.counter->current() == 3);
    CHECK(post("[" + std::to_string(fixture.add_cb) + "]") == 500);
    CHECK(post("[" + std::to_string(fixture.throw_cb) + "]") == 500);
    CHECK(post("[424242]") == 404);
    CHECK(post("{\"id\":1}") == 400);
    CHECK(post(std::string(kMaxCallbackBodyBytes + 1, ' ')) == 413);

    auto snapshot = fixture.metrics.capture_snapshot();
    CHECK(snapshot.callbacks[static_cast<std::size_t>(CallbackOutcome::Dispatched)] == 1);
    CHECK(snapshot.callbacks[static_cast<std::size_t>(CallbackOutcome::Failed)] == 2);
    CHECK(snapshot.callbacks[static_cast<std::size_t>(CallbackOutcome::Unknown)] == 1);
    CHECK(snapshot.callbacks[static_cast<std::size_t>(CallbackOutcome::Malformed)] == 2);

    httplib::Response missing;
    fixture.controller->handle_callback(ControllerFixture::request_for(std::nullopt), missing);
    CHECK(missing.status == 400);

    httplib::Response unknown_context;
    auto              req = ControllerFixture::request_for("nope");
    req.body              = "[1]";
    fixture.controller->handle_callback(req, unknown_context);
    CHECK(unknown_context.status == 404);
}
}

TEST_CASE("Route patterns match the path literally") {
    CHECK(exact_route_pattern("/__live") == "/__live");
    CHECK(exact_route_pattern("/a.b") == "/a\\.b");
    CHECK(exact_route_pattern("/x+(y)") == "/x\\+\\(y\\)");
}

TEST_CASE("Upgrade detection ignores case") {
    httplib::Request req;
    CHECK_FALSE(wants_websocket_upgrade(req));
    req.headers.emplace("Upgrade", "h2c");
    CHECK_FALSE(wants_websocket_upgrade(req));
    httplib::Request ws;
    ws.headers.emplace("Upgrade", "websocket");
    CHECK(wants_websocket_upgrade(ws));
}
