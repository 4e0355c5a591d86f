#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <liveview/web/live_http/routing/PageController.hpp>

#include <liveview/live/ContextDirectory.hpp>
#include <liveview/live/RenderScope.hpp>
#include <liveview/web/LiveOptions.hpp>
#include <liveview/web/live_http/ClientScript.hpp>
#include <liveview/web/live_http/Metrics.hpp>
#include <liveview/web/live_http/routing/HttpHelpers.hpp>

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <iostream>
#include <string_view>

namespace LV::Web {

auto PageController::Create(LiveRequestContext& ctx, std::vector<LivePage> pages) -> std::unique_ptr<PageController> {
    return std::unique_ptr<PageController>(new PageController(ctx, std::move(pages)));
}

PageController::PageController(LiveRequestContext& ctx, std::vector<LivePage> pages)
    : ctx_(ctx)
    , pages_(std::move(pages)) {}

PageController::~PageController() = default;

void PageController::register_routes(httplib::Server& server) {
    for (auto const& page : pages_) {
        server.Get(exact_route_pattern(page.route),
                   [this, &page](httplib::Request const& req, httplib::Response& res) { handle_page(page, req, res); });
    }
}

void PageController::handle_page(LivePage const& page, httplib::Request const&, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Page, res};
    res.set_header("Cache-Control", "no-store");
    res.set_chunked_content_provider("text/html; charset=utf-8", [this, &page](size_t, httplib::DataSink& sink) {
        stream_page(page, sink);
        sink.done();
        return true;
    });
}

void PageController::stream_page(LivePage const& page, httplib::DataSink& sink) {
    auto write = [&sink](std::string_view text) { return sink.write(text.data(), text.size()); };

    if (!write(build_page_head(page.title))) {
        return;
    }

    auto const start = std::chrono::steady_clock::now();
    Live::StreamMarkupSink markup{write};
    auto rendered = ctx_.directory.render(page.render, markup);
    auto const flushed = markup.flush();
    ctx_.metrics.record_page_render_latency(
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start));

    if (!rendered) {
        std::cerr << "[liveview] page " << page.route << " failed to render: " << describeError(rendered.error())
                  << std::endl;
        (void)write(build_page_tail());
        return;
    }

    auto const& context = *rendered;
    if (!flushed) {
        // Client went away mid-render; nobody will ever connect.
        ctx_.directory.disconnect(context->id());
        return;
    }
    if (context->status() != Live::ContextStatus::Closed) {
        lv_log("PageController::stream_page published context " + context->id() + " for " + page.route, "Page");
        if (!write(build_bootstrap_script(context->id(), ctx_.options.live_path, ctx_.options.websocket_port))) {
            ctx_.directory.disconnect(context->id());
            return;
        }
    }
    (void)write(build_page_tail());
}

} // namespace LV::Web
