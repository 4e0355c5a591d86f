#pragma once

#include <liveview/web/LivePage.hpp>

#include <memory>
#include <vector>

namespace httplib {
class Server;
class Request;
class Response;
struct DataSink;
} // namespace httplib

namespace LV::Web {

struct LiveRequestContext;

class PageController {
public:
    static auto Create(LiveRequestContext& ctx, std::vector<LivePage> pages) -> std::unique_ptr<PageController>;

    void register_routes(httplib::Server& server);

    void handle_page(LivePage const& page, httplib::Request const& req, httplib::Response& res);

    // Writes the document for one render of `page`: shell, streamed markup and, when the
    // page registered live components, the client bootstrap for its context.
    void stream_page(LivePage const& page, httplib::DataSink& sink);

    auto pages() const -> std::vector<LivePage> const& { return pages_; }

    ~PageController();

private:
    PageController(LiveRequestContext& ctx, std::vector<LivePage> pages);

    LiveRequestContext&   ctx_;
    std::vector<LivePage> pages_;
};

} // namespace LV::Web
