#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace httplib {
class Request;
class Response;
} // namespace httplib

namespace LV::Live {
class ContextDirectory;
}

namespace LV::Web {

struct LiveOptions;
class MetricsCollector;

struct LiveRequestContext {
    Live::ContextDirectory& directory;
    LiveOptions const&      options;
    MetricsCollector&       metrics;
};

inline constexpr std::size_t kMaxCallbackBodyBytes = 1024 * 1024;

void respond_text(httplib::Response& res, int status, std::string_view message);

auto get_client_address(httplib::Request const& req) -> std::string;

// True when the request asks for a protocol upgrade to WebSocket.
auto wants_websocket_upgrade(httplib::Request const& req) -> bool;

// `path` as an exact-match route pattern for httplib's regex routing.
auto exact_route_pattern(std::string_view path) -> std::string;

} // namespace LV::Web
