#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <liveview/web/live_http/routing/HttpHelpers.hpp>

#include <cctype>
#include <string_view>

namespace LV::Web {

namespace {

auto contains_token_ignore_case(std::string_view header, std::string_view token) -> bool {
    if (token.empty() || header.size() < token.size()) {
        return false;
    }
    for (std::size_t i = 0; i + token.size() <= header.size(); ++i) {
        bool match = true;
        for (std::size_t j = 0; j < token.size(); ++j) {
            auto lhs = std::tolower(static_cast<unsigned char>(header[i + j]));
            auto rhs = std::tolower(static_cast<unsigned char>(token[j]));
            if (lhs != rhs) {
                match = false;
                break;
            }
        }
        if (match) {
            return true;
        }
    }
    return false;
}

} // namespace

void respond_text(httplib::Response& res, int status, std::string_view message) {
    res.status = status;
    res.set_content(std::string{message}, "text/plain; charset=utf-8");
    res.set_header("Cache-Control", "no-store");
}

auto get_client_address(httplib::Request const& req) -> std::string {
    if (!req.remote_addr.empty()) {
        return req.remote_addr;
    }
    if (!req.get_header_value("X-Forwarded-For").empty()) {
        return req.get_header_value("X-Forwarded-For");
    }
    return "<unknown>";
}

auto wants_websocket_upgrade(httplib::Request const& req) -> bool {
    return contains_token_ignore_case(req.get_header_value("Upgrade"), "websocket");
}

auto exact_route_pattern(std::string_view path) -> std::string {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string pattern;
    pattern.reserve(path.size() + 8);
    for (char ch : path) {
        if (kSpecial.find(ch) != std::string_view::npos) {
            pattern.push_back('\\');
        }
        pattern.push_back(ch);
    }
    return pattern;
}

} // namespace LV::Web
