#include <liveview/web/live_http/FrameCodec.hpp>

#include <charconv>
#include <cstdint>

namespace LV::Web {

namespace {

using json = nlohmann::json;

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto parse_id(std::string_view text) -> Expected<Live::CallbackId> {
    if (text.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "callback id is empty"});
    }
    Live::CallbackId id = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), id);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "callback id is not a number: " + std::string{text}});
    }
    return id;
}

} // namespace

auto parse_callback_frame(std::string_view frame) -> Expected<CallbackInvocation> {
    frame           = trim(frame);
    auto const colon = frame.find(':');
    auto id          = parse_id(frame.substr(0, colon));
    if (!id) {
        return std::unexpected(id.error());
    }
    CallbackInvocation invocation{.id = *id, .args = json::array()};
    if (colon == std::string_view::npos) {
        return invocation;
    }

    auto const args_text = trim(frame.substr(colon + 1));
    if (args_text.empty()) {
        return invocation;
    }
    auto parsed = json::parse(args_text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "callback arguments are not valid JSON"});
    }
    if (parsed.is_array()) {
        invocation.args = std::move(parsed);
    } else {
        invocation.args.push_back(std::move(parsed));
    }
    return invocation;
}

auto parse_callback_post_body(std::string_view body) -> Expected<CallbackInvocation> {
    auto parsed = json::parse(trim(body), nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "request body is not valid JSON"});
    }
    if (!parsed.is_array() || parsed.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "request body must be [callbackId, ...args]"});
    }
    auto const& head = parsed.front();
    if (!head.is_number_unsigned() && !(head.is_number_integer() && head.get<std::int64_t>() >= 0)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "callback id must be a non-negative integer"});
    }
    CallbackInvocation invocation{.id = head.get<Live::CallbackId>(), .args = json::array()};
    for (std::size_t i = 1; i < parsed.size(); ++i) {
        invocation.args.push_back(std::move(parsed[i]));
    }
    return invocation;
}

auto encode_event_stream_frame(std::string_view payload) -> std::string {
    std::string block;
    block.reserve(payload.size() + 16);
    std::size_t start = 0U;
    do {
        auto end = payload.find('\n', start);
        auto len = (end == std::string_view::npos ? payload.size() : end) - start;
        block.append("data: ");
        block.append(payload.data() + start, len);
        block.append("\n");
        start = end == std::string_view::npos ? payload.size() + 1 : end + 1;
    } while (start <= payload.size());
    block.append("\n");
    return block;
}

auto encode_event_stream_comment(std::string_view comment) -> std::string {
    std::string block = ": ";
    block.append(comment.data(), comment.size());
    block.append("\n\n");
    return block;
}

auto dispatch_callback_frame(Live::LiveContext& context, std::string_view frame) -> Expected<void> {
    auto invocation = parse_callback_frame(frame);
    if (!invocation) {
        return std::unexpected(invocation.error());
    }
    return context.dispatch_callback(invocation->id, invocation->args);
}

} // namespace LV::Web
