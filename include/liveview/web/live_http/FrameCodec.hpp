#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/live/LiveContext.hpp>
#include <liveview/live/Patch.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace LV::Web {

struct CallbackInvocation {
    Live::CallbackId id{0};
    nlohmann::json   args = nlohmann::json::array();
};

// "<id>:<json-args>" or a bare "<id>". A JSON value that is not an array becomes a
// single argument.
auto parse_callback_frame(std::string_view frame) -> Expected<CallbackInvocation>;

// POST body form: [callbackId, arg0, arg1, ...]
auto parse_callback_post_body(std::string_view body) -> Expected<CallbackInvocation>;

// One server-sent event carrying `payload` as its data lines.
auto encode_event_stream_frame(std::string_view payload) -> std::string;
auto encode_event_stream_comment(std::string_view comment) -> std::string;

// Parses `frame` and dispatches it on `context`. Parse failures surface as MalformedInput.
auto dispatch_callback_frame(Live::LiveContext& context, std::string_view frame) -> Expected<void>;

} // namespace LV::Web
