#pragma once

#include <string>
#include <string_view>

namespace LV::Web {

// Document start up to and including the opening <body> tag.
[[nodiscard]] auto build_page_head(std::string_view title) -> std::string;
[[nodiscard]] auto build_page_tail() -> std::string;

// Client runtime for one context: opens the WebSocket (falling back to an event stream
// plus POST callbacks), applies patch batches and exposes window.liveview.send.
[[nodiscard]] auto build_bootstrap_script(std::string_view context_id, std::string_view live_path, int websocket_port)
    -> std::string;

} // namespace LV::Web
