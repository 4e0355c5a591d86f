#pragma once

#include <liveview/live/LiveContext.hpp>

#include <string>

namespace LV::Web {

// A routed page. `render` runs once per GET with a fresh live context.
struct LivePage {
    std::string        route{"/"};
    std::string        title{"liveview"};
    Live::PageRenderer render;
};

} // namespace LV::Web
