#include <liveview/web/DemoPages.hpp>

#include <liveview/live/RenderScope.hpp>

#include <iostream>
#include <utility>

namespace LV::Web::Demo {

namespace {

constexpr auto kDemoCss =
    "<style>.demo{font-family:system-ui,sans-serif;max-width:640px;margin:48px auto;padding:24px;"
    "border-radius:20px;background:#f8fafc;box-shadow:0 14px 30px rgba(5,25,45,0.12);}"
    ".demo h1{font-size:28px;color:#132b4a;}.demo button{background:#215ba0;color:#fff;border:none;"
    "padding:8px 18px;border-radius:999px;font-size:15px;cursor:pointer;margin-right:8px;}"
    ".demo .on{background:#fff3c4;}.demo .off{background:transparent;}"
    ".demo .panel{padding:12px;border-radius:12px;margin:16px 0;}"
    ".demo ul{font-size:13px;color:#3a4b5c;}</style>";

auto button(Live::CallbackId id, std::string_view args, std::string_view label) -> std::string {
    std::string markup{"<button type=\"button\" onclick=\""};
    markup.append(Live::escape_html(Live::RenderScope::invoke_script(id, args)));
    markup.append("\">");
    markup.append(Live::escape_html(label));
    markup.append("</button>");
    return markup;
}

} // namespace

DemoState::DemoState(std::chrono::milliseconds tick)
    : tick_(tick)
    , uptime_(Live::ValueSource<std::int64_t>::Create(std::int64_t{0}))
    , counter_(Live::ValueSource<int>::Create(0))
    , highlight_(Live::ValueSource<bool>::Create(false))
    , activity_(Live::ValueSource<std::string>::Create()) {
    schedule_tick();
}

DemoState::~DemoState() {
    timers_.shutdown();
}

void DemoState::schedule_tick() {
    auto scheduled = timers_.scheduleAfter(tick_, [this]() {
        uptime_->update([](std::int64_t& seconds) { ++seconds; });
        schedule_tick();
    });
    if (!scheduled && scheduled.error().code != Error::Code::Closed) {
        std::cerr << "[liveview] demo clock stopped: " << describeError(scheduled.error()) << "\n";
    }
}

void DemoState::increment(int delta) {
    int total = 0;
    counter_->update([&](int& value) {
        value += delta;
        total = value;
    });
    activity_->set("counter " + std::string{delta < 0 ? "-" : "+"} + std::to_string(delta < 0 ? -delta : delta)
                   + " = " + std::to_string(total));
}

void DemoState::toggle_highlight() {
    bool enabled = false;
    highlight_->update([&](bool& value) {
        value   = !value;
        enabled = value;
    });
    activity_->set(enabled ? "highlight on" : "highlight off");
}

auto DemoState::pages() -> std::vector<LivePage> {
    return {
        LivePage{.route  = std::string{kDemoRoute},
                 .title  = "liveview demo",
                 .render = [this](Live::RenderScope& scope) { render_demo(scope); }},
        LivePage{.route = std::string{kAboutRoute}, .title = "about liveview", .render = &DemoState::render_about},
    };
}

void DemoState::render_demo(Live::RenderScope& scope) {
    scope.write(kDemoCss);
    scope.write("<div class=\"demo\"><h1>liveview demo</h1>");

    scope.write("<p>Up for ");
    scope.live<std::int64_t>(Live::watch(uptime_), [](Live::RenderScope& out, std::int64_t const& seconds) {
        out.write_text(std::to_string(seconds) + "s");
    });
    scope.write("</p>");

    auto add_one = scope.callback<>([this]() { increment(1); });
    auto add_n   = scope.callback<int>([this](int delta) { increment(delta); });
    scope.write("<p>Count: ");
    scope.live<int>(Live::watch(counter_), [](Live::RenderScope& out, int const& value) {
        out.write_text(std::to_string(value));
    });
    scope.write("</p>");
    scope.write(button(add_one, {}, "+1"));
    scope.write(button(add_n, "10", "+10"));
    scope.write(button(add_n, "-1", "-1"));

    auto toggle = scope.callback<>([this]() { toggle_highlight(); });
    scope.component(
        [this](Live::RenderScope& panel) {
            panel.live<bool>(
                Live::watch(highlight_),
                [](Live::RenderScope& out, bool const& on) { out.write(on ? "class=\"panel on\"" : "class=\"panel off\""); },
                Live::ComponentOptions<bool>{.mode = Live::PatchMode::AttributeOnParent});
            panel.write("This panel's class attribute follows the highlight toggle.");
        },
        "div");
    scope.write(button(toggle, {}, "Toggle highlight"));

    scope.live_data<int>(Live::watch(counter_), [](int const& value) { return nlohmann::json{{"count", value}}; });

    scope.write("<h2>Activity</h2>");
    scope.live<std::string>(
        Live::watch(activity_),
        [](Live::RenderScope& out, std::string const& line) {
            out.write("<li>");
            out.write_text(line);
            out.write("</li>");
        },
        Live::ComponentOptions<std::string>{.mode = Live::PatchMode::Prepend, .container = "ul"});

    scope.write("<p><a href=\"/about\">About</a></p></div>");
}

void DemoState::render_about(Live::RenderScope& scope) {
    scope.write(kDemoCss);
    scope.write("<div class=\"demo\"><h1>about</h1>");
    scope.write("<p>This page has no live components, so no context outlives the request.</p>");
    scope.write("<p><a href=\"/\">Back</a></p></div>");
}

} // namespace LV::Web::Demo
