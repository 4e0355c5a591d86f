#pragma once

#include <liveview/live/ValueSource.hpp>
#include <liveview/task/TimerQueue.hpp>
#include <liveview/web/LivePage.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace LV::Web::Demo {

inline constexpr std::string_view kDemoRoute{"/"};
inline constexpr std::string_view kAboutRoute{"/about"};

// Shared application state behind the demo pages: a ticking uptime counter, a click
// counter, a highlight toggle and an activity log. Every open tab observes the same
// values through its own watched views.
class DemoState {
public:
    explicit DemoState(std::chrono::milliseconds tick = std::chrono::milliseconds(1000));
    ~DemoState();

    DemoState(DemoState const&)            = delete;
    DemoState& operator=(DemoState const&) = delete;

    auto pages() -> std::vector<LivePage>;

    void increment(int delta);
    void toggle_highlight();

    auto uptime() const -> std::shared_ptr<Live::ValueSource<std::int64_t>> const& { return uptime_; }
    auto counter() const -> std::shared_ptr<Live::ValueSource<int>> const& { return counter_; }
    auto highlight() const -> std::shared_ptr<Live::ValueSource<bool>> const& { return highlight_; }
    auto activity() const -> std::shared_ptr<Live::ValueSource<std::string>> const& { return activity_; }

private:
    void schedule_tick();
    void render_demo(Live::RenderScope& scope);
    static void render_about(Live::RenderScope& scope);

    std::chrono::milliseconds                         tick_;
    std::shared_ptr<Live::ValueSource<std::int64_t>> uptime_;
    std::shared_ptr<Live::ValueSource<int>>          counter_;
    std::shared_ptr<Live::ValueSource<bool>>         highlight_;
    std::shared_ptr<Live::ValueSource<std::string>>  activity_;
    TimerQueue                                        timers_;
};

} // namespace LV::Web::Demo
