#include <doctest/doctest.h>

#include <liveview/live/ContextDirectory.hpp>
#include <liveview/web/DemoPages.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace LV;
using namespace LV::Web;
using namespace std::chrono_literals;

TEST_SUITE("web.demo") {
TEST_CASE("Demo state exposes two routed pages") {
    Demo::DemoState state{std::chrono::hours{1}};
    auto            pages = state.pages();
    REQUIRE(pages.size() == 2);
    CHECK(pages[0].route == Demo::kDemoRoute);
    CHECK(pages[1].route == Demo::kAboutRoute);
    CHECK(static_cast<bool>(pages[0].render));
    CHECK(static_cast<bool>(pages[1].render));
}

TEST_CASE("Counter changes are logged as activity") {
    Demo::DemoState state{std::chrono::hours{1}};
    state.increment(10);
    state.increment(-1);
    CHECK(state.counter()->current() == 9);
    CHECK(state.activity()->current() == "counter -1 = 9");
    state.toggle_highlight();
    CHECK(state.highlight()->current() == true);
    CHECK(state.activity()->current() == "highlight on");
}

TEST_CASE("The demo page is live and the about page is static") {
    Demo::DemoState        state{std::chrono::hours{1}};
    Live::ContextDirectory directory;
    auto                   pages = state.pages();

    Live::StringMarkupSink demo_sink;
    auto                   demo = directory.render(pages[0].render, demo_sink);
    REQUIRE(demo.has_value());
    CHECK((*demo)->status() == Live::ContextStatus::NotConnected);
    CHECK(demo_sink.str().find("class=\"demo\"") != std::string::npos);
    CHECK(demo_sink.str().find("liveview.send(") != std::string::npos);
    CHECK(demo_sink.str().find("<script type=\"application/json\"") != std::string::npos);
    // The highlight attribute is queued for the client, not written inline.
    CHECK((*demo)->outbox()->size() == 1);

    Live::StringMarkupSink about_sink;
    auto                   about = directory.render(pages[1].render, about_sink);
    REQUIRE(about.has_value());
    CHECK((*about)->status() == Live::ContextStatus::Closed);
    CHECK(directory.size() == 1);
}

TEST_CASE("The uptime clock ticks") {
    Demo::DemoState state{10ms};
    auto const      deadline = std::chrono::steady_clock::now() + 5s;
    while (state.uptime()->current().value_or(0) < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(state.uptime()->current().value_or(0) >= 2);
}
}
