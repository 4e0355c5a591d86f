#include <doctest/doctest.h>

#include "LiveTestHelpers.hpp"

#include <liveview/live/ContextDirectory.hpp>
#include <liveview/live/ValueSource.hpp>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace LV;
using namespace LV::Live;
using LV::Live::Testing::FakeTransport;

namespace {

struct EventRecorder {
    auto hooks() -> DirectoryHooks {
        return DirectoryHooks{.on_event = [this](DirectoryEvent event) {
            std::lock_guard const lock{mutex};
            events.push_back(event);
        }};
    }

    auto count(DirectoryEvent event) -> int {
        std::lock_guard const lock{mutex};
        int n = 0;
        for (auto e : events) {
            if (e == event) {
                ++n;
            }
        }
        return n;
    }

    std::mutex                  mutex;
    std::vector<DirectoryEvent> events;
};

auto live_counter_page(std::shared_ptr<ValueSource<int>> counter) -> PageRenderer {
    return [counter](RenderScope& page) {
        page.write("<h1>Counter</h1>");
        page.live<int>(watch(counter), [](RenderScope& out, int const& value) { out.write_text(std::to_string(value)); });
    };
}

} // namespace

TEST_SUITE("live.directory") {
TEST_CASE("Rendering a live page publishes a waiting context") {
    EventRecorder    recorder;
    ContextDirectory directory{{}, recorder.hooks()};
    auto             counter = ValueSource<int>::Create(7);

    StringMarkupSink sink;
    auto             rendered = directory.render(live_counter_page(counter), sink);
    REQUIRE(rendered.has_value());
    auto context = *rendered;

    CHECK(sink.str().find("<h1>Counter</h1>") == 0);
    CHECK(sink.str().find(">7</span>") != std::string::npos);
    CHECK(directory.size() == 1);
    CHECK(directory.lookup(context->id()) == context);
    CHECK(context->status() == ContextStatus::NotConnected);
    CHECK(context->connect_deadline().has_value());
    CHECK(recorder.count(DirectoryEvent::Rendered) == 1);
}

TEST_CASE("Static pages never stay in the directory") {
    EventRecorder    recorder;
    ContextDirectory directory{{}, recorder.hooks()};

    StringMarkupSink sink;
    int              clicks   = 0;
    auto             rendered = directory.render(
        [&](RenderScope& page) {
            page.write("<p>static</p>");
            page.callback<>([&]() { ++clicks; });
        },
        sink);
    REQUIRE(rendered.has_value());
    CHECK((*rendered)->status() == ContextStatus::Closed);
    CHECK(directory.size() == 0);
    CHECK(recorder.count(DirectoryEvent::StaticPage) == 1);
}

TEST_CASE("Render failures drop the context") {
    EventRecorder    recorder;
    ContextDirectory directory{{}, recorder.hooks()};

    StringMarkupSink sink;
    auto rendered = directory.render([](RenderScope&) { throw std::runtime_error("broken page"); }, sink);
    REQUIRE_FALSE(rendered.has_value());
    CHECK(rendered.error().code == Error::Code::RenderFailed);
    CHECK(directory.size() == 0);
    CHECK(recorder.count(DirectoryEvent::RenderFailed) == 1);
}

TEST_CASE("Connect attaches once and disconnect releases everything") {
    EventRecorder    recorder;
    ContextDirectory directory{{}, recorder.hooks()};
    auto             counter = ValueSource<int>::Create(1);

    StringMarkupSink sink;
    auto             context = *directory.render(live_counter_page(counter), sink);

    auto transport = std::make_shared<FakeTransport>();
    auto connected = directory.connect(context->id(), transport);
    REQUIRE(connected.has_value());
    CHECK(*connected == context);
    CHECK(recorder.count(DirectoryEvent::Connected) == 1);

    auto again = directory.connect(context->id(), std::make_shared<FakeTransport>());
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == Error::Code::AlreadyConnected);

    auto missing = directory.connect("does-not-exist", std::make_shared<FakeTransport>());
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);

    CHECK(counter->listener_count() == 1);
    directory.disconnect(context->id());
    CHECK(directory.size() == 0);
    CHECK(context->status() == ContextStatus::Closed);
    CHECK(transport->closes.load() == 1);
    CHECK(counter->listener_count() == 0);
    CHECK(recorder.count(DirectoryEvent::Disconnected) == 1);

    directory.disconnect(context->id());
    CHECK(recorder.count(DirectoryEvent::Disconnected) == 1);
}

TEST_CASE("Sweep expires only overdue unconnected contexts") {
    EventRecorder    recorder;
    ContextDirectory directory{{.connect_timeout = std::chrono::seconds{30}}, recorder.hooks()};
    auto             counter = ValueSource<int>::Create(1);

    StringMarkupSink first_sink;
    StringMarkupSink second_sink;
    auto             waiting   = *directory.render(live_counter_page(counter), first_sink);
    auto             connected = *directory.render(live_counter_page(counter), second_sink);
    REQUIRE(directory.connect(connected->id(), std::make_shared<FakeTransport>()).has_value());

    CHECK(directory.sweep(ContextDirectory::Clock::now()) == 0);
    CHECK(directory.size() == 2);

    auto later = ContextDirectory::Clock::now() + std::chrono::seconds{31};
    CHECK(directory.sweep(later) == 1);
    CHECK(directory.size() == 1);
    CHECK(waiting->status() == ContextStatus::Closed);
    CHECK(connected->status() == ContextStatus::Connected);
    CHECK(recorder.count(DirectoryEvent::TimedOut) == 1);
    CHECK(counter->listener_count() == 1);
}

TEST_CASE("The connect timer expires abandoned contexts") {
    EventRecorder    recorder;
    ContextDirectory directory{{.connect_timeout = std::chrono::seconds{1}}, recorder.hooks()};
    auto             counter = ValueSource<int>::Create(1);

    StringMarkupSink sink;
    auto             context = *directory.render(live_counter_page(counter), sink);

    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while ((context->status() != ContextStatus::Closed || directory.lookup(context->id()) != nullptr)
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    CHECK(context->status() == ContextStatus::Closed);
    CHECK(directory.lookup(context->id()) == nullptr);

    auto late = directory.connect(context->id(), std::make_shared<FakeTransport>());
    REQUIRE_FALSE(late.has_value());
    CHECK(late.error().code == Error::Code::NotFound);
}

TEST_CASE("Publishing the same id twice is refused") {
    ContextDirectory directory;
    auto             context = LiveContext::Create("duplicate");
    REQUIRE(directory.publish(context).has_value());
    auto second = directory.publish(LiveContext::Create("duplicate"));
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code == Error::Code::InvalidState);
    CHECK(directory.remove("duplicate") == context);
    CHECK(directory.remove("duplicate") == nullptr);
}

TEST_CASE("Shutdown closes every remaining context") {
    ContextDirectory directory;
    auto             counter = ValueSource<int>::Create(1);

    StringMarkupSink first_sink;
    StringMarkupSink second_sink;
    auto             first  = *directory.render(live_counter_page(counter), first_sink);
    auto             second = *directory.render(live_counter_page(counter), second_sink);
    CHECK(counter->listener_count() == 2);

    directory.shutdown();
    CHECK(directory.size() == 0);
    CHECK(first->status() == ContextStatus::Closed);
    CHECK(second->status() == ContextStatus::Closed);
    CHECK(counter->listener_count() == 0);
}
}
