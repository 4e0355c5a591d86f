#include <doctest/doctest.h>

#include "LiveTestHelpers.hpp"

#include <liveview/live/ComponentRegistry.hpp>
#include <liveview/live/RenderScope.hpp>
#include <liveview/live/ValueSource.hpp>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace LV::Live;
using LV::Live::Testing::RecordingDelivery;

namespace {

void render_int(RenderScope& out, int const& value) {
    out.write_text(std::to_string(value));
}

} // namespace

TEST_SUITE("live.registry") {
TEST_CASE("Replace update delivers rendered markup for the component") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              counter  = ValueSource<int>::Create(1);

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    auto             id = root.live<int>(watch(counter), render_int);

    CHECK(sink.str() == "<span data-lv=\"" + std::to_string(id) + "\">1</span>");
    CHECK(delivery.count() == 0);

    counter->set(5);
    REQUIRE(delivery.count() == 1);
    auto batch = delivery.last();
    REQUIRE(batch.size() == 1);
    CHECK(batch[0].target == id);
    CHECK(batch[0].kind == PatchKind::Replace);
    REQUIRE(batch[0].payload.has_value());
    CHECK(batch[0].payload->markup_text() == "5");
}

TEST_CASE("Components and callbacks share one increasing id sequence") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());

    auto first    = registry->register_container(std::nullopt);
    auto callback = registry->register_callback(first, [](nlohmann::json const&) {});
    auto second   = registry->register_container(first);

    CHECK(first < callback);
    CHECK(callback < second);
    CHECK(registry->parent_of(second) == first);
    CHECK(registry->callbacks_of(first) == std::vector<CallbackId>{callback});
}

TEST_CASE("Replace update tears down nested components and callbacks first") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              outer    = ValueSource<int>::Create(1);
    auto              inner    = ValueSource<std::string>::Create(std::string{"inner"});

    std::vector<std::shared_ptr<Source<std::string>>> views;
    std::vector<CallbackId>                           callbacks;

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    auto             id = root.live<int>(watch(outer), [&](RenderScope& out, int const& value) {
        out.write_text(std::to_string(value));
        auto view = watch(inner);
        views.push_back(view);
        out.live<std::string>(view, [](RenderScope& nested, std::string const& text) { nested.write_text(text); });
        callbacks.push_back(out.raw_callback([](nlohmann::json const&) {}));
    });

    auto const initial_children = registry->children_of(id);
    REQUIRE(initial_children.size() == 1);
    REQUIRE(callbacks.size() == 1);
    CHECK(registry->has_callback(callbacks[0]));

    outer->set(2);

    auto const children = registry->children_of(id);
    REQUIRE(children.size() == 1);
    CHECK(children[0] > initial_children[0]);
    CHECK_FALSE(registry->contains(initial_children[0]));
    CHECK_FALSE(registry->has_callback(callbacks[0]));
    REQUIRE(callbacks.size() == 2);
    CHECK(registry->has_callback(callbacks[1]));
    CHECK(registry->callback_count() == 1);

    REQUIRE(views.size() == 2);
    CHECK(views[0]->closed());
    CHECK_FALSE(views[1]->closed());
    CHECK(inner->listener_count() == 1);

    auto batch = delivery.last();
    REQUIRE(batch.size() == 1);
    CHECK(batch[0].payload->markup_text().find("data-lv=\"" + std::to_string(children[0]) + "\"")
          != std::string::npos);
}

TEST_CASE("Removal deletes the component once and closes its source") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              counter  = ValueSource<int>::Create(1);
    auto              view     = watch(counter);

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    auto             id = root.live<int>(view, render_int);

    counter->remove();
    REQUIRE(delivery.count() == 1);
    auto batch = delivery.last();
    REQUIRE(batch.size() == 1);
    CHECK(batch[0].kind == PatchKind::Delete);
    CHECK(batch[0].target == id);
    CHECK_FALSE(batch[0].payload.has_value());
    CHECK_FALSE(registry->contains(id));
    CHECK(view->closed());
    CHECK(counter->listener_count() == 0);

    registry->handle_source_value(id, SourceEvent::removed());
    registry->handle_source_value(id, SourceEvent::of(std::any{7}));
    CHECK(delivery.count() == 1);
}

TEST_CASE("Attribute components patch their parent and never delete it") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              flag     = ValueSource<bool>::Create(false);

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    ComponentId      attribute = 0;
    auto             panel     = root.component(
        [&](RenderScope& scope) {
            attribute = scope.live<bool>(
                watch(flag),
                [](RenderScope& out, bool const& on) { out.write(on ? "class=\"on\"" : "class=\"off\""); },
                ComponentOptions<bool>{.mode = PatchMode::AttributeOnParent});
            scope.write("body");
        },
        "div");

    CHECK(sink.str() == "<div data-lv=\"" + std::to_string(panel) + "\">body</div>");
    REQUIRE(delivery.count() == 1);
    auto initial = delivery.last();
    REQUIRE(initial.size() == 1);
    CHECK(initial[0].target == panel);
    CHECK(initial[0].kind == PatchKind::Attribute);
    CHECK(initial[0].payload->markup_text() == "class=\"off\"");

    flag->set(true);
    REQUIRE(delivery.count() == 2);
    CHECK(delivery.last()[0].payload->markup_text() == "class=\"on\"");

    flag->remove();
    CHECK(delivery.count() == 2);
    CHECK_FALSE(registry->contains(attribute));
    CHECK(registry->contains(panel));
}

TEST_CASE("Append components keep existing children across updates") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              lines    = ValueSource<std::string>::Create(std::string{"first"});

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    auto             id = root.live<std::string>(
        watch(lines),
        [](RenderScope& out, std::string const& line) {
            out.raw_callback([](nlohmann::json const&) {});
            out.write("<li>");
            out.write_text(line);
            out.write("</li>");
        },
        ComponentOptions<std::string>{.mode = PatchMode::Append, .container = "ul"});

    CHECK(registry->callbacks_of(id).size() == 1);
    lines->set("second");
    CHECK(registry->callbacks_of(id).size() == 2);
    auto batch = delivery.last();
    REQUIRE(batch.size() == 1);
    CHECK(batch[0].kind == PatchKind::Append);
    CHECK(batch[0].payload->markup_text() == "<li>second</li>");
}

TEST_CASE("A failing render skips the patch and keeps the component") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              counter  = ValueSource<int>::Create(1);

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    auto             id = root.live<int>(watch(counter), [](RenderScope& out, int const& value) {
        if (value == 13) {
            throw std::runtime_error("unlucky");
        }
        out.write_text(std::to_string(value));
    });

    counter->set(13);
    CHECK(delivery.count() == 0);
    CHECK(registry->contains(id));

    counter->set(14);
    REQUIRE(delivery.count() == 1);
    CHECK(delivery.last()[0].payload->markup_text() == "14");
}

TEST_CASE("Data components deliver structured payloads") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              counter  = ValueSource<int>::Create(1);

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    auto id = root.live_data<int>(watch(counter), [](int const& value) { return nlohmann::json{{"count", value}}; });

    CHECK(sink.str()
          == "<script type=\"application/json\" data-lv=\"" + std::to_string(id) + "\">{\"count\":1}</script>");

    counter->set(2);
    auto batch = delivery.last();
    REQUIRE(batch.size() == 1);
    CHECK(batch[0].payload->encoding() == PayloadEncoding::Structured);
    CHECK(batch[0].payload->data()["count"] == 2);
}

TEST_CASE("The did-update hook appends a secondary patch") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              counter  = ValueSource<int>::Create(1);

    ComponentOptions<int> options;
    options.did_update = [](int const& value) -> std::optional<SecondaryPatch> {
        return SecondaryPatch{.mode = PatchMode::Append, .payload = Payload::structured(nlohmann::json(value))};
    };

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    auto             id = root.live<int>(watch(counter), render_int, options);

    counter->set(3);
    auto batch = delivery.last();
    REQUIRE(batch.size() == 2);
    CHECK(batch[0].kind == PatchKind::Replace);
    CHECK(batch[1].kind == PatchKind::Append);
    CHECK(batch[1].target == id);
    CHECK(batch[1].payload->data() == 3);
}

TEST_CASE("Deregistering a container drops the callbacks it owns") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    CallbackId       owned = 0;
    auto             panel = root.component([&](RenderScope& scope) {
        owned = scope.raw_callback([](nlohmann::json const&) {});
    });
    auto top = root.raw_callback([](nlohmann::json const&) {});

    CHECK(registry->has_callback(owned));
    registry->deregister(panel);
    CHECK_FALSE(registry->has_callback(owned));
    CHECK(registry->has_callback(top));
    CHECK(delivery.count() == 0);
}

TEST_CASE("cleanup_subtree keeps the component itself") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());

    auto parent = registry->register_container(std::nullopt);
    auto child  = registry->register_container(parent);
    auto cb     = registry->register_callback(parent, [](nlohmann::json const&) {});

    registry->cleanup_subtree(parent);
    CHECK(registry->contains(parent));
    CHECK_FALSE(registry->contains(child));
    CHECK_FALSE(registry->has_callback(cb));
    CHECK(registry->children_of(parent).empty());
}

TEST_CASE("teardown_all releases every source and refuses new entries") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              counter  = ValueSource<int>::Create(1);

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    root.live<int>(watch(counter), render_int);
    root.live<int>(watch(counter), render_int);
    root.raw_callback([](nlohmann::json const&) {});
    CHECK(counter->listener_count() == 2);
    CHECK(registry->sourced_component_count() == 2);

    registry->teardown_all();
    CHECK(registry->torn_down());
    CHECK(registry->component_count() == 0);
    CHECK(registry->callback_count() == 0);
    CHECK(counter->listener_count() == 0);

    counter->set(9);
    CHECK(delivery.count() == 0);

    auto late = registry->register_container(std::nullopt);
    CHECK_FALSE(registry->contains(late));

    auto late_view = watch(counter);
    registry->register_component<int>(std::nullopt, late_view, render_int);
    CHECK(late_view->closed());
    CHECK(counter->listener_count() == 0);

    registry->teardown_all();
}

TEST_CASE("Replacing a parent silences the sources of its stale children") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              outer    = ValueSource<int>::Create(1);
    auto              left     = ValueSource<int>::Create(10);
    auto              right    = ValueSource<int>::Create(20);

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    auto             id = root.live<int>(watch(outer), [&](RenderScope& out, int const& value) {
        out.write_text(std::to_string(value));
        if (value == 1) {
            out.live<int>(watch(left), render_int);
            out.live<int>(watch(right), render_int);
        }
    });

    auto const stale = registry->children_of(id);
    REQUIRE(stale.size() == 2);
    CHECK(left->listener_count() == 1);
    CHECK(right->listener_count() == 1);

    outer->set(2);
    REQUIRE(delivery.count() == 1);
    CHECK(registry->children_of(id).empty());
    CHECK(left->listener_count() == 0);
    CHECK(right->listener_count() == 0);

    left->set(11);
    right->set(21);
    right->remove();
    for (auto child : stale) {
        registry->handle_source_value(child, SourceEvent::of(std::any{99}));
    }
    CHECK(delivery.count() == 1);
    CHECK(registry->component_count() == 1);
}

TEST_CASE("Concurrent emissions on independent sources deliver intact patches") {
    RecordingDelivery delivery;
    auto              registry = ComponentRegistry::Create("ctx", delivery.sink());
    auto              first    = ValueSource<int>::Create(0);
    auto              second   = ValueSource<int>::Create(0);

    StringMarkupSink sink;
    RenderScope      root{*registry, std::nullopt, sink};
    auto             first_id  = root.live<int>(watch(first), render_int);
    auto             second_id = root.live<int>(watch(second), render_int);
    auto const       components = registry->component_count();

    constexpr int kEmissions = 2000;
    auto          emit       = [](std::shared_ptr<ValueSource<int>> source) {
        for (int i = 1; i <= kEmissions; ++i) {
            source->set(i);
        }
    };
    std::thread a{emit, first};
    std::thread b{emit, second};
    a.join();
    b.join();

    REQUIRE(delivery.count() == 2 * kEmissions);
    int last_first  = 0;
    int last_second = 0;
    for (auto const& batch : delivery.batches) {
        REQUIRE(batch.size() == 1);
        REQUIRE(batch[0].kind == PatchKind::Replace);
        REQUIRE(batch[0].payload.has_value());
        auto const value = std::stoi(batch[0].payload->markup_text());
        if (batch[0].target == first_id) {
            CHECK(value == last_first + 1);
            last_first = value;
        } else {
            REQUIRE(batch[0].target == second_id);
            CHECK(value == last_second + 1);
            last_second = value;
        }
    }
    CHECK(last_first == kEmissions);
    CHECK(last_second == kEmissions);
    CHECK(registry->component_count() == components);
}
}
