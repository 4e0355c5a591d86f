#pragma once

#include <liveview/live/Callback.hpp>
#include <liveview/live/Patch.hpp>
#include <liveview/live/Source.hpp>

#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace LV::Live {

class RenderScope;

// Extra patch computed after a successful update, e.g. a script-side binding that
// needs the raw value next to the rendered markup.
struct SecondaryPatch {
    PatchMode mode{PatchMode::Replace};
    Payload   payload;
};

template <typename T>
using MarkupRenderer = std::function<void(RenderScope&, T const&)>;

template <typename T>
using DataRenderer = std::function<nlohmann::json(T const&)>;

template <typename T>
using DidUpdate = std::function<std::optional<SecondaryPatch>(T const&)>;

template <typename T>
struct ComponentOptions {
    PatchMode    mode{PatchMode::Replace};
    DidUpdate<T> did_update;
    // Element wrapping a markup component; its data-lv attribute carries the component id.
    std::string  container{"span"};
};

// Type-erased source emission as seen by the registry.
struct SourceEvent {
    enum class Kind : std::uint8_t {
        NoChange = 0,
        Value,
        Removed,
    };

    Kind     kind{Kind::NoChange};
    std::any value;

    static auto no_change() -> SourceEvent { return SourceEvent{}; }
    static auto removed() -> SourceEvent { return SourceEvent{Kind::Removed, {}}; }
    static auto of(std::any value) -> SourceEvent { return SourceEvent{Kind::Value, std::move(value)}; }
};

template <typename T>
auto to_source_event(Emission<T> const& emission) -> SourceEvent {
    if (std::holds_alternative<Removed>(emission)) {
        return SourceEvent::removed();
    }
    if (auto const* value = std::get_if<1>(&emission)) {
        return SourceEvent::of(std::any{*value});
    }
    return SourceEvent::no_change();
}

using PatchDelivery = std::function<void(PatchBatch)>;

/**
 * ComponentRegistry: the live component tree of one context.
 *
 * Concurrency
 * -----------
 * - All table state (id counter, components, callbacks, child and callback sets) sits
 *   in one State guarded by state_mutex_. Structural changes such as a replace teardown
 *   happen under a single acquisition, so no reader observes a half-updated tree.
 * - The update pipeline (handle_source_value, teardown) is serialized by update_mutex_,
 *   which makes patch delivery order match processing order. It is recursive so a render
 *   function or a source close may trigger a nested update on the same thread.
 * - Render functions, source close() calls and subscription cancels run with the state
 *   mutex released. Callbacks are never invoked by the registry.
 */
class ComponentRegistry : public std::enable_shared_from_this<ComponentRegistry> {
public:
    using ErasedMarkupRenderer = std::function<void(RenderScope&, std::any const&)>;
    using ErasedDataRenderer   = std::function<nlohmann::json(std::any const&)>;
    using ErasedRenderer       = std::variant<std::monostate, ErasedMarkupRenderer, ErasedDataRenderer>;
    using ErasedDidUpdate      = std::function<std::optional<SecondaryPatch>(std::any const&)>;

    static auto Create(std::string context_id, PatchDelivery deliver) -> std::shared_ptr<ComponentRegistry>;

    ComponentRegistry(ComponentRegistry const&)            = delete;
    ComponentRegistry& operator=(ComponentRegistry const&) = delete;

    template <typename T>
    auto register_component(std::optional<ComponentId>   parent,
                            std::shared_ptr<Source<T>>   source,
                            MarkupRenderer<T>            renderer,
                            ComponentOptions<T>          options = {}) -> ComponentId;

    template <typename T>
    auto register_data_component(std::optional<ComponentId> parent,
                                 std::shared_ptr<Source<T>> source,
                                 DataRenderer<T>            renderer,
                                 ComponentOptions<T>        options = {}) -> ComponentId;

    // Sourceless component: groups children and callbacks so they share a lifetime.
    auto register_container(std::optional<ComponentId> parent) -> ComponentId;

    auto register_callback(std::optional<ComponentId> parent, Callback fn) -> CallbackId;

    void handle_source_value(ComponentId id, SourceEvent event);

    void deregister(ComponentId id);
    void cleanup_subtree(ComponentId id);
    void teardown_all();

    // Held for the duration of a page render so source updates wait for the pass to finish.
    auto lock_updates() -> std::unique_lock<std::recursive_mutex>;

    auto lookup_callback(CallbackId id) const -> std::optional<Callback>;
    auto contains(ComponentId id) const -> bool;
    auto has_callback(CallbackId id) const -> bool;
    auto children_of(ComponentId id) const -> std::vector<ComponentId>;
    auto callbacks_of(ComponentId id) const -> std::vector<CallbackId>;
    auto parent_of(ComponentId id) const -> std::optional<ComponentId>;
    auto component_count() const -> std::size_t;
    auto callback_count() const -> std::size_t;
    auto sourced_component_count() const -> std::size_t;
    auto torn_down() const -> bool;

    auto context_id() const -> std::string const& { return context_id_; }

private:
    ComponentRegistry(std::string context_id, PatchDelivery deliver);

    struct ComponentEntry {
        std::optional<ComponentId>  parent;
        std::shared_ptr<SourceBase> source;
        Subscription                subscription;
        ErasedRenderer              renderer;
        ErasedDidUpdate             did_update;
        PatchMode                   mode{PatchMode::Replace};
        std::set<ComponentId>       children;
        std::set<CallbackId>        callbacks;
    };

    struct State {
        std::uint64_t                         next_id{1};
        std::map<ComponentId, ComponentEntry> components;
        std::map<CallbackId, Callback>        callbacks;
        std::set<CallbackId>                  root_callbacks;
        bool                                  closed{false};
    };

    // Subscription and source of a removed entry, released once the state lock is dropped.
    struct Detached {
        Subscription                subscription;
        std::shared_ptr<SourceBase> source;
    };

    template <typename T>
    auto register_erased(std::optional<ComponentId> parent,
                         std::shared_ptr<Source<T>> source,
                         ErasedRenderer             renderer,
                         DidUpdate<T>               did_update,
                         PatchMode                  mode) -> ComponentId;

    auto insert_component(std::optional<ComponentId>  parent,
                          std::shared_ptr<SourceBase> source,
                          ErasedRenderer              renderer,
                          ErasedDidUpdate             did_update,
                          PatchMode                   mode) -> ComponentId;
    void attach_subscription(ComponentId id, Subscription subscription, std::shared_ptr<SourceBase> source);

    void remove_component(ComponentId id);
    void render_update(ComponentId id, std::any const& value);
    auto render_payload(ComponentId id, ErasedRenderer const& renderer, std::any const& value) -> std::optional<Payload>;
    void discard_children_except(ComponentId id, std::set<ComponentId> const& keep_children,
                                 std::set<CallbackId> const& keep_callbacks);

    void detach_children_locked(ComponentEntry& entry, std::vector<Detached>& out);
    void detach_entry_locked(ComponentId id, std::vector<Detached>& out);
    static void release(std::vector<Detached>& detached);

    void deliver(PatchBatch batch);

    std::string                  context_id_;
    PatchDelivery                deliver_;
    mutable std::mutex           state_mutex_;
    std::recursive_mutex         update_mutex_;
    State                        state_;
};

template <typename T>
auto ComponentRegistry::register_component(std::optional<ComponentId> parent,
                                           std::shared_ptr<Source<T>> source,
                                           MarkupRenderer<T>          renderer,
                                           ComponentOptions<T>        options) -> ComponentId {
    ErasedRenderer erased{std::in_place_index<1>,
                          [renderer = std::move(renderer)](RenderScope& scope, std::any const& value) {
                              renderer(scope, std::any_cast<T const&>(value));
                          }};
    return register_erased<T>(parent, std::move(source), std::move(erased), std::move(options.did_update), options.mode);
}

template <typename T>
auto ComponentRegistry::register_data_component(std::optional<ComponentId> parent,
                                                std::shared_ptr<Source<T>> source,
                                                DataRenderer<T>            renderer,
                                                ComponentOptions<T>        options) -> ComponentId {
    ErasedRenderer erased{std::in_place_index<2>, [renderer = std::move(renderer)](std::any const& value) {
                              return renderer(std::any_cast<T const&>(value));
                          }};
    return register_erased<T>(parent, std::move(source), std::move(erased), std::move(options.did_update), options.mode);
}

template <typename T>
auto ComponentRegistry::register_erased(std::optional<ComponentId> parent,
                                        std::shared_ptr<Source<T>> source,
                                        ErasedRenderer             renderer,
                                        DidUpdate<T>               did_update,
                                        PatchMode                  mode) -> ComponentId {
    ErasedDidUpdate erased_hook;
    if (did_update) {
        erased_hook = [hook = std::move(did_update)](std::any const& value) {
            return hook(std::any_cast<T const&>(value));
        };
    }
    auto id = insert_component(parent, source, std::move(renderer), std::move(erased_hook), mode);
    if (source) {
        std::weak_ptr<ComponentRegistry> weak = weak_from_this();
        auto subscription = source->listen([weak, id](Emission<T> const& emission) {
            if (auto registry = weak.lock()) {
                registry->handle_source_value(id, to_source_event(emission));
            }
        });
        attach_subscription(id, std::move(subscription), std::move(source));
    }
    return id;
}

} // namespace LV::Live
