#include <liveview/live/ComponentRegistry.hpp>
#include <liveview/live/RenderScope.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <iostream>

namespace LV::Live {

auto ComponentRegistry::Create(std::string context_id, PatchDelivery deliver) -> std::shared_ptr<ComponentRegistry> {
    return std::shared_ptr<ComponentRegistry>(new ComponentRegistry(std::move(context_id), std::move(deliver)));
}

ComponentRegistry::ComponentRegistry(std::string context_id, PatchDelivery deliver)
    : context_id_(std::move(context_id))
    , deliver_(std::move(deliver)) {}

auto ComponentRegistry::insert_component(std::optional<ComponentId>  parent,
                                         std::shared_ptr<SourceBase> source,
                                         ErasedRenderer              renderer,
                                         ErasedDidUpdate             did_update,
                                         PatchMode                   mode) -> ComponentId {
    std::lock_guard const lock{state_mutex_};
    auto const id = state_.next_id++;
    if (state_.closed) {
        lv_log("ComponentRegistry::insert_component refused after teardown", "Registry");
        return id;
    }
    if (parent) {
        auto parent_it = state_.components.find(*parent);
        if (parent_it == state_.components.end()) {
            lv_log("ComponentRegistry::insert_component parent already removed", "Registry");
            return id;
        }
        parent_it->second.children.insert(id);
    }
    ComponentEntry entry;
    entry.parent     = parent;
    entry.source     = std::move(source);
    entry.renderer   = std::move(renderer);
    entry.did_update = std::move(did_update);
    entry.mode       = mode;
    state_.components.emplace(id, std::move(entry));
    return id;
}

void ComponentRegistry::attach_subscription(ComponentId id, Subscription subscription,
                                            std::shared_ptr<SourceBase> source) {
    {
        std::lock_guard const lock{state_mutex_};
        auto it = state_.components.find(id);
        if (it != state_.components.end()) {
            it->second.subscription = std::move(subscription);
            return;
        }
    }
    // The entry was refused or removed before the subscription landed; nobody else owns the source now.
    subscription.cancel();
    if (source) {
        source->close();
    }
}

auto ComponentRegistry::register_container(std::optional<ComponentId> parent) -> ComponentId {
    return insert_component(parent, nullptr, ErasedRenderer{}, ErasedDidUpdate{}, PatchMode::Replace);
}

auto ComponentRegistry::register_callback(std::optional<ComponentId> parent, Callback fn) -> CallbackId {
    std::lock_guard const lock{state_mutex_};
    auto const id = state_.next_id++;
    if (state_.closed) {
        return id;
    }
    if (parent) {
        auto parent_it = state_.components.find(*parent);
        if (parent_it == state_.components.end()) {
            return id;
        }
        parent_it->second.callbacks.insert(id);
    } else {
        state_.root_callbacks.insert(id);
    }
    state_.callbacks.emplace(id, std::move(fn));
    return id;
}

void ComponentRegistry::handle_source_value(ComponentId id, SourceEvent event) {
    switch (event.kind) {
    case SourceEvent::Kind::NoChange:
        return;
    case SourceEvent::Kind::Removed: {
        std::lock_guard const updates{update_mutex_};
        remove_component(id);
        return;
    }
    case SourceEvent::Kind::Value: {
        std::lock_guard const updates{update_mutex_};
        render_update(id, event.value);
        return;
    }
    }
}

void ComponentRegistry::remove_component(ComponentId id) {
    std::vector<Detached> detached;
    PatchMode             mode = PatchMode::Replace;
    {
        std::lock_guard const lock{state_mutex_};
        auto it = state_.components.find(id);
        if (it == state_.components.end()) {
            return;
        }
        mode = it->second.mode;
        detach_entry_locked(id, detached);
    }
    // An attribute patch lives on the parent's node; deleting it would delete the parent.
    if (!targets_parent(mode)) {
        deliver(PatchBatch{make_delete(id)});
    }
    release(detached);
}

void ComponentRegistry::render_update(ComponentId id, std::any const& value) {
    ErasedRenderer             renderer;
    ErasedDidUpdate            did_update;
    PatchMode                  mode = PatchMode::Replace;
    std::optional<ComponentId> parent;
    std::set<ComponentId>      kept_children;
    std::set<CallbackId>       kept_callbacks;
    std::vector<Detached>      detached;
    {
        std::lock_guard const lock{state_mutex_};
        auto it = state_.components.find(id);
        if (it == state_.components.end()) {
            return;
        }
        auto& entry = it->second;
        renderer    = entry.renderer;
        did_update  = entry.did_update;
        mode        = entry.mode;
        parent      = entry.parent;
        if (mode == PatchMode::Replace) {
            detach_children_locked(entry, detached);
        } else {
            kept_children  = entry.children;
            kept_callbacks = entry.callbacks;
        }
    }
    release(detached);

    auto payload = render_payload(id, renderer, value);
    if (!payload) {
        discard_children_except(id, kept_children, kept_callbacks);
        return;
    }

    auto const target = (targets_parent(mode) && parent) ? *parent : id;
    PatchBatch batch;
    batch.push_back(make_patch(mode, target, std::move(*payload)));
    if (did_update) {
        try {
            if (auto secondary = did_update(value)) {
                auto const secondary_target = (targets_parent(secondary->mode) && parent) ? *parent : id;
                batch.push_back(make_patch(secondary->mode, secondary_target, std::move(secondary->payload)));
            }
        } catch (std::exception const& ex) {
            std::cerr << "[liveview] did-update hook of component " << id << " in context " << context_id_
                      << " threw: " << ex.what() << "\n";
        }
    }

    {
        std::lock_guard const lock{state_mutex_};
        if (!state_.components.contains(id)) {
            return;
        }
    }
    deliver(std::move(batch));
}

auto ComponentRegistry::render_payload(ComponentId id, ErasedRenderer const& renderer, std::any const& value)
    -> std::optional<Payload> {
    try {
        if (auto const* markup = std::get_if<ErasedMarkupRenderer>(&renderer)) {
            StringMarkupSink sink;
            RenderScope      scope{*this, id, sink};
            (*markup)(scope, value);
            return Payload::markup(sink.take());
        }
        if (auto const* data = std::get_if<ErasedDataRenderer>(&renderer)) {
            return Payload::structured((*data)(value));
        }
        lv_log("ComponentRegistry::render_payload component has no renderer", "Registry");
    } catch (std::exception const& ex) {
        std::cerr << "[liveview] component " << id << " in context " << context_id_
                  << " failed to render: " << ex.what() << "\n";
    }
    return std::nullopt;
}

void ComponentRegistry::discard_children_except(ComponentId id, std::set<ComponentId> const& keep_children,
                                                std::set<CallbackId> const& keep_callbacks) {
    std::vector<Detached> detached;
    {
        std::lock_guard const lock{state_mutex_};
        auto it = state_.components.find(id);
        if (it == state_.components.end()) {
            return;
        }
        auto& entry = it->second;
        std::vector<ComponentId> stale_children;
        for (auto child : entry.children) {
            if (!keep_children.contains(child)) {
                stale_children.push_back(child);
            }
        }
        std::vector<CallbackId> stale_callbacks;
        for (auto callback : entry.callbacks) {
            if (!keep_callbacks.contains(callback)) {
                stale_callbacks.push_back(callback);
            }
        }
        for (auto callback : stale_callbacks) {
            entry.callbacks.erase(callback);
            state_.callbacks.erase(callback);
        }
        for (auto child : stale_children) {
            detach_entry_locked(child, detached);
        }
    }
    release(detached);
}

void ComponentRegistry::detach_children_locked(ComponentEntry& entry, std::vector<Detached>& out) {
    for (auto callback : entry.callbacks) {
        state_.callbacks.erase(callback);
    }
    entry.callbacks.clear();
    auto children = std::move(entry.children);
    entry.children.clear();
    for (auto child : children) {
        detach_entry_locked(child, out);
    }
}

void ComponentRegistry::detach_entry_locked(ComponentId id, std::vector<Detached>& out) {
    auto it = state_.components.find(id);
    if (it == state_.components.end()) {
        return;
    }
    detach_children_locked(it->second, out);
    if (it->second.parent) {
        auto parent_it = state_.components.find(*it->second.parent);
        if (parent_it != state_.components.end()) {
            parent_it->second.children.erase(id);
        }
    }
    out.push_back(Detached{std::move(it->second.subscription), std::move(it->second.source)});
    state_.components.erase(it);
}

void ComponentRegistry::release(std::vector<Detached>& detached) {
    for (auto& item : detached) {
        item.subscription.cancel();
        if (item.source) {
            item.source->close();
        }
    }
    detached.clear();
}

void ComponentRegistry::deliver(PatchBatch batch) {
    if (batch.empty() || !deliver_) {
        return;
    }
    deliver_(std::move(batch));
}

void ComponentRegistry::deregister(ComponentId id) {
    std::lock_guard const updates{update_mutex_};
    std::vector<Detached> detached;
    {
        std::lock_guard const lock{state_mutex_};
        detach_entry_locked(id, detached);
    }
    release(detached);
}

void ComponentRegistry::cleanup_subtree(ComponentId id) {
    std::lock_guard const updates{update_mutex_};
    std::vector<Detached> detached;
    {
        std::lock_guard const lock{state_mutex_};
        auto it = state_.components.find(id);
        if (it == state_.components.end()) {
            return;
        }
        detach_children_locked(it->second, detached);
    }
    release(detached);
}

void ComponentRegistry::teardown_all() {
    std::lock_guard const updates{update_mutex_};
    std::vector<Detached> detached;
    {
        std::lock_guard const lock{state_mutex_};
        if (state_.closed) {
            return;
        }
        state_.closed = true;
        std::vector<ComponentId> roots;
        for (auto const& [id, entry] : state_.components) {
            if (!entry.parent) {
                roots.push_back(id);
            }
        }
        for (auto id : roots) {
            detach_entry_locked(id, detached);
        }
        // Anything left was orphaned by a parent removed mid-render.
        for (auto& [id, entry] : state_.components) {
            detached.push_back(Detached{std::move(entry.subscription), std::move(entry.source)});
        }
        state_.components.clear();
        state_.callbacks.clear();
        state_.root_callbacks.clear();
    }
    lv_log("ComponentRegistry::teardown_all released " + std::to_string(detached.size()) + " components", "Registry");
    release(detached);
}

auto ComponentRegistry::lock_updates() -> std::unique_lock<std::recursive_mutex> {
    return std::unique_lock<std::recursive_mutex>{update_mutex_};
}

auto ComponentRegistry::lookup_callback(CallbackId id) const -> std::optional<Callback> {
    std::lock_guard const lock{state_mutex_};
    auto it = state_.callbacks.find(id);
    if (it == state_.callbacks.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto ComponentRegistry::contains(ComponentId id) const -> bool {
    std::lock_guard const lock{state_mutex_};
    return state_.components.contains(id);
}

auto ComponentRegistry::has_callback(CallbackId id) const -> bool {
    std::lock_guard const lock{state_mutex_};
    return state_.callbacks.contains(id);
}

auto ComponentRegistry::children_of(ComponentId id) const -> std::vector<ComponentId> {
    std::lock_guard const lock{state_mutex_};
    auto it = state_.components.find(id);
    if (it == state_.components.end()) {
        return {};
    }
    return {it->second.children.begin(), it->second.children.end()};
}

auto ComponentRegistry::callbacks_of(ComponentId id) const -> std::vector<CallbackId> {
    std::lock_guard const lock{state_mutex_};
    auto it = state_.components.find(id);
    if (it == state_.components.end()) {
        return {};
    }
    return {it->second.callbacks.begin(), it->second.callbacks.end()};
}

auto ComponentRegistry::parent_of(ComponentId id) const -> std::optional<ComponentId> {
    std::lock_guard const lock{state_mutex_};
    auto it = state_.components.find(id);
    if (it == state_.components.end()) {
        return std::nullopt;
    }
    return it->second.parent;
}

auto ComponentRegistry::component_count() const -> std::size_t {
    std::lock_guard const lock{state_mutex_};
    return state_.components.size();
}

auto ComponentRegistry::callback_count() const -> std::size_t {
    std::lock_guard const lock{state_mutex_};
    return state_.callbacks.size();
}

auto ComponentRegistry::sourced_component_count() const -> std::size_t {
    std::lock_guard const lock{state_mutex_};
    std::size_t count = 0;
    for (auto const& [id, entry] : state_.components) {
        if (entry.source) {
            ++count;
        }
    }
    return count;
}

auto ComponentRegistry::torn_down() const -> bool {
    std::lock_guard const lock{state_mutex_};
    return state_.closed;
}

} // namespace LV::Live
