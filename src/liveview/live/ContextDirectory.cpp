#include <liveview/live/ContextDirectory.hpp>

#include "log/TaggedLogger.hpp"

#include <iostream>
#include <vector>

namespace LV::Live {

auto to_string(DirectoryEvent event) -> std::string_view {
    switch (event) {
    case DirectoryEvent::Rendered:
        return "rendered";
    case DirectoryEvent::StaticPage:
        return "static_page";
    case DirectoryEvent::RenderFailed:
        return "render_failed";
    case DirectoryEvent::Connected:
        return "connected";
    case DirectoryEvent::Disconnected:
        return "disconnected";
    case DirectoryEvent::TimedOut:
        return "timed_out";
    }
    return "unknown";
}

ContextDirectory::ContextDirectory(DirectoryConfig config, DirectoryHooks hooks)
    : config_(config)
    , hooks_(std::move(hooks)) {}

ContextDirectory::~ContextDirectory() {
    shutdown();
}

auto ContextDirectory::publish(std::shared_ptr<LiveContext> context) -> Expected<void> {
    if (!context) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Live context is null"});
    }
    auto const& id       = context->id();
    bool        inserted = contexts_.try_emplace_l(
        id, [](auto&) {}, Entry{.context = context, .timer = std::nullopt});
    if (!inserted) {
        return std::unexpected(Error{Error::Code::InvalidState, "Live context " + id + " already published"});
    }
    return {};
}

auto ContextDirectory::lookup(std::string const& id) const -> std::shared_ptr<LiveContext> {
    std::shared_ptr<LiveContext> result;
    contexts_.if_contains(id, [&](auto const& kv) { result = kv.second.context; });
    return result;
}

auto ContextDirectory::remove(std::string const& id) -> std::shared_ptr<LiveContext> {
    std::shared_ptr<LiveContext>       removed;
    std::optional<TimerQueue::TimerId> timer;
    contexts_.erase_if(id, [&](auto& kv) {
        removed = kv.second.context;
        timer   = kv.second.timer;
        return true;
    });
    if (timer) {
        timers_.cancel(*timer);
    }
    return removed;
}

auto ContextDirectory::render(PageRenderer const& renderer, MarkupSink& sink)
    -> Expected<std::shared_ptr<LiveContext>> {
    auto context = LiveContext::Create();
    if (auto published = publish(context); !published) {
        return std::unexpected(published.error());
    }

    auto rendered = context->render(renderer, sink);
    if (!rendered) {
        remove(context->id());
        context->close();
        notify(DirectoryEvent::RenderFailed);
        return std::unexpected(rendered.error());
    }

    if (context->registry()->sourced_component_count() == 0) {
        lv_log("ContextDirectory::render no live components, dropping context " + context->id(), "Directory");
        remove(context->id());
        context->close();
        notify(DirectoryEvent::StaticPage);
        return context;
    }

    auto const deadline = Clock::now() + config_.connect_timeout;
    context->set_connect_deadline(deadline);
    auto timer = timers_.scheduleAt(deadline, [this, id = context->id()]() { expire(id); });
    if (!timer) {
        std::cerr << "[liveview] failed to arm connect timeout for context " << context->id() << ": "
                  << describeError(timer.error()) << "\n";
    } else {
        contexts_.modify_if(context->id(), [&](auto& kv) { kv.second.timer = *timer; });
    }
    notify(DirectoryEvent::Rendered);
    return context;
}

auto ContextDirectory::connect(std::string const& id, std::shared_ptr<Transport> transport)
    -> Expected<std::shared_ptr<LiveContext>> {
    std::shared_ptr<LiveContext>       context;
    std::optional<TimerQueue::TimerId> timer;
    contexts_.if_contains(id, [&](auto const& kv) {
        context = kv.second.context;
        timer   = kv.second.timer;
    });
    if (!context) {
        return std::unexpected(Error{Error::Code::NotFound, "No such live context"});
    }
    if (auto attached = context->attach(std::move(transport)); !attached) {
        return std::unexpected(attached.error());
    }
    if (timer) {
        timers_.cancel(*timer);
    }
    notify(DirectoryEvent::Connected);
    return context;
}

void ContextDirectory::disconnect(std::string const& id) {
    auto context = remove(id);
    if (context && context->close()) {
        lv_log("ContextDirectory::disconnect closed context " + id, "Directory");
        notify(DirectoryEvent::Disconnected);
    }
}

void ContextDirectory::expire(std::string const& id) {
    auto context = lookup(id);
    if (!context || !context->expire()) {
        return;
    }
    remove(id);
    lv_log("ContextDirectory::expire context " + id + " was not connected in time", "Directory");
    notify(DirectoryEvent::TimedOut);
}

auto ContextDirectory::sweep(Clock::time_point now) -> std::size_t {
    std::vector<std::string> overdue;
    contexts_.for_each([&](auto const& kv) {
        auto const& context = kv.second.context;
        if (context->status() != ContextStatus::NotConnected) {
            return;
        }
        auto deadline = context->connect_deadline();
        if (deadline && *deadline <= now) {
            overdue.push_back(kv.first);
        }
    });
    std::size_t expired = 0;
    for (auto const& id : overdue) {
        auto context = lookup(id);
        if (context && context->expire()) {
            remove(id);
            notify(DirectoryEvent::TimedOut);
            ++expired;
        }
    }
    return expired;
}

auto ContextDirectory::size() const -> std::size_t {
    return contexts_.size();
}

void ContextDirectory::shutdown() {
    timers_.shutdown();
    std::vector<std::shared_ptr<LiveContext>> remaining;
    contexts_.for_each([&](auto const& kv) { remaining.push_back(kv.second.context); });
    contexts_.clear();
    for (auto const& context : remaining) {
        context->close();
    }
}

void ContextDirectory::notify(DirectoryEvent event) const {
    if (hooks_.on_event) {
        hooks_.on_event(event);
    }
}

} // namespace LV::Live
