#include <liveview/live/LiveContext.hpp>

#include "log/TaggedLogger.hpp"

#include <array>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace LV::Live {

auto to_string(ContextStatus status) -> std::string_view {
    switch (status) {
    case ContextStatus::NotConnected:
        return "not-connected";
    case ContextStatus::Connected:
        return "connected";
    case ContextStatus::Closed:
        return "closed";
    }
    return "closed";
}

auto LiveContext::generate_id() -> std::string {
    std::array<unsigned char, 16> buffer{};
    std::random_device            device;
    for (auto& byte : buffer) {
        byte = static_cast<unsigned char>(device());
    }

    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (auto byte : buffer) {
        stream << std::setw(2) << static_cast<int>(byte);
    }
    return stream.str();
}

auto LiveContext::Create() -> std::shared_ptr<LiveContext> {
    return Create(generate_id());
}

auto LiveContext::Create(std::string id) -> std::shared_ptr<LiveContext> {
    return std::shared_ptr<LiveContext>(new LiveContext(std::move(id)));
}

LiveContext::LiveContext(std::string id)
    : id_(std::move(id))
    , outbox_(std::make_shared<Outbox>())
    , created_at_(Clock::now()) {
    registry_ = ComponentRegistry::Create(id_, [outbox = outbox_](PatchBatch batch) {
        outbox->push(batch_to_json(batch).dump());
    });
}

LiveContext::~LiveContext() {
    close();
}

auto LiveContext::render(PageRenderer const& renderer, MarkupSink& sink) -> Expected<void> {
    if (status() == ContextStatus::Closed) {
        return std::unexpected(Error{Error::Code::InvalidState, "Live context already closed"});
    }
    StringMarkupSink buffered;
    {
        auto        updates = registry_->lock_updates();
        RenderScope root{*registry_, std::nullopt, buffered};
        try {
            if (renderer) {
                renderer(root);
            }
        } catch (std::exception const& ex) {
            std::cerr << "[liveview] page render failed for context " << id_ << ": " << ex.what() << "\n";
            return std::unexpected(Error{Error::Code::RenderFailed, ex.what()});
        }
    }
    // The client may be slow; updates arriving from here on queue in the outbox.
    sink.write(buffered.str());
    lv_log("LiveContext::render completed with " + std::to_string(registry_->sourced_component_count())
               + " sourced components",
           "LiveContext");
    return {};
}

auto LiveContext::attach(std::shared_ptr<Transport> transport) -> Expected<void> {
    if (!transport) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Transport is null"});
    }
    auto expected = ContextStatus::NotConnected;
    if (!status_.compare_exchange_strong(expected, ContextStatus::Connected, std::memory_order_acq_rel)) {
        if (expected == ContextStatus::Connected) {
            return std::unexpected(Error{Error::Code::AlreadyConnected, "Live context already has a transport"});
        }
        return std::unexpected(Error{Error::Code::Closed, "Live context closed"});
    }
    {
        std::lock_guard const lock{mutex_};
        transport_ = transport;
    }
    std::weak_ptr<Transport> weak = transport;
    outbox_->set_wake([weak]() {
        if (auto attached = weak.lock()) {
            attached->wake();
        }
    });
    // close() may have raced with the attach; it only sees the transport once it is stored.
    if (status() == ContextStatus::Closed) {
        finish_close();
        return std::unexpected(Error{Error::Code::Closed, "Live context closed"});
    }
    lv_log("LiveContext::attach " + std::string{to_string(transport->kind())}, "LiveContext");
    return {};
}

auto LiveContext::close() -> bool {
    if (status_.exchange(ContextStatus::Closed, std::memory_order_acq_rel) == ContextStatus::Closed) {
        return false;
    }
    registry_->teardown_all();
    outbox_->close();
    finish_close();
    return true;
}

auto LiveContext::expire() -> bool {
    auto expected = ContextStatus::NotConnected;
    if (!status_.compare_exchange_strong(expected, ContextStatus::Closed, std::memory_order_acq_rel)) {
        return false;
    }
    registry_->teardown_all();
    outbox_->close();
    finish_close();
    return true;
}

auto LiveContext::finish_close() -> void {
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard const lock{mutex_};
        transport = std::move(transport_);
        transport_.reset();
    }
    if (transport) {
        transport->close();
    }
}

auto LiveContext::dispatch_callback(CallbackId id, nlohmann::json const& args) -> Expected<void> {
    if (status() == ContextStatus::Closed) {
        return std::unexpected(Error{Error::Code::Closed, "Live context closed"});
    }
    auto callback = registry_->lookup_callback(id);
    if (!callback) {
        return std::unexpected(Error{Error::Code::NotFound, "Unknown callback " + std::to_string(id)});
    }
    try {
        (*callback)(args);
    } catch (std::exception const& ex) {
        std::cerr << "[liveview] callback " << id << " in context " << id_ << " threw: " << ex.what() << "\n";
        return std::unexpected(Error{Error::Code::CallbackFailed, ex.what()});
    }
    return {};
}

auto LiveContext::connect_deadline() const -> std::optional<Clock::time_point> {
    std::lock_guard const lock{mutex_};
    return connect_deadline_;
}

void LiveContext::set_connect_deadline(Clock::time_point deadline) {
    std::lock_guard const lock{mutex_};
    connect_deadline_ = deadline;
}

} // namespace LV::Live
