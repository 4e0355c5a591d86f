#pragma once

#include <liveview/live/ComponentRegistry.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace LV::Live {

class MarkupSink {
public:
    virtual ~MarkupSink() = default;
    virtual void write(std::string_view text) = 0;
};

class StringMarkupSink final : public MarkupSink {
public:
    void write(std::string_view text) override { buffer_.append(text); }

    auto str() const -> std::string const& { return buffer_; }
    auto take() -> std::string { return std::exchange(buffer_, std::string{}); }

private:
    std::string buffer_;
};

/**
 * StreamMarkupSink: forwards markup to a chunked HTTP writer.
 *
 * Text is coalesced into chunks of roughly `chunk_size` bytes. Once the writer
 * reports failure (client went away) further output is discarded and ok() turns false.
 */
class StreamMarkupSink final : public MarkupSink {
public:
    using ChunkWriter = std::function<bool(std::string_view)>;

    explicit StreamMarkupSink(ChunkWriter writer, std::size_t chunk_size = 4096);
    ~StreamMarkupSink() override;

    StreamMarkupSink(StreamMarkupSink const&)            = delete;
    StreamMarkupSink& operator=(StreamMarkupSink const&) = delete;

    void write(std::string_view text) override;
    auto flush() -> bool;
    auto ok() const -> bool { return ok_; }

private:
    ChunkWriter writer_;
    std::size_t chunk_size_;
    std::string buffer_;
    bool        ok_{true};
};

[[nodiscard]] auto escape_html(std::string_view text) -> std::string;

// JSON text safe to embed inside a <script> element.
[[nodiscard]] auto escape_script_json(std::string_view json_text) -> std::string;

/**
 * RenderScope: where a render function writes and under which component it registers.
 *
 * The scope is passed explicitly through every render call; nested live components,
 * containers and callbacks registered through it become children of parent().
 */
class RenderScope {
public:
    RenderScope(ComponentRegistry& registry, std::optional<ComponentId> parent, MarkupSink& sink);

    void write(std::string_view markup);
    void write_text(std::string_view text);

    auto parent() const -> std::optional<ComponentId> { return parent_; }
    auto registry() -> ComponentRegistry& { return registry_; }
    auto sink() -> MarkupSink& { return sink_; }
    auto context_id() const -> std::string const&;

    // Same sink, different parent.
    auto child(ComponentId id) -> RenderScope;

    // Sourceless component wrapping `body` in <container data-lv="id">.
    auto component(std::function<void(RenderScope&)> const& body, std::string_view container = "div") -> ComponentId;

    auto raw_callback(Callback fn) -> CallbackId;

    template <typename... Args, typename Fn>
    auto callback(Fn&& fn) -> CallbackId {
        return raw_callback(make_callback<Args...>(std::forward<Fn>(fn)));
    }

    // Client-side expression invoking a callback, e.g. for an onclick attribute.
    // `args_expr` is a comma separated JavaScript argument list.
    [[nodiscard]] static auto invoke_script(CallbackId id, std::string_view args_expr = {}) -> std::string;

    template <typename T>
    auto live(std::shared_ptr<Source<T>> source, MarkupRenderer<T> renderer, ComponentOptions<T> options = {})
        -> ComponentId;

    template <typename T>
    auto live_data(std::shared_ptr<Source<T>> source, DataRenderer<T> renderer, ComponentOptions<T> options = {})
        -> ComponentId;

private:
    void open_element(std::string_view tag, ComponentId id, std::string_view extra_attributes = {});
    void close_element(std::string_view tag);

    ComponentRegistry&         registry_;
    std::optional<ComponentId> parent_;
    MarkupSink&                sink_;
};

template <typename T>
auto RenderScope::live(std::shared_ptr<Source<T>> source, MarkupRenderer<T> renderer, ComponentOptions<T> options)
    -> ComponentId {
    auto const mode      = options.mode;
    auto const container = options.container;
    auto       initial   = renderer;
    // Subscribe first so no emission between the read of current() and the subscription is lost.
    auto id = registry_.register_component<T>(parent_, source, std::move(renderer), std::move(options));
    std::optional<T> value;
    if (source) {
        value = source->current();
    }
    if (mode == PatchMode::AttributeOnParent) {
        // The parent's start tag is already written; the initial attribute value travels as a patch.
        if (value) {
            registry_.handle_source_value(id, SourceEvent::of(std::any{std::move(*value)}));
        }
        return id;
    }
    open_element(container, id);
    if (value) {
        auto scope = child(id);
        initial(scope, *value);
    }
    close_element(container);
    return id;
}

template <typename T>
auto RenderScope::live_data(std::shared_ptr<Source<T>> source, DataRenderer<T> renderer, ComponentOptions<T> options)
    -> ComponentId {
    auto initial = renderer;
    auto id      = registry_.register_data_component<T>(parent_, source, std::move(renderer), std::move(options));
    std::optional<T> value;
    if (source) {
        value = source->current();
    }
    nlohmann::json data = value ? initial(*value) : nlohmann::json(nullptr);
    open_element("script", id, " type=\"application/json\"");
    write(escape_script_json(data.dump()));
    close_element("script");
    return id;
}

} // namespace LV::Live
