#include <liveview/live/RenderScope.hpp>

namespace LV::Live {

StreamMarkupSink::StreamMarkupSink(ChunkWriter writer, std::size_t chunk_size)
    : writer_(std::move(writer))
    , chunk_size_(chunk_size == 0 ? 1 : chunk_size) {
    buffer_.reserve(chunk_size_);
}

StreamMarkupSink::~StreamMarkupSink() {
    (void)flush();
}

void StreamMarkupSink::write(std::string_view text) {
    if (!ok_) {
        return;
    }
    buffer_.append(text);
    if (buffer_.size() >= chunk_size_) {
        (void)flush();
    }
}

auto StreamMarkupSink::flush() -> bool {
    if (!ok_) {
        return false;
    }
    if (buffer_.empty()) {
        return true;
    }
    if (!writer_ || !writer_(buffer_)) {
        ok_ = false;
    }
    buffer_.clear();
    return ok_;
}

auto escape_html(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            escaped.append("&amp;");
            break;
        case '<':
            escaped.append("&lt;");
            break;
        case '>':
            escaped.append("&gt;");
            break;
        case '"':
            escaped.append("&quot;");
            break;
        case '\'':
            escaped.append("&#39;");
            break;
        default:
            escaped.push_back(ch);
            break;
        }
    }
    return escaped;
}

auto escape_script_json(std::string_view json_text) -> std::string {
    std::string escaped;
    escaped.reserve(json_text.size());
    for (std::size_t i = 0; i < json_text.size(); ++i) {
        if (json_text[i] == '<' && i + 1 < json_text.size() && json_text[i + 1] == '/') {
            escaped.append("<\\/");
            ++i;
            continue;
        }
        escaped.push_back(json_text[i]);
    }
    return escaped;
}

RenderScope::RenderScope(ComponentRegistry& registry, std::optional<ComponentId> parent, MarkupSink& sink)
    : registry_(registry)
    , parent_(parent)
    , sink_(sink) {}

void RenderScope::write(std::string_view markup) {
    sink_.write(markup);
}

void RenderScope::write_text(std::string_view text) {
    sink_.write(escape_html(text));
}

auto RenderScope::context_id() const -> std::string const& {
    return registry_.context_id();
}

auto RenderScope::child(ComponentId id) -> RenderScope {
    return RenderScope{registry_, id, sink_};
}

auto RenderScope::component(std::function<void(RenderScope&)> const& body, std::string_view container)
    -> ComponentId {
    auto id = registry_.register_container(parent_);
    open_element(container, id);
    if (body) {
        auto scope = child(id);
        body(scope);
    }
    close_element(container);
    return id;
}

auto RenderScope::raw_callback(Callback fn) -> CallbackId {
    return registry_.register_callback(parent_, std::move(fn));
}

auto RenderScope::invoke_script(CallbackId id, std::string_view args_expr) -> std::string {
    std::string script{"liveview.send("};
    script.append(std::to_string(id));
    if (!args_expr.empty()) {
        script.append(", ");
        script.append(args_expr);
    }
    script.push_back(')');
    return script;
}

void RenderScope::open_element(std::string_view tag, ComponentId id, std::string_view extra_attributes) {
    std::string markup;
    markup.reserve(tag.size() + extra_attributes.size() + 32);
    markup.push_back('<');
    markup.append(tag);
    markup.append(extra_attributes);
    markup.append(" data-lv=\"");
    markup.append(std::to_string(id));
    markup.append("\">");
    sink_.write(markup);
}

void RenderScope::close_element(std::string_view tag) {
    std::string markup{"</"};
    markup.append(tag);
    markup.push_back('>');
    sink_.write(markup);
}

} // namespace LV::Live
