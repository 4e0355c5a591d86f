#include <liveview/live/Patch.hpp>

namespace LV::Live {

auto Payload::markup(std::string text) -> Payload {
    Payload payload;
    payload.encoding_ = PayloadEncoding::Markup;
    payload.markup_   = std::move(text);
    return payload;
}

auto Payload::structured(nlohmann::json value) -> Payload {
    Payload payload;
    payload.encoding_ = PayloadEncoding::Structured;
    payload.data_     = std::move(value);
    return payload;
}

auto Payload::to_json() const -> nlohmann::json {
    switch (encoding_) {
    case PayloadEncoding::Markup:
        return nlohmann::json(markup_);
    case PayloadEncoding::Structured:
        return data_;
    }
    return nullptr;
}

auto targets_parent(PatchMode mode) -> bool {
    return mode == PatchMode::AttributeOnParent;
}

auto patch_kind_for(PatchMode mode) -> PatchKind {
    switch (mode) {
    case PatchMode::Replace:
        return PatchKind::Replace;
    case PatchMode::Append:
        return PatchKind::Append;
    case PatchMode::Prepend:
        return PatchKind::Prepend;
    case PatchMode::AttributeOnParent:
        return PatchKind::Attribute;
    }
    return PatchKind::Replace;
}

auto make_patch(PatchMode mode, ComponentId target, Payload payload) -> Patch {
    return Patch{.target = target, .kind = patch_kind_for(mode), .payload = std::move(payload)};
}

auto make_delete(ComponentId target) -> Patch {
    return Patch{.target = target, .kind = PatchKind::Delete, .payload = std::nullopt};
}

auto to_string(PatchKind kind) -> std::string_view {
    switch (kind) {
    case PatchKind::Replace:
        return "replace";
    case PatchKind::Append:
        return "append";
    case PatchKind::Prepend:
        return "prepend";
    case PatchKind::Attribute:
        return "attribute";
    case PatchKind::Delete:
        return "delete";
    }
    return "replace";
}

auto to_string(PayloadEncoding encoding) -> std::string_view {
    switch (encoding) {
    case PayloadEncoding::Markup:
        return "markup";
    case PayloadEncoding::Structured:
        return "structured";
    }
    return "markup";
}

auto parse_patch_kind(std::string_view text) -> std::optional<PatchKind> {
    if (text == "replace") {
        return PatchKind::Replace;
    }
    if (text == "append") {
        return PatchKind::Append;
    }
    if (text == "prepend") {
        return PatchKind::Prepend;
    }
    if (text == "attribute") {
        return PatchKind::Attribute;
    }
    if (text == "delete") {
        return PatchKind::Delete;
    }
    return std::nullopt;
}

auto patch_to_json(Patch const& patch) -> nlohmann::json {
    nlohmann::json record{{"target", patch.target}, {"mode", to_string(patch.kind)}};
    if (patch.kind != PatchKind::Delete && patch.payload) {
        record["encoding"] = to_string(patch.payload->encoding());
        record["payload"]  = patch.payload->to_json();
    }
    return record;
}

auto batch_to_json(PatchBatch const& batch) -> nlohmann::json {
    auto records = nlohmann::json::array();
    for (auto const& patch : batch) {
        records.push_back(patch_to_json(patch));
    }
    return records;
}

} // namespace LV::Live
