#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace LV::Live {

using ComponentId = std::uint64_t;
using CallbackId  = std::uint64_t;

// How a component's updates are applied on the client.
enum class PatchMode : std::uint8_t {
    Replace = 0,
    Append,
    Prepend,
    AttributeOnParent,
};

// Wire-level patch kind. Delete is not a component mode; it only appears on removal.
enum class PatchKind : std::uint8_t {
    Replace = 0,
    Append,
    Prepend,
    Attribute,
    Delete,
};

enum class PayloadEncoding : std::uint8_t {
    Markup = 0,
    Structured,
};

class Payload {
public:
    static auto markup(std::string text) -> Payload;
    static auto structured(nlohmann::json value) -> Payload;

    auto encoding() const -> PayloadEncoding { return encoding_; }
    auto markup_text() const -> std::string const& { return markup_; }
    auto data() const -> nlohmann::json const& { return data_; }

    auto to_json() const -> nlohmann::json;

    auto operator==(Payload const& other) const -> bool = default;

private:
    Payload() = default;

    PayloadEncoding encoding_{PayloadEncoding::Markup};
    std::string     markup_;
    nlohmann::json  data_;
};

struct Patch {
    ComponentId            target{0};
    PatchKind              kind{PatchKind::Replace};
    std::optional<Payload> payload;

    auto operator==(Patch const& other) const -> bool = default;
};

using PatchBatch = std::vector<Patch>;

[[nodiscard]] auto targets_parent(PatchMode mode) -> bool;
[[nodiscard]] auto patch_kind_for(PatchMode mode) -> PatchKind;

auto make_patch(PatchMode mode, ComponentId target, Payload payload) -> Patch;
auto make_delete(ComponentId target) -> Patch;

auto to_string(PatchKind kind) -> std::string_view;
auto to_string(PayloadEncoding encoding) -> std::string_view;
auto parse_patch_kind(std::string_view text) -> std::optional<PatchKind>;

// {"target": id, "mode": kind, "encoding": ..., "payload": ...}; delete records carry no payload.
auto patch_to_json(Patch const& patch) -> nlohmann::json;
auto batch_to_json(PatchBatch const& batch) -> nlohmann::json;

} // namespace LV::Live
