#pragma once

#include <string>
#include <string_view>

namespace plm_cfg {

// ---------------------------------------------------------------------------
// NodeType: closed set of node kinds known to the authoring system.
// Wire names are upper-case ("SHAPE", "POINT_LIGHT", ...).
// ---------------------------------------------------------------------------
enum class NodeType {
    Unknown,
    Shape,
    Group,
    Light,
    PointLight,
    SpotLight,
    DirectionalLight,
    Camera,
    Body,
    Shell,
    File,
    Locator,
    Switch,
    Lod,
    Sound,
    Fx,
};

[[nodiscard]] const char* NodeTypeName(NodeType type);

// Unknown or empty names fall back to NodeType::Unknown with a warning.
[[nodiscard]] NodeType ParseNodeType(std::string_view name);

} // namespace plm_cfg
