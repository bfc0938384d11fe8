#include <plm_cfg/plmxml/node_type.hpp>

#include <plm_cfg/core/log.hpp>

#include <array>
#include <cctype>
#include <utility>

namespace plm_cfg {

namespace {

constexpr std::array<std::pair<NodeType, const char*>, 16> kNodeTypeNames = {{
    {NodeType::Unknown, "UNKNOWN"},
    {NodeType::Shape, "SHAPE"},
    {NodeType::Group, "GROUP"},
    {NodeType::Light, "LIGHT"},
    {NodeType::PointLight, "POINT_LIGHT"},
    {NodeType::SpotLight, "SPOT_LIGHT"},
    {NodeType::DirectionalLight, "DIRECTIONAL_LIGHT"},
    {NodeType::Camera, "CAMERA"},
    {NodeType::Body, "BODY"},
    {NodeType::Shell, "SHELL"},
    {NodeType::File, "FILE"},
    {NodeType::Locator, "LOCATOR"},
    {NodeType::Switch, "SWITCH"},
    {NodeType::Lod, "LOD"},
    {NodeType::Sound, "SOUND"},
    {NodeType::Fx, "FX"},
}};

bool EqualsUpper(std::string_view value, const char* upper) {
    std::size_t i = 0;
    for (; i < value.size() && upper[i] != '\0'; ++i) {
        if (std::toupper(static_cast<unsigned char>(value[i])) != upper[i]) {
            return false;
        }
    }
    return i == value.size() && upper[i] == '\0';
}

} // anonymous namespace

const char* NodeTypeName(NodeType type) {
    for (const auto& [value, name] : kNodeTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "UNKNOWN";
}

NodeType ParseNodeType(std::string_view name) {
    for (const auto& [value, wire] : kNodeTypeNames) {
        if (EqualsUpper(name, wire)) {
            return value;
        }
    }
    LogWarn(log_component::kPlmXml, "Unknown node type '" + std::string(name) +
            "', using UNKNOWN");
    return NodeType::Unknown;
}

} // namespace plm_cfg
