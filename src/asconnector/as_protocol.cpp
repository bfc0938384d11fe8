#include <plm_cfg/asconnector/as_protocol.hpp>

#include "core/xml_utils.hpp"

#include <tinyxml2.h>

#include <cctype>

namespace plm_cfg {

namespace {

using xml_utils::ChildText;
using xml_utils::FirstChildLocal;
using xml_utils::LocalName;
using xml_utils::NextSiblingLocal;

struct MethodInfo {
    AsMethod method;
    const char* path;
    const char* type;
    const char* name;
};

constexpr MethodInfo kMethods[] = {
    {AsMethod::GetVersionInfo, "getversioninfo", "GetVersionInfo", ""},
    {AsMethod::NodeSetVisible, "node/set/visible", "Node", "SetVisible"},
    {AsMethod::MaterialConnectToTargets, "material/connecttotargets", "Material", "ConnectToTargets"},
    {AsMethod::TargetGetAllNames, "material/getallnames", "Target", "GetAllNames"},
    {AsMethod::SceneGetStructure, "scene/get/structure", "Scene", "GetStructure"},
    {AsMethod::SceneGetActive, "scene/get/active", "Scene", "GetActive"},
    {AsMethod::SceneGetAll, "scene/get/all", "Scene", "GetAll"},
    {AsMethod::SceneSetActive, "scene/set/active", "Scene", "SetActive"},
};

const MethodInfo& InfoFor(AsMethod method) {
    for (const auto& info : kMethods) {
        if (info.method == method) {
            return info;
        }
    }
    return kMethods[0];
}

const char* BoolText(bool value) {
    return value ? "true" : "false";
}

tinyxml2::XMLElement* NewRequestRoot(tinyxml2::XMLDocument& doc, AsMethod method) {
    doc.InsertEndChild(doc.NewDeclaration(R"(xml version="1.0" encoding="utf-8")"));
    auto* root = doc.NewElement(RequestElementName(method).c_str());
    root->SetAttribute("xmlns:xsd", kXsdNamespace);
    root->SetAttribute("xmlns:xsi", kXsiNamespace);
    root->SetAttribute("xmlns", kAsConnectorNamespace);
    doc.InsertEndChild(root);
    return root;
}

tinyxml2::XMLElement* AppendText(tinyxml2::XMLDocument& doc,
                                 tinyxml2::XMLElement* parent,
                                 const char* name,
                                 const std::string& text) {
    auto* element = doc.NewElement(name);
    element->SetText(text.c_str());
    parent->InsertEndChild(element);
    return element;
}

void AppendNodeInfo(tinyxml2::XMLDocument& doc,
                    tinyxml2::XMLElement* parent,
                    const SceneNode& node) {
    auto* info = doc.NewElement("NodeInfo");
    parent->InsertEndChild(info);
    if (!node.as_id.empty()) {
        AppendText(doc, info, "AsId", node.as_id);
    }
    AppendText(doc, info, "LincId", node.linc_id);
    AppendText(doc, info, "Name", node.name);
    if (!node.parent_node_id.empty()) {
        AppendText(doc, info, "ParentNodeId", node.parent_node_id);
    }
    AppendText(doc, info, "NodeInfoType", NodeTypeName(node.node_type));
    if (!node.material_name.empty()) {
        AppendText(doc, info, "MaterialName", node.material_name);
    }

    auto* attributes = doc.NewElement("UserAttributes");
    info->InsertEndChild(attributes);
    for (const auto& [key, value] : node.user_attributes) {
        auto* attribute = doc.NewElement("UserAttribute");
        attributes->InsertEndChild(attribute);
        AppendText(doc, attribute, "Key", key);
        AppendText(doc, attribute, "Value", value);
    }
}

// Parse a response body, skipping anything before the first '<'.
std::optional<Error> ParseResponse(tinyxml2::XMLDocument& doc,
                                   std::string_view body,
                                   AsMethod method) {
    const auto endpoint = std::string(MethodPath(method));
    const auto operation = RequestElementName(method);
    auto start = body.find('<');
    if (start == std::string_view::npos) {
        return Error{operation, endpoint, std::nullopt,
                     "AsConnector response contains no XML",
                     std::string(body.substr(0, 500)), ErrorCategory::ParseError};
    }
    return xml_utils::ParseXmlOrError(doc, body.substr(start), operation, endpoint,
                                      "Cannot read AsConnector response");
}

std::vector<const tinyxml2::XMLElement*> ReturnValues(const tinyxml2::XMLDocument& doc) {
    std::vector<const tinyxml2::XMLElement*> values;
    const auto* root = doc.RootElement();
    if (!root) {
        return values;
    }
    if (LocalName(root) == "returnVal") {
        values.push_back(root);
        return values;
    }
    for (auto* value = FirstChildLocal(root, "returnVal"); value;
         value = NextSiblingLocal(value, "returnVal")) {
        values.push_back(value);
    }
    return values;
}

SceneNode ReadNodeInfo(const tinyxml2::XMLElement* element) {
    SceneNode node;
    node.as_id = ChildText(element, "AsId");
    node.linc_id = ChildText(element, "LincId");
    if (node.linc_id == "None") {
        node.linc_id.clear();
    }
    node.name = ChildText(element, "Name");
    node.parent_node_id = ChildText(element, "ParentNodeId");
    auto type = ChildText(element, "NodeInfoType");
    node.node_type = type.empty() ? NodeType::Unknown : ParseNodeType(type);
    node.material_name = ChildText(element, "MaterialName");

    const auto* attributes = FirstChildLocal(element, "UserAttributes");
    for (auto* attribute = FirstChildLocal(attributes, "UserAttribute"); attribute;
         attribute = NextSiblingLocal(attribute, "UserAttribute")) {
        node.user_attributes[ChildText(attribute, "Key")] = ChildText(attribute, "Value");
    }
    return node;
}

template <typename T>
Result<T, Error> ProtocolError(AsMethod method, std::string message) {
    return Result<T, Error>::Err(Error{RequestElementName(method), MethodPath(method),
                                       std::nullopt, std::move(message), std::nullopt,
                                       ErrorCategory::Protocol});
}

} // anonymous namespace

const char* MethodPath(AsMethod method) {
    return InfoFor(method).path;
}

std::string RequestElementName(AsMethod method) {
    const auto& info = InfoFor(method);
    return std::string(info.type) + info.name + "Request";
}

SceneNode SceneNodeFromNode(const Node& node) {
    SceneNode scene_node;
    scene_node.linc_id = node.LincId().value_or("");
    scene_node.name = node.name;
    scene_node.node_type = NodeType::Unknown;
    scene_node.user_attributes = node.user_data;
    return scene_node;
}

SceneNode SceneRootNode() {
    SceneNode root;
    root.as_id = kSceneRootId;
    root.parent_node_id = kSceneRootId;
    return root;
}

// ---------------------------------------------------------------------------
// Request builders
// ---------------------------------------------------------------------------
std::string BuildEmptyRequest(AsMethod method) {
    tinyxml2::XMLDocument doc;
    NewRequestRoot(doc, method);
    return xml_utils::DocumentToString(doc);
}

std::string BuildSetVisibleRequest(const std::vector<SceneNode>& nodes, bool visible) {
    tinyxml2::XMLDocument doc;
    auto* root = NewRequestRoot(doc, AsMethod::NodeSetVisible);
    auto* nodes_element = doc.NewElement("nodes");
    root->InsertEndChild(nodes_element);
    for (const auto& node : nodes) {
        AppendNodeInfo(doc, nodes_element, node);
    }
    AppendText(doc, root, "visible", BoolText(visible));
    return xml_utils::DocumentToString(doc);
}

std::string BuildConnectToTargetsRequest(const std::vector<MaterialAssignment>& assignments,
                                         const ConnectOptions& options) {
    tinyxml2::XMLDocument doc;
    auto* root = NewRequestRoot(doc, AsMethod::MaterialConnectToTargets);
    auto* materials = doc.NewElement("materialNames");
    auto* targets = doc.NewElement("targetNames");
    root->InsertEndChild(materials);
    root->InsertEndChild(targets);
    for (const auto& assignment : assignments) {
        AppendText(doc, materials, "string", assignment.material);
        AppendText(doc, targets, "string", assignment.target);
    }
    AppendText(doc, root, "useCopyMethod", BoolText(options.use_copy_method));
    AppendText(doc, root, "replaceTargetName", BoolText(options.replace_target_name));
    if (options.use_lookup_table.has_value()) {
        AppendText(doc, root, "useLookUpTable", BoolText(*options.use_lookup_table));
    }
    return xml_utils::DocumentToString(doc);
}

std::string BuildSceneStructureRequest(const SceneNode& start_node,
                                       const std::vector<NodeType>& types) {
    tinyxml2::XMLDocument doc;
    auto* root = NewRequestRoot(doc, AsMethod::SceneGetStructure);
    auto* node = doc.NewElement("node");
    root->InsertEndChild(node);
    AppendNodeInfo(doc, node, start_node);
    auto* types_element = doc.NewElement("types");
    root->InsertEndChild(types_element);
    for (auto type : types) {
        AppendText(doc, types_element, "NodeInfoType", NodeTypeName(type));
    }
    return xml_utils::DocumentToString(doc);
}

std::string BuildSceneSetActiveRequest(const std::string& scene_name) {
    tinyxml2::XMLDocument doc;
    auto* root = NewRequestRoot(doc, AsMethod::SceneSetActive);
    auto* name = doc.NewElement("name");
    root->InsertEndChild(name);
    AppendText(doc, name, "string", scene_name);
    return xml_utils::DocumentToString(doc);
}

// ---------------------------------------------------------------------------
// Response parsers
// ---------------------------------------------------------------------------
Result<std::vector<std::string>, Error> ParseReturnValues(std::string_view body,
                                                          AsMethod method) {
    tinyxml2::XMLDocument doc;
    if (auto err = ParseResponse(doc, body, method)) {
        return Result<std::vector<std::string>, Error>::Err(std::move(*err));
    }
    std::vector<std::string> values;
    for (const auto* value : ReturnValues(doc)) {
        values.push_back(xml_utils::Text(value));
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(values));
}

Result<void, Error> CheckReturnEchoes(std::string_view body,
                                      AsMethod method,
                                      std::string_view expected) {
    auto values = ParseReturnValues(body, method);
    if (values.IsErr()) {
        return Result<void, Error>::Err(values.Error());
    }
    std::size_t mismatches = 0;
    for (const auto& value : values.Value()) {
        if (value != expected) {
            ++mismatches;
        }
    }
    if (mismatches > 0) {
        return Result<void, Error>::Err(Error{
            RequestElementName(method), MethodPath(method), std::nullopt,
            std::to_string(mismatches) + " of " + std::to_string(values.Value().size()) +
                " results did not return '" + std::string(expected) + "'",
            std::nullopt, ErrorCategory::Protocol});
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> ParseVersionInfo(std::string_view body) {
    auto values = ParseReturnValues(body, AsMethod::GetVersionInfo);
    if (values.IsErr()) {
        return Result<std::string, Error>::Err(values.Error());
    }
    for (const auto& value : values.Value()) {
        if (!value.empty() && std::isdigit(static_cast<unsigned char>(value.front()))) {
            return Result<std::string, Error>::Ok(value);
        }
    }
    return ProtocolError<std::string>(AsMethod::GetVersionInfo,
                                      "Response contains no version number");
}

Result<std::vector<std::string>, Error> ParseTargetNames(std::string_view body) {
    tinyxml2::XMLDocument doc;
    if (auto err = ParseResponse(doc, body, AsMethod::TargetGetAllNames)) {
        return Result<std::vector<std::string>, Error>::Err(std::move(*err));
    }
    std::vector<std::string> names;
    for (const auto* value : ReturnValues(doc)) {
        for (auto* child = value->FirstChildElement(); child;
             child = child->NextSiblingElement()) {
            auto text = xml_utils::Text(child);
            if (!text.empty()) {
                names.push_back(std::move(text));
            }
        }
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(names));
}

Result<std::vector<SceneNode>, Error> ParseSceneStructure(std::string_view body) {
    tinyxml2::XMLDocument doc;
    if (auto err = ParseResponse(doc, body, AsMethod::SceneGetStructure)) {
        return Result<std::vector<SceneNode>, Error>::Err(std::move(*err));
    }
    std::vector<SceneNode> nodes;
    for (const auto* value : ReturnValues(doc)) {
        for (auto* child = value->FirstChildElement(); child;
             child = child->NextSiblingElement()) {
            if (LocalName(child) == "NodeInfo") {
                nodes.push_back(ReadNodeInfo(child));
            }
        }
    }
    return Result<std::vector<SceneNode>, Error>::Ok(std::move(nodes));
}

Result<std::string, Error> ParseActiveScene(std::string_view body) {
    auto values = ParseReturnValues(body, AsMethod::SceneGetActive);
    if (values.IsErr()) {
        return Result<std::string, Error>::Err(values.Error());
    }
    for (const auto& value : values.Value()) {
        if (!value.empty()) {
            return Result<std::string, Error>::Ok(value);
        }
    }
    return ProtocolError<std::string>(AsMethod::SceneGetActive, "No active scene reported");
}

Result<std::vector<std::string>, Error> ParseSceneNames(std::string_view body) {
    tinyxml2::XMLDocument doc;
    if (auto err = ParseResponse(doc, body, AsMethod::SceneGetAll)) {
        return Result<std::vector<std::string>, Error>::Err(std::move(*err));
    }
    std::vector<std::string> names;
    for (const auto* value : ReturnValues(doc)) {
        for (auto* scene = FirstChildLocal(value, "Scene"); scene;
             scene = NextSiblingLocal(scene, "Scene")) {
            auto name = ChildText(scene, "Name");
            if (!name.empty()) {
                names.push_back(std::move(name));
            }
        }
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(names));
}

} // namespace plm_cfg
