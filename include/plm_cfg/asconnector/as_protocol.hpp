#pragma once

#include <plm_cfg/core/result.hpp>
#include <plm_cfg/plmxml/node_type.hpp>
#include <plm_cfg/plmxml/product_graph.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plm_cfg {

inline constexpr const char* kAsConnectorNamespace = "urn:authoringsystem_v2";
inline constexpr const char* kXsdNamespace = "http://www.w3.org/2001/XMLSchema";
inline constexpr const char* kXsiNamespace = "http://www.w3.org/2001/XMLSchema-instance";
inline constexpr const char* kAsContentType = "application/xml";
inline constexpr const char* kSceneRootId = "root";

// ---------------------------------------------------------------------------
// AsMethod: the AsConnector REST methods used by this client.
// ---------------------------------------------------------------------------
enum class AsMethod {
    GetVersionInfo,
    NodeSetVisible,
    MaterialConnectToTargets,
    TargetGetAllNames,
    SceneGetStructure,
    SceneGetActive,
    SceneGetAll,
    SceneSetActive,
};

// URL path below "/<api-version>///", e.g. "node/set/visible".
[[nodiscard]] const char* MethodPath(AsMethod method);

// Request root element and log name, e.g. "NodeSetVisibleRequest".
[[nodiscard]] std::string RequestElementName(AsMethod method);

// ---------------------------------------------------------------------------
// SceneNode: a <NodeInfo> as exchanged with the authoring system.
// ---------------------------------------------------------------------------
struct SceneNode {
    std::string as_id;
    std::string linc_id;
    std::string name;
    std::string parent_node_id;
    NodeType node_type = NodeType::Unknown;
    std::string material_name;
    std::map<std::string, std::string> user_attributes;
};

// NodeInfo for a product node: LINC id, name and its user data.
[[nodiscard]] SceneNode SceneNodeFromNode(const Node& node);

// The scene root used as start node for structure queries.
[[nodiscard]] SceneNode SceneRootNode();

// One material -> target pair of a connect request.
struct MaterialAssignment {
    std::string material;
    std::string target;

    bool operator==(const MaterialAssignment& other) const {
        return material == other.material && target == other.target;
    }
};

struct ConnectOptions {
    bool use_copy_method = false;
    bool replace_target_name = false;
    // Sent only when set; AsConnector 2.15 and later understand it.
    std::optional<bool> use_lookup_table;
};

// -- Request builders -------------------------------------------------------

// Request without parameters (version info, target names, scene queries).
[[nodiscard]] std::string BuildEmptyRequest(AsMethod method);

[[nodiscard]] std::string BuildSetVisibleRequest(const std::vector<SceneNode>& nodes,
                                                 bool visible);

[[nodiscard]] std::string BuildConnectToTargetsRequest(
    const std::vector<MaterialAssignment>& assignments,
    const ConnectOptions& options);

// Empty `types` asks for every node type.
[[nodiscard]] std::string BuildSceneStructureRequest(const SceneNode& start_node,
                                                     const std::vector<NodeType>& types);

[[nodiscard]] std::string BuildSceneSetActiveRequest(const std::string& scene_name);

// -- Response parsers -------------------------------------------------------
// Bodies may carry junk before the first '<'; it is skipped. A body without
// any element is a ParseError.

// Text of every <returnVal> below the root, in document order.
[[nodiscard]] Result<std::vector<std::string>, Error> ParseReturnValues(
    std::string_view body, AsMethod method);

// Every <returnVal> must equal `expected`. A response without any
// <returnVal> is accepted.
[[nodiscard]] Result<void, Error> CheckReturnEchoes(std::string_view body,
                                                    AsMethod method,
                                                    std::string_view expected);

// <returnVal> text that starts with a digit, e.g. "2.15.0".
[[nodiscard]] Result<std::string, Error> ParseVersionInfo(std::string_view body);

// Texts of the children of <returnVal>.
[[nodiscard]] Result<std::vector<std::string>, Error> ParseTargetNames(std::string_view body);

// <returnVal><NodeInfo>... children.
[[nodiscard]] Result<std::vector<SceneNode>, Error> ParseSceneStructure(std::string_view body);

[[nodiscard]] Result<std::string, Error> ParseActiveScene(std::string_view body);

// <returnVal><Scene><Name>...
[[nodiscard]] Result<std::vector<std::string>, Error> ParseSceneNames(std::string_view body);

} // namespace plm_cfg
