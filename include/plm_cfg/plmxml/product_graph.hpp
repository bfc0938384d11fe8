#pragma once

#include <plm_cfg/plmxml/node_type.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace plm_cfg {

inline constexpr const char* kUserDataPrTags = "PR_TAGS";
inline constexpr const char* kUserDataLincId = "LINC_ID";

// ---------------------------------------------------------------------------
// Node: one product instance. Immutable after the document is parsed.
// ---------------------------------------------------------------------------
struct Node {
    std::string plmxml_id;
    std::string name;
    std::string part_ref;
    std::map<std::string, std::string> user_data;
    NodeType node_type = NodeType::Unknown;

    // User-data PR_TAGS, empty if absent.
    [[nodiscard]] std::string PrTags() const;
    [[nodiscard]] bool HasPrTags() const;

    // User-data LINC_ID, the id the authoring system knows the node by.
    [[nodiscard]] std::optional<std::string> LincId() const;
};

// ---------------------------------------------------------------------------
// ProductGraph: flat id index plus parent/child adjacency.
//
// Nodes are ordered by id so every traversal is deterministic. A node has
// at most one parent; roots are nodes without one.
// ---------------------------------------------------------------------------
class ProductGraph {
public:
    // Inserts or replaces. Returns false if a node with the same id was
    // replaced.
    bool AddNode(Node node);

    // Records parent -> child. Both ids must exist. A second parent for the
    // same child is ignored and false is returned.
    bool AddChild(const std::string& parent_id, const std::string& child_id);

    [[nodiscard]] const Node* Find(const std::string& id) const;
    [[nodiscard]] bool Contains(const std::string& id) const;

    [[nodiscard]] std::size_t Size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return nodes_.empty(); }
    [[nodiscard]] const std::map<std::string, Node>& Nodes() const noexcept { return nodes_; }

    // Nodes with non-empty PR tags, in id order.
    [[nodiscard]] std::vector<const Node*> ConfigurableNodes() const;

    [[nodiscard]] std::vector<const Node*> Roots() const;
    [[nodiscard]] std::vector<const Node*> Children(const std::string& id) const;
    [[nodiscard]] const Node* Parent(const std::string& id) const;

private:
    std::map<std::string, Node> nodes_;
    std::map<std::string, std::vector<std::string>> children_;
    std::map<std::string, std::string> parents_;
};

} // namespace plm_cfg
