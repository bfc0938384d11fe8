#include <plm_cfg/plmxml/product_graph.hpp>

#include <plm_cfg/core/log.hpp>

#include <algorithm>

namespace plm_cfg {

std::string Node::PrTags() const {
    auto it = user_data.find(kUserDataPrTags);
    return it != user_data.end() ? it->second : std::string{};
}

bool Node::HasPrTags() const {
    auto it = user_data.find(kUserDataPrTags);
    return it != user_data.end() && !it->second.empty();
}

std::optional<std::string> Node::LincId() const {
    auto it = user_data.find(kUserDataLincId);
    if (it == user_data.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

// ---------------------------------------------------------------------------
// ProductGraph
// ---------------------------------------------------------------------------
bool ProductGraph::AddNode(Node node) {
    auto id = node.plmxml_id;
    auto [it, inserted] = nodes_.insert_or_assign(std::move(id), std::move(node));
    (void)it;
    return inserted;
}

bool ProductGraph::AddChild(const std::string& parent_id, const std::string& child_id) {
    if (!Contains(parent_id) || !Contains(child_id) || parent_id == child_id) {
        return false;
    }
    auto existing = parents_.find(child_id);
    if (existing != parents_.end()) {
        if (existing->second != parent_id) {
            LogWarn(log_component::kPlmXml, "Node '" + child_id + "' already has parent '" +
                    existing->second + "', ignoring '" + parent_id + "'");
        }
        return false;
    }
    parents_.emplace(child_id, parent_id);
    children_[parent_id].push_back(child_id);
    return true;
}

const Node* ProductGraph::Find(const std::string& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

bool ProductGraph::Contains(const std::string& id) const {
    return nodes_.count(id) > 0;
}

std::vector<const Node*> ProductGraph::ConfigurableNodes() const {
    std::vector<const Node*> result;
    for (const auto& [id, node] : nodes_) {
        if (node.HasPrTags()) {
            result.push_back(&node);
        }
    }
    return result;
}

std::vector<const Node*> ProductGraph::Roots() const {
    std::vector<const Node*> result;
    for (const auto& [id, node] : nodes_) {
        if (parents_.count(id) == 0) {
            result.push_back(&node);
        }
    }
    return result;
}

std::vector<const Node*> ProductGraph::Children(const std::string& id) const {
    std::vector<const Node*> result;
    auto it = children_.find(id);
    if (it == children_.end()) {
        return result;
    }
    for (const auto& child_id : it->second) {
        if (const auto* child = Find(child_id)) {
            result.push_back(child);
        }
    }
    return result;
}

const Node* ProductGraph::Parent(const std::string& id) const {
    auto it = parents_.find(id);
    return it != parents_.end() ? Find(it->second) : nullptr;
}

} // namespace plm_cfg
