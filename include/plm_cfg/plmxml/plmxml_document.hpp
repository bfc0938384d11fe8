#pragma once

#include <plm_cfg/core/result.hpp>
#include <plm_cfg/plmxml/look_library.hpp>
#include <plm_cfg/plmxml/pr_tag_matcher.hpp>
#include <plm_cfg/plmxml/product_graph.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace plm_cfg {

struct DocumentStats {
    std::size_t node_count = 0;
    std::size_t configurable_count = 0;
    std::size_t target_count = 0;
    std::size_t variant_count = 0;
    std::size_t conflict_count = 0;
};

// ---------------------------------------------------------------------------
// PlmXmlDocument: a parsed PLM-XML product structure.
//
// Reads PLMXML/ProductDef/InstanceGraph/ProductInstance elements (namespace
// prefixes ignored). The instance named "LookLibrary" feeds the look library;
// every other instance becomes a Node. ProductRevisionView instanceRefs give
// the tree shape: the instances of a view are children of every instance
// whose partRef points at it.
//
// Malformed XML, a missing or foreign root element and unreadable files are
// returned as errors. Everything else is a warning and parsing continues.
// The document is immutable once returned.
// ---------------------------------------------------------------------------
class PlmXmlDocument {
public:
    [[nodiscard]] static Result<PlmXmlDocument, Error> FromString(
        std::string_view xml, std::string source = "<memory>");

    [[nodiscard]] static Result<PlmXmlDocument, Error> FromFile(const std::string& path);

    // At least one node and a look library with at least one target.
    [[nodiscard]] bool IsValid() const;

    [[nodiscard]] const std::string& Source() const noexcept { return source_; }
    [[nodiscard]] const ProductGraph& Graph() const noexcept { return graph_; }
    [[nodiscard]] const LookLibrary& Looks() const noexcept { return looks_; }
    [[nodiscard]] const std::vector<std::string>& Warnings() const noexcept { return warnings_; }
    [[nodiscard]] DocumentStats Stats() const;

    [[nodiscard]] const Node* FindNode(const std::string& id) const { return graph_.Find(id); }
    [[nodiscard]] std::vector<const Node*> ConfigurableNodes() const {
        return graph_.ConfigurableNodes();
    }
    [[nodiscard]] std::vector<const Node*> Roots() const { return graph_.Roots(); }
    [[nodiscard]] std::vector<const Node*> Children(const std::string& id) const {
        return graph_.Children(id);
    }
    [[nodiscard]] const Node* Parent(const std::string& id) const { return graph_.Parent(id); }

    // Shared compile cache for PR-tag expressions of this document.
    [[nodiscard]] PrTagMatcher& Matcher() const { return *matcher_; }

private:
    explicit PlmXmlDocument(std::string source);

    std::string source_;
    ProductGraph graph_;
    LookLibrary looks_;
    std::vector<std::string> warnings_;
    std::shared_ptr<PrTagMatcher> matcher_;
};

} // namespace plm_cfg
