#pragma once

#include <plm_cfg/plmxml/look_library.hpp>
#include <plm_cfg/plmxml/plmxml_document.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace plm_cfg {

// ---------------------------------------------------------------------------
// ResolutionDiagnostics: what a resolution pass could not settle.
// ---------------------------------------------------------------------------
struct ResolutionDiagnostics {
    // Targets no variant matched; they keep their current material.
    std::vector<std::string> unmatched_targets;
    // Look-library conflicts of the document, copied for reporting.
    std::vector<TargetConflict> conflicts;
};

// ---------------------------------------------------------------------------
// ConfigurationResult: outcome of resolving one configuration string.
// A fresh value per resolution; nothing in the document is modified.
// ---------------------------------------------------------------------------
struct ConfigurationResult {
    std::string configuration;
    std::set<std::string> visible_nodes;
    std::set<std::string> invisible_nodes;
    // Target name -> chosen variant name, nullopt if no variant matched.
    std::map<std::string, std::optional<std::string>> target_variants;
    ResolutionDiagnostics diagnostics;

    // Targets with a chosen variant: target name -> variant name.
    [[nodiscard]] std::map<std::string, std::string> ActiveTargets() const;

    [[nodiscard]] bool IsConflicting(const std::string& target) const;

    bool operator==(const ConfigurationResult& other) const {
        return configuration == other.configuration &&
               visible_nodes == other.visible_nodes &&
               invisible_nodes == other.invisible_nodes &&
               target_variants == other.target_variants &&
               diagnostics.unmatched_targets == other.diagnostics.unmatched_targets;
    }
    bool operator!=(const ConfigurationResult& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// ConfigurationResolver: evaluates a configuration string against a
// document.
//
//   - Nodes with PR tags are visible if their expression matches, otherwise
//     invisible. Nodes without PR tags are structural and not reported.
//   - For each target, variants with PR tags are evaluated in declared
//     order; the last matching variant wins.
//
// Resolve() is const and reads only immutable document state, so one
// resolver may serve concurrent callers.
// ---------------------------------------------------------------------------
class ConfigurationResolver {
public:
    explicit ConfigurationResolver(const PlmXmlDocument& document);

    [[nodiscard]] ConfigurationResult Resolve(std::string_view configuration) const;

    // Human-readable summary of a result for this document.
    [[nodiscard]] std::string StatusMessage(const ConfigurationResult& result) const;

private:
    const PlmXmlDocument& document_;
};

} // namespace plm_cfg
