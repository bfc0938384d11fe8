#include <plm_cfg/cli/report_json.hpp>

namespace plm_cfg {

namespace {

nlohmann::json NodeToJson(const PlmXmlDocument& document, const Node& node) {
    nlohmann::json j;
    j["id"] = node.plmxml_id;
    j["name"] = node.name;
    j["type"] = NodeTypeName(node.node_type);
    if (node.HasPrTags()) {
        j["pr_tags"] = node.PrTags();
    }
    auto linc = node.LincId();
    if (linc.has_value()) {
        j["linc_id"] = *linc;
    }
    nlohmann::json children = nlohmann::json::array();
    for (const auto* child : document.Children(node.plmxml_id)) {
        children.push_back(NodeToJson(document, *child));
    }
    j["children"] = children;
    return j;
}

} // anonymous namespace

nlohmann::json ToJson(const ConfigurationResult& result) {
    nlohmann::json j;
    j["configuration"] = result.configuration;
    j["visible_nodes"] = result.visible_nodes;
    j["invisible_nodes"] = result.invisible_nodes;

    nlohmann::json targets = nlohmann::json::object();
    for (const auto& [target, variant] : result.target_variants) {
        targets[target] = variant.has_value() ? nlohmann::json(*variant)
                                              : nlohmann::json(nullptr);
    }
    j["target_variants"] = targets;

    nlohmann::json conflicts = nlohmann::json::array();
    for (const auto& c : result.diagnostics.conflicts) {
        conflicts.push_back(ToJson(c));
    }
    j["diagnostics"] = {{"unmatched_targets", result.diagnostics.unmatched_targets},
                        {"conflicts", conflicts}};
    return j;
}

nlohmann::json ToJson(const TargetConflict& conflict) {
    return {{"target", conflict.target},
            {"descriptions", conflict.descriptions}};
}

nlohmann::json ToJson(const DocumentStats& stats) {
    return {{"nodes", stats.node_count},
            {"configurable_nodes", stats.configurable_count},
            {"targets", stats.target_count},
            {"variants", stats.variant_count},
            {"conflicts", stats.conflict_count}};
}

nlohmann::json ToJson(const StepResult& step) {
    return {{"step", step.step_name},
            {"outcome", StepOutcomeName(step.outcome)},
            {"message", step.message},
            {"elapsed_ms", step.duration.count()}};
}

nlohmann::json ToJson(const ApplyReport& report) {
    nlohmann::json j;
    j["success"] = report.success;
    j["connected"] = report.connected;
    j["version"] = report.version;

    nlohmann::json steps = nlohmann::json::array();
    for (const auto& s : report.steps) {
        steps.push_back(ToJson(s));
    }
    j["steps"] = steps;
    j["errors"] = report.errors;
    j["missing_targets"] = report.missing_targets;

    nlohmann::json materials = nlohmann::json::array();
    for (const auto& m : report.connected_materials) {
        materials.push_back({{"material", m.material}, {"target", m.target}});
    }
    j["connected_materials"] = materials;
    j["summary"] = report.summary;
    j["elapsed_ms"] = report.total_duration.count();
    return j;
}

nlohmann::json ToJson(const SceneNode& node) {
    nlohmann::json j;
    j["as_id"] = node.as_id;
    j["linc_id"] = node.linc_id;
    j["name"] = node.name;
    j["parent_node_id"] = node.parent_node_id;
    j["type"] = NodeTypeName(node.node_type);
    if (!node.material_name.empty()) {
        j["material"] = node.material_name;
    }
    return j;
}

nlohmann::json ToJson(const SceneValidation& validation) {
    nlohmann::json j;
    j["valid"] = validation.IsValid();
    j["scene_nodes"] = validation.scene_node_count;
    j["missing_nodes"] = validation.missing_nodes;
    j["missing_targets"] = validation.missing_targets;
    j["material_dummy"] = validation.material_dummy.has_value()
                              ? ToJson(*validation.material_dummy)
                              : nlohmann::json(nullptr);
    return j;
}

nlohmann::json NodeTreeToJson(const PlmXmlDocument& document) {
    nlohmann::json roots = nlohmann::json::array();
    for (const auto* root : document.Roots()) {
        roots.push_back(NodeToJson(document, *root));
    }
    return roots;
}

} // namespace plm_cfg
