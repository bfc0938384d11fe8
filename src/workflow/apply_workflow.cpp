#include <plm_cfg/workflow/apply_workflow.hpp>

#include <plm_cfg/core/log.hpp>

#include <sstream>

namespace plm_cfg {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

ConnectOptions MakeConnectOptions(const ApplyOptions& options, const std::string& version) {
    ConnectOptions connect;
    connect.use_copy_method = options.use_copy_method;
    connect.replace_target_name = options.replace_target_name;
    if (SupportsLookUpTable(version)) {
        connect.use_lookup_table = false;
    }
    return connect;
}

} // anonymous namespace

const char* StepOutcomeName(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return "completed";
        case StepOutcome::Skipped:   return "skipped";
        case StepOutcome::Failed:    return "failed";
    }
    return "failed";
}

const StepResult* ApplyReport::FindStep(const std::string& name) const {
    for (const auto& step : steps) {
        if (step.step_name == name) {
            return &step;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// ApplyWorkflow
// ---------------------------------------------------------------------------
ApplyWorkflow::ApplyWorkflow(AuthoringClient& client,
                             const PlmXmlDocument& document,
                             const ApplyOptions& options)
    : client_(client), document_(document), options_(options) {}

ApplyReport ApplyWorkflow::Run(const ConfigurationResult& result) {
    auto total_start = Clock::now();
    ApplyReport report;

    // Step 1: Version probe. Nothing is sent if it fails.
    report.steps.push_back(RunConnect(report));
    if (!report.connected) {
        report.success = false;
        report.summary = "Could not connect to AsConnector, nothing applied";
        report.total_duration = Elapsed(total_start);
        return report;
    }

    // Step 2/3: Visibility, both batches are sent regardless of each other.
    report.steps.push_back(RunVisibility(result.visible_nodes, true, report));
    report.steps.push_back(RunVisibility(result.invisible_nodes, false, report));

    // Step 4: Which targets does the scene have?
    std::optional<std::set<std::string>> scene_targets;
    report.steps.push_back(RunDiscoverTargets(scene_targets, report));

    // Step 5: Optional dummy material.
    if (options_.material_dummy.empty() || !scene_targets) {
        report.steps.push_back(StepResult{"material_dummy", StepOutcome::Skipped,
                                          "Material dummy not configured", {}});
    } else {
        report.steps.push_back(RunMaterialDummy(*scene_targets, report.version));
    }

    // Step 6: Connect the resolved variants.
    report.steps.push_back(RunMaterials(result, scene_targets, report));

    report.success = report.errors.empty();
    report.total_duration = Elapsed(total_start);

    std::ostringstream oss;
    oss << result.visible_nodes.size() << " shown, " << result.invisible_nodes.size()
        << " hidden, " << report.connected_materials.size() << " materials connected";
    if (!report.missing_targets.empty()) {
        oss << ", " << report.missing_targets.size() << " targets missing in scene";
    }
    if (!report.errors.empty()) {
        oss << ", " << report.errors.size() << " errors";
    }
    report.summary = oss.str();
    LogInfo(log_component::kApply, report.summary);
    return report;
}

StepResult ApplyWorkflow::RunConnect(ApplyReport& report) {
    auto start = Clock::now();
    auto version = client_.GetVersionInfo();
    if (version.IsErr()) {
        report.errors.push_back("Could not connect to AsConnector: " +
                                version.Error().ToString());
        return StepResult{"connect", StepOutcome::Failed,
                          version.Error().ToString(), Elapsed(start)};
    }
    report.connected = true;
    report.version = version.Value();
    return StepResult{"connect", StepOutcome::Completed,
                      "AsConnector " + report.version, Elapsed(start)};
}

StepResult ApplyWorkflow::RunVisibility(const std::set<std::string>& node_ids,
                                        bool visible,
                                        ApplyReport& report) {
    const std::string step_name = visible ? "show" : "hide";
    auto start = Clock::now();
    if (node_ids.empty()) {
        return StepResult{step_name, StepOutcome::Skipped, "No nodes", Elapsed(start)};
    }

    std::vector<SceneNode> nodes;
    nodes.reserve(node_ids.size());
    for (const auto& id : node_ids) {
        if (const auto* node = document_.FindNode(id)) {
            nodes.push_back(SceneNodeFromNode(*node));
        }
    }

    auto sent = client_.SetVisible(nodes, visible);
    if (sent.IsErr()) {
        report.errors.push_back(sent.Error().ToString());
        return StepResult{step_name, StepOutcome::Failed, sent.Error().ToString(),
                          Elapsed(start)};
    }
    return StepResult{step_name, StepOutcome::Completed,
                      std::to_string(nodes.size()) + " nodes", Elapsed(start)};
}

StepResult ApplyWorkflow::RunDiscoverTargets(std::optional<std::set<std::string>>& scene_targets,
                                             ApplyReport& report) {
    auto start = Clock::now();
    auto names = client_.GetAllTargetNames();
    if (names.IsErr()) {
        report.errors.push_back(names.Error().ToString());
        return StepResult{"discover_targets", StepOutcome::Failed,
                          names.Error().ToString(), Elapsed(start)};
    }
    scene_targets.emplace(names.Value().begin(), names.Value().end());
    return StepResult{"discover_targets", StepOutcome::Completed,
                      std::to_string(scene_targets->size()) + " targets in scene",
                      Elapsed(start)};
}

StepResult ApplyWorkflow::RunMaterialDummy(const std::set<std::string>& scene_targets,
                                           const std::string& version) {
    auto start = Clock::now();
    std::vector<MaterialAssignment> assignments;
    for (const auto& [name, target] : document_.Looks().Targets()) {
        if (scene_targets.count(name) > 0) {
            assignments.push_back(MaterialAssignment{options_.material_dummy, name});
        }
    }
    if (assignments.empty()) {
        return StepResult{"material_dummy", StepOutcome::Skipped,
                          "No targets in scene", Elapsed(start)};
    }

    LogInfo(log_component::kApply, "Assigning material dummy " + options_.material_dummy + " to " +
            std::to_string(assignments.size()) + " targets");
    auto sent = client_.ConnectMaterialsToTargets(assignments,
                                                  MakeConnectOptions(options_, version));
    if (sent.IsErr()) {
        // The resolved variants are still connected afterwards.
        LogWarn(log_component::kApply, "Material dummy assignment failed: " + sent.Error().ToString());
        return StepResult{"material_dummy", StepOutcome::Failed,
                          sent.Error().ToString(), Elapsed(start)};
    }
    return StepResult{"material_dummy", StepOutcome::Completed,
                      std::to_string(assignments.size()) + " targets", Elapsed(start)};
}

StepResult ApplyWorkflow::RunMaterials(const ConfigurationResult& result,
                                       const std::optional<std::set<std::string>>& scene_targets,
                                       ApplyReport& report) {
    auto start = Clock::now();
    if (!scene_targets) {
        report.errors.push_back("Material targets not updated, target discovery failed");
        return StepResult{"materials", StepOutcome::Failed,
                          "Target discovery failed", Elapsed(start)};
    }

    std::vector<MaterialAssignment> assignments;
    for (const auto& [target, variant] : result.ActiveTargets()) {
        if (scene_targets->count(target) == 0) {
            report.missing_targets.insert(target);
            continue;
        }
        assignments.push_back(MaterialAssignment{variant, target});
    }
    if (!report.missing_targets.empty()) {
        std::string names;
        for (const auto& name : report.missing_targets) {
            names += names.empty() ? name : "; " + name;
        }
        LogWarn(log_component::kApply, "Scene contains unloaded or missing material targets, ignored: " + names);
    }

    if (assignments.empty()) {
        return StepResult{"materials", StepOutcome::Skipped,
                          "No material targets to update", Elapsed(start)};
    }

    LogInfo(log_component::kApply, "Assigning " + std::to_string(assignments.size()) + " materials");
    auto sent = client_.ConnectMaterialsToTargets(assignments,
                                                  MakeConnectOptions(options_, report.version));
    if (sent.IsErr()) {
        report.errors.push_back(sent.Error().ToString());
        return StepResult{"materials", StepOutcome::Failed, sent.Error().ToString(),
                          Elapsed(start)};
    }
    report.connected_materials = std::move(assignments);
    return StepResult{"materials", StepOutcome::Completed,
                      std::to_string(report.connected_materials.size()) + " targets",
                      Elapsed(start)};
}

// ---------------------------------------------------------------------------
// ValidateSceneVsPlmXml
// ---------------------------------------------------------------------------
Result<SceneValidation, Error> ValidateSceneVsPlmXml(AuthoringClient& client,
                                                     const PlmXmlDocument& document,
                                                     const std::string& material_dummy) {
    auto structure = client.GetSceneStructure();
    if (structure.IsErr()) {
        return Result<SceneValidation, Error>::Err(structure.Error());
    }

    SceneValidation validation;
    validation.scene_node_count = structure.Value().size();

    std::set<std::string> scene_linc_ids;
    for (const auto& node : structure.Value()) {
        if (!node.linc_id.empty()) {
            scene_linc_ids.insert(node.linc_id);
        }
        if (!material_dummy.empty() && node.node_type == NodeType::Group &&
            (node.name == material_dummy || node.name == material_dummy + ".csb")) {
            validation.material_dummy = node;
        }
    }

    for (const auto* node : document.ConfigurableNodes()) {
        auto linc_id = node->LincId();
        if (!linc_id || scene_linc_ids.count(*linc_id) == 0) {
            validation.missing_nodes.push_back(node->plmxml_id);
        }
    }

    auto names = client.GetAllTargetNames();
    if (names.IsErr()) {
        return Result<SceneValidation, Error>::Err(names.Error());
    }
    std::set<std::string> scene_targets(names.Value().begin(), names.Value().end());
    for (const auto& [name, target] : document.Looks().Targets()) {
        if (scene_targets.count(name) == 0) {
            validation.missing_targets.insert(name);
        }
    }

    LogInfo(log_component::kApply, "Validate scene vs PLM-XML: " +
            std::to_string(validation.missing_nodes.size()) + " nodes missing, " +
            std::to_string(validation.missing_targets.size()) +
            " material targets missing or unloaded");
    return Result<SceneValidation, Error>::Ok(std::move(validation));
}

} // namespace plm_cfg
