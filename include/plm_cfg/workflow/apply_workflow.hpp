#pragma once

#include <plm_cfg/asconnector/authoring_client.hpp>
#include <plm_cfg/core/result.hpp>
#include <plm_cfg/plmxml/plmxml_document.hpp>
#include <plm_cfg/resolver/configuration_resolver.hpp>

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace plm_cfg {

// ---------------------------------------------------------------------------
// StepOutcome: outcome for each phase of the workflow.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

[[nodiscard]] const char* StepOutcomeName(StepOutcome outcome);

// ---------------------------------------------------------------------------
// StepResult: outcome + timing for a single workflow step.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
};

// ---------------------------------------------------------------------------
// ApplyOptions: knobs of the apply sequence.
// ---------------------------------------------------------------------------
struct ApplyOptions {
    // Connect every discovered target to this material first. Empty: off.
    std::string material_dummy;
    bool use_copy_method = false;
    bool replace_target_name = false;
};

// ---------------------------------------------------------------------------
// ApplyReport: everything an apply run did, also on partial failure.
// ---------------------------------------------------------------------------
struct ApplyReport {
    bool success = false;
    bool connected = false;
    std::string version;
    std::vector<StepResult> steps;
    // Human-readable errors in the order they happened.
    std::vector<std::string> errors;
    // Resolved targets the scene does not contain; never sent.
    std::set<std::string> missing_targets;
    // Pairs sent with the material connect request.
    std::vector<MaterialAssignment> connected_materials;
    std::string summary;
    std::chrono::milliseconds total_duration{0};

    [[nodiscard]] const StepResult* FindStep(const std::string& name) const;
};

// ---------------------------------------------------------------------------
// ApplyWorkflow: pushes a ConfigurationResult into the authoring scene.
//
//   connect -> show -> hide -> discover_targets -> material_dummy -> materials
//
// A failed version probe ends the run before anything is changed. Every
// other failure is recorded and the sequence continues; there is no
// rollback. Targets the scene does not know are left out of the connect
// request and reported in missing_targets.
//
// Takes ownership of nothing. The client and document must outlive this
// object.
// ---------------------------------------------------------------------------
class ApplyWorkflow {
public:
    ApplyWorkflow(AuthoringClient& client,
                  const PlmXmlDocument& document,
                  const ApplyOptions& options = {});

    ApplyWorkflow(const ApplyWorkflow&) = delete;
    ApplyWorkflow& operator=(const ApplyWorkflow&) = delete;

    [[nodiscard]] ApplyReport Run(const ConfigurationResult& result);

private:
    StepResult RunConnect(ApplyReport& report);
    StepResult RunVisibility(const std::set<std::string>& node_ids, bool visible,
                             ApplyReport& report);
    StepResult RunDiscoverTargets(std::optional<std::set<std::string>>& scene_targets,
                                  ApplyReport& report);
    StepResult RunMaterialDummy(const std::set<std::string>& scene_targets,
                                const std::string& version);
    StepResult RunMaterials(const ConfigurationResult& result,
                            const std::optional<std::set<std::string>>& scene_targets,
                            ApplyReport& report);

    AuthoringClient& client_;
    const PlmXmlDocument& document_;
    ApplyOptions options_;
};

// ---------------------------------------------------------------------------
// SceneValidation: the document compared with the loaded scene.
// ---------------------------------------------------------------------------
struct SceneValidation {
    // Configurable nodes whose LINC id is not in the scene, by plmxml id.
    std::vector<std::string> missing_nodes;
    // Look-library targets the scene has no material for.
    std::set<std::string> missing_targets;
    std::size_t scene_node_count = 0;
    // Scene group carrying the material dummy, if present.
    std::optional<SceneNode> material_dummy;

    // Missing targets alone may be unloaded parts and do not invalidate.
    [[nodiscard]] bool IsValid() const { return missing_nodes.empty(); }
};

// Slow: fetches the full scene structure and all target names.
[[nodiscard]] Result<SceneValidation, Error> ValidateSceneVsPlmXml(
    AuthoringClient& client,
    const PlmXmlDocument& document,
    const std::string& material_dummy = "");

} // namespace plm_cfg
