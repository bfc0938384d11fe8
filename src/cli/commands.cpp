#include <plm_cfg/cli/commands.hpp>
#include <plm_cfg/cli/report_json.hpp>
#include <plm_cfg/config/config_loader.hpp>
#include <plm_cfg/core/ansi.hpp>
#include <plm_cfg/core/version.hpp>
#include <plm_cfg/resolver/configuration_resolver.hpp>
#include <plm_cfg/workflow/apply_workflow.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace plm_cfg {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

Error MakeUsageError(const std::string& message) {
    return Error{"Usage", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

std::string Ms(std::chrono::milliseconds d) {
    return std::to_string(d.count()) + "ms";
}

std::string DisplayName(const Node& node) {
    return node.name.empty() ? node.plmxml_id : node.name;
}

ApplyOptions MakeApplyOptions(const AppConfig& config) {
    ApplyOptions options;
    options.material_dummy = config.material.dummy;
    options.use_copy_method = config.material.use_copy_method;
    options.replace_target_name = config.material.replace_target_name;
    return options;
}

TreeItem BuildTreeItem(const PlmXmlDocument& document, const Node& node,
                       const ConfigurationResult* result) {
    TreeItem item;
    item.label = DisplayName(node);
    item.annotation = "(" + node.plmxml_id + ", " +
                      NodeTypeName(node.node_type) + ")";
    if (node.HasPrTags()) {
        item.annotation += " [" + node.PrTags() + "]";
        if (result != nullptr) {
            bool visible = result->visible_nodes.count(node.plmxml_id) > 0;
            item.annotation += visible ? " visible" : " hidden";
            item.dimmed = !visible;
        }
    }
    for (const auto* child : document.Children(node.plmxml_id)) {
        item.children.push_back(BuildTreeItem(document, *child, result));
    }
    return item;
}

void PrintResolution(const ConfigurationResult& result,
                     const PlmXmlDocument& document,
                     const OutputFormatter& fmt) {
    std::vector<std::vector<std::string>> node_rows;
    for (const auto* node : document.ConfigurableNodes()) {
        bool visible = result.visible_nodes.count(node->plmxml_id) > 0;
        node_rows.push_back({node->plmxml_id, DisplayName(*node),
                             node->PrTags(), visible ? "visible" : "hidden"});
    }
    if (!node_rows.empty()) {
        fmt.PrintTable({"Node", "Name", "PR tags", "State"}, node_rows);
    }

    std::vector<std::vector<std::string>> target_rows;
    for (const auto& [target, variant] : result.target_variants) {
        std::string note;
        if (!variant.has_value()) {
            note = "unchanged";
        } else if (result.IsConflicting(target)) {
            note = "conflict";
        }
        target_rows.push_back({target, variant.value_or("-"), note});
    }
    if (!target_rows.empty()) {
        fmt.PrintTable({"Target", "Variant", "Note"}, target_rows);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Command table
// ---------------------------------------------------------------------------

std::optional<Command> ParseCommand(std::string_view word) {
    if (word == "resolve")   return Command::Resolve;
    if (word == "conflicts") return Command::Conflicts;
    if (word == "tree")      return Command::Tree;
    if (word == "apply")     return Command::Apply;
    if (word == "validate")  return Command::Validate;
    if (word == "scene")     return Command::Scene;
    return std::nullopt;
}

const char* CommandName(Command command) {
    switch (command) {
        case Command::Resolve:   return "resolve";
        case Command::Conflicts: return "conflicts";
        case Command::Tree:      return "tree";
        case Command::Apply:     return "apply";
        case Command::Validate:  return "validate";
        case Command::Scene:     return "scene";
    }
    return "unknown";
}

bool CommandNeedsDocument(Command command) {
    return command != Command::Scene;
}

bool CommandNeedsConnection(Command command) {
    return command == Command::Apply || command == Command::Validate ||
           command == Command::Scene;
}

// ---------------------------------------------------------------------------
// resolve
// ---------------------------------------------------------------------------
int RunResolve(const AppConfig& config, const PlmXmlDocument& document,
               const OutputFormatter& fmt) {
    auto configuration = EffectiveConfiguration(config);
    if (configuration.IsErr()) {
        fmt.PrintError(configuration.Error());
        return configuration.Error().ExitCode();
    }

    ConfigurationResolver resolver(document);
    auto result = resolver.Resolve(configuration.Value());
    auto status = resolver.StatusMessage(result);

    if (fmt.IsJsonMode()) {
        nlohmann::json j;
        j["document"] = document.Source();
        j["stats"] = ToJson(document.Stats());
        j["result"] = ToJson(result);
        j["status"] = status;
        fmt.PrintJson(j.dump());
        return kExitSuccess;
    }

    if (!config.quiet) {
        PrintResolution(result, document, fmt);
    }
    for (const auto& conflict : result.diagnostics.conflicts) {
        fmt.PrintWarning("Conflicting variants: " + conflict.ToString());
    }
    fmt.PrintSuccess(status);
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// conflicts
// ---------------------------------------------------------------------------
int RunConflicts(const PlmXmlDocument& document, const OutputFormatter& fmt) {
    const auto& conflicts = document.Looks().Conflicts();

    if (fmt.IsJsonMode()) {
        nlohmann::json j;
        nlohmann::json list = nlohmann::json::array();
        for (const auto& c : conflicts) {
            list.push_back(ToJson(c));
        }
        j["conflicts"] = list;
        j["warnings"] = document.Warnings();
        fmt.PrintJson(j.dump());
        return kExitSuccess;
    }

    for (const auto& w : document.Warnings()) {
        fmt.PrintWarning(w);
    }
    if (conflicts.empty()) {
        fmt.PrintSuccess("No conflicting variants in " +
                         std::to_string(document.Looks().TargetCount()) +
                         " material targets");
        return kExitSuccess;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& c : conflicts) {
        for (const auto& d : c.descriptions) {
            rows.push_back({c.target, d});
        }
    }
    fmt.PrintTable({"Target", "Conflict"}, rows);
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// tree
// ---------------------------------------------------------------------------
int RunTree(const AppConfig& config, const PlmXmlDocument& document,
            const OutputFormatter& fmt) {
    std::optional<ConfigurationResult> result;
    if (!config.configuration.empty() || !config.pr_codes.empty()) {
        auto configuration = EffectiveConfiguration(config);
        if (configuration.IsErr()) {
            fmt.PrintError(configuration.Error());
            return configuration.Error().ExitCode();
        }
        result = ConfigurationResolver(document).Resolve(configuration.Value());
    }

    if (fmt.IsJsonMode()) {
        nlohmann::json j;
        j["document"] = document.Source();
        j["roots"] = NodeTreeToJson(document);
        if (result.has_value()) {
            j["visible_nodes"] = result->visible_nodes;
            j["invisible_nodes"] = result->invisible_nodes;
        }
        fmt.PrintJson(j.dump());
        return kExitSuccess;
    }

    std::vector<TreeItem> roots;
    for (const auto* root : document.Roots()) {
        roots.push_back(BuildTreeItem(document, *root,
                                      result.has_value() ? &*result : nullptr));
    }
    fmt.PrintTree(roots);

    auto stats = document.Stats();
    DetailSection counts;
    counts.entries = {
        {"Nodes", std::to_string(stats.node_count)},
        {"Configurable", std::to_string(stats.configurable_count)},
        {"Material targets", std::to_string(stats.target_count)},
        {"Variants", std::to_string(stats.variant_count)},
    };
    fmt.PrintDetail(document.Source(), {counts});
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// apply
// ---------------------------------------------------------------------------
int RunApply(const AppConfig& config, const PlmXmlDocument& document,
             AuthoringClient& client, const OutputFormatter& fmt) {
    auto configuration = EffectiveConfiguration(config);
    if (configuration.IsErr()) {
        fmt.PrintError(configuration.Error());
        return configuration.Error().ExitCode();
    }

    auto result = ConfigurationResolver(document).Resolve(configuration.Value());

    ApplyWorkflow workflow(client, document, MakeApplyOptions(config));
    auto report = workflow.Run(result);

    std::optional<SceneValidation> validation;
    std::optional<Error> validation_error;
    if (config.validate_scene && report.connected) {
        auto validated = ValidateSceneVsPlmXml(client, document, config.material.dummy);
        if (validated.IsOk()) {
            validation = std::move(validated).Value();
        } else {
            validation_error = std::move(validated).Error();
        }
    }

    int exit_code = kExitSuccess;
    if (!report.connected) {
        exit_code = kExitConnection;
    } else if (!report.success || validation_error.has_value() ||
               (validation.has_value() && !validation->IsValid())) {
        exit_code = kExitIncomplete;
    }

    if (fmt.IsJsonMode()) {
        nlohmann::json j;
        j["result"] = ToJson(result);
        j["report"] = ToJson(report);
        if (validation.has_value()) {
            j["validation"] = ToJson(*validation);
        }
        fmt.PrintJson(j.dump());
        if (validation_error.has_value()) {
            fmt.PrintError(*validation_error);
        }
        return exit_code;
    }

    if (!config.quiet) {
        std::vector<std::vector<std::string>> rows;
        for (const auto& step : report.steps) {
            rows.push_back({step.step_name, StepOutcomeName(step.outcome),
                            Ms(step.duration), step.message});
        }
        fmt.PrintTable({"Step", "Outcome", "Time", "Message"}, rows);
    }
    for (const auto& target : report.missing_targets) {
        fmt.PrintWarning("Target not in scene: " + target);
    }
    for (const auto& e : report.errors) {
        fmt.PrintWarning(e);
    }
    if (validation_error.has_value()) {
        fmt.PrintError(*validation_error);
    }
    if (validation.has_value()) {
        for (const auto& id : validation->missing_nodes) {
            fmt.PrintWarning("Node not in scene: " + id);
        }
    }

    if (exit_code == kExitSuccess) {
        fmt.PrintSuccess(report.summary + " (" + Ms(report.total_duration) + ")");
    } else {
        fmt.PrintWarning("Apply incomplete: " + report.summary);
    }
    return exit_code;
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------
int RunValidate(const AppConfig& config, const PlmXmlDocument& document,
                AuthoringClient& client, const OutputFormatter& fmt) {
    auto validated = ValidateSceneVsPlmXml(client, document, config.material.dummy);
    if (validated.IsErr()) {
        fmt.PrintError(validated.Error());
        return validated.Error().ExitCode();
    }
    const auto& validation = validated.Value();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(ToJson(validation).dump());
        return validation.IsValid() ? kExitSuccess : kExitIncomplete;
    }

    std::vector<std::pair<std::string, std::string>> summary = {
        {"Scene nodes", std::to_string(validation.scene_node_count)},
        {"Missing nodes", std::to_string(validation.missing_nodes.size())},
        {"Missing targets", std::to_string(validation.missing_targets.size())},
    };
    if (!config.material.dummy.empty()) {
        summary.emplace_back("Material dummy",
                             validation.material_dummy.has_value()
                                 ? validation.material_dummy->name
                                 : "not found");
    }
    DetailSection counts;
    counts.entries = std::move(summary);
    fmt.PrintDetail("Scene validation", {counts});

    if (!config.quiet && !validation.missing_nodes.empty()) {
        std::vector<std::vector<std::string>> rows;
        for (const auto& id : validation.missing_nodes) {
            const auto* node = document.FindNode(id);
            rows.push_back({id,
                            node != nullptr ? DisplayName(*node) : "",
                            node != nullptr ? node->LincId().value_or("") : ""});
        }
        fmt.PrintTable({"Node", "Name", "LINC id"}, rows);
    }
    if (!config.quiet && !validation.missing_targets.empty()) {
        std::vector<std::vector<std::string>> rows;
        for (const auto& target : validation.missing_targets) {
            rows.push_back({target});
        }
        fmt.PrintTable({"Missing target"}, rows);
    }

    if (!validation.IsValid()) {
        fmt.PrintWarning("Scene does not match " + document.Source());
        return kExitIncomplete;
    }
    fmt.PrintSuccess("Scene matches " + document.Source());
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// scene
// ---------------------------------------------------------------------------
int RunScene(const std::string& action, const AppConfig& config,
             AuthoringClient& client, const OutputFormatter& fmt) {
    if (action == "active") {
        auto scene = client.GetActiveScene();
        if (scene.IsErr()) {
            fmt.PrintError(scene.Error());
            return scene.Error().ExitCode();
        }
        if (fmt.IsJsonMode()) {
            fmt.PrintJson(nlohmann::json{{"active_scene", scene.Value()}}.dump());
        } else {
            fmt.PrintSuccess(scene.Value());
        }
        return kExitSuccess;
    }

    if (action == "all") {
        auto scenes = client.GetAllScenes();
        if (scenes.IsErr()) {
            fmt.PrintError(scenes.Error());
            return scenes.Error().ExitCode();
        }
        if (fmt.IsJsonMode()) {
            fmt.PrintJson(nlohmann::json{{"scenes", scenes.Value()}}.dump());
            return kExitSuccess;
        }
        std::vector<std::vector<std::string>> rows;
        for (const auto& name : scenes.Value()) {
            rows.push_back({name});
        }
        fmt.PrintTable({"Scene"}, rows);
        return kExitSuccess;
    }

    if (action == "set") {
        if (config.scene_name.empty()) {
            auto error = MakeUsageError("scene set requires --scene <name>");
            fmt.PrintError(error);
            return error.ExitCode();
        }
        auto set = client.SetActiveScene(config.scene_name);
        if (set.IsErr()) {
            fmt.PrintError(set.Error());
            return set.Error().ExitCode();
        }
        fmt.PrintSuccess("Active scene: " + config.scene_name);
        return kExitSuccess;
    }

    auto error = MakeUsageError("Unknown scene action '" + action +
                                "', expected active, all or set");
    fmt.PrintError(error);
    return error.ExitCode();
}

// ---------------------------------------------------------------------------
// Usage
// ---------------------------------------------------------------------------
void PrintUsage(std::ostream& out, bool color) {
    using namespace ansi;
    const char* bold = color ? kBold : "";
    const char* dim = color ? kDim : "";
    const char* reset = color ? kReset : "";

    out << bold << "plm-cfg" << reset << " " << kVersion
        << " - PLM-XML configuration resolver\n\n";
    out << bold << "Usage:" << reset << " plm-cfg <command> [flags]\n\n";
    out << bold << "Offline commands:" << reset << "\n";
    out << "  resolve     Resolve a configuration against a document\n";
    out << "  conflicts   List look-library variants matching the same tags\n";
    out << "  tree        Show the product structure\n\n";
    out << bold << "AsConnector commands:" << reset << "\n";
    out << "  apply       Resolve and push visibility and materials\n";
    out << "  validate    Compare the loaded scene with a document\n";
    out << "  scene       active | all | set --scene <name>\n\n";
    out << bold << "Common flags:" << reset << "\n";
    out << "  -d, --document <file>     PLM-XML file\n";
    out << "  --configuration <str>     Configuration string, e.g. \"+AB+CD\"\n";
    out << "  --pr <code>               PR code (repeatable)\n";
    out << "  --host, --port            AsConnector endpoint "
        << dim << "(default " << kDefaultHost << ":" << kDefaultPort << ")" << reset << "\n";
    out << "  -c, --config <file>       YAML config file\n";
    out << "  --json                    JSON output\n";
    out << "  -v, -q                    Verbose / quiet\n\n";
    out << dim << "Run 'plm-cfg <command> --help' for all flags." << reset << "\n";
}

} // namespace plm_cfg
