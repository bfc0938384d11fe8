#pragma once

#include <plm_cfg/asconnector/as_protocol.hpp>
#include <plm_cfg/plmxml/look_library.hpp>
#include <plm_cfg/plmxml/plmxml_document.hpp>
#include <plm_cfg/resolver/configuration_resolver.hpp>
#include <plm_cfg/workflow/apply_workflow.hpp>

#include <nlohmann/json.hpp>

namespace plm_cfg {

// JSON renderings used by --json. Keys are snake_case; sets and maps keep
// their sorted order.

[[nodiscard]] nlohmann::json ToJson(const ConfigurationResult& result);
[[nodiscard]] nlohmann::json ToJson(const TargetConflict& conflict);
[[nodiscard]] nlohmann::json ToJson(const DocumentStats& stats);
[[nodiscard]] nlohmann::json ToJson(const StepResult& step);
[[nodiscard]] nlohmann::json ToJson(const ApplyReport& report);
[[nodiscard]] nlohmann::json ToJson(const SceneNode& node);
[[nodiscard]] nlohmann::json ToJson(const SceneValidation& validation);

// Nested {"id","name","type","pr_tags","children":[...]} from the roots down.
[[nodiscard]] nlohmann::json NodeTreeToJson(const PlmXmlDocument& document);

} // namespace plm_cfg
