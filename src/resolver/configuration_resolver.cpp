#include <plm_cfg/resolver/configuration_resolver.hpp>

#include <plm_cfg/core/log.hpp>

#include <sstream>

namespace plm_cfg {

std::map<std::string, std::string> ConfigurationResult::ActiveTargets() const {
    std::map<std::string, std::string> active;
    for (const auto& [target, variant] : target_variants) {
        if (variant) {
            active.emplace(target, *variant);
        }
    }
    return active;
}

bool ConfigurationResult::IsConflicting(const std::string& target) const {
    for (const auto& conflict : diagnostics.conflicts) {
        if (conflict.target == target) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// ConfigurationResolver
// ---------------------------------------------------------------------------
ConfigurationResolver::ConfigurationResolver(const PlmXmlDocument& document)
    : document_(document) {}

ConfigurationResult ConfigurationResolver::Resolve(std::string_view configuration) const {
    ConfigurationResult result;
    result.configuration = std::string(configuration);
    auto& matcher = document_.Matcher();

    for (const auto* node : document_.ConfigurableNodes()) {
        if (matcher.Compile(node->PrTags())->Matches(configuration)) {
            result.visible_nodes.insert(node->plmxml_id);
        } else {
            result.invisible_nodes.insert(node->plmxml_id);
        }
    }

    for (const auto& [name, target] : document_.Looks().Targets()) {
        std::optional<std::string> chosen;
        for (const auto& variant : target.variants) {
            if (!variant.HasPrTags()) {
                continue;
            }
            if (matcher.Compile(variant.pr_tags)->Matches(configuration)) {
                chosen = variant.name;
            }
        }
        if (!chosen) {
            result.diagnostics.unmatched_targets.push_back(name);
        }
        result.target_variants.emplace(name, std::move(chosen));
    }

    result.diagnostics.conflicts = document_.Looks().Conflicts();

    LogDebug(log_component::kResolver, "Resolved '" + result.configuration + "': " +
             std::to_string(result.visible_nodes.size()) + " visible, " +
             std::to_string(result.invisible_nodes.size()) + " invisible, " +
             std::to_string(result.ActiveTargets().size()) + " of " +
             std::to_string(result.target_variants.size()) + " targets matched");
    return result;
}

std::string ConfigurationResolver::StatusMessage(const ConfigurationResult& result) const {
    std::ostringstream out;
    out << result.ActiveTargets().size() << " material targets to update, "
        << document_.ConfigurableNodes().size() << " configurable nodes ("
        << result.visible_nodes.size() << " visible, "
        << result.invisible_nodes.size() << " invisible).";
    if (!result.diagnostics.unmatched_targets.empty()) {
        out << "\nTargets not updated by this configuration:";
        for (const auto& target : result.diagnostics.unmatched_targets) {
            out << "\n  " << target;
        }
    }
    return out.str();
}

} // namespace plm_cfg
