#include <plm_cfg/plmxml/plmxml_document.hpp>

#include <plm_cfg/core/log.hpp>

#include "core/xml_utils.hpp"

#include <tinyxml2.h>

#include <fstream>
#include <map>
#include <sstream>

namespace plm_cfg {

namespace {

using xml_utils::Attr;
using xml_utils::FirstChildLocal;
using xml_utils::LocalName;
using xml_utils::NextSiblingLocal;

constexpr const char* kParseOperation = "ParsePlmXml";

struct ParsedInstance {
    Node node;
    std::vector<std::string> values;
};

// "#id" and "id" both refer to id.
std::string StripRef(std::string_view ref) {
    if (!ref.empty() && ref.front() == '#') {
        ref.remove_prefix(1);
    }
    return std::string(ref);
}

std::vector<std::string> SplitRefs(const std::string& refs) {
    std::vector<std::string> result;
    std::istringstream stream(refs);
    std::string ref;
    while (stream >> ref) {
        result.push_back(StripRef(ref));
    }
    return result;
}

ParsedInstance ReadInstance(const tinyxml2::XMLElement* element) {
    ParsedInstance instance;
    instance.node.plmxml_id = Attr(element, "id");
    instance.node.name = Attr(element, "name");
    instance.node.part_ref = Attr(element, "partRef");

    for (auto* user_data = FirstChildLocal(element, "UserData"); user_data;
         user_data = NextSiblingLocal(user_data, "UserData")) {
        for (auto* value = FirstChildLocal(user_data, "UserValue"); value;
             value = NextSiblingLocal(value, "UserValue")) {
            auto title = Attr(value, "title");
            auto text = Attr(value, "value");
            instance.values.push_back(text);
            instance.node.user_data[title] = std::move(text);
        }
    }
    return instance;
}

} // anonymous namespace

PlmXmlDocument::PlmXmlDocument(std::string source)
    : source_(std::move(source)), matcher_(std::make_shared<PrTagMatcher>()) {}

Result<PlmXmlDocument, Error> PlmXmlDocument::FromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<PlmXmlDocument, Error>::Err(Error{
            kParseOperation, path, std::nullopt,
            "Cannot open PLM-XML file", std::nullopt, ErrorCategory::NotFound});
    }
    std::ostringstream content;
    content << file.rdbuf();
    return FromString(content.str(), path);
}

Result<PlmXmlDocument, Error> PlmXmlDocument::FromString(std::string_view xml,
                                                         std::string source) {
    tinyxml2::XMLDocument xml_doc;
    if (auto err = xml_utils::ParseXmlOrError(xml_doc, xml, kParseOperation, source,
                                              "Malformed PLM-XML")) {
        LogError(log_component::kPlmXml, err->ToString());
        return Result<PlmXmlDocument, Error>::Err(std::move(*err));
    }

    const auto* root = xml_doc.RootElement();
    if (!root || LocalName(root) != "PLMXML") {
        Error err{kParseOperation, source, std::nullopt,
                  root ? "Unexpected root element '" + std::string(root->Name()) + "'"
                       : "Missing PLMXML root element",
                  std::nullopt, ErrorCategory::ParseError};
        LogError(log_component::kPlmXml, err.ToString());
        return Result<PlmXmlDocument, Error>::Err(std::move(err));
    }

    PlmXmlDocument doc(std::move(source));
    auto warn = [&doc](std::string message) {
        LogWarn(log_component::kPlmXml, message);
        doc.warnings_.push_back(std::move(message));
    };
    std::vector<std::string> look_values;
    std::map<std::string, std::vector<std::string>> view_instances;
    std::vector<std::pair<std::string, std::string>> view_users;

    for (auto* product_def = FirstChildLocal(root, "ProductDef"); product_def;
         product_def = NextSiblingLocal(product_def, "ProductDef")) {
        for (auto* graph = FirstChildLocal(product_def, "InstanceGraph"); graph;
             graph = NextSiblingLocal(graph, "InstanceGraph")) {
            for (auto* element = graph->FirstChildElement(); element;
                 element = element->NextSiblingElement()) {
                const auto local = LocalName(element);

                if (local == "ProductRevisionView") {
                    view_instances[Attr(element, "id")] =
                        SplitRefs(Attr(element, "instanceRefs"));
                    continue;
                }
                if (local != "ProductInstance") {
                    continue;
                }

                auto instance = ReadInstance(element);
                if (instance.node.name == kLookLibraryInstanceName) {
                    look_values.insert(look_values.end(), instance.values.begin(),
                                       instance.values.end());
                    continue;
                }
                if (instance.node.plmxml_id.empty()) {
                    warn("ProductInstance '" + instance.node.name + "' without id skipped");
                    continue;
                }

                auto id = instance.node.plmxml_id;
                auto part_ref = StripRef(instance.node.part_ref);
                if (!doc.graph_.AddNode(std::move(instance.node))) {
                    warn("Duplicate ProductInstance id '" + id + "', last definition wins");
                }
                if (!part_ref.empty()) {
                    view_users.emplace_back(id, std::move(part_ref));
                }
            }
        }
    }

    for (const auto& [parent_id, view_id] : view_users) {
        auto view = view_instances.find(view_id);
        if (view == view_instances.end()) {
            continue;
        }
        for (const auto& child_id : view->second) {
            doc.graph_.AddChild(parent_id, child_id);
        }
    }

    doc.looks_.AddValues(look_values);
    doc.warnings_.insert(doc.warnings_.end(), doc.looks_.Warnings().begin(),
                         doc.looks_.Warnings().end());
    doc.looks_.CheckConflicts(*doc.matcher_);

    const auto stats = doc.Stats();
    LogInfo(log_component::kPlmXml, "Parsed " + doc.source_ + ": " +
            std::to_string(stats.node_count) + " nodes (" +
            std::to_string(stats.configurable_count) + " configurable), " +
            std::to_string(stats.target_count) + " material targets with " +
            std::to_string(stats.variant_count) + " variants, " +
            std::to_string(stats.conflict_count) + " conflicts");
    if (!doc.looks_.IsValid()) {
        LogWarn(log_component::kPlmXml, "No valid LookLibrary found in " + doc.source_);
    }
    if (doc.graph_.Empty()) {
        LogWarn(log_component::kPlmXml, "No product instances found in " + doc.source_);
    }

    return Result<PlmXmlDocument, Error>::Ok(std::move(doc));
}

bool PlmXmlDocument::IsValid() const {
    return !graph_.Empty() && looks_.IsValid();
}

DocumentStats PlmXmlDocument::Stats() const {
    DocumentStats stats;
    stats.node_count = graph_.Size();
    stats.configurable_count = graph_.ConfigurableNodes().size();
    stats.target_count = looks_.TargetCount();
    stats.variant_count = looks_.VariantCount();
    stats.conflict_count = looks_.Conflicts().size();
    return stats;
}

} // namespace plm_cfg
