#pragma once

#include <plm_cfg/core/result.hpp>

#include <tinyxml2.h>

#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace plm_cfg::xml_utils {

inline std::string Attr(const tinyxml2::XMLElement* element, const char* name) {
    if (!element || !name) {
        return {};
    }
    const char* value = element->Attribute(name);
    return value ? value : "";
}

// Element name without namespace prefix ("plm:ProductDef" -> "ProductDef").
inline std::string_view LocalName(const tinyxml2::XMLElement* element) {
    if (!element || !element->Name()) {
        return {};
    }
    std::string_view name = element->Name();
    auto colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

inline const tinyxml2::XMLElement* FirstChildLocal(const tinyxml2::XMLElement* parent,
                                                   std::string_view local_name) {
    if (!parent) {
        return nullptr;
    }
    for (auto* child = parent->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
        if (LocalName(child) == local_name) {
            return child;
        }
    }
    return nullptr;
}

inline const tinyxml2::XMLElement* NextSiblingLocal(const tinyxml2::XMLElement* element,
                                                    std::string_view local_name) {
    if (!element) {
        return nullptr;
    }
    for (auto* sibling = element->NextSiblingElement(); sibling;
         sibling = sibling->NextSiblingElement()) {
        if (LocalName(sibling) == local_name) {
            return sibling;
        }
    }
    return nullptr;
}

// Text of a direct child by local name, empty if missing.
inline std::string ChildText(const tinyxml2::XMLElement* parent, std::string_view local_name) {
    const auto* child = FirstChildLocal(parent, local_name);
    if (!child || !child->GetText()) {
        return {};
    }
    return child->GetText();
}

inline std::string Text(const tinyxml2::XMLElement* element) {
    if (!element || !element->GetText()) {
        return {};
    }
    return element->GetText();
}

inline std::optional<Error> ParseXmlOrError(tinyxml2::XMLDocument& doc,
                                            std::string_view xml,
                                            std::string_view operation,
                                            std::string_view endpoint,
                                            std::string_view context,
                                            ErrorCategory category =
                                                ErrorCategory::ParseError) {
    if (doc.Parse(xml.data(), xml.size()) == tinyxml2::XML_SUCCESS) {
        return std::nullopt;
    }

    std::string message(context);
    if (const char* err = doc.ErrorStr(); err != nullptr && *err != '\0') {
        message += ": ";
        message += err;
    }
    const int line = doc.ErrorLineNum();
    if (line > 0) {
        message += " (line ";
        message += std::to_string(line);
        message += ")";
    }

    return Error{
        std::string(operation),
        std::string(endpoint),
        std::nullopt,
        std::move(message),
        std::nullopt,
        category};
}

inline std::string DocumentToString(const tinyxml2::XMLDocument& doc) {
    tinyxml2::XMLPrinter printer(nullptr, true);
    doc.Print(&printer);
    return std::string(printer.CStr());
}

} // namespace plm_cfg::xml_utils
