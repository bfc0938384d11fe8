#include <plm_cfg/plmxml/look_library.hpp>

#include <plm_cfg/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace plm_cfg {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string_view LeadingTargetName(std::string_view value) {
    if (value.empty() || !IsAlpha(value.front())) {
        return {};
    }
    std::size_t end = 1;
    while (end < value.size() && IsNameChar(value[end])) {
        ++end;
    }
    return value.substr(0, end);
}

// Non-greedy "[...]" groups on a single line.
std::vector<std::string_view> BracketGroups(std::string_view value) {
    std::vector<std::string_view> groups;
    std::size_t pos = 0;
    while ((pos = value.find('[', pos)) != std::string_view::npos) {
        auto close = value.find(']', pos + 1);
        if (close == std::string_view::npos) {
            break;
        }
        auto inner = value.substr(pos + 1, close - pos - 1);
        if (inner.find('\n') != std::string_view::npos) {
            ++pos;
            continue;
        }
        groups.push_back(inner);
        pos = close + 1;
    }
    return groups;
}

} // anonymous namespace

std::vector<std::string> SplitVariantFields(std::string_view group) {
    std::vector<std::string> fields;
    std::string current;
    std::size_t i = 0;
    while (i < group.size()) {
        if (i + 2 < group.size() && IsSpace(group[i]) && group[i + 1] == '~' &&
            IsSpace(group[i + 2])) {
            fields.push_back(std::move(current));
            current.clear();
            i += 3;
            continue;
        }
        if (i + 1 < group.size() && group[i] == '~' && IsSpace(group[i + 1])) {
            fields.push_back(std::move(current));
            current.clear();
            i += 2;
            continue;
        }
        current += group[i];
        ++i;
    }
    fields.push_back(std::move(current));
    return fields;
}

std::optional<MaterialTarget> ParseLookValue(std::string_view value,
                                             std::vector<std::string>& warnings) {
    auto name = LeadingTargetName(value);
    if (name.empty()) {
        warnings.push_back("Look value without target name: '" + std::string(value) + "'");
        return std::nullopt;
    }

    MaterialTarget target;
    target.name = std::string(name);
    for (auto group : BracketGroups(value)) {
        auto fields = SplitVariantFields(group);
        if (fields.size() != 3) {
            warnings.push_back("Target '" + target.name + "': skipping variant group '[" +
                               std::string(group) + "]' with " +
                               std::to_string(fields.size()) + " fields");
            continue;
        }
        target.variants.push_back(MaterialVariant{
            std::move(fields[0]), std::move(fields[1]), std::move(fields[2])});
    }

    if (target.variants.empty()) {
        warnings.push_back("Target '" + target.name + "' has no variants");
        return std::nullopt;
    }
    return target;
}

// ---------------------------------------------------------------------------
// Conflicts
// ---------------------------------------------------------------------------
std::string TargetConflict::ToString() const {
    std::string result = target + " variants:";
    for (const auto& description : descriptions) {
        result += ' ';
        result += description;
    }
    return result;
}

std::vector<std::string> FindVariantConflicts(const MaterialTarget& target,
                                              PrTagMatcher& matcher) {
    std::vector<std::string> descriptions;
    std::vector<std::string> seen_tags;
    for (const auto& variant : target.variants) {
        if (!variant.HasPrTags()) {
            continue;
        }
        auto pattern = matcher.Compile(variant.pr_tags);
        for (const auto& previous : seen_tags) {
            if (pattern->Matches(previous)) {
                descriptions.push_back(variant.name + " - " + variant.pr_tags +
                                       " is also matching " + previous);
            }
        }
        if (std::find(seen_tags.begin(), seen_tags.end(), variant.pr_tags) ==
            seen_tags.end()) {
            seen_tags.push_back(variant.pr_tags);
        }
    }
    return descriptions;
}

// ---------------------------------------------------------------------------
// LookLibrary
// ---------------------------------------------------------------------------
std::size_t LookLibrary::AddValues(const std::vector<std::string>& values) {
    const auto first_warning = warnings_.size();
    std::size_t added = 0;
    for (const auto& value : values) {
        auto target = ParseLookValue(value, warnings_);
        if (!target) {
            continue;
        }
        auto name = target->name;
        if (!AddTarget(std::move(*target))) {
            warnings_.push_back("Duplicate look-library target '" + name +
                                "', last definition wins");
        }
        ++added;
    }
    for (auto i = first_warning; i < warnings_.size(); ++i) {
        LogWarn(log_component::kLookLib, warnings_[i]);
    }
    return added;
}

bool LookLibrary::AddTarget(MaterialTarget target) {
    auto name = target.name;
    auto [it, inserted] = targets_.insert_or_assign(std::move(name), std::move(target));
    (void)it;
    return inserted;
}

const std::vector<TargetConflict>& LookLibrary::CheckConflicts(PrTagMatcher& matcher) {
    conflicts_.clear();
    for (const auto& [name, target] : targets_) {
        auto descriptions = FindVariantConflicts(target, matcher);
        if (descriptions.empty()) {
            continue;
        }
        conflicts_.push_back(TargetConflict{name, std::move(descriptions)});
        LogError(log_component::kLookLib, "LookLibrary conflict: " + conflicts_.back().ToString());
    }
    return conflicts_;
}

const MaterialTarget* LookLibrary::Find(const std::string& name) const {
    auto it = targets_.find(name);
    return it != targets_.end() ? &it->second : nullptr;
}

std::size_t LookLibrary::VariantCount() const {
    std::size_t count = 0;
    for (const auto& [name, target] : targets_) {
        count += target.variants.size();
    }
    return count;
}

} // namespace plm_cfg
