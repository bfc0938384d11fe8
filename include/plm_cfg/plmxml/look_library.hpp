#pragma once

#include <plm_cfg/plmxml/pr_tag_matcher.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plm_cfg {

inline constexpr const char* kLookLibraryInstanceName = "LookLibrary";

// One candidate look for a material target.
struct MaterialVariant {
    std::string name;
    std::string pr_tags;
    std::string description;

    [[nodiscard]] bool HasPrTags() const { return !pr_tags.empty(); }

    bool operator==(const MaterialVariant& other) const {
        return name == other.name && pr_tags == other.pr_tags &&
               description == other.description;
    }
};

// A material slot in the scene with its variants in declared order.
struct MaterialTarget {
    std::string name;
    std::vector<MaterialVariant> variants;
};

// Variants of one target whose tags overlap.
struct TargetConflict {
    std::string target;
    std::vector<std::string> descriptions;

    // "<target> variants: <d1> <d2> ..."
    [[nodiscard]] std::string ToString() const;
};

// ---------------------------------------------------------------------------
// ParseLookValue: decode one look-library user value:
//
//   <Target>~ [<Variant>~ <PrTags>; ~ <Description>] [...] ...
//
// The target name is the leading run of [A-Za-z][A-Za-z0-9_]*. Each bracket
// group is split on "ws~ws" or "~ws" into exactly three fields; other groups
// are skipped and reported through `warnings`. Returns nullopt if the value
// has no target name or no usable variant.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<MaterialTarget> ParseLookValue(
    std::string_view value, std::vector<std::string>& warnings);

// Split a bracket group into its fields.
[[nodiscard]] std::vector<std::string> SplitVariantFields(std::string_view group);

// ---------------------------------------------------------------------------
// LookLibrary: target name -> MaterialTarget. Built once from the
// LookLibrary instance and immutable afterwards.
// ---------------------------------------------------------------------------
class LookLibrary {
public:
    LookLibrary() = default;

    // Parses every user value; returns the number of targets added.
    std::size_t AddValues(const std::vector<std::string>& values);

    // Adds or replaces a target. Returns false if it replaced one.
    bool AddTarget(MaterialTarget target);

    // Runs the overlap check over all targets and stores the result.
    const std::vector<TargetConflict>& CheckConflicts(PrTagMatcher& matcher);

    [[nodiscard]] bool IsValid() const noexcept { return !targets_.empty(); }
    [[nodiscard]] const MaterialTarget* Find(const std::string& name) const;
    [[nodiscard]] const std::map<std::string, MaterialTarget>& Targets() const noexcept {
        return targets_;
    }
    [[nodiscard]] std::size_t TargetCount() const noexcept { return targets_.size(); }
    [[nodiscard]] std::size_t VariantCount() const;

    [[nodiscard]] const std::vector<TargetConflict>& Conflicts() const noexcept { return conflicts_; }
    [[nodiscard]] const std::vector<std::string>& Warnings() const noexcept { return warnings_; }

private:
    std::map<std::string, MaterialTarget> targets_;
    std::vector<TargetConflict> conflicts_;
    std::vector<std::string> warnings_;
};

// Conflicts within a single target, in declared order. Empty if none.
[[nodiscard]] std::vector<std::string> FindVariantConflicts(
    const MaterialTarget& target, PrTagMatcher& matcher);

} // namespace plm_cfg
