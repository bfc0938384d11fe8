#pragma once

#include <plm_cfg/core/result.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace plm_cfg {

// A titled group of key/value lines for PrintDetail. An empty title puts
// the entries at the root of the tree.
struct DetailSection {
    std::string title;
    std::vector<std::pair<std::string, std::string>> entries;
};

// One node of a hierarchy rendered by PrintTree.
struct TreeItem {
    std::string label;
    std::string annotation;
    bool dimmed = false;
    std::vector<TreeItem> children;
};

// ---------------------------------------------------------------------------
// OutputFormatter: human-readable and JSON output for CLI commands.
//
// Tables use FTXUI in color mode and padded columns otherwise. JSON mode
// writes one JSON document per call to stdout; errors always go to stderr.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // In JSON mode, outputs an array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    void PrintDetail(const std::string& title,
                     const std::vector<DetailSection>& sections) const;

    // Human mode only; callers emit their own JSON in JSON mode.
    void PrintTree(const std::vector<TreeItem>& roots) const;

    void PrintJson(const std::string& json) const;

    void PrintError(const Error& error) const;

    // Non-fatal problems: stderr in human mode, ignored in JSON mode.
    void PrintWarning(const std::string& message) const;

    void PrintSuccess(const std::string& message) const;

private:
    void PrintTreeItem(const TreeItem& item, const std::string& prefix,
                       bool is_last) const;

    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace plm_cfg
