#include <plm_cfg/cli/output_formatter.hpp>
#include <plm_cfg/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace plm_cfg {

namespace {

using namespace plm_cfg::ansi;

const char* kBranch     = "├── ";
const char* kLastBranch = "└── ";
const char* kPipe       = "│   ";

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(std::move(obj));
        }
        out_ << array.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            auto padded = row;
            padded.resize(headers.size());
            table_data.push_back(std::move(padded));
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c]))
             << headers[c];
    }
    out_ << "\n";

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";

    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c]))
                 << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<DetailSection>& sections) const {

    struct Line {
        std::string key;
        std::string value;
        bool is_header = false;
        bool is_child = false;
        bool is_last = false;
    };

    std::vector<Line> lines;
    for (const auto& sec : sections) {
        if (sec.entries.empty()) continue;
        if (sec.title.empty()) {
            for (const auto& e : sec.entries) {
                lines.push_back({e.first, e.second, false, false, false});
            }
            continue;
        }
        lines.push_back({sec.title, "", true, false, false});
        for (size_t i = 0; i < sec.entries.size(); ++i) {
            lines.push_back({sec.entries[i].first, sec.entries[i].second,
                             false, true, i + 1 == sec.entries.size()});
        }
    }

    // Last root-level line closes the tree.
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (!it->is_child) {
            it->is_last = true;
            break;
        }
    }

    if (json_mode_) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& sec : sections) {
            auto& target = sec.title.empty() ? obj : obj[sec.title];
            for (const auto& e : sec.entries) {
                target[e.first] = e.second;
            }
        }
        out_ << nlohmann::json{{title, obj}}.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kBold << title << kReset << "\n";
        for (const auto& l : lines) {
            if (l.is_child) {
                out_ << kDim << "    " << (l.is_last ? kLastBranch : kBranch)
                     << kReset << l.key << ": " << l.value << "\n";
            } else if (l.is_header) {
                out_ << kDim << (l.is_last ? kLastBranch : kBranch) << kReset
                     << kBold << l.key << kReset << "\n";
            } else {
                out_ << kDim << (l.is_last ? kLastBranch : kBranch) << kReset
                     << l.key << ": " << l.value << "\n";
            }
        }
        return;
    }

    out_ << title << "\n";
    for (const auto& l : lines) {
        if (l.is_child) {
            out_ << (l.is_last ? "    +-- " : "    |-- ")
                 << l.key << ": " << l.value << "\n";
        } else if (l.is_header) {
            out_ << (l.is_last ? "+-- " : "|-- ") << l.key << "\n";
        } else {
            out_ << (l.is_last ? "+-- " : "|-- ")
                 << l.key << ": " << l.value << "\n";
        }
    }
}

void OutputFormatter::PrintTree(const std::vector<TreeItem>& roots) const {
    for (const auto& root : roots) {
        if (color_mode_) {
            out_ << kBold << root.label << kReset;
            if (!root.annotation.empty()) {
                out_ << " " << kDim << root.annotation << kReset;
            }
        } else {
            out_ << root.label;
            if (!root.annotation.empty()) out_ << " " << root.annotation;
        }
        out_ << "\n";
        for (size_t i = 0; i < root.children.size(); ++i) {
            PrintTreeItem(root.children[i], "",
                          i + 1 == root.children.size());
        }
    }
}

void OutputFormatter::PrintTreeItem(const TreeItem& item,
                                    const std::string& prefix,
                                    bool is_last) const {
    if (color_mode_) {
        out_ << kDim << prefix << (is_last ? kLastBranch : kBranch) << kReset;
        if (item.dimmed) {
            out_ << kNodeHidden << item.label << kReset;
        } else {
            out_ << item.label;
        }
        if (!item.annotation.empty()) {
            out_ << " " << kPrTagExpr << item.annotation << kReset;
        }
    } else {
        out_ << prefix << (is_last ? "+-- " : "|-- ") << item.label;
        if (!item.annotation.empty()) out_ << " " << item.annotation;
    }
    out_ << "\n";

    std::string child_prefix = prefix;
    if (color_mode_) {
        child_prefix += is_last ? "    " : kPipe;
    } else {
        child_prefix += is_last ? "    " : "|   ";
    }
    for (size_t i = 0; i < item.children.size(); ++i) {
        PrintTreeItem(item.children[i], child_prefix,
                      i + 1 == item.children.size());
    }
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        if (!error.endpoint.empty()) {
            err_ << kDim << " [" << error.endpoint << "]" << kReset;
        }
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << error.http_status.value() << ")" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (error.remote_error.has_value() && !error.remote_error->empty()) {
            err_ << "  " << kDim << "AsConnector: " << kReset
                 << error.remote_error.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.endpoint.empty()) {
        err_ << " [" << error.endpoint << "]";
    }
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (error.remote_error.has_value() && !error.remote_error->empty()) {
        err_ << "  AsConnector: " << error.remote_error.value() << "\n";
    }
}

void OutputFormatter::PrintWarning(const std::string& message) const {
    if (json_mode_) return;

    if (color_mode_) {
        err_ << kYellow << "Warning: " << kReset << message << "\n";
        return;
    }
    err_ << "Warning: " << message << "\n";
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"success", true}, {"message", message}}.dump()
             << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace plm_cfg
