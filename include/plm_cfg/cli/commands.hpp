#pragma once

#include <plm_cfg/asconnector/authoring_client.hpp>
#include <plm_cfg/cli/output_formatter.hpp>
#include <plm_cfg/config/app_config.hpp>
#include <plm_cfg/plmxml/plmxml_document.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace plm_cfg {

constexpr int kExitSuccess = 0;
// Same code as a connection Error; apply could not reach AsConnector.
constexpr int kExitConnection = 1;
// Apply finished with failed steps, or the scene does not match.
constexpr int kExitIncomplete = 6;

enum class Command {
    Resolve,
    Conflicts,
    Tree,
    Apply,
    Validate,
    Scene,
};

[[nodiscard]] std::optional<Command> ParseCommand(std::string_view word);
[[nodiscard]] const char* CommandName(Command command);

// Offline commands only read the document; scene never reads one.
[[nodiscard]] bool CommandNeedsDocument(Command command);
[[nodiscard]] bool CommandNeedsConnection(Command command);

// ---------------------------------------------------------------------------
// Command handlers. Each writes through `fmt` and returns the process exit
// code. Errors are printed here, never thrown.
// ---------------------------------------------------------------------------

int RunResolve(const AppConfig& config, const PlmXmlDocument& document,
               const OutputFormatter& fmt);

int RunConflicts(const PlmXmlDocument& document, const OutputFormatter& fmt);

// Product tree; annotated with visibility when a configuration is given.
int RunTree(const AppConfig& config, const PlmXmlDocument& document,
            const OutputFormatter& fmt);

int RunApply(const AppConfig& config, const PlmXmlDocument& document,
             AuthoringClient& client, const OutputFormatter& fmt);

int RunValidate(const AppConfig& config, const PlmXmlDocument& document,
                AuthoringClient& client, const OutputFormatter& fmt);

// action: "active", "all" or "set" (uses config.scene_name).
int RunScene(const std::string& action, const AppConfig& config,
             AuthoringClient& client, const OutputFormatter& fmt);

void PrintUsage(std::ostream& out, bool color);

} // namespace plm_cfg
