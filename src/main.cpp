#include <plm_cfg/asconnector/as_session.hpp>
#include <plm_cfg/asconnector/authoring_client.hpp>
#include <plm_cfg/cli/commands.hpp>
#include <plm_cfg/cli/output_formatter.hpp>
#include <plm_cfg/config/config_loader.hpp>
#include <plm_cfg/core/log.hpp>
#include <plm_cfg/core/terminal.hpp>
#include <plm_cfg/core/version.hpp>
#include <plm_cfg/workflow/document_loader.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Resolve color mode for help output (stdout-based, before logger init).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color") force_color = true;
        if (arg == "--no-color") force_no_color = true;
    }
    return plm_cfg::ResolveColor(force_color, force_no_color,
                                 plm_cfg::IsStdoutTty());
}

// Check for --version before the command word.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "plm-cfg " << plm_cfg::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

// Build argv without the command word (and the scene action), so
// LoadFromCli sees plain flags.
std::vector<const char*> StripCommand(int argc, const char* const* argv,
                                      int skip) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 1 + skip; i < argc; ++i) {
        stripped.push_back(argv[i]);
    }
    return stripped;
}

std::unique_ptr<plm_cfg::ILogSink> MakeLogSink(const plm_cfg::AppConfig& config) {
    using namespace plm_cfg;
    if (config.log_file.has_value()) {
        return std::make_unique<FileSink>(*config.log_file);
    }
    if (config.json_output) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    bool use_color = ResolveColor(config.force_color, config.force_no_color,
                                  IsStderrTty());
    return std::make_unique<ColorConsoleSink>(use_color);
}

plm_cfg::LogLevel LogLevelFor(const plm_cfg::AppConfig& config) {
    if (config.verbose) return plm_cfg::LogLevel::Debug;
    if (config.quiet) return plm_cfg::LogLevel::Error;
    return plm_cfg::LogLevel::Warn;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace plm_cfg;

    if (argc == 1) {
        PrintUsage(std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    std::string_view word{argv[1]};
    if (word == "help" || word == "--help" || word == "-h") {
        PrintUsage(std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    auto command = ParseCommand(word);
    if (!command.has_value()) {
        OutputFormatter fmt(false, ResolveColorForHelp(argc, argv));
        Error error{"Usage", "", std::nullopt,
                    "Unknown command '" + std::string(word) + "'", std::nullopt,
                    ErrorCategory::Config};
        fmt.PrintError(error);
        PrintUsage(std::cerr, false);
        return error.ExitCode();
    }

    // scene takes its action as the second word.
    std::string scene_action;
    int skip = 1;
    if (*command == Command::Scene && argc > 2 && argv[2][0] != '-') {
        scene_action = argv[2];
        skip = 2;
    }

    auto stripped = StripCommand(argc, argv, skip);
    std::string config_path;
    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()),
                                  stripped.data(), &config_path);
    if (cli_result.IsErr()) {
        OutputFormatter(false).PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto cli_config = std::move(cli_result).Value();

    AppConfig config;
    if (!config_path.empty()) {
        auto yaml_result = LoadFromYaml(config_path);
        if (yaml_result.IsErr()) {
            OutputFormatter(cli_config.json_output).PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli_config);
    } else {
        config = std::move(cli_config);
    }

    InitGlobalLogger(MakeLogSink(config), LogLevelFor(config));

    OutputFormatter fmt(config.json_output,
                        ResolveColor(config.force_color, config.force_no_color,
                                     IsStdoutTty()));

    auto valid = ValidateConfig(config, CommandNeedsDocument(*command));
    if (valid.IsErr()) {
        fmt.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Parse in the background while the session is set up.
    std::unique_ptr<DocumentLoader> loader;
    if (CommandNeedsDocument(*command)) {
        loader = std::make_unique<DocumentLoader>(config.document);
        loader->Start();
    }

    std::unique_ptr<AsSession> session;
    std::unique_ptr<AuthoringClient> client;
    if (CommandNeedsConnection(*command)) {
        AsSessionOptions session_opts;
        session_opts.connect_timeout = std::chrono::seconds(config.connection.timeout_seconds);
        session_opts.read_timeout = std::chrono::seconds(config.connection.timeout_seconds);
        session = std::make_unique<AsSession>(config.connection.host,
                                              config.connection.port,
                                              session_opts);
        client = std::make_unique<AuthoringClient>(*session,
                                                   EffectiveApiVersion(config),
                                                   config.connection.retries);
    }

    DocumentPtr document;
    if (loader) {
        const auto& loaded = loader->Wait();
        if (loaded.IsErr()) {
            fmt.PrintError(loaded.Error());
            return loaded.Error().ExitCode();
        }
        document = loaded.Value();
        if (!document->IsValid()) {
            fmt.PrintWarning(config.document + " has no product instances or an invalid look library");
        }
    }

    switch (*command) {
        case Command::Resolve:
            return RunResolve(config, *document, fmt);
        case Command::Conflicts:
            return RunConflicts(*document, fmt);
        case Command::Tree:
            return RunTree(config, *document, fmt);
        case Command::Apply:
            return RunApply(config, *document, *client, fmt);
        case Command::Validate:
            return RunValidate(config, *document, *client, fmt);
        case Command::Scene:
            return RunScene(scene_action, config, *client, fmt);
    }
    return kExitSuccess;
}
