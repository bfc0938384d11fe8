#include <plm_cfg/config/config_loader.hpp>

#include <plm_cfg/core/version.hpp>
#include <plm_cfg/plmxml/pr_tag_matcher.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace plm_cfg {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

Result<std::vector<PrCode>, Error> ParsePrCodes(const std::vector<std::string>& values,
                                               const std::string& source) {
    std::vector<PrCode> codes;
    for (const auto& value : values) {
        auto code = PrCode::Create(value);
        if (code.IsErr()) {
            return Result<std::vector<PrCode>, Error>::Err(
                MakeConfigError("Invalid " + source + " '" + value + "': " + code.Error()));
        }
        codes.push_back(std::move(code).Value());
    }
    return Result<std::vector<PrCode>, Error>::Ok(std::move(codes));
}

Result<ApiVersion, Error> ParseApiVersion(const std::string& value,
                                          const std::string& source) {
    auto version = ApiVersion::Create(value);
    if (version.IsErr()) {
        return Result<ApiVersion, Error>::Err(
            MakeConfigError("Invalid " + source + ": " + version.Error()));
    }
    return Result<ApiVersion, Error>::Ok(std::move(version).Value());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        // -- Connection --
        if (root["connection"]) {
            const auto& conn = root["connection"];
            if (conn["host"]) {
                config.connection.host = conn["host"].as<std::string>();
            }
            if (conn["port"]) {
                config.connection.port = conn["port"].as<uint16_t>();
            }
            if (conn["api_version"]) {
                auto version = ParseApiVersion(conn["api_version"].as<std::string>(),
                                               "api_version");
                if (version.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(version).Error());
                }
                config.connection.api_version = std::move(version).Value();
            }
            if (conn["timeout"]) {
                config.connection.timeout_seconds = conn["timeout"].as<int>();
            }
            if (conn["retries"]) {
                config.connection.retries = conn["retries"].as<int>();
            }
        }

        // -- Document and configuration --
        if (root["document"]) {
            config.document = root["document"].as<std::string>();
        }
        if (root["configuration"]) {
            config.configuration = root["configuration"].as<std::string>();
        }
        if (root["pr_codes"]) {
            std::vector<std::string> values;
            for (const auto& code : root["pr_codes"]) {
                values.push_back(code.as<std::string>());
            }
            auto codes = ParsePrCodes(values, "pr_codes entry");
            if (codes.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(codes).Error());
            }
            config.pr_codes = std::move(codes).Value();
        }

        // -- Material --
        if (root["material"]) {
            const auto& material = root["material"];
            if (material["dummy"]) {
                config.material.dummy = material["dummy"].as<std::string>();
            }
            if (material["use_copy_method"]) {
                config.material.use_copy_method = material["use_copy_method"].as<bool>();
            }
            if (material["replace_target_name"]) {
                config.material.replace_target_name =
                    material["replace_target_name"].as<bool>();
            }
        }

        // -- Options --
        if (root["validate_scene"]) {
            config.validate_scene = root["validate_scene"].as<bool>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::string* config_path) {
    argparse::ArgumentParser program("plm-cfg", kVersion);

    // Input
    program.add_argument("-d", "--document")
        .help("PLM-XML file");
    program.add_argument("--configuration")
        .help("Configuration string, e.g. \"+AB+CD\"");
    program.add_argument("--pr")
        .help("PR code of the configuration (repeatable)")
        .append();

    // Connection flags
    program.add_argument("--host")
        .help("AsConnector host");
    program.add_argument("--port")
        .help("AsConnector port")
        .scan<'i', int>();
    program.add_argument("--api-version")
        .help("AsConnector API version (default: v2)");
    program.add_argument("--timeout")
        .help("Request timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--retries")
        .help("Attempts per request on connection failure")
        .scan<'i', int>();

    // Material flags
    program.add_argument("--material-dummy")
        .help("Connect every target to this material before applying");
    program.add_argument("--use-copy-method")
        .help("Connect materials as copies")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--replace-target-name")
        .help("Rename targets to the connected material")
        .default_value(false)
        .implicit_value(true);

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--scene")
        .help("Scene name (scene set)");
    program.add_argument("--validate")
        .help("Compare the scene with the document after apply")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        // Unknown flags are runtime_error, bad numbers invalid_argument.
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    // Input
    if (auto val = program.present("--document")) {
        config.document = *val;
    }
    if (auto val = program.present("--configuration")) {
        config.configuration = *val;
    }
    if (auto val = program.present<std::vector<std::string>>("--pr")) {
        auto codes = ParsePrCodes(*val, "--pr");
        if (codes.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(codes).Error());
        }
        config.pr_codes = std::move(codes).Value();
    }

    // Connection
    if (auto val = program.present("--host")) {
        config.connection.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        if (*val <= 0 || *val > 65535) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --port: " + std::to_string(*val)));
        }
        config.connection.port = static_cast<uint16_t>(*val);
    }
    if (auto val = program.present("--api-version")) {
        auto version = ParseApiVersion(*val, "--api-version");
        if (version.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(version).Error());
        }
        config.connection.api_version = std::move(version).Value();
    }
    if (auto val = program.present<int>("--timeout")) {
        if (*val < 1) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --timeout: " + std::to_string(*val)));
        }
        config.connection.timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--retries")) {
        if (*val < 1) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --retries: " + std::to_string(*val)));
        }
        config.connection.retries = *val;
    }

    // Material
    if (auto val = program.present("--material-dummy")) {
        config.material.dummy = *val;
    }
    config.material.use_copy_method = program.get<bool>("--use-copy-method");
    config.material.replace_target_name = program.get<bool>("--replace-target-name");

    // Options
    if (auto val = program.present("--config"); val && config_path) {
        *config_path = *val;
    }
    if (auto val = program.present("--scene")) {
        config.scene_name = *val;
    }
    config.validate_scene = program.get<bool>("--validate");
    config.json_output = program.get<bool>("--json");
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    config.verbose = program.get<bool>("--verbose");
    config.quiet = program.get<bool>("--quiet");
    config.force_color = program.get<bool>("--color");
    config.force_no_color = program.get<bool>("--no-color");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    // Connection overrides
    if (cli_overrides.connection.host != kDefaultHost) {
        merged.connection.host = cli_overrides.connection.host;
    }
    if (cli_overrides.connection.port != kDefaultPort) {
        merged.connection.port = cli_overrides.connection.port;
    }
    if (cli_overrides.connection.api_version.has_value()) {
        merged.connection.api_version = cli_overrides.connection.api_version;
    }
    if (cli_overrides.connection.timeout_seconds != kDefaultTimeoutSeconds) {
        merged.connection.timeout_seconds = cli_overrides.connection.timeout_seconds;
    }
    if (cli_overrides.connection.retries != kDefaultRetries) {
        merged.connection.retries = cli_overrides.connection.retries;
    }

    // A configuration given on the command line replaces both YAML inputs.
    if (!cli_overrides.document.empty()) {
        merged.document = cli_overrides.document;
    }
    if (!cli_overrides.configuration.empty() || !cli_overrides.pr_codes.empty()) {
        merged.configuration = cli_overrides.configuration;
        merged.pr_codes = cli_overrides.pr_codes;
    }

    // Material
    if (!cli_overrides.material.dummy.empty()) {
        merged.material.dummy = cli_overrides.material.dummy;
    }
    if (cli_overrides.material.use_copy_method) {
        merged.material.use_copy_method = true;
    }
    if (cli_overrides.material.replace_target_name) {
        merged.material.replace_target_name = true;
    }

    // Options
    if (!cli_overrides.scene_name.empty()) {
        merged.scene_name = cli_overrides.scene_name;
    }
    if (cli_overrides.validate_scene) {
        merged.validate_scene = true;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    merged.force_color = cli_overrides.force_color;
    merged.force_no_color = cli_overrides.force_no_color;

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config, bool require_document) {
    if (require_document && config.document.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: document (-d/--document)"));
    }
    if (config.connection.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: host"));
    }
    if (config.connection.port == 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
    }
    if (config.connection.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.connection.timeout_seconds)));
    }
    if (config.connection.retries < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("Retries must be at least 1, got " +
                            std::to_string(config.connection.retries)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    if (config.force_color && config.force_no_color) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> EffectiveConfiguration(const AppConfig& config) {
    if (!config.configuration.empty()) {
        return Result<std::string, Error>::Ok(config.configuration);
    }
    if (!config.pr_codes.empty()) {
        return Result<std::string, Error>::Ok(BuildConfigurationString(config.pr_codes));
    }
    return Result<std::string, Error>::Err(
        MakeConfigError("Missing configuration: use --configuration or --pr"));
}

ApiVersion EffectiveApiVersion(const AppConfig& config) {
    if (config.connection.api_version.has_value()) {
        return *config.connection.api_version;
    }
    return ApiVersion::Create(kDefaultApiVersion).Value();
}

} // namespace plm_cfg
