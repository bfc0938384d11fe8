#pragma once

#include <plm_cfg/config/app_config.hpp>
#include <plm_cfg/core/result.hpp>

#include <string>
#include <string_view>

namespace plm_cfg {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI flags (argv[0] is the program name, no subcommand) into an
// AppConfig. The path given with -c/--config is returned in `config_path`.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::string* config_path = nullptr);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that values are sane. A document path is only required for the
// commands that read one.
Result<void, Error> ValidateConfig(const AppConfig& config, bool require_document = true);

// The configuration string to resolve: `configuration` if set, otherwise the
// joined PR codes. Error if neither is given.
Result<std::string, Error> EffectiveConfiguration(const AppConfig& config);

// Configured API version or the default "v2".
ApiVersion EffectiveApiVersion(const AppConfig& config);

} // namespace plm_cfg
