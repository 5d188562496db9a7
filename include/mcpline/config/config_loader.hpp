#pragma once

#include <mcpline/config/app_config.hpp>
#include <mcpline/core/result.hpp>

#include <string>
#include <string_view>

namespace mcpline {

// Parse a YAML config file into an AppConfig. Keys that are absent keep
// their defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. argv[0] is the program name.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields of cli_overrides that differ from their defaults
// replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Resolve api_key_env: if api_key is unset and api_key_env is set, read the
// environment variable and populate api_key.
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config);

// Validate that values are sane and combinations are supported.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace mcpline
