#pragma once

#include <cayley_client/config/app_config.hpp>
#include <cayley_client/core/result.hpp>

#include <string>
#include <string_view>

namespace cayley_client {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse connection and logging flags plus the optional input positional.
// argv[0] is the program/command name.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that values are present and sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace cayley_client
