#include <cayley_client/config/config_loader.hpp>

#include <cayley_client/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace cayley_client {

namespace {

const ConnectionConfig kDefaultConnection{};

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

bool HasHttpScheme(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
//
//   connection:
//     url: http://localhost:64210
//     api_version: v1
//     query_language: gremlin
//     connect_timeout: 30
//     read_timeout: 120
//     insecure: false
//   log_file: /tmp/cayley-client.log
//   log_level: info
//   json_logs: false
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
        if (root["connection"]) {
            const auto& conn = root["connection"];
            if (conn["url"]) {
                config.connection.url = conn["url"].as<std::string>();
            }
            if (conn["api_version"]) {
                config.connection.api_version = conn["api_version"].as<std::string>();
            }
            if (conn["query_language"]) {
                config.connection.query_language =
                    conn["query_language"].as<std::string>();
            }
            if (conn["connect_timeout"]) {
                config.connection.connect_timeout_seconds =
                    conn["connect_timeout"].as<int>();
            }
            if (conn["read_timeout"]) {
                config.connection.read_timeout_seconds = conn["read_timeout"].as<int>();
            }
            if (conn["insecure"]) {
                config.connection.disable_tls_verify = conn["insecure"].as<bool>();
            }
        }

        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            auto level = ParseLogLevel(root["log_level"].as<std::string>());
            if (level.IsErr()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError(level.Error().message));
            }
            config.log_level = level.Value();
        }
        if (root["json_logs"]) {
            config.json_logs = root["json_logs"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " +
                            std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    const std::string name = argc > 0 ? argv[0] : "cayley-client";
    // -v is --verbose here; --version is handled by main.
    argparse::ArgumentParser program(name, kVersion, argparse::default_arguments::help);

    program.add_argument("input")
        .help("Query text or quad file ('-' reads stdin)")
        .nargs(argparse::nargs_pattern::optional);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--url")
        .help("Graph server base URL (default http://localhost:64210)");
    program.add_argument("--api-version")
        .help("HTTP API version (default v1)");
    program.add_argument("--language")
        .help("Query language endpoint (default gremlin)");
    program.add_argument("--timeout")
        .help("Read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--log-file")
        .help("Append log lines to this file");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--json-logs")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Errors only")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    } catch (const std::invalid_argument& e) {
        // --timeout with a non-numeric value
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("input")) {
        config.input = *val;
    }
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--url")) {
        config.connection.url = *val;
    }
    if (auto val = program.present("--api-version")) {
        config.connection.api_version = *val;
    }
    if (auto val = program.present("--language")) {
        config.connection.query_language = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.connection.read_timeout_seconds = *val;
    }
    if (program.get<bool>("--insecure")) {
        config.connection.disable_tls_verify = true;
    }

    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(MakeConfigError(level.Error().message));
        }
        config.log_level = level.Value();
    }
    if (program.get<bool>("--json-logs")) {
        config.json_logs = true;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const auto& cli = cli_overrides.connection;

    if (cli.url != kDefaultConnection.url) {
        merged.connection.url = cli.url;
    }
    if (cli.api_version != kDefaultConnection.api_version) {
        merged.connection.api_version = cli.api_version;
    }
    if (cli.query_language != kDefaultConnection.query_language) {
        merged.connection.query_language = cli.query_language;
    }
    if (cli.connect_timeout_seconds != kDefaultConnection.connect_timeout_seconds) {
        merged.connection.connect_timeout_seconds = cli.connect_timeout_seconds;
    }
    if (cli.read_timeout_seconds != kDefaultConnection.read_timeout_seconds) {
        merged.connection.read_timeout_seconds = cli.read_timeout_seconds;
    }
    if (cli.disable_tls_verify) {
        merged.connection.disable_tls_verify = true;
    }

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.input.has_value()) {
        merged.input = cli_overrides.input;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level != AppConfig{}.log_level) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.json_logs) {
        merged.json_logs = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& conn = config.connection;
    if (conn.url.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: url"));
    }
    if (!HasHttpScheme(conn.url)) {
        return Result<void, Error>::Err(
            MakeConfigError("URL must start with http:// or https://, got '" +
                            conn.url + "'"));
    }
    if (conn.api_version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: api_version"));
    }
    if (conn.query_language.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: query_language"));
    }
    if (conn.connect_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Connect timeout must be positive, got " +
                            std::to_string(conn.connect_timeout_seconds)));
    }
    if (conn.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Read timeout must be positive, got " +
                            std::to_string(conn.read_timeout_seconds)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace cayley_client
