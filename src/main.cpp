#include <cayley_client/client/graph_client.hpp>
#include <cayley_client/client/graph_session.hpp>
#include <cayley_client/config/config_loader.hpp>
#include <cayley_client/core/log.hpp>
#include <cayley_client/core/version.hpp>
#include <cayley_client/quad/quad_set.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace cayley_client;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 9;  // ErrorCategory::Config

enum class Subcommand {
    Query,
    Write,
};

void PrintUsage(std::ostream& out) {
    out << "usage: cayley-client <query|write> [options] <input>\n"
        << "\n"
        << "  query <text|->   send query text and print the JSON result\n"
        << "  write <file|->   write a JSON array of quad records\n"
        << "\n"
        << "Run 'cayley-client <command> --help' for options.\n";
}

void PrintError(const Error& error, bool json) {
    if (json) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "error: " << error.ToString() << "\n";
    }
}

Error MakeInputError(const std::string& message) {
    return Error{"ReadInput", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

Result<std::string, Error> ReadStream(std::istream& in, const std::string& source) {
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string, Error>::Err(
            MakeInputError("Failed to read " + source));
    }
    return Result<std::string, Error>::Ok(ss.str());
}

// "-" reads stdin; anything else is a file path.
Result<std::string, Error> ReadQuadInput(const std::string& input) {
    if (input == "-") {
        return ReadStream(std::cin, "stdin");
    }
    std::ifstream file(input);
    if (!file) {
        return Result<std::string, Error>::Err(
            MakeInputError("Cannot open quad file '" + input + "'"));
    }
    return ReadStream(file, input);
}

// "-" reads stdin; anything else is the query itself.
Result<std::string, Error> ReadQueryInput(const std::string& input) {
    if (input == "-") {
        return ReadStream(std::cin, "stdin");
    }
    return Result<std::string, Error>::Ok(input);
}

LogLevel EffectiveLogLevel(const AppConfig& config) {
    if (config.verbose) return LogLevel::Debug;
    if (config.quiet) return LogLevel::Error;
    return config.log_level;
}

Result<void, Error> InitLogging(const AppConfig& config) {
    const auto level = EffectiveLogLevel(config);
    if (config.log_file.has_value()) {
        auto file = std::make_unique<std::ofstream>(*config.log_file, std::ios::app);
        if (!*file) {
            return Result<void, Error>::Err(Error{
                "InitLogging", "", std::nullopt,
                "Cannot open log file '" + *config.log_file + "'", std::nullopt,
                ErrorCategory::Config});
        }
        InitGlobalLogger(std::make_unique<FileSink>(std::move(file), config.json_logs),
                         level);
    } else if (config.json_logs) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        InitGlobalLogger(std::make_unique<StreamSink>(std::cerr), level);
    }
    return Result<void, Error>::Ok();
}

Result<AppConfig, Error> ResolveConfig(int argc, const char* const* argv) {
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return cli_result;
    }
    auto config = std::move(cli_result).Value();

    if (config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            return yaml_result;
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

int RunQuery(GraphClient& client, const std::string& input, bool json_errors) {
    auto query = ReadQueryInput(input);
    if (query.IsErr()) {
        PrintError(query.Error(), json_errors);
        return query.Error().ExitCode();
    }

    auto response = client.Send(query.Value());
    if (response.IsErr()) {
        PrintError(response.Error(), json_errors);
        return response.Error().ExitCode();
    }
    std::cout << response.Value().result.dump(2) << "\n";
    return kExitSuccess;
}

int RunWrite(GraphClient& client, const std::string& input, bool json_errors) {
    auto text = ReadQuadInput(input);
    if (text.IsErr()) {
        PrintError(text.Error(), json_errors);
        return text.Error().ExitCode();
    }

    auto quads = QuadSet::FromText(text.Value());
    if (quads.IsErr()) {
        PrintError(quads.Error(), json_errors);
        return quads.Error().ExitCode();
    }
    LogInfo("main", "Writing " + std::to_string(quads.Value().Size()) + " quad(s)");

    auto body = client.Write(quads.Value());
    if (body.IsErr()) {
        PrintError(body.Error(), json_errors);
        return body.Error().ExitCode();
    }
    std::cout << body.Value() << "\n";
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    const std::string_view command{argv[1]};
    if (command == "--version") {
        std::cout << "cayley-client " << kVersion << "\n";
        return kExitSuccess;
    }
    if (command == "--help" || command == "-h") {
        PrintUsage(std::cout);
        return kExitSuccess;
    }

    Subcommand subcommand;
    if (command == "query") {
        subcommand = Subcommand::Query;
    } else if (command == "write") {
        subcommand = Subcommand::Write;
    } else {
        std::cerr << "error: unknown command '" << command << "'\n";
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    // Hand the command's own flags to the parser under "cayley-client <cmd>".
    const std::string program_name = "cayley-client " + std::string(command);
    std::vector<const char*> args;
    args.push_back(program_name.c_str());
    for (int i = 2; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    auto config_result = ResolveConfig(static_cast<int>(args.size()), args.data());
    if (config_result.IsErr()) {
        PrintError(config_result.Error(), false);
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        PrintError(logging.Error(), config.json_logs);
        return logging.Error().ExitCode();
    }

    if (!config.input.has_value()) {
        auto error = MakeInputError("Missing input for '" + std::string(command) + "'");
        PrintError(error, config.json_logs);
        return error.ExitCode();
    }

    GraphSessionOptions session_options;
    session_options.connect_timeout =
        std::chrono::seconds(config.connection.connect_timeout_seconds);
    session_options.read_timeout =
        std::chrono::seconds(config.connection.read_timeout_seconds);
    session_options.disable_tls_verify = config.connection.disable_tls_verify;
    GraphSession session(config.connection.url, session_options);

    GraphClientOptions client_options;
    client_options.api_version = config.connection.api_version;
    client_options.query_language = config.connection.query_language;
    GraphClient client(session, client_options);

    LogDebug("main", "Using " + config.connection.url + client.QueryPath());

    switch (subcommand) {
        case Subcommand::Query:
            return RunQuery(client, *config.input, config.json_logs);
        case Subcommand::Write:
            return RunWrite(client, *config.input, config.json_logs);
    }
    return kExitUsage;
}
