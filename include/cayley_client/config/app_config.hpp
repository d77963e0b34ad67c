#pragma once

#include <cayley_client/core/log.hpp>

#include <optional>
#include <string>

namespace cayley_client {

struct ConnectionConfig {
    std::string url = "http://localhost:64210";
    std::string api_version = "v1";
    std::string query_language = "gremlin";
    int connect_timeout_seconds = 30;
    int read_timeout_seconds = 120;
    bool disable_tls_verify = false;
};

struct AppConfig {
    ConnectionConfig connection;
    std::optional<std::string> config_file;  // -c/--config
    std::optional<std::string> input;        // query text or quad file; "-" is stdin
    std::optional<std::string> log_file;
    LogLevel log_level = LogLevel::Warn;
    bool json_logs = false;
    bool verbose = false;
    bool quiet = false;
};

} // namespace cayley_client
