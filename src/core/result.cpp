#include <cayley_client/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace cayley_client {

namespace {

// The query and write endpoints answer failures with {"error": "..."}.
// Anything else (HTML from a proxy, an empty body) yields nothing.
std::optional<std::string> ExtractServerError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    auto it = parsed.find("error");
    if (it == parsed.end() || !it->is_string()) return std::nullopt;

    auto msg = it->get<std::string>();
    if (msg.empty()) return std::nullopt;
    return msg;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto server_error = ExtractServerError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::BadRequest;
            message = server_error.has_value()
                ? "Bad request: " + *server_error
                : "Bad request";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found, check the API version and query language";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 500:
            category = ErrorCategory::ServerError;
            message = server_error.has_value()
                ? "Graph server error: " + *server_error
                : "Graph server internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Graph server unavailable";
            break;
        default:
            category = status_code >= 500 ? ErrorCategory::ServerError
                                          : ErrorCategory::BadRequest;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, server_error, category};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Connection:        return 1;
        case ErrorCategory::Timeout:           return 2;
        case ErrorCategory::BadRequest:        return 3;
        case ErrorCategory::NotFound:          return 4;
        case ErrorCategory::ServerError:       return 5;
        case ErrorCategory::MalformedResponse: return 6;
        case ErrorCategory::InvalidQuad:       return 7;
        case ErrorCategory::InvalidParameter:  return 8;
        case ErrorCategory::Config:            return 9;
        case ErrorCategory::Internal:          return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Connection:        return "connection";
        case ErrorCategory::Timeout:           return "timeout";
        case ErrorCategory::BadRequest:        return "bad_request";
        case ErrorCategory::NotFound:          return "not_found";
        case ErrorCategory::ServerError:       return "server_error";
        case ErrorCategory::MalformedResponse: return "malformed_response";
        case ErrorCategory::InvalidQuad:       return "invalid_quad";
        case ErrorCategory::InvalidParameter:  return "invalid_parameter";
        case ErrorCategory::Config:            return "config";
        case ErrorCategory::Internal:          return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (server_error.has_value() && !server_error->empty()) {
        oss << "; server: " << *server_error;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json detail;
    detail["category"] = CategoryName();
    detail["operation"] = operation;
    if (!endpoint.empty()) {
        detail["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        detail["http_status"] = *http_status;
    }
    detail["message"] = message;
    if (server_error.has_value() && !server_error->empty()) {
        detail["server_error"] = *server_error;
    }
    detail["exit_code"] = ExitCode();
    return nlohmann::json{{"error", detail}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace cayley_client
