#include <cayley_client/client/graph_session.hpp>

#include <cayley_client/core/log.hpp>

#include <httplib.h>

namespace cayley_client {

namespace {

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers ToRequestHeaders(const HttpHeaders& extra) {
    httplib::Headers hdrs;
    hdrs.emplace("Accept", "application/json");
    for (const auto& [key, value] : extra) {
        hdrs.emplace(key, value);
    }
    return hdrs;
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

struct GraphSession::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string base_url;

    Impl(const std::string& url, const GraphSessionOptions& options)
        : base_url(url) {
        client = std::make_unique<httplib::Client>(url);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);

        if (options.disable_tls_verify) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
            client->enable_server_certificate_verification(false);
#else
            LogWarn("http", "TLS verification bypass requested but TLS support "
                            "is not compiled in");
#endif
        }
    }
};

GraphSession::GraphSession(const std::string& base_url,
                           const GraphSessionOptions& options)
    : impl_(std::make_unique<Impl>(base_url, options)) {}

GraphSession::~GraphSession() = default;

Result<HttpResponse, Error> GraphSession::Post(std::string_view path,
                                               std::string_view body,
                                               std::string_view content_type,
                                               const HttpHeaders& headers) {
    LogInfo("http", "POST " + impl_->base_url + std::string(path));
    LogDebug("http", "  > " + std::to_string(body.size()) + " byte(s) " +
                         std::string(content_type));

    auto res = impl_->client->Post(std::string(path), ToRequestHeaders(headers),
                                   std::string(body), std::string(content_type));
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(Error{
            "Post", std::string(path), std::nullopt,
            "HTTP request failed: " + httplib::to_string(http_error),
            std::nullopt, CategoryFromHttpTransportError(http_error)});
    }

    LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace cayley_client
