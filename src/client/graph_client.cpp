#include <cayley_client/client/graph_client.hpp>

#include <cayley_client/core/log.hpp>

namespace cayley_client {

namespace {

constexpr const char* kQueryContentType = "text/plain";
constexpr const char* kWriteContentType = "application/json";

bool IsSuccess(int status_code) {
    return status_code >= 200 && status_code < 300;
}

} // anonymous namespace

GraphClient::GraphClient(IGraphSession& session, GraphClientOptions options)
    : session_(session),
      query_path_("/api/" + options.api_version + "/query/" + options.query_language),
      write_path_("/api/" + options.api_version + "/write") {}

Result<GraphResponse, Error> GraphClient::Send(std::string_view query) {
    LogDebug("client", "query: " + std::string(query));

    auto response = session_.Post(query_path_, query, kQueryContentType);
    if (response.IsErr()) {
        return Result<GraphResponse, Error>::Err(std::move(response).Error());
    }

    auto http = std::move(response).Value();
    if (!IsSuccess(http.status_code)) {
        return Result<GraphResponse, Error>::Err(
            Error::FromHttpStatus("Send", query_path_, http.status_code, http.body));
    }

    nlohmann::json result;
    try {
        result = nlohmann::json::parse(http.body);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<GraphResponse, Error>::Err(Error{
            "Send", query_path_, http.status_code,
            "Response is not valid JSON: " + std::string(e.what()),
            std::nullopt, ErrorCategory::MalformedResponse});
    }

    return Result<GraphResponse, Error>::Ok(
        GraphResponse{std::move(http), std::move(result)});
}

Result<GraphResponse, Error> GraphClient::Send(const VertexChain& query) {
    return Send(query.Build());
}

Result<std::string, Error> GraphClient::Write(const QuadSet& quads) {
    LogDebug("client", "writing " + std::to_string(quads.Size()) + " quad(s)");

    auto response = session_.Post(write_path_, quads.ToText(), kWriteContentType);
    if (response.IsErr()) {
        return Result<std::string, Error>::Err(std::move(response).Error());
    }

    auto http = std::move(response).Value();
    if (!IsSuccess(http.status_code)) {
        return Result<std::string, Error>::Err(
            Error::FromHttpStatus("Write", write_path_, http.status_code, http.body));
    }
    return Result<std::string, Error>::Ok(std::move(http.body));
}

} // namespace cayley_client
