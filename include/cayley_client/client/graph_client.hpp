#pragma once

#include <cayley_client/client/i_graph_session.hpp>
#include <cayley_client/core/result.hpp>
#include <cayley_client/quad/quad_set.hpp>
#include <cayley_client/query/vertex_chain.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace cayley_client {

struct GraphClientOptions {
    std::string api_version = "v1";
    std::string query_language = "gremlin";
};

// ---------------------------------------------------------------------------
// GraphResponse: the raw HTTP response plus its decoded JSON body.
// ---------------------------------------------------------------------------
struct GraphResponse {
    HttpResponse raw;
    nlohmann::json result;
};

// ---------------------------------------------------------------------------
// GraphClient: sends query text and quad-set payloads to the server.
//
// Endpoints:
//   POST /api/<version>/query/<language>   body: query text
//   POST /api/<version>/write              body: QuadSet::ToText()
//
// One request per call. A non-2xx status becomes Error::FromHttpStatus.
// ---------------------------------------------------------------------------
class GraphClient {
public:
    explicit GraphClient(IGraphSession& session, GraphClientOptions options = {});

    [[nodiscard]] const std::string& QueryPath() const noexcept { return query_path_; }
    [[nodiscard]] const std::string& WritePath() const noexcept { return write_path_; }

    /// Send query text; a body that is not JSON fails with
    /// ErrorCategory::MalformedResponse.
    [[nodiscard]] Result<GraphResponse, Error> Send(std::string_view query);

    /// Send a built vertex chain. Morphism chains are not executable.
    [[nodiscard]] Result<GraphResponse, Error> Send(const VertexChain& query);

    /// Write the quads; returns the raw response body.
    [[nodiscard]] Result<std::string, Error> Write(const QuadSet& quads);

private:
    IGraphSession& session_;
    std::string query_path_;
    std::string write_path_;
};

} // namespace cayley_client
