#pragma once

#include <cayley_client/client/i_graph_session.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace cayley_client {

struct GraphSessionOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{120};
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// GraphSession: IGraphSession over cpp-httplib.
//
// base_url is scheme://host[:port], e.g. http://localhost:64210. httplib
// stays out of the public header (pimpl).
// ---------------------------------------------------------------------------
class GraphSession : public IGraphSession {
public:
    explicit GraphSession(const std::string& base_url,
                          const GraphSessionOptions& options = {});
    ~GraphSession() override;

    GraphSession(const GraphSession&) = delete;
    GraphSession& operator=(const GraphSession&) = delete;
    GraphSession(GraphSession&&) = delete;
    GraphSession& operator=(GraphSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cayley_client
