#pragma once

#include <cayley_client/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace cayley_client {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IGraphSession: the channel to the graph server.
//
// GraphClient depends on this interface rather than a concrete HTTP client,
// so it can be tested offline with MockGraphSession. Exactly one request is
// made per call: no retries, no authentication, no pooling.
//
// Methods return Result<T, Error>: never throw on expected failures.
// ---------------------------------------------------------------------------
class IGraphSession {
public:
    virtual ~IGraphSession() = default;

    IGraphSession(const IGraphSession&) = delete;
    IGraphSession& operator=(const IGraphSession&) = delete;
    IGraphSession(IGraphSession&&) = delete;
    IGraphSession& operator=(IGraphSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

protected:
    IGraphSession() = default;
};

} // namespace cayley_client
