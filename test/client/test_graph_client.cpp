#include <catch2/catch_test_macros.hpp>

#include <cayley_client/client/graph_client.hpp>
#include <cayley_client/query/graph.hpp>

#include "../../test/mocks/mock_graph_session.hpp"

#include <nlohmann/json.hpp>

#include <string>

using namespace cayley_client;
using namespace cayley_client::testing;

namespace {

Result<HttpResponse, Error> MakeResponse(int status, const std::string& body) {
    return Result<HttpResponse, Error>::Ok(HttpResponse{status, {}, body});
}

} // anonymous namespace

// ===========================================================================
// Endpoints
// ===========================================================================

TEST_CASE("GraphClient: default endpoints", "[client]") {
    MockGraphSession mock;
    GraphClient client(mock);
    CHECK(client.QueryPath() == "/api/v1/query/gremlin");
    CHECK(client.WritePath() == "/api/v1/write");
}

TEST_CASE("GraphClient: endpoints follow version and language", "[client]") {
    MockGraphSession mock;
    GraphClient client(mock, GraphClientOptions{"v2", "gizmo"});
    CHECK(client.QueryPath() == "/api/v2/query/gizmo");
    CHECK(client.WritePath() == "/api/v2/write");
}

// ===========================================================================
// Send
// ===========================================================================

TEST_CASE("GraphClient: Send posts query text and decodes JSON", "[client][send]") {
    MockGraphSession mock;
    mock.EnqueuePost(MakeResponse(200, R"({"result": [{"id": "bob"}]})"));
    GraphClient client(mock);

    auto r = client.Send("g.V('alice').Out('follows').All()");
    REQUIRE(r.IsOk());
    CHECK(r.Value().raw.status_code == 200);
    CHECK(r.Value().result["result"][0]["id"] == "bob");

    REQUIRE(mock.PostCallCount() == 1);
    const auto& call = mock.PostCalls()[0];
    CHECK(call.path == "/api/v1/query/gremlin");
    CHECK(call.body == "g.V('alice').Out('follows').All()");
    CHECK(call.content_type == "text/plain");
}

TEST_CASE("GraphClient: Send accepts a built vertex chain", "[client][send]") {
    MockGraphSession mock;
    mock.EnqueuePost(MakeResponse(200, R"({"result": null})"));
    GraphClient client(mock);

    Graph g;
    auto chain = g.Vertices("alice");
    chain.Out("follows").All();
    auto r = client.Send(chain);
    REQUIRE(r.IsOk());
    CHECK(r.Value().result["result"].is_null());
    CHECK(mock.PostCalls()[0].body == "g.V('alice').Out('follows').All()");
}

TEST_CASE("GraphClient: Send reports a non-JSON body as malformed", "[client][send]") {
    MockGraphSession mock;
    mock.EnqueuePost(MakeResponse(200, "<html>proxy page</html>"));
    GraphClient client(mock);

    auto r = client.Send("g.V().All()");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::MalformedResponse);
    CHECK(r.Error().operation == "Send");
}

TEST_CASE("GraphClient: Send maps HTTP errors", "[client][send]") {
    MockGraphSession mock;
    mock.EnqueuePost(MakeResponse(400, R"({"error": "syntax error at line 1"})"));
    GraphClient client(mock);

    auto r = client.Send("g.V(");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::BadRequest);
    CHECK(r.Error().endpoint == "/api/v1/query/gremlin");
    CHECK(r.Error().server_error == std::optional<std::string>("syntax error at line 1"));
}

TEST_CASE("GraphClient: Send propagates transport errors", "[client][send]") {
    MockGraphSession mock;
    mock.EnqueuePost(Result<HttpResponse, Error>::Err(Error{
        "Post", "/api/v1/query/gremlin", std::nullopt, "HTTP request failed: Connection",
        std::nullopt, ErrorCategory::Connection}));
    GraphClient client(mock);

    auto r = client.Send("g.V().All()");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Connection);
    CHECK(r.Error().ExitCode() == 1);
}

TEST_CASE("GraphClient: one request per call", "[client][send]") {
    MockGraphSession mock;
    mock.EnqueuePost(MakeResponse(503, ""));
    GraphClient client(mock);

    auto r = client.Send("g.V().All()");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Connection);
    CHECK(mock.PostCallCount() == 1);
}

// ===========================================================================
// Write
// ===========================================================================

TEST_CASE("GraphClient: Write posts the quad set as JSON", "[client][write]") {
    MockGraphSession mock;
    mock.EnqueuePost(MakeResponse(200, R"({"result": "Successfully wrote 2 quads."})"));
    GraphClient client(mock);

    QuadSet quads({Quad("alice", "follows", "bob"),
                   Quad("bob", "follows", "fred", std::string("social"))});
    auto r = client.Write(quads);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == R"({"result": "Successfully wrote 2 quads."})");

    REQUIRE(mock.PostCallCount() == 1);
    const auto& call = mock.PostCalls()[0];
    CHECK(call.path == "/api/v1/write");
    CHECK(call.content_type == "application/json");

    auto sent = QuadSet::FromText(call.body);
    REQUIRE(sent.IsOk());
    CHECK(sent.Value().Size() == 2);
    CHECK(sent.Value().Contains(Quad("alice", "follows", "bob")));
}

TEST_CASE("GraphClient: Write maps server errors", "[client][write]") {
    MockGraphSession mock;
    mock.EnqueuePost(MakeResponse(500, R"({"error": "quad store closed"})"));
    GraphClient client(mock);

    auto r = client.Write(QuadSet({Quad("a", "b", "c")}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::ServerError);
    CHECK(r.Error().operation == "Write");
    CHECK(r.Error().http_status == 500);
}

TEST_CASE("GraphClient: empty mock queue is an error, not a crash", "[client]") {
    MockGraphSession mock;
    GraphClient client(mock);
    auto r = client.Send("g.V()");
    REQUIRE(r.IsErr());
    CHECK(r.Error().message.find("no responses enqueued") != std::string::npos);
}
