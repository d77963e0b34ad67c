#include <catch2/catch_test_macros.hpp>

#include <cayley_client/quad/quad.hpp>
#include <cayley_client/query/graph.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>

using namespace cayley_client;

TEST_CASE("Graph: default root is g", "[query][graph]") {
    CHECK(Graph().Root() == "g");
}

TEST_CASE("Graph: custom root names every chain", "[query][graph]") {
    Graph graph("graph");
    CHECK(graph.Vertices("a").Build() == "graph.V('a')");
    CHECK(graph.Morphism().Build() == "graph.Morphism()");
    CHECK(graph.Emit(1) == "graph.Emit(1)");
}

TEST_CASE("Graph: V and M are aliases", "[query][graph]") {
    Graph g;
    CHECK(g.V().Build() == g.Vertices().Build());
    CHECK(g.V("a", "b").Build() == "g.V('a','b')");
    CHECK(g.M().Build() == g.Morphism().Build());
}

TEST_CASE("Graph: chains are independent", "[query][graph]") {
    Graph g;
    auto a = g.Vertices();
    auto b = g.Vertices();
    a.Out("x");
    CHECK(b.Build() == "g.V()");
}

TEST_CASE("Graph: Emit serializes JSON values", "[query][graph]") {
    Graph g;
    CHECK(g.Emit(std::map<std::string, int>{{"b", 2}, {"a", 1}}) ==
          R"(g.Emit({"a": 1, "b": 2}))");
    CHECK(g.Emit(std::string("hi")) == R"(g.Emit("hi"))");
    CHECK(g.EmitJson(nlohmann::json::array({1, 2})) == "g.Emit([1, 2])");
}

TEST_CASE("Graph: Emit accepts a quad", "[query][graph]") {
    Graph g;
    Quad q("alice", "follows", "bob");
    CHECK(g.Emit(q) ==
          R"(g.Emit({"object": "bob", "predicate": "follows", "subject": "alice"}))");
}

TEST_CASE("Graph: Emit with invalid UTF-8 does not throw", "[query][graph]") {
    Graph g;
    std::string text;
    REQUIRE_NOTHROW(text = g.Emit(std::string("\xff")));
    CHECK(text == R"(g.Emit("\ufffd"))");
}
