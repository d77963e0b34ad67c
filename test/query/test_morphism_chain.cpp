#include <catch2/catch_test_macros.hpp>

#include <cayley_client/query/graph.hpp>

using namespace cayley_client;

TEST_CASE("MorphismChain: rooted at Morphism()", "[query][morphism]") {
    Graph g;
    auto m = g.Morphism();
    CHECK(m.Kind() == ChainKind::Morphism);
    CHECK(m.Build() == "g.Morphism()");
}

TEST_CASE("MorphismChain: shares the traversal steps", "[query][morphism]") {
    Graph g;
    auto m = g.Morphism();
    m.Out("follows").In("likes").Has("kind", "person").Tag("seen");
    CHECK(m.Build() ==
          R"(g.Morphism().Out('follows').In('likes').Has('kind', 'person').Tag(["seen"]))");
}

TEST_CASE("MorphismChain: Follow accepts another morphism", "[query][morphism]") {
    Graph g;
    auto inner = g.Morphism();
    inner.Out("a");
    auto outer = g.Morphism();
    REQUIRE(outer.Follow(inner).IsOk());
    CHECK(outer.Build() == "g.Morphism().Follow(g.Morphism().Out('a'))");
}

TEST_CASE("MorphismChain: Union rejects a morphism operand", "[query][morphism]") {
    Graph g;
    auto m = g.Morphism();
    auto r = m.Union(g.Morphism());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidParameter);
    CHECK(m.Build() == "g.Morphism()");
}

TEST_CASE("MorphismChain: Intersect accepts a vertex chain", "[query][morphism]") {
    Graph g;
    auto m = g.Morphism();
    REQUIRE(m.Intersect(g.Vertices("x")).IsOk());
    CHECK(m.Build() == "g.Morphism().Intersect(g.V('x'))");
}

TEST_CASE("MorphismChain: steps continue after Follow", "[query][morphism]") {
    Graph g;
    auto inner = g.Morphism();
    inner.Out("a");
    auto outer = g.Morphism();
    auto r = outer.Follow(inner);
    REQUIRE(r.IsOk());
    r.Value().get().In("b").Tag("t");
    CHECK(outer.Build() ==
          R"(g.Morphism().Follow(g.Morphism().Out('a')).In('b').Tag(["t"]))");
}
