#pragma once

#include <cayley_client/core/result.hpp>
#include <cayley_client/query/bound_value.hpp>
#include <cayley_client/query/query_step.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cayley_client {

enum class ChainKind {
    Vertex,
    Morphism,
};

// ---------------------------------------------------------------------------
// QueryChain: an ordered, never-empty sequence of steps.
//
// The first step is the root selector. Build() joins every serialized step
// with '.', e.g. g.V('alice').Out('follows').All().
// ---------------------------------------------------------------------------
class QueryChain {
public:
    virtual ~QueryChain() = default;

    [[nodiscard]] virtual ChainKind Kind() const noexcept = 0;

    [[nodiscard]] std::string Build() const;
    [[nodiscard]] const std::vector<QueryStep>& Steps() const noexcept { return steps_; }

protected:
    explicit QueryChain(std::string root_step);

    QueryChain(const QueryChain&) = default;
    QueryChain& operator=(const QueryChain&) = default;
    QueryChain(QueryChain&&) noexcept = default;
    QueryChain& operator=(QueryChain&&) noexcept = default;

    void Put(std::string token, std::vector<std::string> parameters = {});

private:
    std::vector<QueryStep> steps_;
};

// ---------------------------------------------------------------------------
// QueryOperand: the argument of Intersect/Union/Follow/FollowR.
//
// Closed over three shapes: query text, a vertex chain, a morphism chain.
// The chain's text is captured at conversion time.
// ---------------------------------------------------------------------------
class QueryOperand {
public:
    enum class Kind {
        Text,
        VertexChain,
        MorphismChain,
    };

    QueryOperand(const QueryChain& chain);
    QueryOperand(std::string text);
    QueryOperand(const char* text);

    [[nodiscard]] Kind GetKind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& Text() const noexcept { return text_; }

private:
    Kind kind_;
    std::string text_;
};

// ---------------------------------------------------------------------------
// PathChain: the traversal vocabulary shared by VertexChain and
// MorphismChain. Each step method appends exactly one step and returns the
// same chain.
//
// Intersect/Union accept a vertex chain or text; Follow/FollowR accept a
// morphism chain or text. Any other operand fails with
// ErrorCategory::InvalidParameter and leaves the chain untouched. On success
// the Result carries the same chain, so traversal continues through Value():
//
//   chain.Intersect(cool).Value().get().All();
// ---------------------------------------------------------------------------
template <typename Derived>
class PathChain : public QueryChain {
public:
    // Zero arguments when both are absent, one when only tags is absent.
    Derived& Out(const BoundValue& predicate = {}, const BoundValue& tags = {});
    Derived& In(const BoundValue& predicate = {}, const BoundValue& tags = {});
    Derived& Both(const BoundValue& predicate = {}, const BoundValue& tags = {});

    // All ids inside one pair of quotes: Is('a', 'b').
    Derived& Is(const std::vector<std::string>& nodes);

    template <typename... Nodes>
    Derived& Is(const Nodes&... nodes) {
        return Is(std::vector<std::string>{std::string(nodes)...});
    }

    Derived& Has(std::string_view predicate, std::string_view object);

    // Tags as one JSON array: Tag(["t1", "t2"]).
    Derived& Tag(const std::vector<std::string>& tags);

    template <typename... Tags>
    Derived& Tag(const Tags&... tags) {
        return Tag(std::vector<std::string>{std::string(tags)...});
    }

    Derived& Back(std::string_view tag);
    Derived& Save(std::string_view predicate, std::string_view tag);

    using ChainRef = std::reference_wrapper<Derived>;

    [[nodiscard]] Result<ChainRef, Error> Intersect(const QueryOperand& query);
    [[nodiscard]] Result<ChainRef, Error> Union(const QueryOperand& query);
    [[nodiscard]] Result<ChainRef, Error> Follow(const QueryOperand& query);
    [[nodiscard]] Result<ChainRef, Error> FollowR(const QueryOperand& query);

protected:
    using QueryChain::QueryChain;

    Derived& Self() { return static_cast<Derived&>(*this); }

private:
    void PutBounds(std::string_view method,
                   const BoundValue& predicate,
                   const BoundValue& tags);

    Result<ChainRef, Error> PutOperand(std::string_view method,
                                   const QueryOperand& query,
                                   QueryOperand::Kind accepted);
};

} // namespace cayley_client
