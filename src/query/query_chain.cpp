#include <cayley_client/query/query_chain.hpp>

#include <cayley_client/core/json_text.hpp>
#include <cayley_client/core/log.hpp>
#include <cayley_client/query/morphism_chain.hpp>
#include <cayley_client/query/vertex_chain.hpp>

namespace cayley_client {

namespace {

const char* KindName(QueryOperand::Kind kind) {
    switch (kind) {
        case QueryOperand::Kind::Text:          return "query text";
        case QueryOperand::Kind::VertexChain:   return "vertex chain";
        case QueryOperand::Kind::MorphismChain: return "morphism chain";
    }
    return "unknown operand";
}

std::string ToLower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// QueryChain
// ---------------------------------------------------------------------------
QueryChain::QueryChain(std::string root_step) {
    Put(std::move(root_step));
}

std::string QueryChain::Build() const {
    std::string out;
    for (size_t i = 0; i < steps_.size(); ++i) {
        if (i > 0) out += '.';
        out += steps_[i].Serialize();
    }
    return out;
}

void QueryChain::Put(std::string token, std::vector<std::string> parameters) {
    steps_.emplace_back(std::move(token), std::move(parameters));
}

// ---------------------------------------------------------------------------
// QueryOperand
// ---------------------------------------------------------------------------
QueryOperand::QueryOperand(const QueryChain& chain)
    : kind_(chain.Kind() == ChainKind::Vertex ? Kind::VertexChain
                                              : Kind::MorphismChain),
      text_(chain.Build()) {}

QueryOperand::QueryOperand(std::string text)
    : kind_(Kind::Text), text_(std::move(text)) {}

QueryOperand::QueryOperand(const char* text)
    : kind_(Kind::Text), text_(text != nullptr ? text : "") {}

// ---------------------------------------------------------------------------
// PathChain
// ---------------------------------------------------------------------------
template <typename Derived>
Derived& PathChain<Derived>::Out(const BoundValue& predicate, const BoundValue& tags) {
    PutBounds("Out", predicate, tags);
    return Self();
}

template <typename Derived>
Derived& PathChain<Derived>::In(const BoundValue& predicate, const BoundValue& tags) {
    PutBounds("In", predicate, tags);
    return Self();
}

template <typename Derived>
Derived& PathChain<Derived>::Both(const BoundValue& predicate, const BoundValue& tags) {
    PutBounds("Both", predicate, tags);
    return Self();
}

template <typename Derived>
Derived& PathChain<Derived>::Is(const std::vector<std::string>& nodes) {
    std::string joined;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0) joined += "', '";
        joined += nodes[i];
    }
    Put("Is('%s')", {std::move(joined)});
    return Self();
}

template <typename Derived>
Derived& PathChain<Derived>::Has(std::string_view predicate, std::string_view object) {
    Put("Has('%s', '%s')", {std::string(predicate), std::string(object)});
    return Self();
}

template <typename Derived>
Derived& PathChain<Derived>::Tag(const std::vector<std::string>& tags) {
    Put("Tag(%s)", {DumpJson(nlohmann::json(tags))});
    return Self();
}

template <typename Derived>
Derived& PathChain<Derived>::Back(std::string_view tag) {
    Put("Back('%s')", {std::string(tag)});
    return Self();
}

template <typename Derived>
Derived& PathChain<Derived>::Save(std::string_view predicate, std::string_view tag) {
    Put("Save('%s', '%s')", {std::string(predicate), std::string(tag)});
    return Self();
}

template <typename Derived>
Result<typename PathChain<Derived>::ChainRef, Error>
PathChain<Derived>::Intersect(const QueryOperand& query) {
    return PutOperand("Intersect", query, QueryOperand::Kind::VertexChain);
}

template <typename Derived>
Result<typename PathChain<Derived>::ChainRef, Error>
PathChain<Derived>::Union(const QueryOperand& query) {
    return PutOperand("Union", query, QueryOperand::Kind::VertexChain);
}

template <typename Derived>
Result<typename PathChain<Derived>::ChainRef, Error>
PathChain<Derived>::Follow(const QueryOperand& query) {
    return PutOperand("Follow", query, QueryOperand::Kind::MorphismChain);
}

template <typename Derived>
Result<typename PathChain<Derived>::ChainRef, Error>
PathChain<Derived>::FollowR(const QueryOperand& query) {
    return PutOperand("FollowR", query, QueryOperand::Kind::MorphismChain);
}

template <typename Derived>
void PathChain<Derived>::PutBounds(std::string_view method,
                                   const BoundValue& predicate,
                                   const BoundValue& tags) {
    const std::string name(method);
    if (predicate.IsAbsent() && tags.IsAbsent()) {
        Put(name + "()");
    } else if (tags.IsAbsent()) {
        Put(name + "(%s)", {predicate.Format()});
    } else {
        Put(name + "(%s, %s)", {predicate.Format(), tags.Format()});
    }
}

template <typename Derived>
Result<typename PathChain<Derived>::ChainRef, Error>
PathChain<Derived>::PutOperand(std::string_view method,
                               const QueryOperand& query,
                               QueryOperand::Kind accepted) {
    const auto kind = query.GetKind();
    if (kind != QueryOperand::Kind::Text && kind != accepted) {
        const std::string message =
            "Invalid parameter in " + ToLower(method) + " query: expected a " +
            KindName(accepted) + " or query text, got a " + KindName(kind);
        LogDebug("query", message);
        return Result<ChainRef, Error>::Err(Error{
            std::string(method), "", std::nullopt, message, std::nullopt,
            ErrorCategory::InvalidParameter});
    }
    Put(std::string(method) + "(%s)", {query.Text()});
    return Result<ChainRef, Error>::Ok(std::ref(Self()));
}

template class PathChain<VertexChain>;
template class PathChain<MorphismChain>;

// ---------------------------------------------------------------------------
// VertexChain / MorphismChain
// ---------------------------------------------------------------------------
VertexChain::VertexChain(std::string root_step)
    : PathChain<VertexChain>(std::move(root_step)) {}

VertexChain& VertexChain::All() {
    Put("All()");
    return *this;
}

VertexChain& VertexChain::GetLimit(std::int64_t limit) {
    Put("GetLimit(%d)", {std::to_string(limit)});
    return *this;
}

MorphismChain::MorphismChain(std::string root_step)
    : PathChain<MorphismChain>(std::move(root_step)) {}

} // namespace cayley_client
