#pragma once

#include <cayley_client/query/query_chain.hpp>

#include <string>

namespace cayley_client {

class Graph;

// ---------------------------------------------------------------------------
// MorphismChain: a reusable traversal fragment rooted at <root>.Morphism().
// Never executed on its own; applied through Follow/FollowR.
// ---------------------------------------------------------------------------
class MorphismChain final : public PathChain<MorphismChain> {
public:
    [[nodiscard]] ChainKind Kind() const noexcept override { return ChainKind::Morphism; }

private:
    friend class Graph;
    explicit MorphismChain(std::string root_step);
};

extern template class PathChain<MorphismChain>;

} // namespace cayley_client
