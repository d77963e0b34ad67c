#pragma once

#include <cayley_client/query/query_chain.hpp>

#include <cstdint>
#include <string>

namespace cayley_client {

class Graph;

// ---------------------------------------------------------------------------
// VertexChain: a chain rooted at <root>.V(...); the only chain that can be
// sent for execution.
// ---------------------------------------------------------------------------
class VertexChain final : public PathChain<VertexChain> {
public:
    [[nodiscard]] ChainKind Kind() const noexcept override { return ChainKind::Vertex; }

    VertexChain& All();
    VertexChain& GetLimit(std::int64_t limit);

private:
    friend class Graph;
    explicit VertexChain(std::string root_step);
};

extern template class PathChain<VertexChain>;

} // namespace cayley_client
