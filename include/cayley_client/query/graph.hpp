#pragma once

#include <cayley_client/query/morphism_chain.hpp>
#include <cayley_client/query/vertex_chain.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cayley_client {

// ---------------------------------------------------------------------------
// Graph: entry point that roots new chains at the query object (default
// "g") and renders standalone Emit fragments.
//
//   Graph g;
//   g.Vertices().All().Build();                    // g.V().All()
//   g.Vertices("alice", "bob").Build();            // g.V('alice','bob')
//   g.Vertices("alice").Out("follows").Build();    // g.V('alice').Out('follows')
// ---------------------------------------------------------------------------
class Graph {
public:
    explicit Graph(std::string root = "g");

    [[nodiscard]] const std::string& Root() const noexcept { return root_; }

    /// No ids selects every vertex; otherwise each id is single-quoted.
    [[nodiscard]] VertexChain Vertices(const std::vector<std::string>& ids) const;

    template <typename... Ids>
    [[nodiscard]] VertexChain Vertices(const Ids&... ids) const {
        return Vertices(std::vector<std::string>{std::string(ids)...});
    }

    template <typename... Ids>
    [[nodiscard]] VertexChain V(const Ids&... ids) const {
        return Vertices(ids...);
    }

    [[nodiscard]] MorphismChain Morphism() const;
    [[nodiscard]] MorphismChain M() const { return Morphism(); }

    /// <root>.Emit(<json>). Any type with an nlohmann to_json overload can be
    /// emitted.
    template <typename T>
    [[nodiscard]] std::string Emit(const T& data) const {
        return EmitJson(nlohmann::json(data));
    }

    [[nodiscard]] std::string EmitJson(const nlohmann::json& data) const;

private:
    std::string root_;
};

} // namespace cayley_client
