#include <cayley_client/query/graph.hpp>

#include <cayley_client/core/json_text.hpp>

namespace cayley_client {

Graph::Graph(std::string root) : root_(std::move(root)) {}

VertexChain Graph::Vertices(const std::vector<std::string>& ids) const {
    std::string selector = root_ + ".V(";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) selector += ',';
        selector += "'" + ids[i] + "'";
    }
    selector += ')';
    return VertexChain(std::move(selector));
}

MorphismChain Graph::Morphism() const {
    return MorphismChain(root_ + ".Morphism()");
}

std::string Graph::EmitJson(const nlohmann::json& data) const {
    return root_ + ".Emit(" + DumpJson(data) + ")";
}

} // namespace cayley_client
