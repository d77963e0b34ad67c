#pragma once

#include <cayley_client/core/result.hpp>
#include <cayley_client/quad/quad.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace cayley_client {

// ---------------------------------------------------------------------------
// QuadSet: unordered collection of unique quads; the write payload.
//
// Serialized form is a JSON array of quad records. Element order follows
// the set's iteration order and carries no meaning.
// ---------------------------------------------------------------------------
class QuadSet {
public:
    using const_iterator = std::unordered_set<Quad>::const_iterator;

    QuadSet() = default;
    explicit QuadSet(const std::vector<Quad>& quads);

    /// Build from a JSON array of records. The first element that is not a
    /// valid quad fails the whole set with ErrorCategory::InvalidQuad.
    static Result<QuadSet, Error> FromRecords(const nlohmann::json& records);

    /// Parse text as a JSON array, then FromRecords.
    static Result<QuadSet, Error> FromText(std::string_view text);

    /// Returns true when the quad was not already present.
    bool Add(const Quad& quad);

    void AddAll(const std::vector<Quad>& quads);
    void AddAll(const QuadSet& other);

    [[nodiscard]] bool Contains(const Quad& quad) const;
    [[nodiscard]] std::size_t Size() const noexcept { return quads_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return quads_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return quads_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return quads_.end(); }

    [[nodiscard]] nlohmann::json ToRecords() const;
    [[nodiscard]] std::string ToText() const;

private:
    std::unordered_set<Quad> quads_;
};

} // namespace cayley_client
