#pragma once

#include <cayley_client/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cayley_client {

// ---------------------------------------------------------------------------
// Quad: one directed, optionally labeled graph edge.
//
// Every field is stored in canonical form (see Normalize): trimmed, spaces
// replaced by underscores, lowercased. An absent label is distinct from an
// empty one. Equality and hashing look only at the four canonical fields.
//
// Record form (the write payload element):
//   {"subject": "...", "predicate": "...", "object": "...", "label": "..."}
// "label" is omitted, not null, when absent.
// ---------------------------------------------------------------------------
class Quad {
public:
    Quad(std::string_view subject,
         std::string_view predicate,
         std::string_view object,
         const std::optional<std::string>& label = std::nullopt);

    /// Build from a record. Fails with ErrorCategory::InvalidQuad when the
    /// record is not an object, lacks subject/predicate/object, carries a
    /// key other than the four quad fields, or has a non-string field.
    /// A null "label" counts as absent.
    static Result<Quad, Error> FromRecord(const nlohmann::json& record);

    /// Parse text as a JSON object, then FromRecord. Parse failures are
    /// reported as ErrorCategory::InvalidQuad.
    static Result<Quad, Error> FromText(std::string_view text);

    [[nodiscard]] const std::string& Subject() const noexcept { return subject_; }
    [[nodiscard]] const std::string& Predicate() const noexcept { return predicate_; }
    [[nodiscard]] const std::string& Object() const noexcept { return object_; }
    [[nodiscard]] const std::optional<std::string>& Label() const noexcept { return label_; }

    [[nodiscard]] nlohmann::json ToRecord() const;
    [[nodiscard]] std::string ToText() const;

    [[nodiscard]] bool Equals(const Quad& other) const;

    /// Compare against a record. A record that is not a valid quad but is a
    /// JSON string is tried as quad text. Returns false when neither
    /// conversion succeeds.
    [[nodiscard]] bool EqualsRecord(const nlohmann::json& record) const;

    /// Compare against quad text; false when the text is not a quad.
    [[nodiscard]] bool EqualsText(std::string_view text) const;

    /// 3*h(subject) + 5*h(predicate) + 7*h(object) + 11*h(label), where an
    /// absent label hashes to kAbsentLabelHash.
    [[nodiscard]] std::size_t Hash() const noexcept;

    static constexpr std::size_t kAbsentLabelHash = 0x5bd1e995;

    bool operator==(const Quad& other) const { return Equals(other); }
    bool operator!=(const Quad& other) const { return !Equals(other); }

private:
    std::string subject_;
    std::string predicate_;
    std::string object_;
    std::optional<std::string> label_;
};

// nlohmann serialization hook, so a Quad can be passed to Graph::Emit.
void to_json(nlohmann::json& j, const Quad& quad);

} // namespace cayley_client

namespace std {

template <>
struct hash<cayley_client::Quad> {
    size_t operator()(const cayley_client::Quad& q) const noexcept {
        return q.Hash();
    }
};

} // namespace std
