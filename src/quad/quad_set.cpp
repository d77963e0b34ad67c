#include <cayley_client/quad/quad_set.hpp>

#include <cayley_client/core/json_text.hpp>
#include <cayley_client/core/log.hpp>

namespace cayley_client {

QuadSet::QuadSet(const std::vector<Quad>& quads) {
    AddAll(quads);
}

Result<QuadSet, Error> QuadSet::FromRecords(const nlohmann::json& records) {
    if (!records.is_array()) {
        return Result<QuadSet, Error>::Err(Error{
            "QuadSet::FromRecords", "", std::nullopt,
            "Quad set must be a JSON array", std::nullopt,
            ErrorCategory::InvalidQuad});
    }

    QuadSet set;
    size_t index = 0;
    for (const auto& record : records) {
        auto quad = Quad::FromRecord(record);
        if (quad.IsErr()) {
            auto error = std::move(quad).Error();
            error.operation = "QuadSet::FromRecords";
            error.message = "Element " + std::to_string(index) + ": " + error.message;
            return Result<QuadSet, Error>::Err(std::move(error));
        }
        set.Add(quad.Value());
        ++index;
    }

    if (set.Size() != records.size()) {
        LogDebug("quad", "Dropped " + std::to_string(records.size() - set.Size()) +
                             " duplicate quad(s)");
    }
    return Result<QuadSet, Error>::Ok(std::move(set));
}

Result<QuadSet, Error> QuadSet::FromText(std::string_view text) {
    nlohmann::json records;
    try {
        records = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<QuadSet, Error>::Err(Error{
            "QuadSet::FromText", "", std::nullopt,
            "Malformed quad set JSON: " + std::string(e.what()), std::nullopt,
            ErrorCategory::InvalidQuad});
    }
    return FromRecords(records);
}

bool QuadSet::Add(const Quad& quad) {
    return quads_.insert(quad).second;
}

void QuadSet::AddAll(const std::vector<Quad>& quads) {
    quads_.insert(quads.begin(), quads.end());
}

void QuadSet::AddAll(const QuadSet& other) {
    quads_.insert(other.quads_.begin(), other.quads_.end());
}

bool QuadSet::Contains(const Quad& quad) const {
    return quads_.count(quad) != 0;
}

nlohmann::json QuadSet::ToRecords() const {
    auto records = nlohmann::json::array();
    for (const auto& quad : quads_) {
        records.push_back(quad.ToRecord());
    }
    return records;
}

std::string QuadSet::ToText() const {
    return DumpJson(ToRecords());
}

} // namespace cayley_client
