#include <cayley_client/quad/quad.hpp>

#include <cayley_client/core/json_text.hpp>
#include <cayley_client/core/log.hpp>
#include <cayley_client/core/normalize.hpp>

#include <array>

namespace cayley_client {

namespace {

constexpr std::array<const char*, 3> kRequiredFields = {"subject", "predicate", "object"};
constexpr const char* kLabelField = "label";

Error MakeQuadError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidQuad};
}

bool IsQuadField(const std::string& key) {
    if (key == kLabelField) return true;
    for (const auto* field : kRequiredFields) {
        if (key == field) return true;
    }
    return false;
}

} // anonymous namespace

Quad::Quad(std::string_view subject,
           std::string_view predicate,
           std::string_view object,
           const std::optional<std::string>& label)
    : subject_(Normalize(subject)),
      predicate_(Normalize(predicate)),
      object_(Normalize(object)),
      label_(NormalizeOptional(label)) {}

Result<Quad, Error> Quad::FromRecord(const nlohmann::json& record) {
    const std::string op = "Quad::FromRecord";
    if (!record.is_object()) {
        return Result<Quad, Error>::Err(
            MakeQuadError(op, "Quad record must be a JSON object"));
    }

    for (auto it = record.begin(); it != record.end(); ++it) {
        if (!IsQuadField(it.key())) {
            return Result<Quad, Error>::Err(
                MakeQuadError(op, "Unexpected field '" + it.key() + "' in quad record"));
        }
    }

    std::array<std::string, 3> values;
    for (size_t i = 0; i < kRequiredFields.size(); ++i) {
        auto it = record.find(kRequiredFields[i]);
        if (it == record.end()) {
            return Result<Quad, Error>::Err(MakeQuadError(
                op, std::string("Quad record missing '") + kRequiredFields[i] + "' field"));
        }
        if (!it->is_string()) {
            return Result<Quad, Error>::Err(MakeQuadError(
                op, std::string("Field '") + kRequiredFields[i] + "' must be a string"));
        }
        values[i] = it->get<std::string>();
    }

    std::optional<std::string> label;
    if (auto it = record.find(kLabelField); it != record.end() && !it->is_null()) {
        if (!it->is_string()) {
            return Result<Quad, Error>::Err(
                MakeQuadError(op, "Field 'label' must be a string or null"));
        }
        label = it->get<std::string>();
    }

    return Result<Quad, Error>::Ok(Quad(values[0], values[1], values[2], label));
}

Result<Quad, Error> Quad::FromText(std::string_view text) {
    nlohmann::json record;
    try {
        record = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        LogDebug("quad", "Rejected quad text: " + std::string(e.what()));
        return Result<Quad, Error>::Err(MakeQuadError(
            "Quad::FromText", "Malformed quad JSON: " + std::string(e.what())));
    }
    return FromRecord(record);
}

nlohmann::json Quad::ToRecord() const {
    nlohmann::json record;
    record["subject"] = subject_;
    record["predicate"] = predicate_;
    record["object"] = object_;
    if (label_.has_value()) {
        record[kLabelField] = *label_;
    }
    return record;
}

std::string Quad::ToText() const {
    return DumpJson(ToRecord());
}

bool Quad::Equals(const Quad& other) const {
    return subject_ == other.subject_ &&
           predicate_ == other.predicate_ &&
           object_ == other.object_ &&
           label_ == other.label_;
}

bool Quad::EqualsRecord(const nlohmann::json& record) const {
    auto from_record = FromRecord(record);
    if (from_record.IsOk()) {
        return Equals(from_record.Value());
    }
    if (record.is_string()) {
        return EqualsText(record.get_ref<const std::string&>());
    }
    return false;
}

bool Quad::EqualsText(std::string_view text) const {
    auto from_text = FromText(text);
    return from_text.IsOk() && Equals(from_text.Value());
}

std::size_t Quad::Hash() const noexcept {
    const std::hash<std::string> h;
    const std::size_t label_hash =
        label_.has_value() ? h(*label_) : kAbsentLabelHash;
    return 3 * h(subject_) +
           5 * h(predicate_) +
           7 * h(object_) +
           11 * label_hash;
}

void to_json(nlohmann::json& j, const Quad& quad) {
    j = quad.ToRecord();
}

} // namespace cayley_client
