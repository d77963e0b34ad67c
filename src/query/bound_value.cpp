#include <cayley_client/query/bound_value.hpp>

#include <cayley_client/core/json_text.hpp>

namespace cayley_client {

BoundValue::BoundValue(const char* text) {
    if (text != nullptr) {
        formatted_ = "'" + std::string(text) + "'";
    }
}

BoundValue::BoundValue(const std::string& text)
    : formatted_("'" + text + "'") {}

BoundValue::BoundValue(const nlohmann::json& structured)
    : formatted_(DumpJson(structured)) {}

BoundValue::BoundValue(const std::vector<std::string>& sequence) {
    std::string out = "[";
    for (size_t i = 0; i < sequence.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + sequence[i] + "'";
    }
    out += "]";
    formatted_ = std::move(out);
}

std::string BoundValue::Format() const {
    return formatted_.value_or("null");
}

} // namespace cayley_client
