#include <cayley_client/core/json_text.hpp>

namespace cayley_client {

namespace {

// Invalid UTF-8 in a field becomes U+FFFD instead of throwing.
std::string DumpScalar(const nlohmann::json& value) {
    return value.dump(-1, ' ', /*ensure_ascii=*/true,
                      nlohmann::json::error_handler_t::replace);
}

void AppendJson(std::string& out, const nlohmann::json& value) {
    if (value.is_object()) {
        out += '{';
        bool first = true;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!first) out += ", ";
            first = false;
            out += DumpScalar(nlohmann::json(it.key()));
            out += ": ";
            AppendJson(out, it.value());
        }
        out += '}';
        return;
    }
    if (value.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& element : value) {
            if (!first) out += ", ";
            first = false;
            AppendJson(out, element);
        }
        out += ']';
        return;
    }
    out += DumpScalar(value);
}

} // anonymous namespace

std::string DumpJson(const nlohmann::json& value) {
    std::string out;
    AppendJson(out, value);
    return out;
}

} // namespace cayley_client
