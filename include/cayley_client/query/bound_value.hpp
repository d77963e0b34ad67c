#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace cayley_client {

// ---------------------------------------------------------------------------
// BoundValue: an argument of Out/In/Both, formatted when constructed.
//
//   absent                 -> null
//   text                   -> 'text'
//   nlohmann::json         -> JSON text, e.g. {"a": 1}
//   number / bool          -> bare literal
//   sequence of strings    -> ['t1', 't2']
//
// A sequence is rendered as a bracketed list of quoted items, not as JSON,
// so a tag list passed here differs from what Tag() emits.
// ---------------------------------------------------------------------------
class BoundValue {
public:
    BoundValue() = default;
    BoundValue(std::nullopt_t) {}
    BoundValue(const char* text);
    BoundValue(const std::string& text);
    BoundValue(const nlohmann::json& structured);
    BoundValue(const std::vector<std::string>& sequence);

    template <typename T,
              typename = std::enable_if_t<std::is_arithmetic_v<T>>>
    BoundValue(T number) : formatted_(FormatNumber(number)) {}

    [[nodiscard]] bool IsAbsent() const noexcept { return !formatted_.has_value(); }

    /// The text embedded in the query ("null" when absent).
    [[nodiscard]] std::string Format() const;

private:
    template <typename T>
    static std::string FormatNumber(T number) {
        if constexpr (std::is_same_v<T, bool>) {
            return number ? "true" : "false";
        } else if constexpr (std::is_integral_v<T>) {
            return std::to_string(number);
        } else {
            return nlohmann::json(number).dump();
        }
    }

    std::optional<std::string> formatted_;
};

} // namespace cayley_client
