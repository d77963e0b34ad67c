#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cayley_client {

// ---------------------------------------------------------------------------
// Normalize: canonical form of a quad field.
//
// Strips leading/trailing whitespace, replaces every ' ' with '_' and
// lowercases ASCII letters. Total and idempotent.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string Normalize(std::string_view text);

// An absent field stays absent.
[[nodiscard]] std::optional<std::string> NormalizeOptional(
    const std::optional<std::string>& text);

} // namespace cayley_client
