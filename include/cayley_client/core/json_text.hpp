#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace cayley_client {

// Serialize on one line with ", " between elements and ": " after keys,
// escaping non-ASCII as \uXXXX. This is the layout the query endpoint's
// documentation and the write payloads use, e.g. ["t1", "t2"].
// Bytes that are not valid UTF-8 are written as \ufffd; never throws.
[[nodiscard]] std::string DumpJson(const nlohmann::json& value);

} // namespace cayley_client
