#pragma once

#include <string>
#include <vector>

namespace cayley_client {

// ---------------------------------------------------------------------------
// QueryStep: one fragment of a traversal, e.g. Out('follows').
//
// The token is a template whose %s / %d placeholders take the already
// formatted parameters in order ("%%" is a literal '%'). A step without
// parameters serializes as the raw token, placeholders included.
// ---------------------------------------------------------------------------
class QueryStep {
public:
    explicit QueryStep(std::string token, std::vector<std::string> parameters = {});

    [[nodiscard]] const std::string& Token() const noexcept { return token_; }
    [[nodiscard]] const std::vector<std::string>& Parameters() const noexcept {
        return parameters_;
    }

    /// Placeholders beyond the last parameter are kept verbatim and surplus
    /// parameters are dropped. A count mismatch is logged at DEBUG under
    /// the "query" component.
    [[nodiscard]] std::string Serialize() const;

private:
    std::string token_;
    std::vector<std::string> parameters_;
};

} // namespace cayley_client
