#include <cayley_client/query/query_step.hpp>

#include <cayley_client/core/log.hpp>

namespace cayley_client {

QueryStep::QueryStep(std::string token, std::vector<std::string> parameters)
    : token_(std::move(token)), parameters_(std::move(parameters)) {}

std::string QueryStep::Serialize() const {
    if (parameters_.empty()) {
        return token_;
    }

    std::string out;
    out.reserve(token_.size());
    size_t next = 0;
    size_t placeholders = 0;
    for (size_t i = 0; i < token_.size(); ++i) {
        const char c = token_[i];
        if (c != '%' || i + 1 >= token_.size()) {
            out += c;
            continue;
        }
        const char conversion = token_[i + 1];
        if (conversion == '%') {
            out += '%';
            ++i;
        } else if (conversion == 's' || conversion == 'd') {
            ++placeholders;
            if (next < parameters_.size()) {
                out += parameters_[next++];
                ++i;
            } else {
                out += c;
            }
        } else {
            out += c;
        }
    }

    if (placeholders != parameters_.size()) {
        LogDebug("query", "Step '" + token_ + "' has " + std::to_string(placeholders) +
                              " placeholder(s) for " +
                              std::to_string(parameters_.size()) + " parameter(s)");
    }
    return out;
}

} // namespace cayley_client
