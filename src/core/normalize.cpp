#include <cayley_client/core/normalize.hpp>

#include <algorithm>
#include <cctype>

namespace cayley_client {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

std::string Normalize(std::string_view text) {
    auto first = std::find_if_not(text.begin(), text.end(), IsSpace);
    auto last = std::find_if_not(text.rbegin(), text.rend(), IsSpace).base();
    if (first >= last) {
        return {};
    }

    std::string out(first, last);
    for (auto& c : out) {
        if (c == ' ') {
            c = '_';
        } else {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

std::optional<std::string> NormalizeOptional(const std::optional<std::string>& text) {
    if (!text.has_value()) {
        return std::nullopt;
    }
    return Normalize(std::string_view(*text));
}

} // namespace cayley_client
