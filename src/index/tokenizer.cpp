#include "hybridkb/index/tokenizer.hpp"

#include <utility>

namespace hybridkb::index {

namespace {

constexpr auto to_lower_ascii(char c) noexcept -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // anonymous namespace

auto Tokenizer::tokenize(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&] {
        // Trailing hyphens never end a token.
        while (!current.empty() && current.back() == '-') current.pop_back();
        if (!current.empty()) tokens.push_back(std::move(current));
        current.clear();
    };

    for (char raw : text) {
        const char c = to_lower_ascii(raw);
        if (is_term_char(c)) {
            current.push_back(c);
        } else if (c == '-' && !current.empty()) {
            current.push_back(c);
        } else {
            flush();
        }
    }
    flush();

    return tokens;
}

} // namespace hybridkb::index
