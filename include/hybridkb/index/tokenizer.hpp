#pragma once

/** \file tokenizer.hpp
 *  \brief Deterministic text tokenizer shared by indexing and querying.
 *
 * Rules:
 * - ASCII lowercase.
 * - A token is a run of [a-z0-9-] that begins and ends with [a-z0-9]; interior
 *   hyphens are kept so error codes survive ("E-4012" -> "e-4012").
 * - Everything else separates tokens. No stemming, no stopwords, no length limits.
 *
 * Thread-safety: stateless; safe for concurrent calls.
 */

#include <string>
#include <string_view>
#include <vector>

namespace hybridkb::index {

class Tokenizer {
public:
    /** \brief Tokenize text into terms, in order of appearance, duplicates kept.
     *
     * Complexity: O(n) in the input length.
     */
    static auto tokenize(std::string_view text) -> std::vector<std::string>;

    /** \brief True for the characters a token may begin or end with. */
    static constexpr auto is_term_char(char c) noexcept -> bool {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    }
};

} // namespace hybridkb::index
