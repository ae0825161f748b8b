#pragma once

/** \file bm25.hpp
 *  \brief Okapi BM25 inverted index over the knowledge-base corpus.
 *
 * The index is built once from an ordered document list and is immutable afterwards.
 * This implementation provides:
 * - Roaring bitmap posting lists with per-posting term frequencies
 * - Okapi scoring with an epsilon floor for negative IDF values
 * - Deterministic ranking: score descending, ties broken by corpus order
 *
 * Scoring, for each token t of the tokenized query (duplicates counted):
 *   idf(t) * tf * (k1 + 1) / (tf + k1 * (1 - b + b * dl / avgdl))
 * with idf(t) = ln(N - df + 0.5) - ln(df + 0.5). Terms whose idf is negative get
 * epsilon * (mean idf over the vocabulary) instead. Unseen terms contribute zero.
 *
 * Thread-safety: search operations are const and safe for concurrent calls.
 * Memory: O(V + P) where V is vocabulary size and P the number of postings.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "hybridkb/document.hpp"
#include "hybridkb/error.hpp"

namespace hybridkb::index {

/** \brief BM25 scoring parameters. */
struct BM25Params {
    double k1{1.5};        /**< Term frequency saturation */
    double b{0.75};        /**< Length normalization (0.0-1.0) */
    double epsilon{0.25};  /**< Floor for negative IDF, as a fraction of the mean IDF */
};

/** \brief One scored document, addressed by its position in the corpus. */
struct SparseHit {
    std::uint32_t ordinal{0};
    double score{0.0};
};

/** \brief BM25 index statistics. */
struct BM25Stats {
    std::size_t num_documents{0};      /**< Total documents indexed */
    std::size_t vocabulary_size{0};    /**< Unique terms in vocabulary */
    std::size_t total_tokens{0};       /**< Total tokens processed */
    double avg_doc_length{0.0};        /**< Average document length */
    std::size_t memory_bytes{0};       /**< Approximate memory usage in bytes */
};

/** \brief BM25 inverted index for keyword search.
 *
 * Example usage:
 * ```cpp
 * auto idx = BM25Index::build(documents);
 * if (!idx) return idx.error();
 * for (const auto& hit : idx->search("E-4012 token expired", 10)) {
 *     std::cout << documents[hit.ordinal].doc_id << ": " << hit.score << "\n";
 * }
 * ```
 */
class BM25Index {
public:
    ~BM25Index();
    BM25Index(BM25Index&&) noexcept;
    BM25Index& operator=(BM25Index&&) noexcept;
    BM25Index(const BM25Index&) = delete;
    BM25Index& operator=(const BM25Index&) = delete;

    /** \brief Index title + " " + body of every document, in order.
     *
     * \return The index, or invalid_argument for bad parameters
     *
     * Preconditions: k1 > 0; 0 <= b <= 1; epsilon >= 0
     * Complexity: O(total tokens)
     * An empty corpus is valid; every search then returns nothing.
     */
    static auto build(const std::vector<document>& docs, const BM25Params& params = {})
        -> std::expected<BM25Index, core::error>;

    /** \brief Rank the whole corpus against \p query and keep the best \p k.
     *
     * Every document is eligible, including those scoring zero, so the result holds
     * min(k, size()) hits.
     *
     * Complexity: O(P_q + N log k) where P_q is the postings touched by the query
     */
    auto search(std::string_view query, std::size_t k) const -> std::vector<SparseHit>;

    /** \brief Score of every document in corpus order. */
    auto score_all(std::string_view query) const -> std::vector<double>;

    /** \brief IDF of a (tokenized) term after the epsilon floor; 0 for unseen terms. */
    auto idf(std::string_view term) const -> double;

    /** \brief Number of documents containing the term. */
    auto document_frequency(std::string_view term) const -> std::uint32_t;

    /** \brief Get index statistics. */
    auto get_stats() const noexcept -> BM25Stats;

    /** \brief Get total number of indexed documents. */
    auto size() const noexcept -> std::size_t;

    /** \brief Get vocabulary size. */
    auto vocabulary_size() const noexcept -> std::size_t;

    /** \brief Get average document length in tokens. */
    auto avg_doc_length() const noexcept -> double;

    auto params() const noexcept -> const BM25Params&;

private:
    BM25Index();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hybridkb::index
