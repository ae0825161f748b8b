#pragma once

/** \file hybrid_searcher.hpp
 *  \brief Hybrid retrieval combining local BM25 ranking with an external vector search.
 *
 * Per query:
 * 1. Dense branch: ask the VectorSearchPort for 3*top_k items with the filter. A failure
 *    under a filter is retried once without it; any other failure is fatal.
 * 2. Sparse branch: BM25 for 3*top_k. Under a filter, rank 10*top_k, keep the matches,
 *    re-rank them from 1 and take 3*top_k; if nothing survives, use unfiltered BM25.
 * 3. Reciprocal rank fusion of [dense, sparse], in that order.
 * 4. If the fused list is empty under a filter, run 1-3 once more without the filter.
 * 5. Truncate to top_k.
 *
 * Fallbacks are not errors; each one is logged at warn, counted in HybridSearchStats
 * and reported in SearchReport.
 *
 * Thread-safety: all search operations are thread-safe. Each query works on one
 * CorpusIndex snapshot taken at entry, retry included.
 *
 * With a positive dense_timeout every port call runs on its own detached thread. A call
 * that outlives the deadline is abandoned, not cancelled: its thread stays alive until the
 * port returns (counted in HybridSearchStats::dense_timeouts).
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "hybridkb/config.hpp"
#include "hybridkb/document.hpp"
#include "hybridkb/error.hpp"
#include "hybridkb/filter_expr.hpp"
#include "hybridkb/index/index_handle.hpp"
#include "hybridkb/search/vector_port.hpp"

namespace hybridkb::search {

/** \brief Candidates requested from each branch, as a multiple of top_k. */
inline constexpr std::size_t kOverFetchMultiplier = 3;
/** \brief Unfiltered BM25 candidates ranked before post-filtering, as a multiple of top_k. */
inline constexpr std::size_t kPostFilterMultiplier = 10;

/** \brief How one branch produced its list. */
enum class BranchOutcome {
    ok,              /**< filter applied as requested (or no filter given) */
    filter_dropped,  /**< filter removed to recover candidates */
};

/** \brief How the query as a whole produced its results. */
enum class QueryOutcome {
    ok,
    unfiltered_retry,  /**< fused list was empty under the filter; re-run without it */
};

auto to_string(BranchOutcome o) noexcept -> std::string_view;
auto to_string(QueryOutcome o) noexcept -> std::string_view;

/** \brief Results plus the path taken to produce them. */
struct SearchReport {
    std::vector<result_record> results;
    BranchOutcome dense{BranchOutcome::ok};   /**< of the pass that produced results */
    BranchOutcome sparse{BranchOutcome::ok};  /**< of the pass that produced results */
    QueryOutcome query{QueryOutcome::ok};
    std::size_t dense_candidates{0};
    std::size_t sparse_candidates{0};
};

/** \brief Hybrid search statistics. */
struct HybridSearchStats {
    std::atomic<std::size_t> total_queries{0};           /**< Total queries processed */
    std::atomic<std::size_t> dense_searches{0};          /**< Vector port calls, retries included */
    std::atomic<std::size_t> sparse_searches{0};         /**< BM25 rankings executed */
    std::atomic<std::size_t> dense_filter_retries{0};    /**< Dense calls retried without filter */
    std::atomic<std::size_t> dense_timeouts{0};          /**< Port calls abandoned at the deadline */
    std::atomic<std::size_t> sparse_filter_fallbacks{0}; /**< Post-filter emptied the sparse list */
    std::atomic<std::size_t> unfiltered_retries{0};      /**< Whole queries re-run without filter */
    std::atomic<std::size_t> failed_queries{0};          /**< Queries that returned an error */
    std::atomic<std::size_t> batch_queries{0};           /**< Batch calls processed */
    std::atomic<std::size_t> total_latency_us{0};        /**< Total latency in microseconds */
};

/** \brief Hybrid searcher combining sparse and dense search.
 *
 * Example usage:
 * ```cpp
 * auto handle = std::make_shared<index::IndexHandle>();
 * handle->rebuild_from_config(cfg);
 * HybridSearcher searcher(handle, vector_port, cfg);
 *
 * auto filter = filter_json::parse_predicate(R"({"region": {"$eq": "EU"}})");
 * auto results = searcher.search("E-4012 token expired", 5, filter->has_value() ? &**filter : nullptr);
 * ```
 */
class HybridSearcher {
public:
    HybridSearcher(std::shared_ptr<index::IndexHandle> index,
                   std::shared_ptr<VectorSearchPort> dense,
                   retrieval_config config = {});
    ~HybridSearcher();

    HybridSearcher(const HybridSearcher&) = delete;
    HybridSearcher& operator=(const HybridSearcher&) = delete;

    /** \brief Search with an optional metadata filter.
     *
     * \param query Free-text query
     * \param top_k Number of results; 0 returns an empty list without searching
     * \param filter Predicate, or nullptr for none
     * \return Up to top_k results ranked 1..n, or
     *   - config_invalid: the searcher was built with a config that fails validate()
     *   - malformed_predicate: filter fails validation (checked before any branch runs)
     *   - index_unavailable: no corpus index installed
     *   - unavailable / deadline_exceeded: vector port failed after the retry policy
     */
    auto search(std::string_view query, std::size_t top_k, const filter_expr* filter = nullptr)
        -> std::expected<std::vector<result_record>, core::error>;

    /** \brief Search for config().default_top_k results. */
    auto search(std::string_view query)
        -> std::expected<std::vector<result_record>, core::error>;

    /** \brief Filtered search for config().default_top_k results. */
    auto search(std::string_view query, const filter_expr& filter)
        -> std::expected<std::vector<result_record>, core::error>;

    /** \brief Same as search(), also reporting which fallbacks were taken. */
    auto search_detailed(std::string_view query, std::size_t top_k,
                         const filter_expr* filter = nullptr)
        -> std::expected<SearchReport, core::error>;

    /** \brief Run several queries concurrently against one index snapshot.
     *
     * \return One result list per query, in input order, or the first error
     */
    auto batch_search(const std::vector<std::string>& queries, std::size_t top_k,
                      const filter_expr* filter = nullptr)
        -> std::expected<std::vector<std::vector<result_record>>, core::error>;

    /** \brief Get search statistics. */
    auto get_stats() const noexcept -> HybridSearchStats;

    auto config() const noexcept -> const retrieval_config&;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hybridkb::search
