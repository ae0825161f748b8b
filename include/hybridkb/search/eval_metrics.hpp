#pragma once

/** \file eval_metrics.hpp
 *  \brief Offline retrieval quality evaluation: Recall@k and MRR over a labelled query set.
 *
 * Eval set format: a JSON array of
 *   {query_id, query, category, expected_doc_ids: [..], filters?: {flat extractor output}}
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/value.h>

#include "hybridkb/error.hpp"
#include "hybridkb/filter_expr.hpp"
#include "hybridkb/search/hybrid_searcher.hpp"

namespace hybridkb::search::eval {

struct EvalQuery {
    std::string query_id;
    std::string query;
    std::string category;
    std::vector<std::string> expected_doc_ids;
    std::optional<filter_expr> filter;  /**< from the "filters" object, if any usable */
};

struct QueryResult {
    std::string query_id;
    std::string category;
    std::vector<std::string> retrieved_doc_ids;
    double recall_at_5{0.0};
    double recall_at_10{0.0};
    double mrr{0.0};
    std::optional<std::string> error;  /**< set when the search failed */
};

struct CategorySummary {
    std::string category;
    std::size_t queries{0};
    double recall_at_5{0.0};
    double recall_at_10{0.0};
    double mrr{0.0};
};

struct EvalReport {
    std::vector<QueryResult> queries;       /**< input order */
    std::vector<CategorySummary> categories; /**< sorted by name */
    CategorySummary overall;
};

/** \brief Fraction of \p expected found among the first \p k retrieved; 1.0 if expected is empty. */
auto recall_at_k(const std::vector<std::string>& retrieved,
                 const std::vector<std::string>& expected, std::size_t k) -> double;

/** \brief 1 / (1-based position of the first expected id), or 0 if none was retrieved. */
auto reciprocal_rank(const std::vector<std::string>& retrieved,
                     const std::vector<std::string>& expected) -> double;

auto parse_eval_set(std::string_view json_text) -> std::expected<std::vector<EvalQuery>, core::error>;

auto load_eval_set(const std::string& path) -> std::expected<std::vector<EvalQuery>, core::error>;

/** \brief Run every query through \p searcher and aggregate the metrics.
 *
 * A failing query is recorded with its error and zero metrics; the run continues.
 */
auto evaluate(HybridSearcher& searcher, const std::vector<EvalQuery>& queries,
              std::size_t top_k = 10) -> EvalReport;

auto to_json(const EvalReport& report) -> Json::Value;

} // namespace hybridkb::search::eval
