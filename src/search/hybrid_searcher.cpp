#include "hybridkb/search/hybrid_searcher.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "hybridkb/filter_eval.hpp"
#include "hybridkb/filter_json.hpp"
#include "hybridkb/search/fusion_algorithms.hpp"

namespace hybridkb::search {

namespace {

constexpr const char* kComponent = "search.hybrid";

using RankedList = std::vector<fusion::RankedItem>;
using PortResult = std::expected<RankedList, core::error>;

// Port implementations may throw; that is a port failure like any other.
auto invoke_port(VectorSearchPort& port, std::string_view text, std::size_t k,
                 const filter_expr* filter) -> PortResult {
    try {
        return port.query(text, k, filter);
    } catch (const std::exception& e) {
        return core::make_error(core::error_code::unavailable,
                                std::string("vector search threw: ") + e.what(), kComponent);
    }
}

auto describe(const filter_expr* filter) -> std::string {
    return filter ? filter_json::to_string(*filter) : std::string("none");
}

} // anonymous namespace

auto to_string(BranchOutcome o) noexcept -> std::string_view {
    switch (o) {
        case BranchOutcome::ok: return "ok";
        case BranchOutcome::filter_dropped: return "filter_dropped";
    }
    return "unknown";
}

auto to_string(QueryOutcome o) noexcept -> std::string_view {
    switch (o) {
        case QueryOutcome::ok: return "ok";
        case QueryOutcome::unfiltered_retry: return "unfiltered_retry";
    }
    return "unknown";
}

// HybridSearcher::Impl class definition
class HybridSearcher::Impl {
public:
    Impl(std::shared_ptr<index::IndexHandle> index,
         std::shared_ptr<VectorSearchPort> dense,
         retrieval_config config)
        : index_(std::move(index))
        , dense_(std::move(dense))
        , config_(std::move(config)) {
        if (auto ok = hybridkb::validate(config_); !ok) {
            spdlog::error("hybrid searcher config rejected: {}", ok.error().message);
            config_error_ = ok.error();
        }
    }

    auto search(std::string_view query, std::size_t top_k, const filter_expr* filter)
        -> std::expected<SearchReport, core::error>;

    auto batch_search(const std::vector<std::string>& queries, std::size_t top_k,
                      const filter_expr* filter)
        -> std::expected<std::vector<std::vector<result_record>>, core::error>;

    auto get_stats() const noexcept -> HybridSearchStats;
    auto config() const noexcept -> const retrieval_config& { return config_; }

private:
    std::shared_ptr<index::IndexHandle> index_;
    std::shared_ptr<VectorSearchPort> dense_;
    retrieval_config config_;
    std::optional<core::error> config_error_;
    mutable HybridSearchStats stats_;

    // Helper functions
    auto acquire(const filter_expr* filter) const
        -> std::expected<std::shared_ptr<const index::CorpusIndex>, core::error>;

    auto search_snapshot(const index::CorpusIndex& corpus, std::string_view query,
                         std::size_t top_k, const filter_expr* filter)
        -> std::expected<SearchReport, core::error>;

    auto run_pass(const index::CorpusIndex& corpus, std::string_view query, std::size_t top_k,
                  const filter_expr* filter, SearchReport& report)
        -> std::expected<std::vector<fusion::FusedResult>, core::error>;

    auto call_port(std::string_view query, std::size_t k, const filter_expr* filter) -> PortResult;

    auto execute_dense_search(const index::CorpusIndex& corpus, std::string_view query,
                              std::size_t k, const filter_expr* filter, BranchOutcome& outcome)
        -> std::expected<RankedList, core::error>;

    auto execute_sparse_search(const index::CorpusIndex& corpus, std::string_view query,
                               std::size_t top_k, const filter_expr* filter,
                               BranchOutcome& outcome) -> RankedList;
};

// HybridSearcher implementation

HybridSearcher::HybridSearcher(std::shared_ptr<index::IndexHandle> index,
                               std::shared_ptr<VectorSearchPort> dense,
                               retrieval_config config)
    : impl_(std::make_unique<Impl>(std::move(index), std::move(dense), std::move(config))) {
}

HybridSearcher::~HybridSearcher() = default;

auto HybridSearcher::search(std::string_view query, std::size_t top_k, const filter_expr* filter)
    -> std::expected<std::vector<result_record>, core::error> {
    auto report = impl_->search(query, top_k, filter);
    if (!report) return std::unexpected(report.error());
    return std::move(report->results);
}

auto HybridSearcher::search(std::string_view query)
    -> std::expected<std::vector<result_record>, core::error> {
    return search(query, impl_->config().default_top_k, nullptr);
}

auto HybridSearcher::search(std::string_view query, const filter_expr& filter)
    -> std::expected<std::vector<result_record>, core::error> {
    return search(query, impl_->config().default_top_k, &filter);
}

auto HybridSearcher::search_detailed(std::string_view query, std::size_t top_k,
                                     const filter_expr* filter)
    -> std::expected<SearchReport, core::error> {
    return impl_->search(query, top_k, filter);
}

auto HybridSearcher::batch_search(const std::vector<std::string>& queries, std::size_t top_k,
                                  const filter_expr* filter)
    -> std::expected<std::vector<std::vector<result_record>>, core::error> {
    return impl_->batch_search(queries, top_k, filter);
}

auto HybridSearcher::get_stats() const noexcept -> HybridSearchStats {
    // Return a copy that's constructed from atomic values
    return impl_->get_stats();
}

auto HybridSearcher::config() const noexcept -> const retrieval_config& {
    return impl_->config();
}

// HybridSearcher::Impl implementation

auto HybridSearcher::Impl::acquire(const filter_expr* filter) const
    -> std::expected<std::shared_ptr<const index::CorpusIndex>, core::error> {
    if (config_error_) return std::unexpected(*config_error_);
    if (filter) {
        if (auto ok = filter_eval::validate(*filter); !ok) return std::unexpected(ok.error());
    }
    if (!dense_) {
        return core::make_error(core::error_code::precondition_failed,
                                "no vector search port configured", kComponent);
    }
    auto snapshot = index_ ? index_->snapshot() : nullptr;
    if (!snapshot) {
        return core::make_error(core::error_code::index_unavailable,
                                "no corpus index installed", kComponent);
    }
    return snapshot;
}

auto HybridSearcher::Impl::call_port(std::string_view query, std::size_t k,
                                     const filter_expr* filter) -> PortResult {
    stats_.dense_searches.fetch_add(1);

    const auto timeout = config_.dense_timeout;
    if (timeout.count() <= 0) {
        return invoke_port(*dense_, query, k, filter);
    }

    // The worker owns copies of everything it touches, so an abandoned call can
    // finish after this frame is gone.
    auto promise = std::make_shared<std::promise<PortResult>>();
    auto future = promise->get_future();
    std::optional<filter_expr> owned_filter;
    if (filter) owned_filter = *filter;

    std::thread([port = dense_, text = std::string(query), k,
                 owned_filter = std::move(owned_filter), promise]() {
        promise->set_value(invoke_port(*port, text, k, owned_filter ? &*owned_filter : nullptr));
    }).detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        stats_.dense_timeouts.fetch_add(1);
        return core::make_error(core::error_code::deadline_exceeded,
                                "vector search exceeded " + std::to_string(timeout.count()) + " ms",
                                kComponent);
    }
    return future.get();
}

auto HybridSearcher::Impl::execute_dense_search(const index::CorpusIndex& corpus,
                                                std::string_view query, std::size_t k,
                                                const filter_expr* filter,
                                                BranchOutcome& outcome)
    -> std::expected<RankedList, core::error> {

    outcome = BranchOutcome::ok;
    auto result = call_port(query, k, filter);
    if (!result && filter != nullptr) {
        spdlog::warn("dense search with filter {} failed ({}); retrying without filter",
                     describe(filter), result.error().message);
        stats_.dense_filter_retries.fetch_add(1);
        outcome = BranchOutcome::filter_dropped;
        result = call_port(query, k, nullptr);
    }
    if (!result) {
        const auto& err = result.error();
        const auto code = err.code == core::error_code::deadline_exceeded
            ? core::error_code::deadline_exceeded
            : core::error_code::unavailable;
        return core::make_error(code, "dense search failed: " + err.message, kComponent);
    }

    auto& items = *result;
    if (items.size() > k) items.resize(k);
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto& item = items[i];
        item.rank = static_cast<std::uint32_t>(i + 1);
        if (!item.fields) {
            if (auto ordinal = corpus.find(item.doc_id)) {
                item.fields = display_fields::from(corpus.document_at(*ordinal));
            }
        }
    }
    return std::move(items);
}

auto HybridSearcher::Impl::execute_sparse_search(const index::CorpusIndex& corpus,
                                                 std::string_view query, std::size_t top_k,
                                                 const filter_expr* filter,
                                                 BranchOutcome& outcome) -> RankedList {

    const std::size_t over_k = top_k * kOverFetchMultiplier;
    const auto& bm25 = corpus.sparse();
    outcome = BranchOutcome::ok;

    auto to_items = [&corpus](const std::vector<index::SparseHit>& hits) {
        RankedList items;
        items.reserve(hits.size());
        for (const auto& hit : hits) {
            const auto& doc = corpus.document_at(hit.ordinal);
            items.push_back(fusion::RankedItem{doc.doc_id, hit.score, 0, display_fields::from(doc)});
        }
        for (std::size_t i = 0; i < items.size(); ++i) {
            items[i].rank = static_cast<std::uint32_t>(i + 1);
        }
        return items;
    };

    stats_.sparse_searches.fetch_add(1);
    if (filter == nullptr) {
        return to_items(bm25.search(query, over_k));
    }

    auto raw = bm25.search(query, top_k * kPostFilterMultiplier);
    std::vector<index::SparseHit> kept;
    for (const auto& hit : raw) {
        if (kept.size() == over_k) break;
        if (filter_eval::matches(*filter, corpus.record_at(hit.ordinal))) kept.push_back(hit);
    }
    spdlog::debug("sparse post-filter kept {} of {} candidates", kept.size(), raw.size());

    if (kept.empty()) {
        spdlog::warn("BM25 post-filter {} removed all {} candidates; using unfiltered BM25",
                     describe(filter), raw.size());
        stats_.sparse_filter_fallbacks.fetch_add(1);
        stats_.sparse_searches.fetch_add(1);
        outcome = BranchOutcome::filter_dropped;
        return to_items(bm25.search(query, over_k));
    }
    return to_items(kept);
}

auto HybridSearcher::Impl::run_pass(const index::CorpusIndex& corpus, std::string_view query,
                                    std::size_t top_k, const filter_expr* filter,
                                    SearchReport& report)
    -> std::expected<std::vector<fusion::FusedResult>, core::error> {

    const std::size_t over_k = top_k * kOverFetchMultiplier;

    std::expected<RankedList, core::error> dense;
    RankedList sparse;
    if (config_.parallel_branches) {
        auto sparse_future = std::async(std::launch::async, [&]() {
            return execute_sparse_search(corpus, query, top_k, filter, report.sparse);
        });
        dense = execute_dense_search(corpus, query, over_k, filter, report.dense);
        sparse = sparse_future.get();
    } else {
        dense = execute_dense_search(corpus, query, over_k, filter, report.dense);
        if (dense) sparse = execute_sparse_search(corpus, query, top_k, filter, report.sparse);
    }
    if (!dense) return std::unexpected(dense.error());

    report.dense_candidates = dense->size();
    report.sparse_candidates = sparse.size();
    spdlog::debug("hybrid pass: dense {} candidates, sparse {} candidates, filter {}",
                  dense->size(), sparse.size(), describe(filter));

    fusion::ReciprocalRankFusion rrf(config_.rrf_k);
    std::vector<RankedList> lists;
    lists.reserve(2);
    lists.push_back(std::move(*dense));
    lists.push_back(std::move(sparse));
    return rrf.fuse(lists);
}

auto HybridSearcher::Impl::search_snapshot(const index::CorpusIndex& corpus, std::string_view query,
                                           std::size_t top_k, const filter_expr* filter)
    -> std::expected<SearchReport, core::error> {

    SearchReport report;
    if (top_k == 0) return report;

    auto fused = run_pass(corpus, query, top_k, filter, report);
    if (!fused) return std::unexpected(fused.error());

    if (fused->empty() && filter != nullptr) {
        spdlog::warn("hybrid search with filter {} returned no results; retrying without filter",
                     describe(filter));
        stats_.unfiltered_retries.fetch_add(1);
        report = SearchReport{};
        report.query = QueryOutcome::unfiltered_retry;
        fused = run_pass(corpus, query, top_k, nullptr, report);
        if (!fused) return std::unexpected(fused.error());
    }

    if (fused->size() > top_k) fused->resize(top_k);
    report.results.reserve(fused->size());
    for (auto& fr : *fused) {
        report.results.push_back(result_record{std::move(fr.doc_id),
                                               fr.fields ? std::move(*fr.fields) : display_fields{},
                                               fr.fused_score, fr.rank});
    }
    return report;
}

auto HybridSearcher::Impl::search(std::string_view query, std::size_t top_k,
                                  const filter_expr* filter)
    -> std::expected<SearchReport, core::error> {

    auto start_time = std::chrono::steady_clock::now();
    stats_.total_queries.fetch_add(1);

    auto snapshot = acquire(filter);
    auto result = snapshot
        ? search_snapshot(**snapshot, query, top_k, filter)
        : std::expected<SearchReport, core::error>(std::unexpect, snapshot.error());

    auto end_time = std::chrono::steady_clock::now();
    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
    stats_.total_latency_us.fetch_add(static_cast<std::size_t>(latency.count()));

    if (!result) {
        stats_.failed_queries.fetch_add(1);
        spdlog::debug("hybrid search failed ({}): {}", core::to_string(result.error().code),
                      result.error().message);
    }
    return result;
}

auto HybridSearcher::Impl::batch_search(const std::vector<std::string>& queries,
                                        std::size_t top_k, const filter_expr* filter)
    -> std::expected<std::vector<std::vector<result_record>>, core::error> {

    stats_.batch_queries.fetch_add(1);

    auto snapshot = acquire(filter);
    if (!snapshot) return std::unexpected(snapshot.error());
    const auto& corpus = **snapshot;

    // Process queries in parallel
    std::vector<std::future<std::expected<SearchReport, core::error>>> futures;
    futures.reserve(queries.size());
    for (const auto& query : queries) {
        futures.push_back(std::async(std::launch::async,
            [this, &corpus, &query, top_k, filter]() {
                stats_.total_queries.fetch_add(1);
                auto r = search_snapshot(corpus, query, top_k, filter);
                if (!r) stats_.failed_queries.fetch_add(1);
                return r;
            }));
    }

    // Collect results; every future is drained before returning
    std::vector<std::vector<result_record>> results;
    results.reserve(queries.size());
    std::optional<core::error> first_error;
    for (auto& future : futures) {
        auto result = future.get();
        if (!result) {
            if (!first_error) first_error = result.error();
            continue;
        }
        results.push_back(std::move(result->results));
    }
    if (first_error) return std::unexpected(std::move(*first_error));
    return results;
}

auto HybridSearcher::Impl::get_stats() const noexcept -> HybridSearchStats {
    return HybridSearchStats{
        stats_.total_queries.load(),
        stats_.dense_searches.load(),
        stats_.sparse_searches.load(),
        stats_.dense_filter_retries.load(),
        stats_.dense_timeouts.load(),
        stats_.sparse_filter_fallbacks.load(),
        stats_.unfiltered_retries.load(),
        stats_.failed_queries.load(),
        stats_.batch_queries.load(),
        stats_.total_latency_us.load()
    };
}

} // namespace hybridkb::search
