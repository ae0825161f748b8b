/** \file hybrid_searcher_test.cpp
 *  \brief Unit tests for hybrid sparse-dense search.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "hybridkb/search/hybrid_searcher.hpp"
#include "hybridkb/index/index_handle.hpp"
#include "hybridkb/filter_eval.hpp"
#include "hybridkb/filter_json.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

#include "tests/support/fake_vector_port.hpp"
#include "tests/support/kb_corpus_fixtures.hpp"

using namespace hybridkb;
using namespace hybridkb::search;
using namespace hybridkb::index;
using Catch::Matchers::WithinRel;
using kb_test_helpers::FakeVectorPort;

namespace {

const std::vector<std::string> kAllIds{"kb-001", "kb-002", "kb-003", "kb-004", "kb-005", "kb-006"};

// Port calls run inline so tests stay deterministic.
retrieval_config direct_config() {
    retrieval_config cfg;
    cfg.dense_timeout = std::chrono::milliseconds(0);
    return cfg;
}

std::shared_ptr<IndexHandle> kb_handle() {
    auto handle = std::make_shared<IndexHandle>();
    REQUIRE(handle->rebuild(kb_test_helpers::small_kb()).has_value());
    return handle;
}

std::vector<std::string> ids_of(const std::vector<result_record>& results) {
    std::vector<std::string> ids;
    for (const auto& r : results) ids.push_back(r.doc_id);
    return ids;
}

// Ranks are 1..n and scores never increase.
bool well_ranked(const std::vector<result_record>& results) {
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].rank != i + 1) return false;
        if (i > 0 && results[i - 1].score < results[i].score) return false;
    }
    return true;
}

} // namespace

TEST_CASE("Hybrid search fuses both branches", "[hybrid][search]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking({"kb-001", "kb-005"});
    HybridSearcher searcher(handle, port, direct_config());

    auto results = searcher.search("E-4012 token expired", 3);
    REQUIRE(results.has_value());
    REQUIRE(results->size() == 3);
    REQUIRE(well_ranked(*results));

    // kb-001 is first in both lists.
    REQUIRE((*results)[0].doc_id == "kb-001");
    REQUIRE_THAT((*results)[0].score, WithinRel(2.0 / 61.0, 1e-12));
    REQUIRE((*results)[0].fields.title == "Resolving E-4012: Authentication Issue in EU");
    REQUIRE((*results)[0].fields.region == "EU");
    // kb-005 is dense rank 2 and also trails the sparse list; kb-002 is sparse rank 2 only.
    REQUIRE((*results)[1].doc_id == "kb-005");
    REQUIRE((*results)[2].doc_id == "kb-002");

    auto calls = port->calls();
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].top_k == 3 * kOverFetchMultiplier);
    REQUIRE_FALSE(calls[0].filtered);

    SECTION("repeat queries give identical results") {
        auto again = searcher.search("E-4012 token expired", 3);
        REQUIRE(again.has_value());
        REQUIRE(ids_of(*again) == ids_of(*results));
        for (std::size_t i = 0; i < again->size(); ++i) {
            REQUIRE((*again)[i].score == (*results)[i].score);
        }
    }

    SECTION("smaller top_k truncates the fused list") {
        auto one = searcher.search("E-4012 token expired", 1);
        REQUIRE(one.has_value());
        REQUIRE(ids_of(*one) == std::vector<std::string>{"kb-001"});
    }
}

TEST_CASE("Hybrid search applies the filter to both branches", "[hybrid][filter]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking(kAllIds);
    port->attach_corpus(handle->snapshot());
    HybridSearcher searcher(handle, port, direct_config());

    const auto eu = where(field::region, comparison::eq, "EU");
    auto report = searcher.search_detailed("E-4012 token expired", 2, &eu);
    REQUIRE(report.has_value());
    REQUIRE(report->query == QueryOutcome::ok);
    REQUIRE(report->dense == BranchOutcome::ok);
    REQUIRE(report->sparse == BranchOutcome::ok);
    REQUIRE(report->results.size() == 2);
    for (const auto& r : report->results) {
        REQUIRE(r.fields.region == "EU");
    }
    REQUIRE(report->results[0].doc_id == "kb-001");

    auto calls = port->calls();
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].filtered);
    REQUIRE(calls[0].top_k == 2 * kOverFetchMultiplier);
    REQUIRE(calls[0].filter_json == R"({"region":{"$eq":"EU"}})");
}

TEST_CASE("Extracted error codes do not narrow the filter", "[hybrid][filter]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking(kAllIds);
    port->attach_corpus(handle->snapshot());
    HybridSearcher searcher(handle, port, direct_config());

    Json::Value flat(Json::objectValue);
    flat["region"] = "EU";
    flat["error_codes"] = "E-9999";
    auto filter = filter_json::from_extracted_filters(flat);
    REQUIRE(filter.has_value());

    auto report = searcher.search_detailed("E-9999 token expired", 5, &*filter);
    REQUIRE(report.has_value());
    REQUIRE(report->query == QueryOutcome::ok);
    REQUIRE(report->sparse == BranchOutcome::ok);
    REQUIRE(ids_of(report->results) == std::vector<std::string>{"kb-001", "kb-003"});
    REQUIRE(searcher.get_stats().sparse_filter_fallbacks.load() == 0);
    REQUIRE(port->calls()[0].filter_json == R"({"region":{"$eq":"EU"}})");
}

TEST_CASE("Dense branch retries once without the filter", "[hybrid][fallback]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking({"kb-006", "kb-002"});
    HybridSearcher searcher(handle, port, direct_config());

    const auto eu = where(field::region, comparison::eq, "EU");

    SECTION("filtered failure recovers") {
        port->fail_filtered_calls(true);
        auto report = searcher.search_detailed("vpn tunnel", 3, &eu);
        REQUIRE(report.has_value());
        REQUIRE(report->dense == BranchOutcome::filter_dropped);
        REQUIRE(report->dense_candidates == 2);

        auto calls = port->calls();
        REQUIRE(calls.size() == 2);
        REQUIRE(calls[0].filtered);
        REQUIRE_FALSE(calls[1].filtered);

        auto stats = searcher.get_stats();
        REQUIRE(stats.dense_filter_retries.load() == 1);
        REQUIRE(stats.dense_searches.load() == 2);
        REQUIRE(stats.failed_queries.load() == 0);
    }

    SECTION("failure under a filter after the retry is fatal") {
        port->fail_all_calls(true);
        auto r = searcher.search("vpn tunnel", 3, &eu);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::unavailable);
        REQUIRE(port->calls().size() == 2);
    }

    SECTION("unfiltered failure is fatal without a retry") {
        port->fail_all_calls(true);
        auto r = searcher.search("vpn tunnel", 3);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::unavailable);
        REQUIRE(port->calls().size() == 1);

        auto stats = searcher.get_stats();
        REQUIRE(stats.failed_queries.load() == 1);
        REQUIRE(stats.sparse_searches.load() == 0);
    }

    SECTION("a throwing port is reported as unavailable") {
        port->throw_on_call(true);
        auto r = searcher.search("vpn tunnel", 3);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::unavailable);
        REQUIRE(r.error().message.find("connection reset") != std::string::npos);
    }
}

TEST_CASE("Sparse branch falls back to unfiltered BM25", "[hybrid][fallback]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking(kAllIds);
    port->attach_corpus(handle->snapshot());
    HybridSearcher searcher(handle, port, direct_config());

    // No article is both EU and networking.
    const auto none = all_of({where(field::region, comparison::eq, "EU"),
                              where(field::category, comparison::eq, "networking")});
    auto report = searcher.search_detailed("vpn tunnel timeouts", 1, &none);
    REQUIRE(report.has_value());
    REQUIRE(report->query == QueryOutcome::ok);
    REQUIRE(report->dense == BranchOutcome::ok);
    REQUIRE(report->dense_candidates == 0);
    REQUIRE(report->sparse == BranchOutcome::filter_dropped);
    REQUIRE(report->sparse_candidates == 1 * kOverFetchMultiplier);
    REQUIRE(report->results.size() == 1);
    REQUIRE(report->results[0].doc_id == "kb-006");

    auto stats = searcher.get_stats();
    REQUIRE(stats.sparse_filter_fallbacks.load() == 1);
    REQUIRE(stats.sparse_searches.load() == 2);
    REQUIRE(stats.unfiltered_retries.load() == 0);
}

TEST_CASE("Empty filtered result is retried without the filter", "[hybrid][fallback]") {
    auto handle = std::make_shared<IndexHandle>();
    REQUIRE(handle->rebuild({}).has_value());
    auto port = std::make_shared<FakeVectorPort>();
    port->attach_corpus(handle->snapshot());
    HybridSearcher searcher(handle, port, direct_config());

    const auto eu = where(field::region, comparison::eq, "EU");

    SECTION("the unfiltered pass finds results") {
        port->set_ranking({"ext-1", "ext-2"});
        auto report = searcher.search_detailed("anything", 5, &eu);
        REQUIRE(report.has_value());
        REQUIRE(report->query == QueryOutcome::unfiltered_retry);
        REQUIRE(ids_of(report->results) == std::vector<std::string>{"ext-1", "ext-2"});
        REQUIRE(well_ranked(report->results));
        // Unknown to the corpus: display fields stay empty.
        REQUIRE(report->results[0].fields.title.empty());

        auto calls = port->calls();
        REQUIRE(calls.size() == 2);
        REQUIRE(calls[0].filtered);
        REQUIRE_FALSE(calls[1].filtered);
        REQUIRE(searcher.get_stats().unfiltered_retries.load() == 1);
    }

    SECTION("nothing anywhere is an empty success") {
        auto report = searcher.search_detailed("anything", 5, &eu);
        REQUIRE(report.has_value());
        REQUIRE(report->results.empty());
        REQUIRE(report->query == QueryOutcome::unfiltered_retry);
    }

    SECTION("no filter means no retry") {
        auto report = searcher.search_detailed("anything", 5);
        REQUIRE(report.has_value());
        REQUIRE(report->results.empty());
        REQUIRE(report->query == QueryOutcome::ok);
        REQUIRE(port->calls().size() == 1);
    }
}

TEST_CASE("Hybrid search rejects bad requests before searching", "[hybrid][errors]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking(kAllIds);

    SECTION("malformed filter") {
        HybridSearcher searcher(handle, port, direct_config());
        const auto bad = where(field::deprecated, comparison::eq, "false");
        auto r = searcher.search("sso", 3, &bad);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::malformed_predicate);
        REQUIRE(port->calls().empty());
    }

    SECTION("no index installed") {
        HybridSearcher searcher(std::make_shared<IndexHandle>(), port, direct_config());
        auto r = searcher.search("sso", 3);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::index_unavailable);
        REQUIRE(port->calls().empty());
    }

    SECTION("no vector port") {
        HybridSearcher searcher(handle, nullptr, direct_config());
        auto r = searcher.search("sso", 3);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::precondition_failed);
    }

    SECTION("top_k of zero") {
        HybridSearcher searcher(handle, port, direct_config());
        auto r = searcher.search("sso", 0);
        REQUIRE(r.has_value());
        REQUIRE(r->empty());
        REQUIRE(port->calls().empty());
        REQUIRE(searcher.get_stats().sparse_searches.load() == 0);
    }
    SECTION("invalid config") {
        auto cfg = direct_config();
        cfg.rrf_k = -1.0;
        HybridSearcher searcher(handle, port, cfg);
        auto r = searcher.search("sso", 3);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::config_invalid);
        REQUIRE(port->calls().empty());
        REQUIRE(searcher.get_stats().failed_queries.load() == 1);

        auto batch = searcher.batch_search({"sso"}, 3);
        REQUIRE_FALSE(batch.has_value());
        REQUIRE(batch.error().code == core::error_code::config_invalid);
    }
}

TEST_CASE("Default result count comes from the config", "[hybrid][config]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking(kAllIds);
    port->attach_corpus(handle->snapshot());
    auto cfg = direct_config();
    cfg.default_top_k = 2;
    HybridSearcher searcher(handle, port, cfg);

    SECTION("unfiltered") {
        auto r = searcher.search("E-4012 token expired");
        REQUIRE(r.has_value());
        REQUIRE(r->size() == 2);
        REQUIRE(port->calls()[0].top_k == 2 * kOverFetchMultiplier);
    }

    SECTION("filtered") {
        const auto eu = where(field::region, comparison::eq, "EU");
        auto r = searcher.search("E-4012 token expired", eu);
        REQUIRE(r.has_value());
        REQUIRE(r->size() == 2);
        for (const auto& rec : *r) REQUIRE(rec.fields.region == "EU");
        REQUIRE(port->calls()[0].filtered);
    }
}

TEST_CASE("Dense results are normalised", "[hybrid][dense]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking({"kb-005", "kb-006", "kb-004", "kb-003", "kb-002"});
    port->set_reported_rank(9);
    port->ignore_top_k(true);
    HybridSearcher searcher(handle, port, direct_config());

    auto report = searcher.search_detailed("zzz", 1);
    REQUIRE(report.has_value());
    // The port over-delivered; the branch keeps 3 * top_k.
    REQUIRE(report->dense_candidates == 1 * kOverFetchMultiplier);
    REQUIRE(report->results.size() == 1);

    // Reported rank 9 is replaced by position: 1 / (60 + 1).
    const auto& top = report->results[0];
    REQUIRE(top.doc_id == "kb-005");
    REQUIRE_THAT(top.score, WithinRel(1.0 / 61.0, 1e-12));
    // The port sent no display data; it is filled in from the corpus.
    REQUIRE(top.fields.title == "Deployment rollback procedure");
    REQUIRE(top.fields.region == "US");
    REQUIRE(top.fields.category == "deployment");
    REQUIRE_FALSE(top.fields.deprecated);
}

TEST_CASE("Dense branch deadline", "[hybrid][timeout]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking(kAllIds);
    port->block_calls();

    retrieval_config cfg;
    cfg.dense_timeout = std::chrono::milliseconds(50);
    HybridSearcher searcher(handle, port, cfg);

    auto r = searcher.search("sso", 3);
    port->release();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::deadline_exceeded);
    REQUIRE(searcher.get_stats().failed_queries.load() == 1);
    REQUIRE(searcher.get_stats().dense_timeouts.load() == 1);

    SECTION("answers inside the deadline are used") {
        cfg.dense_timeout = std::chrono::milliseconds(5000);
        HybridSearcher patient(handle, port, cfg);
        auto ok = patient.search("sso", 3);
        REQUIRE(ok.has_value());
        REQUIRE(ok->size() == 3);
    }
}

TEST_CASE("A filtered call past the deadline is retried without the filter", "[hybrid][timeout]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking(kAllIds);
    port->attach_corpus(handle->snapshot());
    port->block_filtered_calls();

    retrieval_config cfg;
    cfg.dense_timeout = std::chrono::milliseconds(200);
    HybridSearcher searcher(handle, port, cfg);

    const auto eu = where(field::region, comparison::eq, "EU");
    auto report = searcher.search_detailed("E-4012 token expired", 2, &eu);
    port->release();
    REQUIRE(report.has_value());
    REQUIRE(report->dense == BranchOutcome::filter_dropped);
    REQUIRE(report->sparse == BranchOutcome::ok);
    REQUIRE(report->dense_candidates == 2 * kOverFetchMultiplier);
    REQUIRE_FALSE(report->results.empty());
    REQUIRE(report->results[0].doc_id == "kb-001");

    auto stats = searcher.get_stats();
    REQUIRE(stats.dense_filter_retries.load() == 1);
    REQUIRE(stats.dense_timeouts.load() == 1);
    REQUIRE(stats.dense_searches.load() == 2);
    REQUIRE(stats.failed_queries.load() == 0);

    auto calls = port->calls();
    REQUIRE(calls.size() == 2);
    REQUIRE(calls[0].filtered);
    REQUIRE_FALSE(calls[1].filtered);
}

TEST_CASE("Parallel branches match sequential execution", "[hybrid][parallel]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking({"kb-004", "kb-001", "kb-006"});
    port->attach_corpus(handle->snapshot());

    auto parallel_cfg = direct_config();
    parallel_cfg.parallel_branches = true;
    HybridSearcher sequential(handle, port, direct_config());
    HybridSearcher parallel(handle, port, parallel_cfg);

    const auto auth = where(field::category, comparison::eq, "authentication");
    for (const filter_expr* filter : {static_cast<const filter_expr*>(nullptr), &auth}) {
        auto a = sequential.search("E-4012 token expired sso", 4, filter);
        auto b = parallel.search("E-4012 token expired sso", 4, filter);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(ids_of(*a) == ids_of(*b));
        for (std::size_t i = 0; i < a->size(); ++i) {
            REQUIRE((*a)[i].score == (*b)[i].score);
        }
    }

    SECTION("dense failure still fails the query") {
        port->fail_all_calls(true);
        auto r = parallel.search("sso", 3);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::unavailable);
    }
}

TEST_CASE("Batch search", "[hybrid][batch]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking({"kb-003", "kb-005"});
    HybridSearcher searcher(handle, port, direct_config());

    const std::vector<std::string> queries{"E-4012 token expired", "invoice billing", "rollback"};

    SECTION("results match individual searches") {
        auto batch = searcher.batch_search(queries, 2);
        REQUIRE(batch.has_value());
        REQUIRE(batch->size() == queries.size());
        for (std::size_t i = 0; i < queries.size(); ++i) {
            auto single = searcher.search(queries[i], 2);
            REQUIRE(single.has_value());
            REQUIRE(ids_of((*batch)[i]) == ids_of(*single));
        }
        REQUIRE(searcher.get_stats().batch_queries.load() == 1);
    }

    SECTION("any failure fails the batch") {
        port->fail_all_calls(true);
        auto batch = searcher.batch_search(queries, 2);
        REQUIRE_FALSE(batch.has_value());
        REQUIRE(batch.error().code == core::error_code::unavailable);
        REQUIRE(searcher.get_stats().failed_queries.load() == queries.size());
    }

    SECTION("empty batch") {
        auto batch = searcher.batch_search({}, 2);
        REQUIRE(batch.has_value());
        REQUIRE(batch->empty());
    }
}

TEST_CASE("A query keeps its snapshot across a rebuild", "[hybrid][snapshot]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->block_calls();
    HybridSearcher searcher(handle, port, direct_config());

    auto pending = std::async(std::launch::async, [&searcher]() {
        return searcher.search("E-4012 token expired", 2);
    });
    port->wait_for_calls(1);

    // Replace the corpus while the query is inside the dense branch.
    auto replacement = kb_test_helpers::small_kb();
    replacement.erase(replacement.begin(), replacement.begin() + 4);
    REQUIRE(handle->rebuild(std::move(replacement)).has_value());
    port->release();

    auto results = pending.get();
    REQUIRE(results.has_value());
    REQUIRE(ids_of(*results) == std::vector<std::string>{"kb-001", "kb-002"});

    auto after = searcher.search("E-4012 token expired", 2);
    REQUIRE(after.has_value());
    for (const auto& r : *after) {
        REQUIRE((r.doc_id == "kb-005" || r.doc_id == "kb-006"));
    }
}

TEST_CASE("Hybrid search statistics", "[hybrid][stats]") {
    auto handle = kb_handle();
    auto port = std::make_shared<FakeVectorPort>();
    port->set_ranking(kAllIds);
    HybridSearcher searcher(handle, port, direct_config());

    REQUIRE(searcher.search("sso", 2).has_value());
    REQUIRE(searcher.search("billing", 2).has_value());

    auto stats = searcher.get_stats();
    REQUIRE(stats.total_queries.load() == 2);
    REQUIRE(stats.dense_searches.load() == 2);
    REQUIRE(stats.sparse_searches.load() == 2);
    REQUIRE(stats.failed_queries.load() == 0);
    REQUIRE(searcher.config().rrf_k == 60.0);
}

TEST_CASE("Outcome names", "[hybrid]") {
    REQUIRE(to_string(BranchOutcome::ok) == "ok");
    REQUIRE(to_string(BranchOutcome::filter_dropped) == "filter_dropped");
    REQUIRE(to_string(QueryOutcome::unfiltered_retry) == "unfiltered_retry");
}
