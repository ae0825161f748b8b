#include "hybridkb/search/eval_metrics.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>
#include <utility>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "hybridkb/filter_json.hpp"
#include "json_util.hpp"

namespace hybridkb::search::eval {

namespace {

constexpr const char* kComponent = "eval";

auto bad_entry(std::size_t index, const std::string& what) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::data_integrity,
                            "eval entry " + std::to_string(index) + ": " + what, kComponent);
}

auto summarize(std::string name, const std::vector<const QueryResult*>& rows) -> CategorySummary {
    CategorySummary s;
    s.category = std::move(name);
    s.queries = rows.size();
    if (rows.empty()) return s;
    for (const auto* r : rows) {
        s.recall_at_5 += r->recall_at_5;
        s.recall_at_10 += r->recall_at_10;
        s.mrr += r->mrr;
    }
    const auto n = static_cast<double>(rows.size());
    s.recall_at_5 /= n;
    s.recall_at_10 /= n;
    s.mrr /= n;
    return s;
}

auto summary_json(const CategorySummary& s) -> Json::Value {
    Json::Value v(Json::objectValue);
    v["category"] = s.category;
    v["queries"] = static_cast<Json::UInt64>(s.queries);
    v["recall_at_5"] = s.recall_at_5;
    v["recall_at_10"] = s.recall_at_10;
    v["mrr"] = s.mrr;
    return v;
}

} // namespace

auto recall_at_k(const std::vector<std::string>& retrieved,
                 const std::vector<std::string>& expected, std::size_t k) -> double {
    if (expected.empty()) return 1.0;
    const auto end = retrieved.begin() + static_cast<std::ptrdiff_t>(std::min(k, retrieved.size()));
    const std::unordered_set<std::string> top(retrieved.begin(), end);
    const auto found = std::count_if(expected.begin(), expected.end(),
                                     [&top](const std::string& id) { return top.contains(id); });
    return static_cast<double>(found) / static_cast<double>(expected.size());
}

auto reciprocal_rank(const std::vector<std::string>& retrieved,
                     const std::vector<std::string>& expected) -> double {
    const std::unordered_set<std::string> wanted(expected.begin(), expected.end());
    for (std::size_t i = 0; i < retrieved.size(); ++i) {
        if (wanted.contains(retrieved[i])) return 1.0 / static_cast<double>(i + 1);
    }
    return 0.0;
}

auto parse_eval_set(std::string_view json_text) -> std::expected<std::vector<EvalQuery>, core::error> {
    auto root = detail::parse_json_text(json_text, core::error_code::data_integrity, kComponent);
    if (!root) return std::unexpected(root.error());
    if (!root->isArray()) {
        return core::make_error(core::error_code::data_integrity, "eval set must be a JSON array", kComponent);
    }

    std::vector<EvalQuery> out;
    out.reserve(root->size());
    for (Json::ArrayIndex i = 0; i < root->size(); ++i) {
        const auto& e = (*root)[i];
        if (!e.isObject()) return bad_entry(i, "not an object");
        for (const char* key : {"query_id", "query", "category"}) {
            if (!e.isMember(key) || !e[key].isString()) {
                return bad_entry(i, std::string(key) + " must be a string");
            }
        }
        if (!e.isMember("expected_doc_ids") || !e["expected_doc_ids"].isArray()) {
            return bad_entry(i, "expected_doc_ids must be an array");
        }

        EvalQuery q;
        q.query_id = e["query_id"].asString();
        q.query = e["query"].asString();
        q.category = e["category"].asString();
        for (const auto& id : e["expected_doc_ids"]) {
            if (!id.isString()) return bad_entry(i, "expected_doc_ids must hold strings");
            q.expected_doc_ids.push_back(id.asString());
        }
        if (e.isMember("filters") && !e["filters"].isNull()) {
            if (!e["filters"].isObject()) return bad_entry(i, "filters must be an object");
            q.filter = filter_json::from_extracted_filters(e["filters"]);
        }
        out.push_back(std::move(q));
    }
    return out;
}

auto load_eval_set(const std::string& path) -> std::expected<std::vector<EvalQuery>, core::error> {
    auto text = detail::read_text_file(path, kComponent);
    if (!text) return std::unexpected(text.error());
    return parse_eval_set(*text);
}

auto evaluate(HybridSearcher& searcher, const std::vector<EvalQuery>& queries, std::size_t top_k)
    -> EvalReport {
    EvalReport report;
    report.queries.reserve(queries.size());

    for (const auto& q : queries) {
        QueryResult r;
        r.query_id = q.query_id;
        r.category = q.category;

        auto found = searcher.search(q.query, top_k, q.filter ? &*q.filter : nullptr);
        if (!found) {
            spdlog::warn("eval query {} failed ({}): {}", q.query_id,
                         core::to_string(found.error().code), found.error().message);
            r.error = found.error().message;
        } else {
            for (const auto& rec : *found) r.retrieved_doc_ids.push_back(rec.doc_id);
            r.recall_at_5 = recall_at_k(r.retrieved_doc_ids, q.expected_doc_ids, 5);
            r.recall_at_10 = recall_at_k(r.retrieved_doc_ids, q.expected_doc_ids, 10);
            r.mrr = reciprocal_rank(r.retrieved_doc_ids, q.expected_doc_ids);
        }
        report.queries.push_back(std::move(r));
    }

    std::map<std::string, std::vector<const QueryResult*>> by_category;
    std::vector<const QueryResult*> all;
    all.reserve(report.queries.size());
    for (const auto& r : report.queries) {
        by_category[r.category].push_back(&r);
        all.push_back(&r);
    }
    for (const auto& [name, rows] : by_category) {
        report.categories.push_back(summarize(name, rows));
    }
    report.overall = summarize("overall", all);
    return report;
}

auto to_json(const EvalReport& report) -> Json::Value {
    Json::Value out(Json::objectValue);

    Json::Value rows(Json::arrayValue);
    for (const auto& r : report.queries) {
        Json::Value v(Json::objectValue);
        v["query_id"] = r.query_id;
        v["category"] = r.category;
        Json::Value ids(Json::arrayValue);
        for (const auto& id : r.retrieved_doc_ids) ids.append(id);
        v["retrieved_doc_ids"] = ids;
        v["recall_at_5"] = r.recall_at_5;
        v["recall_at_10"] = r.recall_at_10;
        v["mrr"] = r.mrr;
        if (r.error) v["error"] = *r.error;
        rows.append(v);
    }
    out["queries"] = rows;

    Json::Value cats(Json::arrayValue);
    for (const auto& c : report.categories) cats.append(summary_json(c));
    out["categories"] = cats;
    out["overall"] = summary_json(report.overall);
    return out;
}

} // namespace hybridkb::search::eval
