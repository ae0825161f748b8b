#include "hybridkb/corpus_loader.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <unordered_set>
#include <utility>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "json_util.hpp"

namespace hybridkb {

namespace {

constexpr const char* kComponent = "corpus.loader";

constexpr std::array<std::string_view, 3> kRegions{"EU", "US", "APAC"};
constexpr std::array<std::string_view, 3> kVersions{"v1.0", "v2.0", "v3.0"};
constexpr std::array<std::string_view, 4> kCategories{"authentication", "billing", "deployment",
                                                      "networking"};

template <std::size_t N>
auto one_of(const std::array<std::string_view, N>& allowed, std::string_view v) -> bool {
    return std::find(allowed.begin(), allowed.end(), v) != allowed.end();
}

auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

// YYYY-MM-DD with month 01-12 and day 01-31.
auto is_iso_date(std::string_view s) -> bool {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for (std::size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (!is_digit(s[i])) return false;
    }
    const int month = (s[5] - '0') * 10 + (s[6] - '0');
    const int day = (s[8] - '0') * 10 + (s[9] - '0');
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

// E-#### (four digits).
auto is_error_code(std::string_view s) -> bool {
    return s.size() == 6 && s[0] == 'E' && s[1] == '-' && is_digit(s[2]) && is_digit(s[3]) &&
           is_digit(s[4]) && is_digit(s[5]);
}

auto bad_record(std::size_t index, std::string_view doc_id, const std::string& what)
    -> std::unexpected<core::error> {
    std::string msg = "record " + std::to_string(index);
    if (!doc_id.empty()) msg.append(" (").append(doc_id).append(")");
    msg.append(": ").append(what);
    return core::make_error(core::error_code::data_integrity, std::move(msg), kComponent);
}

auto optional_string(const Json::Value& obj, const char* key, std::size_t index,
                     std::string_view doc_id)
    -> std::expected<std::optional<std::string>, core::error> {
    if (!obj.isMember(key) || obj[key].isNull()) return std::optional<std::string>{};
    if (!obj[key].isString()) return bad_record(index, doc_id, std::string(key) + " must be a string");
    return std::optional<std::string>{obj[key].asString()};
}

auto decode_document(const Json::Value& obj, std::size_t index) -> std::expected<document, core::error> {
    if (!obj.isObject()) return bad_record(index, {}, "not an object");

    document doc;
    if (!obj.isMember("doc_id") || !obj["doc_id"].isString()) {
        return bad_record(index, {}, "doc_id must be a string");
    }
    doc.doc_id = obj["doc_id"].asString();

    for (const char* key : {"title", "body"}) {
        if (!obj.isMember(key) || !obj[key].isString()) {
            return bad_record(index, doc.doc_id, std::string(key) + " must be a string");
        }
    }
    doc.title = obj["title"].asString();
    doc.body = obj["body"].asString();

    auto& meta = doc.metadata;
    auto region = optional_string(obj, "region", index, doc.doc_id);
    if (!region) return std::unexpected(region.error());
    meta.region = std::move(*region);

    auto version = optional_string(obj, "product_version", index, doc.doc_id);
    if (!version) return std::unexpected(version.error());
    meta.product_version = std::move(*version);

    auto category = optional_string(obj, "category", index, doc.doc_id);
    if (!category) return std::unexpected(category.error());
    meta.category = std::move(*category);

    auto date = optional_string(obj, "effective_date", index, doc.doc_id);
    if (!date) return std::unexpected(date.error());
    meta.effective_date = std::move(*date);

    if (obj.isMember("deprecated") && !obj["deprecated"].isNull()) {
        if (!obj["deprecated"].isBool()) return bad_record(index, doc.doc_id, "deprecated must be a boolean");
        meta.deprecated = obj["deprecated"].asBool();
    }

    if (obj.isMember("error_codes") && !obj["error_codes"].isNull()) {
        const auto& codes = obj["error_codes"];
        if (!codes.isArray()) return bad_record(index, doc.doc_id, "error_codes must be an array");
        for (const auto& code : codes) {
            if (!code.isString()) return bad_record(index, doc.doc_id, "error code must be a string");
            meta.error_codes.push_back(code.asString());
        }
    }
    return doc;
}

} // namespace

auto validate_document(const document& doc) -> std::expected<void, core::error> {
    auto fail = [&doc](const std::string& what) {
        return core::make_error(core::error_code::data_integrity, doc.doc_id + ": " + what, kComponent);
    };
    const auto& meta = doc.metadata;

    if (doc.doc_id.empty()) {
        return core::make_error(core::error_code::data_integrity, "empty doc_id", kComponent);
    }
    if (meta.region && !one_of(kRegions, *meta.region)) return fail("unknown region '" + *meta.region + "'");
    if (meta.product_version && !one_of(kVersions, *meta.product_version)) {
        return fail("unknown product_version '" + *meta.product_version + "'");
    }
    if (meta.category && !one_of(kCategories, *meta.category)) {
        return fail("unknown category '" + *meta.category + "'");
    }
    if (meta.effective_date && !is_iso_date(*meta.effective_date)) {
        return fail("effective_date '" + *meta.effective_date + "' is not YYYY-MM-DD");
    }
    for (const auto& code : meta.error_codes) {
        if (!is_error_code(code)) return fail("error code '" + code + "' is not E-####");
    }
    return {};
}

auto parse_documents(std::string_view json_text) -> std::expected<std::vector<document>, core::error> {
    auto root = detail::parse_json_text(json_text, core::error_code::data_integrity, kComponent);
    if (!root) return std::unexpected(root.error());
    if (!root->isArray()) {
        return core::make_error(core::error_code::data_integrity, "corpus must be a JSON array", kComponent);
    }

    std::vector<document> docs;
    docs.reserve(root->size());
    std::unordered_set<std::string> seen;
    for (Json::ArrayIndex i = 0; i < root->size(); ++i) {
        auto doc = decode_document((*root)[i], i);
        if (!doc) return std::unexpected(doc.error());
        if (auto ok = validate_document(*doc); !ok) return std::unexpected(ok.error());
        if (!seen.insert(doc->doc_id).second) {
            return bad_record(i, doc->doc_id, "duplicate doc_id");
        }
        docs.push_back(std::move(*doc));
    }
    return docs;
}

auto load_documents(const std::string& path) -> std::expected<std::vector<document>, core::error> {
    auto text = detail::read_text_file(path, kComponent);
    if (!text) return std::unexpected(text.error());
    auto docs = parse_documents(*text);
    if (!docs) return docs;
    spdlog::info("loaded {} articles from {}", docs->size(), path);
    return docs;
}

} // namespace hybridkb
