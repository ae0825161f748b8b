#include "hybridkb/index/corpus_index.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace hybridkb::index {

CorpusIndex::CorpusIndex(std::vector<document> docs, std::vector<filter_eval::metadata_record> records,
                         std::unordered_map<std::string, std::uint32_t> by_id, BM25Index bm25)
    : docs_(std::move(docs)),
      records_(std::move(records)),
      by_id_(std::move(by_id)),
      bm25_(std::move(bm25)) {}

auto CorpusIndex::build(std::vector<document> docs, const BM25Params& params)
    -> std::expected<std::shared_ptr<const CorpusIndex>, core::error> {

    std::unordered_map<std::string, std::uint32_t> by_id;
    by_id.reserve(docs.size());
    std::vector<filter_eval::metadata_record> records;
    records.reserve(docs.size());

    for (std::size_t i = 0; i < docs.size(); ++i) {
        const auto& doc = docs[i];
        if (!by_id.emplace(doc.doc_id, static_cast<std::uint32_t>(i)).second) {
            return core::make_error(core::error_code::data_integrity,
                                    "duplicate doc_id '" + doc.doc_id + "'", "corpus.index");
        }
        records.push_back(filter_eval::metadata_record::from(doc.metadata));
    }

    auto bm25 = BM25Index::build(docs, params);
    if (!bm25) return std::unexpected(bm25.error());

    const auto stats = bm25->get_stats();
    spdlog::info("corpus index built: {} documents, {} terms, avg length {:.1f} tokens",
                 stats.num_documents, stats.vocabulary_size, stats.avg_doc_length);

    return std::shared_ptr<const CorpusIndex>(
        new CorpusIndex(std::move(docs), std::move(records), std::move(by_id), std::move(*bm25)));
}

auto CorpusIndex::find(std::string_view doc_id) const -> std::optional<std::uint32_t> {
    auto it = by_id_.find(std::string(doc_id));
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
}

} // namespace hybridkb::index
