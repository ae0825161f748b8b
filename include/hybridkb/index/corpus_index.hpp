#pragma once

/** \file corpus_index.hpp
 *  \brief Immutable corpus snapshot: documents, flattened metadata and the BM25 index.
 *
 * Built once from an ordered document list and shared read-only between concurrent
 * queries through std::shared_ptr<const CorpusIndex>. Corpus order (the ordinal) is the
 * tie-break order of the sparse ranking.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "hybridkb/document.hpp"
#include "hybridkb/error.hpp"
#include "hybridkb/filter_eval.hpp"
#include "hybridkb/index/bm25.hpp"

namespace hybridkb::index {

class CorpusIndex {
public:
    /** \brief Index a corpus.
     *
     * \return data_integrity if two documents share a doc_id; invalid_argument for bad params
     */
    static auto build(std::vector<document> docs, const BM25Params& params = {})
        -> std::expected<std::shared_ptr<const CorpusIndex>, core::error>;

    auto size() const noexcept -> std::size_t { return docs_.size(); }
    auto empty() const noexcept -> bool { return docs_.empty(); }

    auto documents() const noexcept -> const std::vector<document>& { return docs_; }
    auto document_at(std::uint32_t ordinal) const -> const document& { return docs_.at(ordinal); }
    auto record_at(std::uint32_t ordinal) const -> const filter_eval::metadata_record& {
        return records_.at(ordinal);
    }

    /** \brief Ordinal of a doc_id, if present. */
    auto find(std::string_view doc_id) const -> std::optional<std::uint32_t>;

    auto sparse() const noexcept -> const BM25Index& { return bm25_; }

private:
    CorpusIndex(std::vector<document> docs, std::vector<filter_eval::metadata_record> records,
                std::unordered_map<std::string, std::uint32_t> by_id, BM25Index bm25);

    std::vector<document> docs_;
    std::vector<filter_eval::metadata_record> records_;
    std::unordered_map<std::string, std::uint32_t> by_id_;
    BM25Index bm25_;
};

} // namespace hybridkb::index
