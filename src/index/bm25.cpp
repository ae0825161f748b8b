#include "hybridkb/index/bm25.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_map>

#include <roaring/roaring.hh>

#include "hybridkb/index/tokenizer.hpp"

namespace hybridkb::index {

namespace {

constexpr const char* kComponent = "bm25";

auto indexed_text(const document& doc) -> std::string {
    std::string text;
    text.reserve(doc.title.size() + 1 + doc.body.size());
    text.append(doc.title).append(" ").append(doc.body);
    return text;
}

} // anonymous namespace

// BM25Index::Impl class definition

class BM25Index::Impl {
public:
    Impl() = default;

    auto build(const std::vector<document>& docs, const BM25Params& params)
        -> std::expected<void, core::error>;

    auto accumulate(std::string_view query, std::vector<double>& scores) const -> void;
    auto idf(std::string_view term) const -> double;
    auto document_frequency(std::string_view term) const -> std::uint32_t;
    auto get_stats() const noexcept -> BM25Stats;

    auto size() const noexcept -> std::size_t { return doc_lengths_.size(); }
    auto vocabulary_size() const noexcept -> std::size_t { return term_to_id_.size(); }
    auto avg_doc_length() const noexcept -> double { return avg_doc_length_; }
    auto params() const noexcept -> const BM25Params& { return params_; }

private:
    // Term to term ID mapping
    std::unordered_map<std::string, std::uint32_t> term_to_id_;

    // Inverted index: term_id -> ordinals, with term frequencies in ascending ordinal order
    std::vector<roaring::Roaring> inverted_index_;
    std::vector<std::vector<std::uint32_t>> posting_tfs_;

    // Document frequency and floored IDF for each term
    std::vector<std::uint32_t> doc_freqs_;
    std::vector<double> idf_;

    // Per-document length in tokens, by ordinal
    std::vector<std::uint32_t> doc_lengths_;

    // Global statistics
    double avg_doc_length_{0.0};
    std::size_t total_tokens_{0};

    BM25Params params_;

    auto get_or_create_term_id(const std::string& term) -> std::uint32_t;
    auto compute_idf() -> void;
};

auto BM25Index::Impl::get_or_create_term_id(const std::string& term) -> std::uint32_t {
    auto it = term_to_id_.find(term);
    if (it != term_to_id_.end()) {
        return it->second;
    }

    const auto id = static_cast<std::uint32_t>(term_to_id_.size());
    term_to_id_.emplace(term, id);
    inverted_index_.emplace_back();
    posting_tfs_.emplace_back();
    doc_freqs_.push_back(0);

    return id;
}

auto BM25Index::Impl::build(const std::vector<document>& docs, const BM25Params& params)
    -> std::expected<void, core::error> {

    if (!(params.k1 > 0.0)) {
        return core::make_error(core::error_code::invalid_argument, "k1 must be positive", kComponent);
    }
    if (!(params.b >= 0.0 && params.b <= 1.0)) {
        return core::make_error(core::error_code::invalid_argument, "b must be between 0 and 1", kComponent);
    }
    if (!(params.epsilon >= 0.0)) {
        return core::make_error(core::error_code::invalid_argument, "epsilon must be non-negative", kComponent);
    }
    if (docs.size() > std::numeric_limits<std::uint32_t>::max()) {
        return core::make_error(core::error_code::invalid_argument, "corpus too large", kComponent);
    }

    params_ = params;
    doc_lengths_.reserve(docs.size());

    std::unordered_map<std::uint32_t, std::uint32_t> term_counts;
    for (std::uint32_t ordinal = 0; ordinal < docs.size(); ++ordinal) {
        const auto tokens = Tokenizer::tokenize(indexed_text(docs[ordinal]));

        term_counts.clear();
        for (const auto& token : tokens) {
            term_counts[get_or_create_term_id(token)]++;
        }

        // Ordinals are visited in ascending order, so each posting tf vector stays
        // aligned with its bitmap's iteration order.
        for (const auto& [term_id, count] : term_counts) {
            inverted_index_[term_id].add(ordinal);
            posting_tfs_[term_id].push_back(count);
            doc_freqs_[term_id]++;
        }

        doc_lengths_.push_back(static_cast<std::uint32_t>(tokens.size()));
        total_tokens_ += tokens.size();
    }

    for (auto& bitmap : inverted_index_) bitmap.runOptimize();

    if (!doc_lengths_.empty()) {
        avg_doc_length_ = static_cast<double>(total_tokens_) / static_cast<double>(doc_lengths_.size());
    }
    compute_idf();
    return {};
}

auto BM25Index::Impl::compute_idf() -> void {
    const auto n = static_cast<double>(doc_lengths_.size());
    idf_.assign(doc_freqs_.size(), 0.0);
    if (idf_.empty()) return;

    double idf_sum = 0.0;
    std::vector<std::uint32_t> negative;
    for (std::uint32_t term_id = 0; term_id < doc_freqs_.size(); ++term_id) {
        const auto df = static_cast<double>(doc_freqs_[term_id]);
        const double value = std::log(n - df + 0.5) - std::log(df + 0.5);
        idf_[term_id] = value;
        idf_sum += value;
        if (value < 0.0) negative.push_back(term_id);
    }

    // Terms present in more than half the corpus would otherwise score negatively.
    const double floor = params_.epsilon * (idf_sum / static_cast<double>(idf_.size()));
    for (std::uint32_t term_id : negative) idf_[term_id] = floor;
}

auto BM25Index::Impl::accumulate(std::string_view query, std::vector<double>& scores) const -> void {
    const double k1 = params_.k1;
    const double b = params_.b;

    for (const auto& token : Tokenizer::tokenize(query)) {
        auto it = term_to_id_.find(token);
        if (it == term_to_id_.end()) continue;

        const std::uint32_t term_id = it->second;
        const double term_idf = idf_[term_id];
        const auto& tfs = posting_tfs_[term_id];

        std::size_t i = 0;
        for (std::uint32_t ordinal : inverted_index_[term_id]) {
            const double tf = static_cast<double>(tfs[i++]);
            const double length_term = avg_doc_length_ > 0.0
                ? b * static_cast<double>(doc_lengths_[ordinal]) / avg_doc_length_
                : 0.0;
            scores[ordinal] += term_idf * (tf * (k1 + 1.0) / (tf + k1 * (1.0 - b + length_term)));
        }
    }
}

auto BM25Index::Impl::idf(std::string_view term) const -> double {
    auto it = term_to_id_.find(std::string(term));
    return it == term_to_id_.end() ? 0.0 : idf_[it->second];
}

auto BM25Index::Impl::document_frequency(std::string_view term) const -> std::uint32_t {
    auto it = term_to_id_.find(std::string(term));
    return it == term_to_id_.end() ? 0u : doc_freqs_[it->second];
}

auto BM25Index::Impl::get_stats() const noexcept -> BM25Stats {
    BM25Stats stats;
    stats.num_documents = doc_lengths_.size();
    stats.vocabulary_size = term_to_id_.size();
    stats.total_tokens = total_tokens_;
    stats.avg_doc_length = avg_doc_length_;

    // Estimate memory usage
    stats.memory_bytes = sizeof(*this);
    stats.memory_bytes += term_to_id_.size() * (32 + sizeof(std::uint32_t));  // Approx
    for (const auto& bitmap : inverted_index_) {
        stats.memory_bytes += bitmap.getSizeInBytes();
    }
    for (const auto& tfs : posting_tfs_) {
        stats.memory_bytes += tfs.capacity() * sizeof(std::uint32_t);
    }
    stats.memory_bytes += doc_lengths_.capacity() * sizeof(std::uint32_t);
    stats.memory_bytes += idf_.capacity() * (sizeof(double) + sizeof(std::uint32_t));

    return stats;
}

// BM25Index implementation (forwarding to Impl)

BM25Index::BM25Index() : impl_(std::make_unique<Impl>()) {}
BM25Index::~BM25Index() = default;
BM25Index::BM25Index(BM25Index&&) noexcept = default;
BM25Index& BM25Index::operator=(BM25Index&&) noexcept = default;

auto BM25Index::build(const std::vector<document>& docs, const BM25Params& params)
    -> std::expected<BM25Index, core::error> {
    BM25Index idx;
    if (auto r = idx.impl_->build(docs, params); !r) {
        return std::unexpected(r.error());
    }
    return idx;
}

auto BM25Index::search(std::string_view query, std::size_t k) const -> std::vector<SparseHit> {
    const auto scores = score_all(query);
    const std::size_t n = scores.size();
    const std::size_t take = std::min(k, n);
    if (take == 0) return {};

    std::vector<std::uint32_t> order(n);
    std::iota(order.begin(), order.end(), 0u);
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(take), order.end(),
        [&scores](std::uint32_t a, std::uint32_t b) {
            if (scores[a] != scores[b]) return scores[a] > scores[b];
            return a < b;
        });

    std::vector<SparseHit> hits;
    hits.reserve(take);
    for (std::size_t i = 0; i < take; ++i) {
        hits.push_back(SparseHit{order[i], scores[order[i]]});
    }
    return hits;
}

auto BM25Index::score_all(std::string_view query) const -> std::vector<double> {
    std::vector<double> scores(impl_->size(), 0.0);
    impl_->accumulate(query, scores);
    return scores;
}

auto BM25Index::idf(std::string_view term) const -> double {
    return impl_->idf(term);
}

auto BM25Index::document_frequency(std::string_view term) const -> std::uint32_t {
    return impl_->document_frequency(term);
}

auto BM25Index::get_stats() const noexcept -> BM25Stats {
    return impl_->get_stats();
}

auto BM25Index::size() const noexcept -> std::size_t {
    return impl_->size();
}

auto BM25Index::vocabulary_size() const noexcept -> std::size_t {
    return impl_->vocabulary_size();
}

auto BM25Index::avg_doc_length() const noexcept -> double {
    return impl_->avg_doc_length();
}

auto BM25Index::params() const noexcept -> const BM25Params& {
    return impl_->params();
}

} // namespace hybridkb::index
