#include "hybridkb/index/index_handle.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "hybridkb/corpus_loader.hpp"

namespace hybridkb::index {

IndexHandle::IndexHandle(std::shared_ptr<const CorpusIndex> initial)
    : current_(std::move(initial)) {}

auto IndexHandle::snapshot() const -> std::shared_ptr<const CorpusIndex> {
    return current_.load(std::memory_order_acquire);
}

auto IndexHandle::install(std::shared_ptr<const CorpusIndex> next) -> std::shared_ptr<const CorpusIndex> {
    return current_.exchange(std::move(next), std::memory_order_acq_rel);
}

auto IndexHandle::rebuild(std::vector<document> docs, const BM25Params& params)
    -> std::expected<void, core::error> {
    auto built = CorpusIndex::build(std::move(docs), params);
    if (!built) {
        spdlog::warn("index rebuild failed ({}): {}", core::to_string(built.error().code),
                     built.error().message);
        return std::unexpected(built.error());
    }
    const std::size_t count = (*built)->size();
    auto previous = install(std::move(*built));
    spdlog::info("index installed ({} documents, replaced {})", count,
                 previous ? previous->size() : std::size_t{0});
    return {};
}

auto IndexHandle::rebuild_from_config(const retrieval_config& cfg, const BM25Params& params)
    -> std::expected<void, core::error> {
    auto docs = load_documents(cfg.corpus_path);
    if (!docs) {
        spdlog::warn("corpus {} not loaded ({}): {}", cfg.corpus_path,
                     core::to_string(docs.error().code), docs.error().message);
        return std::unexpected(docs.error());
    }
    return rebuild(std::move(*docs), params);
}

} // namespace hybridkb::index
