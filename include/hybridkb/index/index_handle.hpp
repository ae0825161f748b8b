#pragma once

/** \file index_handle.hpp
 *  \brief Atomically swappable reference to the current corpus index.
 *
 * Queries take one snapshot() at entry and keep it for their whole lifetime, so a
 * concurrent install()/rebuild() never changes the corpus under a running query.
 *
 * Thread-safety: all member functions are safe for concurrent calls.
 */

#include <atomic>
#include <expected>
#include <memory>
#include <vector>

#include "hybridkb/config.hpp"
#include "hybridkb/document.hpp"
#include "hybridkb/error.hpp"
#include "hybridkb/index/bm25.hpp"
#include "hybridkb/index/corpus_index.hpp"

namespace hybridkb::index {

class IndexHandle {
public:
    IndexHandle() = default;
    explicit IndexHandle(std::shared_ptr<const CorpusIndex> initial);

    IndexHandle(const IndexHandle&) = delete;
    IndexHandle& operator=(const IndexHandle&) = delete;

    /** \brief Current index, or nullptr if none has been installed. */
    auto snapshot() const -> std::shared_ptr<const CorpusIndex>;

    /** \brief Publish a new index; returns the one it replaced. */
    auto install(std::shared_ptr<const CorpusIndex> next) -> std::shared_ptr<const CorpusIndex>;

    /** \brief Build an index from \p docs and install it.
     *
     * On failure the current index stays in place.
     */
    auto rebuild(std::vector<document> docs, const BM25Params& params = {})
        -> std::expected<void, core::error>;

    /** \brief Load the corpus named by cfg.corpus_path and install it.
     *
     * \return io_failed or data_integrity from the loader; the current index stays in place
     */
    auto rebuild_from_config(const retrieval_config& cfg, const BM25Params& params = {})
        -> std::expected<void, core::error>;

private:
    std::atomic<std::shared_ptr<const CorpusIndex>> current_;
};

} // namespace hybridkb::index
