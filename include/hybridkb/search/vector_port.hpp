#pragma once

/** \file vector_port.hpp
 *  \brief Boundary to the external dense (embedding) retrieval service.
 *
 * Implementations embed the query text themselves and enforce the filter natively
 * (filter_json::to_json gives the canonical wire form). They may return fewer than
 * top_k items and may fail; the orchestrator owns the retry policy.
 *
 * Thread-safety: query() may be called concurrently, and from a thread other than the
 * caller's when a dense timeout is configured. In that case each call gets its own
 * detached thread and a call past the deadline is abandoned, not cancelled; the thread
 * lives until query() returns. Implementations should bound their own I/O (socket or
 * client timeouts) so that a hung service does not accumulate one thread per query.
 */

#include <cstddef>
#include <expected>
#include <string_view>
#include <vector>

#include "hybridkb/error.hpp"
#include "hybridkb/filter_expr.hpp"
#include "hybridkb/search/fusion_algorithms.hpp"

namespace hybridkb::search {

class VectorSearchPort {
public:
    virtual ~VectorSearchPort() = default;

    /** \brief Rank the corpus against \p text, most similar first.
     *
     * \param filter Predicate to enforce, or nullptr for none
     * \return Items ordered by descending similarity; ranks are re-assigned by the caller
     */
    virtual auto query(std::string_view text, std::size_t top_k, const filter_expr* filter)
        -> std::expected<std::vector<fusion::RankedItem>, core::error> = 0;
};

} // namespace hybridkb::search
