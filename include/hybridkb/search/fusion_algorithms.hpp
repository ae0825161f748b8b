#pragma once

/** \file fusion_algorithms.hpp
 *  \brief Rank fusion of ranked lists produced by the retrieval branches.
 *
 * Reciprocal Rank Fusion (RRF) is rank-only: raw branch scores never enter the fused
 * score, so dense similarities and BM25 scores need no calibration against each other.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hybridkb/document.hpp"

namespace hybridkb::search::fusion {

/** \brief Result from a single retrieval branch. */
struct RankedItem {
    std::string doc_id;
    double score{0.0};
    std::uint32_t rank{0};                 /**< 1-based, contiguous within its list */
    std::optional<display_fields> fields;  /**< display data, when the branch carries it */
};

/** \brief Combined result. */
struct FusedResult {
    std::string doc_id;
    double fused_score{0.0};
    std::uint32_t rank{0};                 /**< 1..n contiguous */
    std::optional<display_fields> fields;
};

/** \brief Reciprocal Rank Fusion implementation.
 *
 * score(d) = sum over lists L containing d of 1 / (k + rank_L(d)).
 *
 * Ties on the fused score are ordered by (index of the first list containing d,
 * d's rank in that list, d's position in that list). Display fields come from the
 * first occurrence of d, or from the first later occurrence that has them.
 */
class ReciprocalRankFusion {
public:
    explicit ReciprocalRankFusion(double k = 60.0) : k_(k) {}

    /** \brief Fuse ranked lists, given in priority order.
     *
     * \param lists Ranked lists, each sorted by relevance
     * \return All distinct documents, ranked 1..n
     *
     * Complexity: O(T log T) where T is the total number of items
     */
    auto fuse(const std::vector<std::vector<RankedItem>>& lists) const -> std::vector<FusedResult>;

    /** \brief Contribution of one occurrence at \p rank. */
    auto contribution(std::uint32_t rank) const noexcept -> double {
        return 1.0 / (k_ + static_cast<double>(rank));
    }

    auto k() const noexcept -> double { return k_; }

    /** \brief Update k parameter. */
    auto set_k(double k) -> void { k_ = k; }

private:
    double k_;
};

} // namespace hybridkb::search::fusion
