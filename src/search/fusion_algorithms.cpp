#include "hybridkb/search/fusion_algorithms.hpp"

#include <algorithm>
#include <unordered_map>

namespace hybridkb::search::fusion {

namespace {

struct Accumulator {
    double score{0.0};
    std::size_t first_list{0};
    std::uint32_t first_rank{0};
    std::size_t first_position{0};
    std::optional<display_fields> fields;
};

} // anonymous namespace

// ReciprocalRankFusion implementation

auto ReciprocalRankFusion::fuse(const std::vector<std::vector<RankedItem>>& lists) const
    -> std::vector<FusedResult> {

    std::unordered_map<std::string, std::size_t> slot_of;
    std::vector<std::string> ids;
    std::vector<Accumulator> acc;

    for (std::size_t li = 0; li < lists.size(); ++li) {
        const auto& list = lists[li];
        for (std::size_t pos = 0; pos < list.size(); ++pos) {
            const auto& item = list[pos];
            auto [it, inserted] = slot_of.try_emplace(item.doc_id, acc.size());
            if (inserted) {
                ids.push_back(item.doc_id);
                acc.push_back(Accumulator{0.0, li, item.rank, pos, item.fields});
            }
            auto& a = acc[it->second];
            a.score += contribution(item.rank);
            if (!a.fields && item.fields) a.fields = item.fields;
        }
    }

    std::vector<std::size_t> order(acc.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;

    std::sort(order.begin(), order.end(), [&acc](std::size_t x, std::size_t y) {
        const auto& a = acc[x];
        const auto& b = acc[y];
        if (a.score != b.score) return a.score > b.score;
        if (a.first_list != b.first_list) return a.first_list < b.first_list;
        if (a.first_rank != b.first_rank) return a.first_rank < b.first_rank;
        return a.first_position < b.first_position;
    });

    std::vector<FusedResult> output;
    output.reserve(order.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        auto& a = acc[order[i]];
        output.push_back(FusedResult{std::move(ids[order[i]]), a.score,
                                     static_cast<std::uint32_t>(i + 1), std::move(a.fields)});
    }
    return output;
}

} // namespace hybridkb::search::fusion
