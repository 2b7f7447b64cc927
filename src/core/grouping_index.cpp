#include "core/grouping_index.hpp"

#include <algorithm>

namespace core {

GroupingIndex::GroupingIndex(const Ledger& ledger) {
    build(ledger);
}

void GroupingIndex::build(const Ledger& ledger) {
    groups_.clear();
    indexed_records_ = 0;
    largest_group_ = 0;

    for (std::size_t pos = 0; pos < ledger.size(); ++pos) {
        groups_[ledger[pos].grouping_key()].push_back(pos);
        ++indexed_records_;
    }

    // Dates are immutable for the lifetime of a run, so one stable sort per
    // group gives the same order as sorting the group on every lookup.
    for (auto& [key, positions] : groups_) {
        std::stable_sort(positions.begin(), positions.end(), [&ledger](std::size_t lhs, std::size_t rhs) {
            return ledger[lhs].date < ledger[rhs].date;
        });
        largest_group_ = std::max(largest_group_, positions.size());
    }
}

std::span<const std::size_t> GroupingIndex::candidates(const GroupingKey& key) const noexcept {
    const auto it = groups_.find(key);
    if (it == groups_.end()) {
        return {};
    }
    return it->second;
}

std::span<const std::size_t> GroupingIndex::candidates(const Transaction& tx) const {
    return candidates(tx.grouping_key());
}

} // namespace core
