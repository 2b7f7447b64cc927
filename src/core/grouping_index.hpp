#pragma once

#include <cstddef>
#include <span>
#include <unordered_map>
#include <vector>

#include "core/transaction.hpp"

namespace core {

// GroupingIndex maps a grouping key to the positions of the ledger records
// sharing it. Positions within a group are ordered by date ascending, ties
// keeping ledger order, so the first compatible candidate in a group is the
// chronologically earliest one. The index stores positions only; the ledger
// it was built from must outlive it and must not be resized while it is used.
class GroupingIndex {
public:
    GroupingIndex() = default;
    explicit GroupingIndex(const Ledger& ledger);

    void build(const Ledger& ledger);

    // Empty span when no record of the indexed ledger shares the key.
    std::span<const std::size_t> candidates(const GroupingKey& key) const noexcept;
    std::span<const std::size_t> candidates(const Transaction& tx) const;

    std::size_t group_count() const noexcept { return groups_.size(); }
    std::size_t indexed_records() const noexcept { return indexed_records_; }
    std::size_t largest_group() const noexcept { return largest_group_; }

private:
    std::unordered_map<GroupingKey, std::vector<std::size_t>, GroupingKeyHash> groups_;
    std::size_t indexed_records_{0};
    std::size_t largest_group_{0};
};

} // namespace core
