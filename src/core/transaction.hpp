#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "core/tx_status.hpp"

namespace core {

using Date = std::chrono::sys_days;
using Amount = std::int64_t; // fixed point, micro-units (16.00 = 16'000'000)

inline constexpr Amount amount_scale = 1'000'000;
inline constexpr int default_date_tolerance_days = 1;

// Department, counterpart and value. Exact equality only; two records sharing
// a key are candidates for each other regardless of date.
struct GroupingKey {
    std::string department;
    std::string counterpart;
    Amount value{0};

    friend bool operator==(const GroupingKey&, const GroupingKey&) = default;
};

struct GroupingKeyHash {
    std::size_t operator()(const GroupingKey& key) const noexcept {
        // FNV-1a 64-bit; a unit separator keeps ("ab","c") apart from ("a","bc").
        static constexpr std::uint64_t fnv_offset_basis = 14695981039346656037ULL;
        static constexpr std::uint64_t fnv_prime = 1099511628211ULL;

        std::uint64_t hash = fnv_offset_basis;
        auto mix = [&hash](std::uint8_t b) {
            hash ^= b;
            hash *= fnv_prime;
        };
        for (char c : key.department) mix(static_cast<std::uint8_t>(c));
        mix(0x1f);
        for (char c : key.counterpart) mix(static_cast<std::uint8_t>(c));
        mix(0x1f);
        const auto v = static_cast<std::uint64_t>(key.value);
        for (int shift = 0; shift < 64; shift += 8) {
            mix(static_cast<std::uint8_t>(v >> shift));
        }
        return static_cast<std::size_t>(hash);
    }
};

struct Transaction {
    Date date{};
    std::string department;
    std::string counterpart;
    Amount value{0};
    TxStatus status{TxStatus::Missing};

    Transaction() = default;
    Transaction(Date d, std::string dept, Amount v, std::string cpty)
        : date(d), department(std::move(dept)), counterpart(std::move(cpty)), value(v) {}

    GroupingKey grouping_key() const { return GroupingKey{department, counterpart, value}; }

    bool same_key_as(const Transaction& other) const noexcept {
        return value == other.value && department == other.department && counterpart == other.counterpart;
    }

    // True when both records are still unmatched, share a grouping key and lie
    // within the date tolerance of each other in either direction. Reads state
    // only.
    bool is_compatible_with(const Transaction& other,
                            int tolerance_days = default_date_tolerance_days) const noexcept {
        if (status == TxStatus::Found || other.status == TxStatus::Found) {
            return false;
        }
        if (!same_key_as(other)) {
            return false;
        }
        const auto days = (date - other.date).count();
        return std::llabs(static_cast<long long>(days)) <= tolerance_days;
    }
};

using Ledger = std::vector<Transaction>;

inline std::size_t count_status(const Ledger& ledger, TxStatus s) noexcept {
    std::size_t n = 0;
    for (const auto& t : ledger) {
        if (t.status == s) ++n;
    }
    return n;
}

} // namespace core
