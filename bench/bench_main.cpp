#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

#include "core/reconciler.hpp"
#include "core/transaction.hpp"

namespace {

// Synthetic ledgers: 64 departments x 512 counterparties with a duplicate
// every 16th row; B is A shifted by one day with every 10th row repriced.
core::Ledger make_ledger(std::size_t rows, bool shifted) {
    using namespace std::chrono;
    const core::Date base = sys_days{year{2020} / December / 1};
    core::Ledger ledger;
    ledger.reserve(rows);
    for (std::size_t i = 0; i < rows; ++i) {
        const std::size_t key = (i % 16 == 15) ? i - 1 : i;
        core::Amount value = static_cast<core::Amount>((key % 997) + 1) * core::amount_scale;
        if (shifted && i % 10 == 0) {
            value += 10'000;
        }
        const auto day = base + days{static_cast<int>(key % 28) + (shifted ? 1 : 0)};
        ledger.emplace_back(day, "DEPT" + std::to_string(key % 64), value, "CPTY" + std::to_string(key % 512));
    }
    return ledger;
}

} // namespace

int main() {
    constexpr std::size_t rows = 200000;
    const core::Ledger a0 = make_ledger(rows, false);
    const core::Ledger b0 = make_ledger(rows, true);

    constexpr std::size_t iterations = 5;
    std::uint64_t matched = 0;
    std::chrono::nanoseconds total{0};
    for (std::size_t i = 0; i < iterations; ++i) {
        core::Ledger a = a0;
        core::Ledger b = b0;
        core::Reconciler recon;
        auto start = std::chrono::steady_clock::now();
        recon.run(a, b);
        auto end = std::chrono::steady_clock::now();
        total += std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
        matched = recon.counters().matched_pairs;
    }
    const auto ns = total.count();
    std::cout << "Reconcile " << rows << " x " << rows << " records, " << iterations << " iterations took " << ns
              << " ns (" << (ns / static_cast<long long>(iterations)) << " ns/run, " << matched << " pairs)\n";
    return 0;
}
