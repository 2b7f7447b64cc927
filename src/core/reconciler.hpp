#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

#include "core/grouping_index.hpp"
#include "core/recon_config.hpp"
#include "core/transaction.hpp"

namespace core {

struct ReconCounters {
    std::uint64_t ledger_a_records{0};
    std::uint64_t ledger_b_records{0};

    std::uint64_t groups{0};
    std::uint64_t largest_group{0};
    std::uint64_t candidate_checks{0};

    std::uint64_t matched_pairs{0};
    std::uint64_t ledger_a_missing{0};
    std::uint64_t ledger_b_missing{0};
    std::uint64_t ledger_b_no_group{0};

    // Records already Found before the run started.
    std::uint64_t ledger_a_prematched{0};
    std::uint64_t ledger_b_prematched{0};
};

// Pairs records of ledger A with records of ledger B. Each B record, in
// ledger order, claims the earliest still-Missing compatible A record of its
// group. Both statuses flip to Found together or not at all; Found records are
// never released.
class Reconciler {
public:
    // Throws std::invalid_argument when cfg carries an unsupported tolerance.
    explicit Reconciler(ReconConfig cfg = default_recon_config());

    void run(Ledger& ledger_a, Ledger& ledger_b);

    const ReconCounters& counters() const noexcept { return counters_; }
    const ReconConfig& config() const noexcept { return cfg_; }

private:
    void match_one(Ledger& ledger_a, Transaction& b, const GroupingIndex& index);

    ReconConfig cfg_;
    ReconCounters counters_{};
};

// Marks matching records Found in place, with the default configuration.
void reconcile_accounts(Ledger& ledger_a, Ledger& ledger_b, ReconCounters* counters = nullptr);

// Returns annotated copies; the inputs are left untouched.
std::pair<Ledger, Ledger> reconciled(Ledger ledger_a, Ledger ledger_b);

} // namespace core
