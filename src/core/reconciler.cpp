#include "core/reconciler.hpp"

#include <stdexcept>

#include "core/tx_status.hpp"

namespace core {

Reconciler::Reconciler(ReconConfig cfg) : cfg_(cfg) {
    if (!is_valid_recon_config(cfg_)) {
        throw std::invalid_argument("Reconciler date_tolerance_days must be 0 or 1");
    }
}

void Reconciler::match_one(Ledger& ledger_a, Transaction& b, const GroupingIndex& index) {
    if (b.status == TxStatus::Found) {
        ++counters_.ledger_b_prematched;
        return;
    }

    const auto group = index.candidates(b);
    if (group.empty()) {
        ++counters_.ledger_b_no_group;
        return;
    }

    for (const std::size_t pos : group) {
        Transaction& a = ledger_a[pos];
        ++counters_.candidate_checks;
        if (!a.is_compatible_with(b, cfg_.date_tolerance_days)) {
            continue;
        }
        // Both sides are Missing here, so neither transition can be refused.
        apply_status_transition(a.status, TxStatus::Found);
        apply_status_transition(b.status, TxStatus::Found);
        ++counters_.matched_pairs;
        return;
    }
}

void Reconciler::run(Ledger& ledger_a, Ledger& ledger_b) {
    counters_ = ReconCounters{};
    counters_.ledger_a_records = ledger_a.size();
    counters_.ledger_b_records = ledger_b.size();
    counters_.ledger_a_prematched = count_status(ledger_a, TxStatus::Found);

    if (!ledger_a.empty() && !ledger_b.empty()) {
        const GroupingIndex index(ledger_a);
        counters_.groups = index.group_count();
        counters_.largest_group = index.largest_group();

        for (auto& b : ledger_b) {
            match_one(ledger_a, b, index);
        }
    } else {
        counters_.ledger_b_prematched = count_status(ledger_b, TxStatus::Found);
    }

    counters_.ledger_a_missing = count_status(ledger_a, TxStatus::Missing);
    counters_.ledger_b_missing = count_status(ledger_b, TxStatus::Missing);
}

void reconcile_accounts(Ledger& ledger_a, Ledger& ledger_b, ReconCounters* counters) {
    Reconciler recon;
    recon.run(ledger_a, ledger_b);
    if (counters) {
        *counters = recon.counters();
    }
}

std::pair<Ledger, Ledger> reconciled(Ledger ledger_a, Ledger ledger_b) {
    reconcile_accounts(ledger_a, ledger_b);
    return {std::move(ledger_a), std::move(ledger_b)};
}

} // namespace core
