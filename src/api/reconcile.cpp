#include "api/reconcile.hpp"

#include <string>

#include "core/reconciler.hpp"
#include "core/transaction.hpp"
#include "ingest/ledger_reader.hpp"
#include "persist/report_writer.hpp"
#include "util/log.hpp"

namespace api {

namespace {

void apply_log_level(const ReconcileConfig& cfg) noexcept {
    if (cfg.quiet) {
        util::set_min_level(util::LogLevel::Error);
    } else if (cfg.verbose) {
        util::set_min_level(util::LogLevel::Debug);
    } else {
        util::set_min_level(util::LogLevel::Info);
    }
}

// Returns 0 on success, otherwise the exit code for the failure.
int load_ledger(const std::filesystem::path& path,
                const ingest::LedgerReadOptions& options,
                core::Ledger& out) {
    ingest::LedgerReadError error{};
    ingest::ParseStats stats{};
    if (!ingest::read_ledger(path, options, out, error, &stats)) {
        RECON_LOG_ERROR("%s", error.message.c_str());
        return error.line == 0 ? kExitIoError : kExitParseError;
    }
    RECON_LOG_DEBUG("Loaded %s records=%zu blank_lines=%zu",
                    path.string().c_str(), stats.parsed, stats.blank_lines);
    return kExitSuccess;
}

void log_summary(const core::ReconCounters& c) {
    RECON_LOG_INFO("Ledger A records=%llu found=%llu missing=%llu",
                   static_cast<unsigned long long>(c.ledger_a_records),
                   static_cast<unsigned long long>(c.ledger_a_records - c.ledger_a_missing),
                   static_cast<unsigned long long>(c.ledger_a_missing));
    RECON_LOG_INFO("Ledger B records=%llu found=%llu missing=%llu no_group=%llu",
                   static_cast<unsigned long long>(c.ledger_b_records),
                   static_cast<unsigned long long>(c.ledger_b_records - c.ledger_b_missing),
                   static_cast<unsigned long long>(c.ledger_b_missing),
                   static_cast<unsigned long long>(c.ledger_b_no_group));
    RECON_LOG_INFO("Matched pairs=%llu groups=%llu largest_group=%llu candidate_checks=%llu",
                   static_cast<unsigned long long>(c.matched_pairs),
                   static_cast<unsigned long long>(c.groups),
                   static_cast<unsigned long long>(c.largest_group),
                   static_cast<unsigned long long>(c.candidate_checks));
}

} // namespace

int run_reconcile(const ReconcileConfig& cfg, std::ostream& out) {
    apply_log_level(cfg);

    if (cfg.ledger_a.empty() || cfg.ledger_b.empty()) {
        RECON_LOG_ERROR("Two ledger files are required");
        return kExitUsage;
    }

    const ingest::LedgerReadOptions options{cfg.delimiter};
    core::Ledger ledger_a;
    core::Ledger ledger_b;
    if (const int rc = load_ledger(cfg.ledger_a, options, ledger_a); rc != kExitSuccess) {
        return rc;
    }
    if (const int rc = load_ledger(cfg.ledger_b, options, ledger_b); rc != kExitSuccess) {
        return rc;
    }

    core::Reconciler recon;
    recon.run(ledger_a, ledger_b);
    RECON_LOG_DEBUG("Reconciled %zu vs %zu records, %llu pairs",
                    ledger_a.size(), ledger_b.size(),
                    static_cast<unsigned long long>(recon.counters().matched_pairs));

    if (cfg.output_path.empty()) {
        persist::write_report(out, ledger_a, ledger_b);
        out.flush();
        if (!out) {
            RECON_LOG_ERROR("Failed to write report");
            return kExitIoError;
        }
    } else {
        std::string error;
        if (!persist::write_report_file(cfg.output_path, ledger_a, ledger_b, error)) {
            RECON_LOG_ERROR("%s", error.c_str());
            return kExitIoError;
        }
        RECON_LOG_INFO("Report written to %s", cfg.output_path.string().c_str());
    }

    if (cfg.summary) {
        log_summary(recon.counters());
    }
    return kExitSuccess;
}

} // namespace api
