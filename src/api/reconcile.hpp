#pragma once

#include <filesystem>
#include <ostream>

namespace api {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitParseError = 3;
inline constexpr int kExitIoError = 4;

struct ReconcileConfig {
    std::filesystem::path ledger_a{};
    std::filesystem::path ledger_b{};
    std::filesystem::path output_path{}; // report goes to the stream passed in when empty
    char delimiter{','};

    bool summary{false};
    bool quiet{false};
    bool verbose{false};
};

// Loads both ledgers, reconciles them and writes the report. Returns one of
// the kExit* codes.
int run_reconcile(const ReconcileConfig& cfg, std::ostream& out);

} // namespace api
