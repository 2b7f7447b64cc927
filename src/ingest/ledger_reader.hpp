#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>

#include "core/transaction.hpp"
#include "ingest/ledger_parser.hpp"

namespace ingest {

struct LedgerReadOptions {
    char delimiter{','};
};

struct LedgerReadError {
    std::size_t line{0}; // 1-based; 0 when the failure is not tied to a row
    ParseResult result{ParseResult::Ok};
    std::string message;
};

// Reads every row of a ledger in file order. Blank lines are skipped; the
// first row that fails to parse stops the read and is described in error.
// out is left empty on failure.
bool read_ledger(std::istream& in,
                 const LedgerReadOptions& options,
                 core::Ledger& out,
                 LedgerReadError& error,
                 ParseStats* stats = nullptr);

bool read_ledger(const std::filesystem::path& path,
                 const LedgerReadOptions& options,
                 core::Ledger& out,
                 LedgerReadError& error,
                 ParseStats* stats = nullptr);

} // namespace ingest
