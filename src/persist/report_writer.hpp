#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

#include "core/transaction.hpp"

namespace persist {

inline constexpr std::size_t department_width = 12;
inline constexpr std::size_t counterpart_width = 12;
inline constexpr std::size_t value_width = 4;
inline constexpr std::size_t status_width = 8;

// Two fraction digits, round half to even beyond that.
std::string format_amount(core::Amount value);

std::string format_date(core::Date date);

// Number of UTF-8 code points; padding is computed in code points.
std::size_t display_width(std::string_view text) noexcept;

// Left-pads text with spaces up to width code points.
std::string pad_left(std::string_view text, std::size_t width);

// "Transaction: <date> | <department> | <counterpart> | <value> | Status: <status>"
std::string format_transaction(const core::Transaction& tx);

void write_ledger_section(std::ostream& out, std::string_view title, const core::Ledger& ledger);

// "Transactions A:" section, a blank line, then "Transactions B:".
void write_report(std::ostream& out, const core::Ledger& ledger_a, const core::Ledger& ledger_b);

bool write_report_file(const std::filesystem::path& path,
                       const core::Ledger& ledger_a,
                       const core::Ledger& ledger_b,
                       std::string& error);

} // namespace persist
