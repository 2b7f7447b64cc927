#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/transaction.hpp"

namespace ingest {

enum class ParseResult : std::uint8_t { Ok, FieldCount, InvalidDate, InvalidAmount, Malformed };

const char* to_string(ParseResult r) noexcept;

struct ParseStats {
    std::size_t parsed{0};
    std::size_t blank_lines{0};
    std::size_t failed{0};
};

inline constexpr std::size_t ledger_field_count = 4;
inline constexpr std::size_t max_amount_fraction_digits = 6;

// Strict YYYY-MM-DD naming a real calendar day.
bool parse_date(std::string_view text, core::Date& out) noexcept;

// [+-]digits[.digits], at most six fraction digits, surrounding blanks ignored.
bool parse_amount(std::string_view text, core::Amount& out) noexcept;

// Splits one CSV row. Double-quoted fields may contain the delimiter and
// escape a quote as "". Returns false on an unterminated quote or on stray
// characters after a closing quote.
bool split_csv_row(std::string_view line, char delimiter, std::vector<std::string>& fields);

// Parses "date,department,amount,counterpart" into a Missing transaction.
ParseResult parse_ledger_row(std::string_view line, char delimiter, core::Transaction& out);

} // namespace ingest
