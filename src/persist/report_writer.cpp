#include "persist/report_writer.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fstream>

namespace persist {
namespace {

constexpr std::int64_t cents_divisor = core::amount_scale / 100;

} // namespace

std::string format_amount(core::Amount value) {
    const bool negative = value < 0;
    // Work on the magnitude as unsigned so INT64_MIN stays representable.
    const std::uint64_t magnitude = negative ? (~static_cast<std::uint64_t>(value) + 1u)
                                             : static_cast<std::uint64_t>(value);
    const auto divisor = static_cast<std::uint64_t>(cents_divisor);
    std::uint64_t cents = magnitude / divisor;
    const std::uint64_t remainder = magnitude % divisor;
    const std::uint64_t half = divisor / 2;
    if (remainder > half || (remainder == half && (cents & 1u) != 0)) {
        ++cents;
    }

    char buf[32];
    const int n = std::snprintf(buf, sizeof(buf), "%s%llu.%02llu",
                                negative ? "-" : "",
                                static_cast<unsigned long long>(cents / 100),
                                static_cast<unsigned long long>(cents % 100));
    return std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0);
}

std::string format_date(core::Date date) {
    const std::chrono::year_month_day ymd{date};
    char buf[16];
    const int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                                static_cast<int>(ymd.year()),
                                static_cast<unsigned>(ymd.month()),
                                static_cast<unsigned>(ymd.day()));
    return std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0);
}

std::size_t display_width(std::string_view text) noexcept {
    std::size_t n = 0;
    for (char c : text) {
        // Continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(c) & 0xC0u) != 0x80u) {
            ++n;
        }
    }
    return n;
}

std::string pad_left(std::string_view text, std::size_t width) {
    const std::size_t w = display_width(text);
    std::string out;
    if (w < width) {
        out.assign(width - w, ' ');
    }
    out.append(text);
    return out;
}

std::string format_transaction(const core::Transaction& tx) {
    std::string line = "Transaction: ";
    line += format_date(tx.date);
    line += " | ";
    line += pad_left(tx.department, department_width);
    line += " | ";
    line += pad_left(tx.counterpart, counterpart_width);
    line += " | ";
    line += pad_left(format_amount(tx.value), value_width);
    line += " | Status: ";
    line += pad_left(core::to_string(tx.status), status_width);
    return line;
}

void write_ledger_section(std::ostream& out, std::string_view title, const core::Ledger& ledger) {
    out << title << '\n';
    for (const auto& tx : ledger) {
        out << format_transaction(tx) << '\n';
    }
}

void write_report(std::ostream& out, const core::Ledger& ledger_a, const core::Ledger& ledger_b) {
    write_ledger_section(out, "Transactions A:", ledger_a);
    out << '\n';
    write_ledger_section(out, "Transactions B:", ledger_b);
}

bool write_report_file(const std::filesystem::path& path,
                       const core::Ledger& ledger_a,
                       const core::Ledger& ledger_b,
                       std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Failed to open report file: " + path.string();
        return false;
    }
    write_report(out, ledger_a, ledger_b);
    out.flush();
    if (!out) {
        error = "Failed to write report file: " + path.string();
        return false;
    }
    return true;
}

} // namespace persist
