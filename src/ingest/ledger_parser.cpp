#include "ingest/ledger_parser.hpp"

#include <charconv>
#include <chrono>
#include <limits>
#include <utility>

namespace ingest {
namespace {

constexpr char quote = '"';

inline bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

inline bool is_blank(char c) noexcept {
    return c == ' ' || c == '\t';
}

template <typename T>
inline bool parse_unsigned(const char* begin, const char* end, T& out) noexcept {
    for (const char* p = begin; p < end; ++p) {
        if (!is_digit(*p)) return false;
    }
    auto res = std::from_chars(begin, end, out);
    return res.ec == std::errc{} && res.ptr == end;
}

std::string_view trim_blanks(std::string_view s) noexcept {
    while (!s.empty() && is_blank(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_blank(s.back())) s.remove_suffix(1);
    return s;
}

} // namespace

const char* to_string(ParseResult r) noexcept {
    switch (r) {
    case ParseResult::Ok: return "Ok";
    case ParseResult::FieldCount: return "FieldCount";
    case ParseResult::InvalidDate: return "InvalidDate";
    case ParseResult::InvalidAmount: return "InvalidAmount";
    case ParseResult::Malformed: return "Malformed";
    }
    return "Unknown";
}

bool parse_date(std::string_view text, core::Date& out) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    const char* p = text.data();
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (!parse_unsigned(p, p + 4, y) || !parse_unsigned(p + 5, p + 7, m) || !parse_unsigned(p + 8, p + 10, d)) {
        return false;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!ymd.ok()) {
        return false;
    }
    out = core::Date{ymd};
    return true;
}

bool parse_amount(std::string_view text, core::Amount& out) noexcept {
    text = trim_blanks(text);
    if (text.empty()) {
        return false;
    }

    bool negative = false;
    if (text.front() == '+' || text.front() == '-') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    const auto dot = text.find('.');
    const std::string_view int_part = text.substr(0, dot);
    const std::string_view frac_part = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        return false;
    }
    if (frac_part.size() > max_amount_fraction_digits) {
        return false;
    }

    std::int64_t whole = 0;
    if (!int_part.empty() && !parse_unsigned(int_part.data(), int_part.data() + int_part.size(), whole)) {
        return false;
    }
    std::int64_t frac = 0;
    if (!frac_part.empty() && !parse_unsigned(frac_part.data(), frac_part.data() + frac_part.size(), frac)) {
        return false;
    }
    for (std::size_t i = frac_part.size(); i < max_amount_fraction_digits; ++i) {
        frac *= 10;
    }

    if (whole > (std::numeric_limits<std::int64_t>::max() - frac) / core::amount_scale) {
        return false;
    }
    const std::int64_t magnitude = whole * core::amount_scale + frac;
    out = negative ? -magnitude : magnitude;
    return true;
}

bool split_csv_row(std::string_view line, char delimiter, std::vector<std::string>& fields) {
    fields.clear();
    std::string current;
    std::size_t i = 0;
    bool field_start = true;

    while (i <= line.size()) {
        if (i == line.size()) {
            fields.push_back(std::move(current));
            break;
        }
        const char c = line[i];
        if (field_start && c == quote) {
            ++i;
            bool closed = false;
            while (i < line.size()) {
                if (line[i] == quote) {
                    if (i + 1 < line.size() && line[i + 1] == quote) {
                        current.push_back(quote);
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                current.push_back(line[i++]);
            }
            if (!closed) {
                return false;
            }
            if (i < line.size() && line[i] != delimiter) {
                return false;
            }
            field_start = false;
            continue;
        }
        if (c == delimiter) {
            fields.push_back(std::move(current));
            current.clear();
            field_start = true;
            ++i;
            if (i == line.size()) {
                fields.emplace_back();
                break;
            }
            continue;
        }
        current.push_back(c);
        field_start = false;
        ++i;
    }
    return true;
}

ParseResult parse_ledger_row(std::string_view line, char delimiter, core::Transaction& out) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    std::vector<std::string> fields;
    fields.reserve(ledger_field_count);
    if (!split_csv_row(line, delimiter, fields)) {
        return ParseResult::Malformed;
    }
    if (fields.size() != ledger_field_count) {
        return ParseResult::FieldCount;
    }

    core::Date date{};
    if (!parse_date(fields[0], date)) {
        return ParseResult::InvalidDate;
    }
    core::Amount value{0};
    if (!parse_amount(fields[2], value)) {
        return ParseResult::InvalidAmount;
    }

    out = core::Transaction(date, std::move(fields[1]), value, std::move(fields[3]));
    return ParseResult::Ok;
}

} // namespace ingest
