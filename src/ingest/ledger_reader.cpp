#include "ingest/ledger_reader.hpp"

#include <fstream>
#include <string_view>

namespace ingest {
namespace {

bool is_blank_line(std::string_view line) noexcept {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

std::string describe(ParseResult r, std::size_t line_no) {
    std::string msg = "line " + std::to_string(line_no) + ": ";
    switch (r) {
    case ParseResult::FieldCount:
        msg += "expected " + std::to_string(ledger_field_count) + " fields (date,department,amount,counterpart)";
        break;
    case ParseResult::InvalidDate:
        msg += "date is not a valid YYYY-MM-DD calendar day";
        break;
    case ParseResult::InvalidAmount:
        msg += "amount is not a decimal number";
        break;
    case ParseResult::Malformed:
        msg += "unterminated or misplaced quote";
        break;
    case ParseResult::Ok:
        msg += "ok";
        break;
    }
    return msg;
}

} // namespace

bool read_ledger(std::istream& in,
                 const LedgerReadOptions& options,
                 core::Ledger& out,
                 LedgerReadError& error,
                 ParseStats* stats) {
    ParseStats local{};
    ParseStats& st = stats ? *stats : local;
    out.clear();

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (is_blank_line(line)) {
            ++st.blank_lines;
            continue;
        }
        core::Transaction tx;
        const ParseResult res = parse_ledger_row(line, options.delimiter, tx);
        if (res != ParseResult::Ok) {
            ++st.failed;
            error.line = line_no;
            error.result = res;
            error.message = describe(res, line_no);
            out.clear();
            return false;
        }
        out.push_back(std::move(tx));
        ++st.parsed;
    }

    if (in.bad()) {
        error.line = 0;
        error.result = ParseResult::Ok;
        error.message = "read error after line " + std::to_string(line_no);
        out.clear();
        return false;
    }
    return true;
}

bool read_ledger(const std::filesystem::path& path,
                 const LedgerReadOptions& options,
                 core::Ledger& out,
                 LedgerReadError& error,
                 ParseStats* stats) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error.line = 0;
        error.result = ParseResult::Ok;
        error.message = "failed to open file: " + path.string();
        out.clear();
        return false;
    }
    if (!read_ledger(in, options, out, error, stats)) {
        error.message = path.string() + ": " + error.message;
        return false;
    }
    return true;
}

} // namespace ingest
