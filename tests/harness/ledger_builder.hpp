#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "core/transaction.hpp"

namespace test {

inline core::Date make_date(int y, unsigned m, unsigned d) {
    return core::Date{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}};
}

// Amount from whole units and cents: to_amount(16, 0) == 16.00.
constexpr core::Amount to_amount(std::int64_t units, std::int64_t cents = 0) noexcept {
    return units * core::amount_scale + cents * (core::amount_scale / 100);
}

// Defaults mirror a typical row: 2020-12-04, Tecnologia, Bitbucket, 16.00.
struct TxSpec {
    core::Date date{make_date(2020, 12, 4)};
    std::string department{"Tecnologia"};
    std::string counterpart{"Bitbucket"};
    core::Amount value{to_amount(16)};
    core::TxStatus status{core::TxStatus::Missing};
};

inline core::Transaction make_tx(const TxSpec& spec = {}) {
    core::Transaction tx(spec.date, spec.department, spec.value, spec.counterpart);
    tx.status = spec.status;
    return tx;
}

// Fluent construction of a ledger.
class LedgerBuilder {
public:
    LedgerBuilder& add(const TxSpec& spec = {}) {
        ledger_.push_back(make_tx(spec));
        return *this;
    }

    LedgerBuilder& add_on(core::Date date) {
        TxSpec spec{};
        spec.date = date;
        return add(spec);
    }

    LedgerBuilder& add(core::Date date, const std::string& department, const std::string& counterpart,
                       core::Amount value) {
        TxSpec spec{};
        spec.date = date;
        spec.department = department;
        spec.counterpart = counterpart;
        spec.value = value;
        return add(spec);
    }

    LedgerBuilder& repeat(std::size_t n, const TxSpec& spec = {}) {
        for (std::size_t i = 0; i < n; ++i) {
            add(spec);
        }
        return *this;
    }

    core::Ledger build() const { return ledger_; }

private:
    core::Ledger ledger_;
};

inline std::vector<core::TxStatus> statuses(const core::Ledger& ledger) {
    std::vector<core::TxStatus> out;
    out.reserve(ledger.size());
    for (const auto& tx : ledger) {
        out.push_back(tx.status);
    }
    return out;
}

} // namespace test
