#pragma once

#include <cstdint>

namespace core {

enum class TxStatus : std::uint8_t { Missing, Found };

inline constexpr const char* to_string(TxStatus s) noexcept {
    switch (s) {
    case TxStatus::Missing: return "MISSING";
    case TxStatus::Found: return "FOUND";
    }
    return "UNKNOWN";
}

inline constexpr bool is_terminal_status(TxStatus s) noexcept {
    return s == TxStatus::Found;
}

// Missing -> Found is the only change a record ever goes through. Found is
// terminal: it cannot revert and a second Found is rejected so a record can
// never be claimed twice.
inline constexpr bool is_valid_transition(TxStatus current, TxStatus next) noexcept {
    if (is_terminal_status(current)) {
        return false;
    }
    return next == TxStatus::Found || next == TxStatus::Missing;
}

// Apply a new status, returning whether the change was accepted.
inline bool apply_status_transition(TxStatus& current, TxStatus next) noexcept {
    if (!is_valid_transition(current, next)) {
        return false;
    }
    current = next;
    return true;
}

} // namespace core
