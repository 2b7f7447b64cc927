#pragma once

#include <cstdint>
#include <type_traits>

#include "core/transaction.hpp"

namespace core {

// Matching engine settings.
struct ReconConfig {
    // Maximum distance in calendar days between two matched records.
    // Only 0 (same day) and 1 are accepted.
    std::int32_t date_tolerance_days{default_date_tolerance_days};
};

static_assert(std::is_trivially_copyable_v<ReconConfig>, "ReconConfig must be trivially copyable");

inline constexpr std::int32_t max_date_tolerance_days = 1;

[[nodiscard]] inline constexpr ReconConfig default_recon_config() noexcept {
    return ReconConfig{};
}

[[nodiscard]] inline constexpr bool is_valid_recon_config(const ReconConfig& cfg) noexcept {
    return cfg.date_tolerance_days >= 0 && cfg.date_tolerance_days <= max_date_tolerance_days;
}

} // namespace core
