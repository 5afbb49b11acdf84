#pragma once

/** \file staking.hpp
 *  \brief Expected value, Kelly fraction and per-mode stake sizing.
 */

#include <expected>
#include <string_view>

#include "calibet/backtest/bet.hpp"
#include "calibet/error.hpp"

namespace calibet::backtest {

/** \brief EV per unit staked: p*(odds-1) - (1-p). */
[[nodiscard]] constexpr auto expected_value(double p, double odds) noexcept -> double {
    return p * (odds - 1.0) - (1.0 - p);
}

/** \brief Unclamped Kelly fraction (b*p - q)/b with b = odds-1; 0 when b <= 0. */
[[nodiscard]] constexpr auto kelly_fraction(double p, double odds) noexcept -> double {
    const double b = odds - 1.0;
    if (b <= 0.0) return 0.0;
    return (b * p - (1.0 - p)) / b;
}

/** \brief Stake for one bet given the current bankroll, clamped to [0, bankroll].
 *
 * kelly with odds <= 1 falls back to the flat stake.
 */
[[nodiscard]] auto stake_for(const BacktestConfig& cfg, double bankroll, double p, double odds) noexcept
    -> double;

/** \brief Reject configurations the engine cannot simulate (config_invalid). */
auto validate_config(const BacktestConfig& cfg) -> std::expected<void, core::error>;

[[nodiscard]] auto to_string(StakeMode mode) noexcept -> std::string_view;
auto stake_mode_from_string(std::string_view s) -> std::expected<StakeMode, core::error>;

/** \brief Fair decimal odds of the "over" side after removing the bookmaker margin. */
auto remove_vig(double over_odds, double under_odds) -> std::expected<double, core::error>;

} // namespace calibet::backtest
