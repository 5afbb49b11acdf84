#pragma once

/** \file performance_metrics.hpp
 *  \brief Risk and return statistics over a simulated bankroll.
 */

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "calibet/backtest/bet.hpp"

namespace calibet::backtest {

struct SharpeOptions {
    /** Multiply the raw ratio by sqrt(periods_per_year) when set. */
    std::optional<double> periods_per_year;
};

/** \brief (final - initial) / initial; 0 when initial <= 0. */
[[nodiscard]] auto roi(double initial, double final_value) noexcept -> double;

/** \brief wins / total; 0 when total == 0. */
[[nodiscard]] auto win_rate(std::size_t wins, std::size_t total) noexcept -> double;

/** \brief Largest peak-to-trough decline relative to the running peak, in [0, 1]. */
[[nodiscard]] auto max_drawdown(std::span<const double> balances) noexcept -> double;

/** \brief Compound annual growth rate; nullopt for a zero-length period or a non-positive ratio. */
[[nodiscard]] auto cagr(double initial, double final_value, TimePoint first, TimePoint last) noexcept
    -> std::optional<double>;

/** \brief mean / population stddev of per-bet returns.
 *
 * No risk-free subtraction. nullopt for fewer than two returns or zero variance.
 */
[[nodiscard]] auto sharpe_ratio(std::span<const double> returns, const SharpeOptions& opts = {}) noexcept
    -> std::optional<double>;

/** \brief Assemble the summary for a finished ledger.
 *
 * Drawdown is evaluated on the initial bankroll followed by every balance;
 * Sharpe uses profit / initial bankroll per bet; CAGR spans first to last bet.
 */
[[nodiscard]] auto summarize(double initial_bankroll, std::span<const BetRecord> bets,
                             const SharpeOptions& opts = {}) -> BacktestSummary;

} // namespace calibet::backtest
