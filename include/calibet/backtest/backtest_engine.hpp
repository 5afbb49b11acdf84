#pragma once

/** \file backtest_engine.hpp
 *  \brief Sequential bankroll simulation over bet candidates.
 *
 * Candidates are visited in non-decreasing event time (stable, so ties keep
 * input order). For each one:
 *   1. pending (no actual) -> skipped
 *   2. EV <= 0 with require_ev_positive -> skipped
 *   3. confidence present and below min_confidence -> skipped
 *   4. stake per StakeMode; a non-positive stake -> skipped
 *   5. resolve the win, settle the bankroll, append ledger and trajectory
 *
 * A run is a pure function of (candidates, config).
 */

#include <expected>
#include <span>

#include "calibet/backtest/bet.hpp"
#include "calibet/backtest/performance_metrics.hpp"
#include "calibet/error.hpp"

namespace calibet::backtest {

auto run_backtest(std::span<const BetCandidate> candidates, const BacktestConfig& config,
                  const SharpeOptions& sharpe = {})
    -> std::expected<BacktestResult, core::error>;

} // namespace calibet::backtest
