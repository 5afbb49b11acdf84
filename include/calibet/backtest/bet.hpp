#pragma once

/** \file bet.hpp
 *  \brief Value types flowing through the backtest: candidates, ledger rows, configuration.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "calibet/calibration/calibration_metrics.hpp"

namespace calibet::backtest {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/** \brief One betting opportunity. A missing actual means the outcome is pending. */
struct BetCandidate {
    TimePoint event_time{};
    std::string label;                       /**< e.g. player or market name */
    double probability{0.5};                 /**< model probability of the "over" side */
    double odds{2.0};                        /**< decimal odds, > 1 */
    std::optional<double> confidence;        /**< [0,1] */
    std::optional<double> line;              /**< market line */
    std::optional<double> prediction;        /**< model point estimate */
    std::optional<double> actual;            /**< resolved value; nullopt = pending */
};

/** \brief Ledger row, appended once per accepted bet. */
struct BetRecord {
    TimePoint event_time{};
    std::string label;
    double probability{0.0};
    std::optional<double> confidence;
    double ev{0.0};
    double odds{0.0};
    std::optional<double> line;
    std::optional<double> prediction;
    double actual{0.0};
    double stake{0.0};
    bool won{false};
    double profit{0.0};
    double bankroll_after{0.0};
};

struct BankrollPoint {
    TimePoint event_time{};
    double balance{0.0};
};

enum class StakeMode : std::uint8_t { flat, fixed_amount, fixed_fraction, kelly };

struct BacktestConfig {
    double initial_bankroll{1000.0};
    StakeMode stake_mode{StakeMode::kelly};
    double stake_amount{10.0};                  /**< flat / fixed_amount stake */
    std::optional<double> stake_fraction;       /**< fixed_fraction; unset -> max_fraction_per_bet */
    std::optional<double> kelly_cap;            /**< unset -> max_fraction_per_bet */
    double min_confidence{0.6};                 /**< applied only when a candidate carries confidence */
    bool require_ev_positive{true};
    double max_fraction_per_bet{0.02};
    std::uint32_t calibration_bins{10};
};

struct BacktestSummary {
    double initial_bankroll{0.0};
    double final_bankroll{0.0};
    std::size_t total_bets{0};
    std::size_t wins{0};
    std::size_t losses{0};
    double win_rate{0.0};
    double roi{0.0};
    std::optional<double> sharpe;
    double max_drawdown{0.0};
    std::optional<double> cagr;
    std::optional<double> brier_score;          /**< over resolved candidates; nullopt when none */
};

struct BacktestResult {
    BacktestSummary summary;
    std::vector<BetRecord> bets;
    std::vector<BankrollPoint> trajectory;
    std::vector<calibration::ReliabilityBin> calibration;
    std::size_t skipped_pending{0};
    std::size_t skipped_ev{0};
    std::size_t skipped_confidence{0};
    std::size_t skipped_stake{0};
};

/** \brief Win rule: actual > line, else actual > prediction, else actual > 0. */
[[nodiscard]] inline auto resolve_win(double actual, const std::optional<double>& line,
                                      const std::optional<double>& prediction) noexcept -> bool {
    if (line) return actual > *line;
    if (prediction) return actual > *prediction;
    return actual > 0.0;
}

} // namespace calibet::backtest
