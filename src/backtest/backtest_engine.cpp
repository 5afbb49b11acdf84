#include "calibet/backtest/backtest_engine.hpp"
#include "calibet/backtest/staking.hpp"
#include "calibet/calibration/calibration_metrics.hpp"
#include "calibet/core/log.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

namespace calibet::backtest {

namespace {

constexpr const char* kComponent = "backtest.engine";

auto check_candidate(const BetCandidate& c, std::size_t index) -> std::expected<void, core::error> {
    if (!std::isfinite(c.probability) || c.probability < 0.0 || c.probability > 1.0) {
        return core::make_error(core::error_code::invalid_argument,
            "candidate " + std::to_string(index) + ": probability must be in [0, 1]", kComponent);
    }
    if (!std::isfinite(c.odds)) {
        return core::make_error(core::error_code::invalid_argument,
            "candidate " + std::to_string(index) + ": odds must be finite", kComponent);
    }
    if (c.confidence && (!std::isfinite(*c.confidence) || *c.confidence < 0.0 || *c.confidence > 1.0)) {
        return core::make_error(core::error_code::invalid_argument,
            "candidate " + std::to_string(index) + ": confidence must be in [0, 1]", kComponent);
    }
    if ((c.actual && !std::isfinite(*c.actual)) || (c.line && !std::isfinite(*c.line)) ||
        (c.prediction && !std::isfinite(*c.prediction))) {
        return core::make_error(core::error_code::invalid_argument,
            "candidate " + std::to_string(index) + ": actual, line and prediction must be finite", kComponent);
    }
    return {};
}

} // anonymous namespace

auto run_backtest(std::span<const BetCandidate> candidates, const BacktestConfig& config,
                  const SharpeOptions& sharpe)
    -> std::expected<BacktestResult, core::error> {
    if (auto ok = validate_config(config); !ok) return std::unexpected(ok.error());
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (auto ok = check_candidate(candidates[i], i); !ok) return std::unexpected(ok.error());
    }

    std::vector<std::size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t l, std::size_t r) {
        return candidates[l].event_time < candidates[r].event_time;
    });

    BacktestResult result;
    std::vector<double> cal_y;
    std::vector<double> cal_p;
    double bankroll = config.initial_bankroll;

    for (std::size_t idx : order) {
        const auto& c = candidates[idx];
        if (!c.actual) {
            ++result.skipped_pending;
            continue;
        }
        const bool won = resolve_win(*c.actual, c.line, c.prediction);
        cal_y.push_back(won ? 1.0 : 0.0);
        cal_p.push_back(c.probability);

        const double ev = expected_value(c.probability, c.odds);
        if (config.require_ev_positive && ev <= 0.0) {
            ++result.skipped_ev;
            continue;
        }
        if (c.confidence && *c.confidence < config.min_confidence) {
            ++result.skipped_confidence;
            continue;
        }
        const double stake = stake_for(config, bankroll, c.probability, c.odds);
        if (!(stake > 0.0)) {
            ++result.skipped_stake;
            continue;
        }

        const double profit = won ? stake * (c.odds - 1.0) : -stake;
        bankroll += profit;

        BetRecord rec;
        rec.event_time = c.event_time;
        rec.label = c.label;
        rec.probability = c.probability;
        rec.confidence = c.confidence;
        rec.ev = ev;
        rec.odds = c.odds;
        rec.line = c.line;
        rec.prediction = c.prediction;
        rec.actual = *c.actual;
        rec.stake = stake;
        rec.won = won;
        rec.profit = profit;
        rec.bankroll_after = bankroll;
        result.bets.push_back(std::move(rec));
        result.trajectory.push_back(BankrollPoint{c.event_time, bankroll});
    }

    result.summary = summarize(config.initial_bankroll, result.bets, sharpe);
    if (!cal_y.empty()) {
        auto brier = calibration::brier_score(cal_y, cal_p);
        if (!brier) return std::unexpected(brier.error());
        result.summary.brier_score = *brier;
        auto bins = calibration::reliability_diagram(cal_y, cal_p, config.calibration_bins);
        if (!bins) return std::unexpected(bins.error());
        result.calibration = std::move(*bins);
    }

    if (core::log_enabled(core::log_level::info)) {
        core::log(core::log_level::info, kComponent,
                  "bets=" + std::to_string(result.summary.total_bets) +
                  " pending=" + std::to_string(result.skipped_pending) +
                  " ev_skips=" + std::to_string(result.skipped_ev) +
                  " confidence_skips=" + std::to_string(result.skipped_confidence) +
                  " final=" + std::to_string(result.summary.final_bankroll));
    }
    return result;
}

} // namespace calibet::backtest
