#include "calibet/backtest/performance_metrics.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace calibet::backtest {

auto roi(double initial, double final_value) noexcept -> double {
    if (initial <= 0.0) return 0.0;
    return (final_value - initial) / initial;
}

auto win_rate(std::size_t wins, std::size_t total) noexcept -> double {
    if (total == 0) return 0.0;
    return static_cast<double>(wins) / static_cast<double>(total);
}

auto max_drawdown(std::span<const double> balances) noexcept -> double {
    double peak = 0.0;
    double worst = 0.0;
    bool have_peak = false;
    for (double b : balances) {
        if (!have_peak || b > peak) {
            peak = b;
            have_peak = true;
        }
        if (peak > 0.0) worst = std::max(worst, (peak - b) / peak);
    }
    return std::clamp(worst, 0.0, 1.0);
}

auto cagr(double initial, double final_value, TimePoint first, TimePoint last) noexcept
    -> std::optional<double> {
    using namespace std::chrono;
    constexpr double kSecondsPerYear = 365.25 * 86400.0;
    const double secs = duration<double>(last - first).count();
    const double years = secs / kSecondsPerYear;
    if (years == 0.0 || initial <= 0.0) return std::nullopt;
    const double ratio = final_value / initial;
    if (!(ratio > 0.0)) return std::nullopt;
    const double g = std::pow(ratio, 1.0 / years) - 1.0;
    if (!std::isfinite(g)) return std::nullopt;
    return g;
}

auto sharpe_ratio(std::span<const double> returns, const SharpeOptions& opts) noexcept
    -> std::optional<double> {
    const std::size_t n = returns.size();
    if (n < 2) return std::nullopt;
    double sum = 0.0;
    for (double r : returns) sum += r;
    const double mean = sum / static_cast<double>(n);
    double ss = 0.0;
    for (double r : returns) ss += (r - mean) * (r - mean);
    const double sd = std::sqrt(ss / static_cast<double>(n));
    if (!(sd > 0.0)) return std::nullopt;
    double ratio = mean / sd;
    if (opts.periods_per_year) ratio *= std::sqrt(*opts.periods_per_year);
    return ratio;
}

auto summarize(double initial_bankroll, std::span<const BetRecord> bets, const SharpeOptions& opts)
    -> BacktestSummary {
    BacktestSummary s;
    s.initial_bankroll = initial_bankroll;
    s.final_bankroll = bets.empty() ? initial_bankroll : bets.back().bankroll_after;
    s.total_bets = bets.size();

    std::vector<double> balances;
    std::vector<double> returns;
    balances.reserve(bets.size() + 1);
    returns.reserve(bets.size());
    balances.push_back(initial_bankroll);
    for (const auto& b : bets) {
        if (b.won) ++s.wins;
        balances.push_back(b.bankroll_after);
        returns.push_back(initial_bankroll > 0.0 ? b.profit / initial_bankroll : 0.0);
    }
    s.losses = s.total_bets - s.wins;
    s.win_rate = win_rate(s.wins, s.total_bets);
    s.roi = roi(initial_bankroll, s.final_bankroll);
    s.max_drawdown = max_drawdown(balances);
    s.sharpe = sharpe_ratio(returns, opts);
    if (!bets.empty()) {
        s.cagr = cagr(initial_bankroll, s.final_bankroll, bets.front().event_time, bets.back().event_time);
    }
    return s;
}

} // namespace calibet::backtest
