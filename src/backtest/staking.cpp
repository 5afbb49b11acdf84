#include "calibet/backtest/staking.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace calibet::backtest {

namespace {

constexpr const char* kComponent = "backtest.staking";

auto fraction_ok(double f) noexcept -> bool { return std::isfinite(f) && f > 0.0 && f <= 1.0; }

} // anonymous namespace

auto stake_for(const BacktestConfig& cfg, double bankroll, double p, double odds) noexcept -> double {
    if (!(bankroll > 0.0)) return 0.0;
    double stake = 0.0;
    switch (cfg.stake_mode) {
        case StakeMode::flat:
        case StakeMode::fixed_amount:
            stake = cfg.stake_amount;
            break;
        case StakeMode::fixed_fraction: {
            const double frac = cfg.stake_fraction.value_or(cfg.max_fraction_per_bet);
            stake = std::min(bankroll * frac, bankroll * cfg.max_fraction_per_bet);
            break;
        }
        case StakeMode::kelly: {
            if (odds - 1.0 <= 0.0) {
                stake = cfg.stake_amount;
                break;
            }
            const double cap = cfg.kelly_cap.value_or(cfg.max_fraction_per_bet);
            const double f = std::clamp(kelly_fraction(p, odds), 0.0, cap);
            stake = bankroll * f;
            break;
        }
    }
    if (!std::isfinite(stake)) return 0.0;
    return std::clamp(stake, 0.0, bankroll);
}

auto validate_config(const BacktestConfig& cfg) -> std::expected<void, core::error> {
    auto invalid = [](const std::string& msg) {
        return core::make_error(core::error_code::config_invalid, msg, kComponent);
    };
    if (!std::isfinite(cfg.initial_bankroll) || cfg.initial_bankroll <= 0.0) {
        return invalid("initial_bankroll must be > 0");
    }
    if (!fraction_ok(cfg.max_fraction_per_bet)) return invalid("max_fraction_per_bet must be in (0, 1]");
    if (cfg.stake_fraction && !fraction_ok(*cfg.stake_fraction)) return invalid("stake_fraction must be in (0, 1]");
    if (cfg.kelly_cap && !fraction_ok(*cfg.kelly_cap)) return invalid("kelly_cap must be in (0, 1]");
    if (!(cfg.min_confidence >= 0.0 && cfg.min_confidence <= 1.0)) {
        return invalid("min_confidence must be in [0, 1]");
    }
    const bool uses_amount = cfg.stake_mode == StakeMode::flat ||
                             cfg.stake_mode == StakeMode::fixed_amount ||
                             cfg.stake_mode == StakeMode::kelly;
    if (uses_amount && (!std::isfinite(cfg.stake_amount) || cfg.stake_amount <= 0.0)) {
        return invalid("stake_amount must be > 0 for " + std::string(to_string(cfg.stake_mode)) + " staking");
    }
    if (cfg.calibration_bins == 0) return invalid("calibration_bins must be >= 1");
    return {};
}

auto to_string(StakeMode mode) noexcept -> std::string_view {
    switch (mode) {
        case StakeMode::flat: return "flat";
        case StakeMode::fixed_amount: return "fixed_amount";
        case StakeMode::fixed_fraction: return "fixed_fraction";
        case StakeMode::kelly: return "kelly";
    }
    return "kelly";
}

auto stake_mode_from_string(std::string_view s) -> std::expected<StakeMode, core::error> {
    if (s == "flat") return StakeMode::flat;
    if (s == "fixed_amount") return StakeMode::fixed_amount;
    if (s == "fixed_fraction") return StakeMode::fixed_fraction;
    if (s == "kelly") return StakeMode::kelly;
    return core::make_error(core::error_code::invalid_argument,
                            "unknown stake mode \"" + std::string(s) + "\"", kComponent);
}

auto remove_vig(double over_odds, double under_odds) -> std::expected<double, core::error> {
    if (!std::isfinite(over_odds) || !std::isfinite(under_odds) || over_odds <= 1.0 || under_odds <= 1.0) {
        return core::make_error(core::error_code::invalid_argument,
                                "decimal odds must be finite and > 1", kComponent);
    }
    const double p_over = 1.0 / over_odds;
    const double p_under = 1.0 / under_odds;
    const double fair = p_over / (p_over + p_under);
    return 1.0 / fair;
}

} // namespace calibet::backtest
