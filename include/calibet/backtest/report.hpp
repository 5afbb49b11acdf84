#pragma once

/** \file report.hpp
 *  \brief Tabular and JSON export of a finished backtest.
 *
 * save_report writes into <outdir>/<run_name>/:
 *   bets.csv         one row per ledger entry
 *   summary.csv      header + one row of summary statistics
 *   calibration.csv  bin, center, mean_pred, mean_obs, count
 *   summary.json     summary plus skip counters
 * Absent optional statistics are written as empty CSV fields and JSON null.
 */

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "calibet/backtest/bet.hpp"
#include "calibet/error.hpp"

namespace calibet::backtest {

[[nodiscard]] auto bets_csv(const BacktestResult& result) -> std::string;
[[nodiscard]] auto summary_csv(const BacktestSummary& summary) -> std::string;
[[nodiscard]] auto calibration_csv(const BacktestResult& result) -> std::string;
[[nodiscard]] auto summary_json(const BacktestResult& result) -> nlohmann::json;

/** \brief "backtest_YYYYMMDDTHHMMSSZ" for the given instant. */
[[nodiscard]] auto default_run_name(TimePoint now = Clock::now()) -> std::string;

/** \brief Write all report files; returns the run directory. */
auto save_report(const BacktestResult& result, const std::filesystem::path& outdir,
                 std::optional<std::string> run_name = std::nullopt)
    -> std::expected<std::filesystem::path, core::error>;

} // namespace calibet::backtest
