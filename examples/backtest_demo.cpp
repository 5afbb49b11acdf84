/**
 * End-to-end calibration and backtest example using calibet
 *
 * This example demonstrates:
 * - Fitting a calibrator on historical predictions
 * - Registering it in a versioned registry
 * - Calibrating new candidates and simulating a bankroll
 * - Writing a report
 *
 * Usage: backtest_demo <candidates.csv> [registry_dir] [report_dir]
 */

#include <calibet/backtest/backtest_engine.hpp>
#include <calibet/backtest/candidate_csv.hpp>
#include <calibet/backtest/report.hpp>
#include <calibet/calibration/calibration_service.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    using namespace calibet;

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <candidates.csv> [registry_dir] [report_dir]\n";
        return 2;
    }
    const std::string registry_dir = argc > 2 ? argv[2] : "./calibrators";
    const std::string report_dir = argc > 3 ? argv[3] : "./reports";

    auto candidates = backtest::load_candidates_csv(argv[1]);
    if (!candidates) {
        std::cerr << "Failed to load candidates: " << candidates.error().message << "\n";
        return 1;
    }

    // Resolved candidates form the calibration set.
    std::vector<double> p, y;
    for (const auto& c : *candidates) {
        if (!c.actual) continue;
        p.push_back(c.probability);
        y.push_back(backtest::resolve_win(*c.actual, c.line, c.prediction) ? 1.0 : 0.0);
    }

    auto registry = registry::CalibratorRegistry::open(registry_dir);
    if (!registry) {
        std::cerr << "Failed to open registry: " << registry.error().message << "\n";
        return 1;
    }

    auto reg = calibration::fit_and_register(*registry, "demo", p, y, calibration::FitMethod::isotonic_kfold);
    if (!reg) {
        std::cerr << "Calibration failed: " << reg.error().message << "\n";
        return 1;
    }
    std::cout << "Registered demo@" << reg->record.version_id
              << "  brier " << reg->before.brier << " -> " << reg->after.brier
              << "  ece " << reg->before.ece << " -> " << reg->after.ece << "\n";

    auto calibrator = registry->load(reg->record.name, reg->record.version_id);
    if (!calibrator) {
        std::cerr << "Reload failed: " << calibrator.error().message << "\n";
        return 1;
    }
    auto calibrated = *candidates;
    for (auto& c : calibrated) c.probability = calibration::calibrate_or_raw(**calibrator, c.probability);

    auto result = backtest::run_backtest(calibrated, backtest::BacktestConfig{});
    if (!result) {
        std::cerr << "Backtest failed: " << result.error().message << "\n";
        return 1;
    }
    const auto& s = result->summary;
    std::cout << "Bets: " << s.total_bets << "  wins: " << s.wins
              << "  final bankroll: " << s.final_bankroll << "  roi: " << s.roi
              << "  max drawdown: " << s.max_drawdown << "\n";

    auto dir = backtest::save_report(*result, report_dir);
    if (!dir) {
        std::cerr << "Report failed: " << dir.error().message << "\n";
        return 1;
    }
    std::cout << "Report written to " << dir->string() << "\n";
    return 0;
}
