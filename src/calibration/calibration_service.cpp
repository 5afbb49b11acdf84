#include "calibet/calibration/calibration_service.hpp"
#include "calibet/calibration/calibration_metrics.hpp"
#include "calibet/core/log.hpp"

#include <cmath>
#include <vector>

namespace calibet::calibration {

namespace {

constexpr const char* kComponent = "calibration.service";

} // anonymous namespace

auto to_string(FitMethod m) noexcept -> std::string_view {
    switch (m) {
        case FitMethod::platt: return "platt";
        case FitMethod::isotonic: return "isotonic";
        case FitMethod::platt_kfold: return "platt_kfold";
        case FitMethod::isotonic_kfold: return "isotonic_kfold";
    }
    return "isotonic";
}

auto fit_method_from_string(std::string_view s) -> std::expected<FitMethod, core::error> {
    if (s == "platt") return FitMethod::platt;
    if (s == "isotonic") return FitMethod::isotonic;
    if (s == "platt_kfold") return FitMethod::platt_kfold;
    if (s == "isotonic_kfold") return FitMethod::isotonic_kfold;
    return core::make_error(core::error_code::invalid_argument,
                            "unknown fit method \"" + std::string(s) + "\"", kComponent);
}

auto to_json(const QualityReport& q) -> nlohmann::json {
    return nlohmann::json{
        {"brier", q.brier}, {"ece", q.ece}, {"mse", q.mse}, {"rmse", q.rmse}, {"mae", q.mae},
    };
}

auto fit_calibrator(FitMethod method, std::span<const double> p, std::span<const double> y,
                    const FitOptions& options)
    -> std::expected<Calibrator, core::error> {
    switch (method) {
        case FitMethod::platt: {
            auto f = fit_platt(p, y, options.kfold.platt);
            if (!f) return std::unexpected(f.error());
            return Calibrator(f->model);
        }
        case FitMethod::isotonic: {
            auto m = fit_isotonic(p, y, options.kfold.isotonic);
            if (!m) return std::unexpected(m.error());
            return Calibrator(std::move(*m));
        }
        case FitMethod::platt_kfold: {
            auto f = fit_platt_kfold(p, y, options.kfold);
            if (!f) return std::unexpected(f.error());
            return Calibrator(f->model);
        }
        case FitMethod::isotonic_kfold: {
            auto e = fit_isotonic_kfold(p, y, options.kfold);
            if (!e) return std::unexpected(e.error());
            return Calibrator(std::move(*e));
        }
    }
    return core::make_error(core::error_code::internal, "unreachable fit method", kComponent);
}

auto evaluate_calibration(std::span<const double> y, std::span<const double> p, std::uint32_t ece_bins)
    -> std::expected<QualityReport, core::error> {
    QualityReport q;
    auto brier = brier_score(y, p);
    if (!brier) return std::unexpected(brier.error());
    auto ece = expected_calibration_error(y, p, ece_bins);
    if (!ece) return std::unexpected(ece.error());
    double abs_sum = 0.0;
    for (std::size_t i = 0; i < y.size(); ++i) abs_sum += std::abs(p[i] - y[i]);
    q.brier = *brier;
    q.ece = *ece;
    q.mse = *brier;
    q.rmse = std::sqrt(*brier);
    q.mae = abs_sum / static_cast<double>(y.size());
    return q;
}

auto fit_and_register(registry::CalibratorRegistry& registry, std::string_view name,
                      std::span<const double> p, std::span<const double> y,
                      FitMethod method, const FitOptions& options)
    -> std::expected<RegistrationResult, core::error> {
    auto before = evaluate_calibration(y, p, options.ece_bins);
    if (!before) return std::unexpected(before.error());

    auto calibrator = fit_calibrator(method, p, y, options);
    if (!calibrator) return std::unexpected(calibrator.error());

    std::vector<double> raw(p.begin(), p.end());
    const auto calibrated = calibrate_all(*calibrator, raw);
    auto after = evaluate_calibration(y, calibrated, options.ece_bins);
    if (!after) return std::unexpected(after.error());

    const nlohmann::json metadata{
        {"method", std::string(to_string(method))},
        {"n_samples", p.size()},
        {"before", to_json(*before)},
        {"after", to_json(*after)},
    };
    auto record = registry.register_calibrator(name, *calibrator, metadata);
    if (!record) return std::unexpected(record.error());

    if (core::log_enabled(core::log_level::info)) {
        core::log(core::log_level::info, kComponent,
                  std::string(name) + ": brier " + std::to_string(before->brier) + " -> " +
                  std::to_string(after->brier) + ", ece " + std::to_string(before->ece) + " -> " +
                  std::to_string(after->ece));
    }
    return RegistrationResult{std::move(*record), *before, *after};
}

} // namespace calibet::calibration
