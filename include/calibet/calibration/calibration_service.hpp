#pragma once

/** \file calibration_service.hpp
 *  \brief Fit-by-method, before/after evaluation and registration in one call.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "calibet/calibration/calibrator.hpp"
#include "calibet/calibration/kfold.hpp"
#include "calibet/error.hpp"
#include "calibet/registry/calibrator_registry.hpp"

namespace calibet::calibration {

enum class FitMethod : std::uint8_t { platt, isotonic, platt_kfold, isotonic_kfold };

[[nodiscard]] auto to_string(FitMethod m) noexcept -> std::string_view;
auto fit_method_from_string(std::string_view s) -> std::expected<FitMethod, core::error>;

struct FitOptions {
    KFoldParams kfold{};          /**< k-fold settings; kfold.platt / kfold.isotonic also drive single fits */
    std::uint32_t ece_bins{10};
};

/** \brief Error statistics of probabilities against binary outcomes. */
struct QualityReport {
    double brier{0.0};
    double ece{0.0};
    double mse{0.0};
    double rmse{0.0};
    double mae{0.0};
};

[[nodiscard]] auto to_json(const QualityReport& q) -> nlohmann::json;

auto fit_calibrator(FitMethod method, std::span<const double> p, std::span<const double> y,
                    const FitOptions& options = {})
    -> std::expected<Calibrator, core::error>;

auto evaluate_calibration(std::span<const double> y, std::span<const double> p,
                          std::uint32_t ece_bins = 10)
    -> std::expected<QualityReport, core::error>;

struct RegistrationResult {
    registry::CalibratorRecord record;
    QualityReport before;
    QualityReport after;
};

/** \brief Fit, evaluate raw vs calibrated on the same data and register the calibrator.
 *
 * Metadata: {method, n_samples, before{...}, after{...}}.
 */
auto fit_and_register(registry::CalibratorRegistry& registry, std::string_view name,
                      std::span<const double> p, std::span<const double> y,
                      FitMethod method, const FitOptions& options = {})
    -> std::expected<RegistrationResult, core::error>;

} // namespace calibet::calibration
