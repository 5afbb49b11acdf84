#pragma once

/** \file calibration_metrics.hpp
 *  \brief Calibration quality metrics: Brier score, ECE and reliability bins.
 *
 * All functions take (y_true, y_prob) pairs of equal length. A length mismatch
 * is reported as shape_mismatch, never truncated.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "calibet/error.hpp"

namespace calibet::calibration {

/** \brief One bin of a reliability diagram. */
struct ReliabilityBin {
    double center{0.0};          /**< midpoint of the bin on [0,1] */
    double mean_predicted{0.0};  /**< 0 for empty bins */
    double mean_observed{0.0};   /**< 0 for empty bins */
    std::size_t count{0};
};

/** \brief Mean squared error between probability and binary outcome. */
auto brier_score(std::span<const double> y_true, std::span<const double> y_prob)
    -> std::expected<double, core::error>;

/** \brief Expected Calibration Error over equal-width bins.
 *
 * Bin index is floor(p * n_bins) clamped to [0, n_bins-1], so p == 1 belongs to
 * the last bin. Each non-empty bin contributes |mean(pred) - mean(obs)| weighted
 * by its share of samples.
 */
auto expected_calibration_error(std::span<const double> y_true, std::span<const double> y_prob,
                                std::uint32_t n_bins = 10)
    -> std::expected<double, core::error>;

/** \brief Per-bin data for a reliability diagram (same binning as ECE). */
auto reliability_diagram(std::span<const double> y_true, std::span<const double> y_prob,
                         std::uint32_t n_bins = 10)
    -> std::expected<std::vector<ReliabilityBin>, core::error>;

/** \brief Bin index used by ECE and the reliability diagram. */
[[nodiscard]] auto calibration_bin(double p, std::uint32_t n_bins) noexcept -> std::size_t;

} // namespace calibet::calibration
