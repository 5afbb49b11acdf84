#pragma once

/** \file platt.hpp
 *  \brief Platt scaling: calibrated = sigmoid(a * p + b).
 *
 * Fitted by Newton-Raphson on the L2-regularized log-likelihood with design
 * matrix columns [p, 1]. The regularization term only keeps the Hessian
 * invertible; it does not noticeably move the optimum on well-posed inputs.
 *
 * Determinism: identical inputs and parameters produce bit-identical (a, b).
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

#include "calibet/error.hpp"

namespace calibet::calibration {

/** \brief Newton-Raphson parameters. */
struct PlattParams {
    std::uint32_t max_iter{100};   /**< Iteration cap */
    double tol{1e-6};              /**< Stop when max |delta| falls below */
    double reg{1e-8};              /**< L2 regularization */
    std::size_t min_samples{3};    /**< Fewer pairs -> insufficient_data */
};

/** \brief Fitted Platt coefficients. */
struct PlattModel {
    double a{1.0};
    double b{0.0};
};

/** \brief Fit outcome with solver diagnostics. */
struct PlattFit {
    PlattModel model;
    std::uint32_t iterations{0};
    bool converged{false};
};

/** \brief Fit Platt scaling.
 *
 * \param p Raw probabilities
 * \param y Binary labels (0/1)
 * \param params Solver parameters
 * \return Fitted model or error (shape_mismatch, insufficient_data, invalid_argument)
 *
 * Complexity: O(n * iterations)
 */
auto fit_platt(std::span<const double> p, std::span<const double> y,
               const PlattParams& params = {})
    -> std::expected<PlattFit, core::error>;

/** \brief Apply a Platt model to one probability (not clamped, always in (0,1) for finite input). */
[[nodiscard]] auto apply_platt(const PlattModel& m, double p) noexcept -> double;

} // namespace calibet::calibration
