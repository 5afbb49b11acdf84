#pragma once

/** \file isotonic.hpp
 *  \brief Isotonic calibration fitted with Pool-Adjacent-Violators (PAV).
 *
 * The fitted model is a sequence of knots (x, y) with both coordinates
 * non-decreasing. Application interpolates linearly between knots, clamps to
 * the boundary y outside the knot range, and clamps the result to [0, 1].
 */

#include <cstddef>
#include <expected>
#include <span>
#include <vector>

#include "calibet/error.hpp"

namespace calibet::calibration {

struct IsotonicParams {
    std::size_t min_samples{0};   /**< Fewer pairs -> insufficient_data (0 allows empty fits) */
};

/** \brief Monotone piecewise-linear calibrator. xs and ys have equal length. */
struct IsotonicModel {
    std::vector<double> xs;   /**< knot positions (mean raw probability per block) */
    std::vector<double> ys;   /**< knot values (mean outcome per block) */

    [[nodiscard]] bool empty() const noexcept { return xs.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return xs.size(); }
};

/** \brief Fit isotonic regression of y on p.
 *
 * Points are stable-sorted by p; ties keep input order. Empty input yields an
 * empty model.
 *
 * \return Model or error (shape_mismatch, insufficient_data, invalid_argument)
 * Complexity: O(n log n) for the sort, amortized O(n) merges
 */
auto fit_isotonic(std::span<const double> p, std::span<const double> y,
                  const IsotonicParams& params = {})
    -> std::expected<IsotonicModel, core::error>;

/** \brief Apply the mapping; an empty model returns p clamped to [0, 1]. */
[[nodiscard]] auto apply_isotonic(const IsotonicModel& m, double p) noexcept -> double;

} // namespace calibet::calibration
