#pragma once

/** \file sigmoid.hpp
 *  \brief Numerically stable logistic transform and its inverse.
 */

#include <algorithm>
#include <cmath>

namespace calibet::calibration {

/** \brief Logistic function 1/(1+e^-x), branch-split so exp() never overflows. */
[[nodiscard]] inline auto sigmoid(double x) noexcept -> double {
  if (x >= 0.0) {
    return 1.0 / (1.0 + std::exp(-x));
  }
  const double ex = std::exp(x);
  return ex / (1.0 + ex);
}

/** \brief Log-odds of p, with p clamped to [eps, 1-eps]. */
[[nodiscard]] inline auto logit(double p, double eps = 1e-12) noexcept -> double {
  const double c = std::clamp(p, eps, 1.0 - eps);
  return std::log(c / (1.0 - c));
}

} // namespace calibet::calibration
