#pragma once

/** \file kfold.hpp
 *  \brief K-fold cross-fitted calibrators.
 *
 * Indices are shuffled with a seeded generator and split into k contiguous
 * folds of near-equal size. Fold i is fitted on every other fold; the held-out
 * fold is not evaluated. Fold fits are independent and run on a thread pool;
 * results are aggregated in fold order so the output does not depend on
 * scheduling.
 *
 * Failure policy: a failing fold is logged and skipped. If every fold fails,
 * a single fit on the full data is attempted and its error (if any) returned.
 * With fewer samples than folds, a single non-folded fit is returned.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "calibet/calibration/calibrator.hpp"
#include "calibet/calibration/isotonic.hpp"
#include "calibet/calibration/platt.hpp"
#include "calibet/error.hpp"

namespace calibet::calibration {

struct KFoldParams {
    std::uint32_t k{5};              /**< Number of folds */
    std::uint64_t seed{0};           /**< Shuffle seed */
    std::size_t threads{0};          /**< Workers (0 = CALIBET_KFOLD_THREADS or min(k, hw/2)) */
    PlattParams platt{};             /**< Per-fold Platt solver parameters */
    IsotonicParams isotonic{};       /**< Per-fold isotonic parameters */
};

/** \brief Shuffled fold assignment: folds[i] lists the sample indices of fold i. */
auto make_folds(std::size_t n, std::uint32_t k, std::uint64_t seed)
    -> std::vector<std::vector<std::size_t>>;

/** \brief Platt fit averaged over k training folds (mean of a and b). */
auto fit_platt_kfold(std::span<const double> p, std::span<const double> y,
                     const KFoldParams& params = {})
    -> std::expected<PlattFit, core::error>;

/** \brief K isotonic fits kept as an averaging ensemble. */
auto fit_isotonic_kfold(std::span<const double> p, std::span<const double> y,
                        const KFoldParams& params = {})
    -> std::expected<IsotonicEnsemble, core::error>;

} // namespace calibet::calibration
