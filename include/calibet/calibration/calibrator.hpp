#pragma once

/** \file calibrator.hpp
 *  \brief Tagged calibrator variant with a single dispatch point and a text blob format.
 *
 * Blob format (v1):
 *   calibet-calibrator v1\n
 *   kind=<platt|isotonic|isotonic_ensemble>\n
 *   platt:             a=<double>\n b=<double>\n
 *   isotonic:          knots=<N>\n followed by N lines "<x> <y>"
 *   isotonic_ensemble: models=<K>\n followed by K isotonic sections (knots=<N> + N lines)
 * Doubles are written with 17 significant digits so a reload reproduces the
 * in-memory model exactly.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "calibet/calibration/isotonic.hpp"
#include "calibet/calibration/platt.hpp"
#include "calibet/error.hpp"

namespace calibet::calibration {

enum class CalibratorKind : std::uint8_t { platt, isotonic, isotonic_ensemble };

/** \brief K isotonic models whose applied outputs are averaged. */
struct IsotonicEnsemble {
    std::vector<IsotonicModel> models;
};

[[nodiscard]] auto to_string(CalibratorKind kind) noexcept -> std::string_view;
auto calibrator_kind_from_string(std::string_view s) -> std::expected<CalibratorKind, core::error>;

/** \brief Immutable fitted calibrator. */
class Calibrator {
public:
    using Model = std::variant<PlattModel, IsotonicModel, IsotonicEnsemble>;

    Calibrator() = default;
    explicit Calibrator(PlattModel m) : model_(m) {}
    explicit Calibrator(IsotonicModel m) : model_(std::move(m)) {}
    explicit Calibrator(IsotonicEnsemble m) : model_(std::move(m)) {}

    [[nodiscard]] auto kind() const noexcept -> CalibratorKind;
    [[nodiscard]] auto model() const noexcept -> const Model& { return model_; }

    /** \brief Raw transform of one probability; may be non-finite for non-finite input. */
    [[nodiscard]] auto apply(double p) const noexcept -> double;

private:
    Model model_{PlattModel{}};
};

/** \brief Calibrate one probability.
 *
 * Finite outputs are clamped to [0, 1]; a non-finite output is reported as
 * numeric_failure so the caller can decide on a fallback.
 */
auto calibrate(const Calibrator& c, double p) -> std::expected<double, core::error>;

/** \brief Calibrate, falling back to the raw probability (with a warning) on numeric failure. */
[[nodiscard]] auto calibrate_or_raw(const Calibrator& c, double p) -> double;

/** \brief Calibrate a batch with calibrate_or_raw semantics. */
[[nodiscard]] auto calibrate_all(const Calibrator& c, const std::vector<double>& p) -> std::vector<double>;

/** \brief Arithmetic mean of each member's applied value; an empty ensemble clamps p. */
[[nodiscard]] auto apply_ensemble(const IsotonicEnsemble& e, double p) noexcept -> double;

auto serialize(const Calibrator& c) -> std::string;
auto deserialize(std::string_view text) -> std::expected<Calibrator, core::error>;

} // namespace calibet::calibration
