#include "calibet/calibration/platt.hpp"
#include "calibet/calibration/sigmoid.hpp"
#include "calibet/core/log.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace calibet::calibration {

namespace {

constexpr const char* kComponent = "calibration.platt";

/** \brief Symmetric 2x2 matrix [[m00, m01], [m01, m11]]. */
struct Sym2 {
    double m00{0.0};
    double m01{0.0};
    double m11{0.0};
};

using Vec2 = std::array<double, 2>;

/** \brief Moore-Penrose pseudo-inverse applied to rhs, via the symmetric eigen-decomposition. */
auto pinv_solve(const Sym2& h, const Vec2& rhs) noexcept -> Vec2 {
    const double half_tr = 0.5 * (h.m00 + h.m11);
    const double half_diff = 0.5 * (h.m00 - h.m11);
    const double r = std::hypot(half_diff, h.m01);
    const std::array<double, 2> lambda{half_tr + r, half_tr - r};
    const double cutoff = 1e-15 * std::max(std::abs(lambda[0]), std::abs(lambda[1]));

    std::array<Vec2, 2> vecs{};
    if (h.m01 == 0.0) {
        // Already diagonal: order axes to match lambda (largest first).
        if (h.m00 >= h.m11) { vecs = {Vec2{1.0, 0.0}, Vec2{0.0, 1.0}}; }
        else { vecs = {Vec2{0.0, 1.0}, Vec2{1.0, 0.0}}; }
    } else {
        for (int i = 0; i < 2; ++i) {
            Vec2 v{lambda[i] - h.m11, h.m01};
            const double norm = std::hypot(v[0], v[1]);
            vecs[i] = {v[0] / norm, v[1] / norm};
        }
    }

    Vec2 out{0.0, 0.0};
    for (int i = 0; i < 2; ++i) {
        if (std::abs(lambda[i]) <= cutoff) continue;
        const double proj = (vecs[i][0] * rhs[0] + vecs[i][1] * rhs[1]) / lambda[i];
        out[0] += proj * vecs[i][0];
        out[1] += proj * vecs[i][1];
    }
    return out;
}

/** \brief Solve h * x = rhs; falls back to the pseudo-inverse when h is singular. */
auto solve2(const Sym2& h, const Vec2& rhs) noexcept -> Vec2 {
    const double det = h.m00 * h.m11 - h.m01 * h.m01;
    const double scale = std::max({std::abs(h.m00), std::abs(h.m01), std::abs(h.m11)});
    if (scale == 0.0 || std::abs(det) <= 1e-15 * scale * scale) {
        if (core::log_enabled(core::log_level::debug)) {
            core::log(core::log_level::debug, kComponent, "singular Hessian, using pseudo-inverse");
        }
        return pinv_solve(h, rhs);
    }
    return {(h.m11 * rhs[0] - h.m01 * rhs[1]) / det,
            (h.m00 * rhs[1] - h.m01 * rhs[0]) / det};
}

} // anonymous namespace

auto fit_platt(std::span<const double> p, std::span<const double> y,
               const PlattParams& params)
    -> std::expected<PlattFit, core::error> {
    using core::error_code;
    if (p.size() != y.size()) {
        return core::make_error(error_code::shape_mismatch,
            "p and y must have the same length (" + std::to_string(p.size()) + " vs " +
            std::to_string(y.size()) + ")", kComponent);
    }
    const std::size_t n = p.size();
    if (n < params.min_samples || n == 0) {
        return core::make_error(error_code::insufficient_data,
            "need at least " + std::to_string(std::max<std::size_t>(params.min_samples, 1)) +
            " paired samples, got " + std::to_string(n), kComponent);
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(p[i]) || !std::isfinite(y[i])) {
            return core::make_error(error_code::invalid_argument,
                "non-finite input at index " + std::to_string(i), kComponent);
        }
    }

    double y_sum = 0.0;
    for (double v : y) y_sum += v;
    const double y_mean = y_sum / static_cast<double>(n);

    // w = [a, b]
    Vec2 w{1.0, logit(y_mean)};
    PlattFit fit{};

    for (std::uint32_t it = 0; it < params.max_iter; ++it) {
        Vec2 grad{0.0, 0.0};
        Sym2 xsx{};
        for (std::size_t i = 0; i < n; ++i) {
            const double s = sigmoid(w[0] * p[i] + w[1]);
            const double r = y[i] - s;
            grad[0] += p[i] * r;
            grad[1] += r;
            const double sw = s * (1.0 - s);
            xsx.m00 += sw * p[i] * p[i];
            xsx.m01 += sw * p[i];
            xsx.m11 += sw;
        }
        grad[0] -= params.reg * w[0];
        grad[1] -= params.reg * w[1];
        const Sym2 h{-xsx.m00 - params.reg, -xsx.m01, -xsx.m11 - params.reg};

        const Vec2 delta = solve2(h, grad);
        if (!std::isfinite(delta[0]) || !std::isfinite(delta[1])) {
            return core::make_error(error_code::numeric_failure,
                "non-finite Newton step at iteration " + std::to_string(it), kComponent);
        }
        w[0] -= delta[0];
        w[1] -= delta[1];
        fit.iterations = it + 1;
        if (std::max(std::abs(delta[0]), std::abs(delta[1])) < params.tol) {
            fit.converged = true;
            break;
        }
    }

    if (!fit.converged && core::log_enabled(core::log_level::debug)) {
        core::log(core::log_level::debug, kComponent,
                  "iteration cap reached (" + std::to_string(params.max_iter) + ") before convergence");
    }
    fit.model = PlattModel{w[0], w[1]};
    return fit;
}

auto apply_platt(const PlattModel& m, double p) noexcept -> double {
    return sigmoid(m.a * p + m.b);
}

} // namespace calibet::calibration
