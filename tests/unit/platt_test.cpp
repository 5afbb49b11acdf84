/** \file platt_test.cpp
 *  \brief Unit tests for Platt scaling (Newton-Raphson fit and application).
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include "calibet/calibration/platt.hpp"
#include "calibet/calibration/sigmoid.hpp"

using namespace calibet;
using namespace calibet::calibration;
using Catch::Matchers::WithinAbs;

namespace {

// y ~ Bernoulli(sigmoid(a * p + b)) for p uniform on [0.01, 0.99].
void make_logistic_data(std::size_t n, double a, double b, std::uint32_t seed,
                        std::vector<double>& p, std::vector<double>& y) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unif(0.01, 0.99);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    p.resize(n);
    y.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        p[i] = unif(rng);
        y[i] = coin(rng) < sigmoid(a * p[i] + b) ? 1.0 : 0.0;
    }
}

} // namespace

TEST_CASE("Platt recovers generating coefficients", "[platt]") {
    std::vector<double> p, y;
    make_logistic_data(20000, 3.0, -1.0, 7, p, y);

    auto fit = fit_platt(p, y);
    REQUIRE(fit.has_value());
    REQUIRE(fit->converged);
    REQUIRE(fit->iterations > 0);
    REQUIRE(fit->iterations <= 100);
    REQUIRE_THAT(fit->model.a, WithinAbs(3.0, 0.3));
    REQUIRE_THAT(fit->model.b, WithinAbs(-1.0, 0.2));
}

TEST_CASE("Platt fit is deterministic", "[platt]") {
    std::vector<double> p, y;
    make_logistic_data(500, 2.0, 0.5, 11, p, y);

    auto f1 = fit_platt(p, y);
    auto f2 = fit_platt(p, y);
    REQUIRE(f1.has_value());
    REQUIRE(f2.has_value());
    REQUIRE(f1->model.a == f2->model.a);
    REQUIRE(f1->model.b == f2->model.b);
    REQUIRE(f1->iterations == f2->iterations);
}

TEST_CASE("Platt input validation", "[platt]") {
    const std::vector<double> p3{0.2, 0.5, 0.8};
    const std::vector<double> y2{0.0, 1.0};

    SECTION("shape mismatch") {
        auto r = fit_platt(p3, y2);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::shape_mismatch);
    }
    SECTION("too few samples") {
        const std::vector<double> p2{0.2, 0.8};
        auto r = fit_platt(p2, y2);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::insufficient_data);
    }
    SECTION("empty input") {
        PlattParams params;
        params.min_samples = 0;
        auto r = fit_platt({}, {}, params);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::insufficient_data);
    }
    SECTION("non-finite input") {
        const std::vector<double> p{0.2, std::numeric_limits<double>::quiet_NaN(), 0.8};
        const std::vector<double> y{0.0, 1.0, 1.0};
        auto r = fit_platt(p, y);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::invalid_argument);
    }
}

TEST_CASE("Platt with constant input uses the pseudo-inverse", "[platt]") {
    // Columns [p, 1] are collinear; with no regularization the Hessian is singular.
    std::vector<double> p(10, 0.5);
    std::vector<double> y{1, 1, 1, 0, 0, 0, 0, 0, 0, 0};
    PlattParams params;
    params.reg = 0.0;

    auto fit = fit_platt(p, y, params);
    REQUIRE(fit.has_value());
    REQUIRE(std::isfinite(fit->model.a));
    REQUIRE(std::isfinite(fit->model.b));
    REQUIRE_THAT(apply_platt(fit->model, 0.5), WithinAbs(0.3, 1e-6));
}

TEST_CASE("Platt application", "[platt]") {
    PlattModel identity_like{1.0, 0.0};
    REQUIRE_THAT(apply_platt(identity_like, 0.0), WithinAbs(0.5, 1e-15));

    PlattModel steep{10.0, -5.0};
    REQUIRE(apply_platt(steep, 0.9) > apply_platt(steep, 0.1));
    REQUIRE_THAT(apply_platt(steep, 0.5), WithinAbs(0.5, 1e-15));
}
