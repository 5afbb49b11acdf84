/** \file calibration_metrics_test.cpp
 *  \brief Brier score, ECE and reliability bins.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <vector>

#include "calibet/calibration/calibration_metrics.hpp"

using namespace calibet;
using namespace calibet::calibration;
using Catch::Matchers::WithinAbs;

TEST_CASE("Brier score", "[metrics]") {
    const std::vector<double> y{1.0, 0.0};
    const std::vector<double> p{0.8, 0.4};
    auto b = brier_score(y, p);
    REQUIRE(b.has_value());
    REQUIRE_THAT(*b, WithinAbs(0.1, 1e-12));

    const std::vector<double> perfect{1.0, 0.0};
    REQUIRE(*brier_score(y, perfect) == 0.0);
}

TEST_CASE("ECE places p == 1 in the last bin", "[metrics]") {
    const std::vector<double> y{0.0, 1.0, 1.0};
    const std::vector<double> p{0.1, 0.9, 1.0};

    auto ece = expected_calibration_error(y, p);
    REQUIRE(ece.has_value());
    // bin 1: |0.1 - 0| * 1/3, bin 9: |0.95 - 1| * 2/3
    REQUIRE_THAT(*ece, WithinAbs(0.1 / 3.0 + 0.05 * 2.0 / 3.0, 1e-12));

    REQUIRE(calibration_bin(1.0, 10) == 9);
    REQUIRE(calibration_bin(0.0, 10) == 0);
    REQUIRE(calibration_bin(0.35, 10) == 3);
    REQUIRE(calibration_bin(-0.5, 10) == 0);
}

TEST_CASE("reliability diagram bins", "[metrics]") {
    const std::vector<double> y{0.0, 1.0, 1.0};
    const std::vector<double> p{0.1, 0.9, 1.0};

    auto bins = reliability_diagram(y, p, 10);
    REQUIRE(bins.has_value());
    REQUIRE(bins->size() == 10);
    REQUIRE((*bins)[9].count == 2);
    REQUIRE_THAT((*bins)[9].center, WithinAbs(0.95, 1e-12));
    REQUIRE_THAT((*bins)[9].mean_predicted, WithinAbs(0.95, 1e-12));
    REQUIRE_THAT((*bins)[9].mean_observed, WithinAbs(1.0, 1e-12));
    REQUIRE((*bins)[5].count == 0);
    REQUIRE((*bins)[5].mean_predicted == 0.0);
}

TEST_CASE("metric input errors", "[metrics]") {
    const std::vector<double> y{1.0, 0.0};
    const std::vector<double> p{0.5};

    auto b = brier_score(y, p);
    REQUIRE_FALSE(b.has_value());
    REQUIRE(b.error().code == core::error_code::shape_mismatch);

    auto e = expected_calibration_error({}, {});
    REQUIRE_FALSE(e.has_value());
    REQUIRE(e.error().code == core::error_code::insufficient_data);

    const std::vector<double> p2{0.5, 0.5};
    auto z = expected_calibration_error(y, p2, 0);
    REQUIRE_FALSE(z.has_value());
    REQUIRE(z.error().code == core::error_code::invalid_argument);
}
