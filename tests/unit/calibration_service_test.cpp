/** \file calibration_service_test.cpp
 *  \brief Fitting by method, quality evaluation and registration.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include "calibet/calibration/calibration_service.hpp"
#include "calibet/calibration/sigmoid.hpp"

using namespace calibet;
using namespace calibet::calibration;
using Catch::Matchers::WithinAbs;

namespace {

// Raw scores are badly miscalibrated: the true probability is sigmoid(10p - 7).
void miscalibrated(std::size_t n, std::uint32_t seed, std::vector<double>& p, std::vector<double>& y) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    p.resize(n);
    y.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        p[i] = unif(rng);
        y[i] = unif(rng) < sigmoid(10.0 * p[i] - 7.0) ? 1.0 : 0.0;
    }
}

} // namespace

TEST_CASE("fit method names", "[service]") {
    for (auto m : {FitMethod::platt, FitMethod::isotonic, FitMethod::platt_kfold, FitMethod::isotonic_kfold}) {
        auto parsed = fit_method_from_string(to_string(m));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == m);
    }
    auto bad = fit_method_from_string("beta");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == core::error_code::invalid_argument);
}

TEST_CASE("fit_calibrator produces the requested kind", "[service]") {
    std::vector<double> p, y;
    miscalibrated(400, 1, p, y);

    REQUIRE(fit_calibrator(FitMethod::platt, p, y)->kind() == CalibratorKind::platt);
    REQUIRE(fit_calibrator(FitMethod::platt_kfold, p, y)->kind() == CalibratorKind::platt);
    REQUIRE(fit_calibrator(FitMethod::isotonic, p, y)->kind() == CalibratorKind::isotonic);
    REQUIRE(fit_calibrator(FitMethod::isotonic_kfold, p, y)->kind() == CalibratorKind::isotonic_ensemble);

    const std::vector<double> short_y{1.0};
    auto bad = fit_calibrator(FitMethod::platt, p, short_y);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == core::error_code::shape_mismatch);
}

TEST_CASE("quality report", "[service]") {
    const std::vector<double> y{1.0, 0.0};
    const std::vector<double> p{0.8, 0.4};
    auto q = evaluate_calibration(y, p);
    REQUIRE(q.has_value());
    REQUIRE_THAT(q->brier, WithinAbs(0.1, 1e-12));
    REQUIRE_THAT(q->mse, WithinAbs(0.1, 1e-12));
    REQUIRE_THAT(q->rmse, WithinAbs(std::sqrt(0.1), 1e-12));
    REQUIRE_THAT(q->mae, WithinAbs(0.3, 1e-12));
}

TEST_CASE("fit_and_register improves and records quality", "[service]") {
    namespace fs = std::filesystem;
    std::vector<double> p, y;
    miscalibrated(5000, 2024, p, y);

    std::random_device rd;
    const auto base = fs::temp_directory_path() / ("calibet_service_" + std::to_string(rd()));
    registry::RegistryOptions opts;
    opts.durable = false;
    auto reg = registry::CalibratorRegistry::open(base, opts);
    REQUIRE(reg.has_value());

    auto res = fit_and_register(*reg, "Some Player", p, y, FitMethod::platt);
    REQUIRE(res.has_value());
    REQUIRE(res->after.brier < res->before.brier);
    REQUIRE(res->after.ece < res->before.ece);

    const auto& meta = res->record.metadata;
    REQUIRE(meta["method"] == "platt");
    REQUIRE(meta["n_samples"] == 5000);
    REQUIRE(meta["before"]["brier"].get<double>() == res->before.brier);
    REQUIRE(meta["after"]["ece"].get<double>() == res->after.ece);

    auto loaded = reg->load_latest("Some Player");
    REQUIRE(loaded.has_value());
    REQUIRE((*loaded)->kind() == CalibratorKind::platt);

    std::error_code ec;
    fs::remove_all(base, ec);
}
