#include "calibet/calibration/calibration_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace calibet::calibration {

namespace {

constexpr const char* kComponent = "calibration.metrics";

auto check_pair(std::span<const double> y_true, std::span<const double> y_prob)
    -> std::expected<void, core::error> {
    if (y_true.size() != y_prob.size()) {
        return core::make_error(core::error_code::shape_mismatch,
            "y_true and y_prob must have the same length (" + std::to_string(y_true.size()) +
            " vs " + std::to_string(y_prob.size()) + ")", kComponent);
    }
    if (y_true.empty()) {
        return core::make_error(core::error_code::insufficient_data, "empty input", kComponent);
    }
    return {};
}

} // anonymous namespace

auto calibration_bin(double p, std::uint32_t n_bins) noexcept -> std::size_t {
    if (n_bins == 0) return 0;
    if (!(p > 0.0)) return 0;  // also catches NaN
    const double scaled = std::floor(p * static_cast<double>(n_bins));
    if (scaled >= static_cast<double>(n_bins - 1)) return n_bins - 1;
    return static_cast<std::size_t>(scaled);
}

auto brier_score(std::span<const double> y_true, std::span<const double> y_prob)
    -> std::expected<double, core::error> {
    if (auto ok = check_pair(y_true, y_prob); !ok) return std::unexpected(ok.error());
    double sum = 0.0;
    for (std::size_t i = 0; i < y_true.size(); ++i) {
        const double d = y_prob[i] - y_true[i];
        sum += d * d;
    }
    return sum / static_cast<double>(y_true.size());
}

auto reliability_diagram(std::span<const double> y_true, std::span<const double> y_prob,
                         std::uint32_t n_bins)
    -> std::expected<std::vector<ReliabilityBin>, core::error> {
    if (n_bins < 1) {
        return core::make_error(core::error_code::invalid_argument, "n_bins must be >= 1", kComponent);
    }
    if (auto ok = check_pair(y_true, y_prob); !ok) return std::unexpected(ok.error());

    std::vector<ReliabilityBin> bins(n_bins);
    std::vector<double> sum_pred(n_bins, 0.0), sum_obs(n_bins, 0.0);
    const double width = 1.0 / static_cast<double>(n_bins);
    for (std::size_t b = 0; b < n_bins; ++b) {
        bins[b].center = (static_cast<double>(b) + 0.5) * width;
    }
    for (std::size_t i = 0; i < y_prob.size(); ++i) {
        const std::size_t b = calibration_bin(y_prob[i], n_bins);
        sum_pred[b] += y_prob[i];
        sum_obs[b] += y_true[i];
        ++bins[b].count;
    }
    for (std::size_t b = 0; b < n_bins; ++b) {
        if (bins[b].count == 0) continue;
        const double c = static_cast<double>(bins[b].count);
        bins[b].mean_predicted = sum_pred[b] / c;
        bins[b].mean_observed = sum_obs[b] / c;
    }
    return bins;
}

auto expected_calibration_error(std::span<const double> y_true, std::span<const double> y_prob,
                                std::uint32_t n_bins)
    -> std::expected<double, core::error> {
    auto bins = reliability_diagram(y_true, y_prob, n_bins);
    if (!bins) return std::unexpected(bins.error());
    const double n = static_cast<double>(y_true.size());
    double ece = 0.0;
    for (const auto& b : *bins) {
        if (b.count == 0) continue;
        ece += std::abs(b.mean_predicted - b.mean_observed) * (static_cast<double>(b.count) / n);
    }
    return ece;
}

} // namespace calibet::calibration
