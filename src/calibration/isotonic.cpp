#include "calibet/calibration/isotonic.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace calibet::calibration {

namespace {

constexpr const char* kComponent = "calibration.isotonic";

struct Block {
    double sum_p{0.0};
    double sum_y{0.0};
    std::size_t count{0};

    [[nodiscard]] double mean_y() const noexcept { return sum_y / static_cast<double>(count); }
    [[nodiscard]] double mean_p() const noexcept { return sum_p / static_cast<double>(count); }
};

} // anonymous namespace

auto fit_isotonic(std::span<const double> p, std::span<const double> y,
                  const IsotonicParams& params)
    -> std::expected<IsotonicModel, core::error> {
    using core::error_code;
    if (p.size() != y.size()) {
        return core::make_error(error_code::shape_mismatch,
            "p and y must have the same length (" + std::to_string(p.size()) + " vs " +
            std::to_string(y.size()) + ")", kComponent);
    }
    const std::size_t n = p.size();
    if (n < params.min_samples) {
        return core::make_error(error_code::insufficient_data,
            "need at least " + std::to_string(params.min_samples) + " paired samples, got " +
            std::to_string(n), kComponent);
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(p[i]) || !std::isfinite(y[i])) {
            return core::make_error(error_code::invalid_argument,
                "non-finite input at index " + std::to_string(i), kComponent);
        }
    }
    IsotonicModel model;
    if (n == 0) return model;

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t l, std::size_t r) { return p[l] < p[r]; });

    // Blocks form a stack: each new point enters as a singleton block and merges
    // backwards while the previous block's mean exceeds it. This is the
    // left-to-right scan that steps back one block after every merge.
    std::vector<Block> blocks;
    blocks.reserve(n);
    for (std::size_t idx : order) {
        blocks.push_back(Block{p[idx], y[idx], 1});
        while (blocks.size() >= 2) {
            const std::size_t last = blocks.size() - 1;
            if (blocks[last - 1].mean_y() <= blocks[last].mean_y()) break;
            blocks[last - 1].sum_p += blocks[last].sum_p;
            blocks[last - 1].sum_y += blocks[last].sum_y;
            blocks[last - 1].count += blocks[last].count;
            blocks.pop_back();
        }
    }

    model.xs.reserve(blocks.size());
    model.ys.reserve(blocks.size());
    for (const auto& b : blocks) {
        model.xs.push_back(b.mean_p());
        model.ys.push_back(b.mean_y());
    }
    return model;
}

auto apply_isotonic(const IsotonicModel& m, double p) noexcept -> double {
    if (m.empty()) return std::clamp(p, 0.0, 1.0);
    if (std::isnan(p)) return p;

    double out;
    if (p <= m.xs.front()) {
        out = m.ys.front();
    } else if (p >= m.xs.back()) {
        out = m.ys.back();
    } else {
        // First knot strictly greater than p; p lies in [xs[hi-1], xs[hi]).
        auto it = std::upper_bound(m.xs.begin(), m.xs.end(), p);
        const auto hi = static_cast<std::size_t>(it - m.xs.begin());
        const std::size_t lo = hi - 1;
        const double dx = m.xs[hi] - m.xs[lo];
        if (dx <= 0.0) {
            out = m.ys[hi];
        } else {
            const double t = (p - m.xs[lo]) / dx;
            out = m.ys[lo] + t * (m.ys[hi] - m.ys[lo]);
        }
    }
    return std::clamp(out, 0.0, 1.0);
}

} // namespace calibet::calibration
