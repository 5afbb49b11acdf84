#include "calibet/calibration/kfold.hpp"
#include "calibet/core/log.hpp"
#include "calibet/core/platform_utils.hpp"
#include "calibet/core/thread_pool.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <numeric>
#include <optional>
#include <random>
#include <string>
#include <thread>

namespace calibet::calibration {

namespace {

constexpr const char* kComponent = "calibration.kfold";

auto resolve_threads(const KFoldParams& params) -> std::size_t {
    if (params.threads > 0) return params.threads;
    if (auto env = core::getenv_size("CALIBET_KFOLD_THREADS"); env && *env > 0) return *env;
    const std::size_t hw = std::max(1u, std::thread::hardware_concurrency() / 2);
    return std::min<std::size_t>(hw, params.k);
}

/** \brief Gather the training subset for fold `held_out`. */
auto training_slice(std::span<const double> p, std::span<const double> y,
                    const std::vector<std::vector<std::size_t>>& folds, std::size_t held_out)
    -> std::pair<std::vector<double>, std::vector<double>> {
    std::vector<double> tp, ty;
    tp.reserve(p.size());
    ty.reserve(y.size());
    for (std::size_t f = 0; f < folds.size(); ++f) {
        if (f == held_out) continue;
        for (std::size_t idx : folds[f]) {
            tp.push_back(p[idx]);
            ty.push_back(y[idx]);
        }
    }
    return {std::move(tp), std::move(ty)};
}

/** \brief Run fit_fold(i) for every fold on a pool; failed folds become std::nullopt. */
template <typename Model, typename FitFn>
auto run_folds(std::size_t k, std::size_t threads, FitFn fit_fold)
    -> std::vector<std::optional<Model>> {
    std::vector<std::optional<Model>> out(k);
    core::ThreadPool pool(std::min(threads, k));
    std::vector<std::future<std::expected<Model, core::error>>> futures;
    futures.reserve(k);
    for (std::size_t i = 0; i < k; ++i) {
        futures.push_back(pool.submit([&fit_fold, i] { return fit_fold(i); }));
    }
    for (std::size_t i = 0; i < k; ++i) {
        try {
            auto r = futures[i].get();
            if (r) {
                out[i] = std::move(*r);
            } else {
                core::log(core::log_level::warn, kComponent,
                          "fold " + std::to_string(i) + " skipped: " + r.error().message);
            }
        } catch (const std::exception& e) {
            core::log(core::log_level::warn, kComponent,
                      "fold " + std::to_string(i) + " skipped: " + e.what());
        }
    }
    return out;
}

} // anonymous namespace

auto make_folds(std::size_t n, std::uint32_t k, std::uint64_t seed)
    -> std::vector<std::vector<std::size_t>> {
    std::vector<std::vector<std::size_t>> folds;
    if (k == 0) return folds;
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::mt19937_64 rng(seed);
    std::shuffle(idx.begin(), idx.end(), rng);

    folds.resize(k);
    const std::size_t base = n / k;
    const std::size_t extra = n % k;
    std::size_t pos = 0;
    for (std::size_t f = 0; f < k; ++f) {
        const std::size_t len = base + (f < extra ? 1 : 0);
        folds[f].assign(idx.begin() + static_cast<std::ptrdiff_t>(pos),
                        idx.begin() + static_cast<std::ptrdiff_t>(pos + len));
        pos += len;
    }
    return folds;
}

auto fit_platt_kfold(std::span<const double> p, std::span<const double> y,
                     const KFoldParams& params)
    -> std::expected<PlattFit, core::error> {
    if (p.size() != y.size()) {
        return core::make_error(core::error_code::shape_mismatch,
            "p and y must have the same length (" + std::to_string(p.size()) + " vs " +
            std::to_string(y.size()) + ")", kComponent);
    }
    if (params.k < 2 || p.size() < params.k) {
        return fit_platt(p, y, params.platt);
    }

    const auto folds = make_folds(p.size(), params.k, params.seed);
    auto fits = run_folds<PlattFit>(folds.size(), resolve_threads(params),
        [&](std::size_t i) {
            auto [tp, ty] = training_slice(p, y, folds, i);
            return fit_platt(tp, ty, params.platt);
        });

    double a_sum = 0.0, b_sum = 0.0;
    std::size_t used = 0;
    std::uint32_t max_iters = 0;
    bool all_converged = true;
    for (const auto& f : fits) {
        if (!f) continue;
        a_sum += f->model.a;
        b_sum += f->model.b;
        max_iters = std::max(max_iters, f->iterations);
        all_converged = all_converged && f->converged;
        ++used;
    }
    if (used == 0) {
        core::log(core::log_level::warn, kComponent, "all folds failed, fitting on full data");
        return fit_platt(p, y, params.platt);
    }

    PlattFit out;
    out.model = PlattModel{a_sum / static_cast<double>(used), b_sum / static_cast<double>(used)};
    out.iterations = max_iters;
    out.converged = all_converged;
    return out;
}

auto fit_isotonic_kfold(std::span<const double> p, std::span<const double> y,
                        const KFoldParams& params)
    -> std::expected<IsotonicEnsemble, core::error> {
    if (p.size() != y.size()) {
        return core::make_error(core::error_code::shape_mismatch,
            "p and y must have the same length (" + std::to_string(p.size()) + " vs " +
            std::to_string(y.size()) + ")", kComponent);
    }

    auto single = [&]() -> std::expected<IsotonicEnsemble, core::error> {
        auto m = fit_isotonic(p, y, params.isotonic);
        if (!m) return std::unexpected(m.error());
        IsotonicEnsemble e;
        e.models.push_back(std::move(*m));
        return e;
    };

    if (params.k < 2 || p.size() < params.k) {
        return single();
    }

    const auto folds = make_folds(p.size(), params.k, params.seed);
    auto fits = run_folds<IsotonicModel>(folds.size(), resolve_threads(params),
        [&](std::size_t i) {
            auto [tp, ty] = training_slice(p, y, folds, i);
            return fit_isotonic(tp, ty, params.isotonic);
        });

    IsotonicEnsemble e;
    for (auto& f : fits) {
        if (f) e.models.push_back(std::move(*f));
    }
    if (e.models.empty()) {
        core::log(core::log_level::warn, kComponent, "all folds failed, fitting on full data");
        return single();
    }
    return e;
}

} // namespace calibet::calibration
