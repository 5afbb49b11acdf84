#include "calibet/calibration/calibrator.hpp"
#include "calibet/core/log.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace calibet::calibration {

namespace {

constexpr const char* kComponent = "calibration.calibrator";
constexpr std::string_view kHeader = "calibet-calibrator v1";

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

auto format_double(double v) -> std::string {
    char buf[64];
    const int len = std::snprintf(buf, sizeof(buf), "%.17g", v);
    return std::string(buf, static_cast<std::size_t>(len));
}

auto parse_double(std::string_view s, double& out) -> bool {
    const char* beg = s.data(); const char* end = beg + s.size();
    auto [ptr, ec] = std::from_chars(beg, end, out);
    return ec == std::errc() && ptr == end && std::isfinite(out);
}

auto parse_count(std::string_view s, std::size_t& out) -> bool {
    const char* beg = s.data(); const char* end = beg + s.size();
    auto [ptr, ec] = std::from_chars(beg, end, out, 10);
    return ec == std::errc() && ptr == end;
}

auto append_isotonic(std::string& out, const IsotonicModel& m) -> void {
    out.append("knots=").append(std::to_string(m.xs.size())).append("\n");
    for (std::size_t i = 0; i < m.xs.size(); ++i) {
        out.append(format_double(m.xs[i])).append(" ").append(format_double(m.ys[i])).append("\n");
    }
}

/** \brief Line cursor over the blob, tracking line numbers for diagnostics. */
class LineReader {
public:
    explicit LineReader(std::string_view text) : text_(text) {}

    auto next(std::string_view& line) -> bool {
        while (pos_ <= text_.size()) {
            if (pos_ == text_.size()) return false;
            auto nl = text_.find('\n', pos_);
            if (nl == std::string_view::npos) nl = text_.size();
            line = text_.substr(pos_, nl - pos_);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            pos_ = nl + 1;
            ++line_no_;
            if (!line.empty()) return true;
        }
        return false;
    }

    [[nodiscard]] auto line_no() const noexcept -> std::size_t { return line_no_; }
    [[nodiscard]] auto remaining() const noexcept -> std::size_t {
        return pos_ < text_.size() ? text_.size() - pos_ : 0;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
    std::size_t line_no_{0};
};

auto parse_error(const LineReader& r, const std::string& what) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::data_integrity,
        "calibrator parse error at line " + std::to_string(r.line_no()) + ": " + what, kComponent);
}

auto read_kv(LineReader& r, std::string_view key, std::string_view& value)
    -> std::expected<void, core::error> {
    std::string_view line;
    if (!r.next(line)) return parse_error(r, "missing " + std::string(key));
    const auto eq = line.find('=');
    if (eq == std::string_view::npos || line.substr(0, eq) != key) {
        return parse_error(r, "expected " + std::string(key) + "=");
    }
    value = line.substr(eq + 1);
    return {};
}

auto read_isotonic(LineReader& r) -> std::expected<IsotonicModel, core::error> {
    std::string_view v;
    if (auto ok = read_kv(r, "knots", v); !ok) return std::unexpected(ok.error());
    std::size_t n = 0;
    if (!parse_count(v, n)) return parse_error(r, "invalid knots=\"" + std::string(v) + "\"");

    // Each knot needs at least one line of the blob.
    if (n > r.remaining()) return parse_error(r, "knot count exceeds blob size");

    IsotonicModel m;
    m.xs.reserve(n);
    m.ys.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        std::string_view line;
        if (!r.next(line)) return parse_error(r, "truncated knot list");
        const auto sp = line.find(' ');
        double x = 0.0, y = 0.0;
        if (sp == std::string_view::npos || !parse_double(line.substr(0, sp), x) ||
            !parse_double(line.substr(sp + 1), y)) {
            return parse_error(r, "invalid knot \"" + std::string(line) + "\"");
        }
        if (!m.xs.empty() && (x < m.xs.back() || y < m.ys.back())) {
            return parse_error(r, "knots are not non-decreasing");
        }
        m.xs.push_back(x);
        m.ys.push_back(y);
    }
    return m;
}

} // anonymous namespace

auto to_string(CalibratorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case CalibratorKind::platt: return "platt";
        case CalibratorKind::isotonic: return "isotonic";
        case CalibratorKind::isotonic_ensemble: return "isotonic_ensemble";
    }
    return "platt";
}

auto calibrator_kind_from_string(std::string_view s) -> std::expected<CalibratorKind, core::error> {
    if (s == "platt") return CalibratorKind::platt;
    if (s == "isotonic") return CalibratorKind::isotonic;
    if (s == "isotonic_ensemble") return CalibratorKind::isotonic_ensemble;
    return core::make_error(core::error_code::invalid_argument,
                            "unknown calibrator kind \"" + std::string(s) + "\"", kComponent);
}

auto Calibrator::kind() const noexcept -> CalibratorKind {
    return std::visit(overloaded{
        [](const PlattModel&) { return CalibratorKind::platt; },
        [](const IsotonicModel&) { return CalibratorKind::isotonic; },
        [](const IsotonicEnsemble&) { return CalibratorKind::isotonic_ensemble; },
    }, model_);
}

auto Calibrator::apply(double p) const noexcept -> double {
    return std::visit(overloaded{
        [p](const PlattModel& m) { return apply_platt(m, p); },
        [p](const IsotonicModel& m) { return apply_isotonic(m, p); },
        [p](const IsotonicEnsemble& e) { return apply_ensemble(e, p); },
    }, model_);
}

auto apply_ensemble(const IsotonicEnsemble& e, double p) noexcept -> double {
    if (e.models.empty()) return std::clamp(p, 0.0, 1.0);
    double sum = 0.0;
    for (const auto& m : e.models) sum += apply_isotonic(m, p);
    return sum / static_cast<double>(e.models.size());
}

auto calibrate(const Calibrator& c, double p) -> std::expected<double, core::error> {
    const double v = c.apply(p);
    if (!std::isfinite(v)) {
        return core::make_error(core::error_code::numeric_failure,
            "non-finite calibrated value for " + std::string(to_string(c.kind())) + " calibrator",
            kComponent);
    }
    return std::clamp(v, 0.0, 1.0);
}

auto calibrate_or_raw(const Calibrator& c, double p) -> double {
    auto v = calibrate(c, p);
    if (v) return *v;
    core::log(core::log_level::warn, kComponent, v.error().message + ", using raw probability");
    return p;
}

auto calibrate_all(const Calibrator& c, const std::vector<double>& p) -> std::vector<double> {
    std::vector<double> out;
    out.reserve(p.size());
    for (double v : p) out.push_back(calibrate_or_raw(c, v));
    return out;
}

auto serialize(const Calibrator& c) -> std::string {
    std::string out;
    out.append(kHeader).append("\n");
    out.append("kind=").append(to_string(c.kind())).append("\n");
    std::visit(overloaded{
        [&out](const PlattModel& m) {
            out.append("a=").append(format_double(m.a)).append("\n");
            out.append("b=").append(format_double(m.b)).append("\n");
        },
        [&out](const IsotonicModel& m) { append_isotonic(out, m); },
        [&out](const IsotonicEnsemble& e) {
            out.append("models=").append(std::to_string(e.models.size())).append("\n");
            for (const auto& m : e.models) append_isotonic(out, m);
        },
    }, c.model());
    return out;
}

auto deserialize(std::string_view text) -> std::expected<Calibrator, core::error> {
    LineReader r(text);
    std::string_view header;
    if (!r.next(header) || header != kHeader) {
        return core::make_error(core::error_code::data_integrity, "bad calibrator header", kComponent);
    }
    std::string_view kind_text;
    if (auto ok = read_kv(r, "kind", kind_text); !ok) return std::unexpected(ok.error());
    auto kind = calibrator_kind_from_string(kind_text);
    if (!kind) return parse_error(r, kind.error().message);

    switch (*kind) {
        case CalibratorKind::platt: {
            std::string_view av, bv;
            if (auto ok = read_kv(r, "a", av); !ok) return std::unexpected(ok.error());
            PlattModel m;
            if (!parse_double(av, m.a)) return parse_error(r, "invalid a=\"" + std::string(av) + "\"");
            if (auto ok = read_kv(r, "b", bv); !ok) return std::unexpected(ok.error());
            if (!parse_double(bv, m.b)) return parse_error(r, "invalid b=\"" + std::string(bv) + "\"");
            return Calibrator(m);
        }
        case CalibratorKind::isotonic: {
            auto m = read_isotonic(r);
            if (!m) return std::unexpected(m.error());
            return Calibrator(std::move(*m));
        }
        case CalibratorKind::isotonic_ensemble: {
            std::string_view kv;
            if (auto ok = read_kv(r, "models", kv); !ok) return std::unexpected(ok.error());
            std::size_t k = 0;
            if (!parse_count(kv, k)) return parse_error(r, "invalid models=\"" + std::string(kv) + "\"");
            if (k > r.remaining()) return parse_error(r, "model count exceeds blob size");
            IsotonicEnsemble e;
            e.models.reserve(k);
            for (std::size_t i = 0; i < k; ++i) {
                auto m = read_isotonic(r);
                if (!m) return std::unexpected(m.error());
                e.models.push_back(std::move(*m));
            }
            return Calibrator(std::move(e));
        }
    }
    return core::make_error(core::error_code::internal, "unreachable calibrator kind", kComponent);
}

} // namespace calibet::calibration
