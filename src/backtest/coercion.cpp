#include "calibet/backtest/coercion.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdio>

namespace calibet::backtest {

namespace {

constexpr const char* kComponent = "backtest.coercion";

auto reject(std::string reason) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::invalid_argument, std::move(reason), kComponent);
}

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

auto fixed_int(std::string_view s, std::size_t pos, std::size_t len, int& out) -> bool {
    if (pos + len > s.size()) return false;
    const char* beg = s.data() + pos;
    const char* end = beg + len;
    auto [ptr, ec] = std::from_chars(beg, end, out, 10);
    return ec == std::errc() && ptr == end;
}

auto make_date(int y, int m, int d) -> std::expected<std::chrono::sys_days, core::error> {
    using namespace std::chrono;
    const year_month_day ymd{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return reject("not a calendar date");
    return sys_days{ymd};
}

/** \brief "YYYY-MM-DD<sep>HH:MM:SS[.fraction][Z]" */
auto parse_datetime(std::string_view t, char sep) -> std::expected<TimePoint, core::error> {
    if (t.size() < 19 || t[4] != '-' || t[7] != '-' || t[10] != sep || t[13] != ':' || t[16] != ':') {
        return reject(std::string("expected YYYY-MM-DD") + sep + "HH:MM:SS");
    }
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!fixed_int(t, 0, 4, y) || !fixed_int(t, 5, 2, mo) || !fixed_int(t, 8, 2, d) ||
        !fixed_int(t, 11, 2, h) || !fixed_int(t, 14, 2, mi) || !fixed_int(t, 17, 2, s)) {
        return reject("non-numeric date/time field");
    }
    if (h > 23 || mi > 59 || s > 60) return reject("time of day out of range");

    std::size_t pos = 19;
    std::chrono::microseconds frac{0};
    if (pos < t.size() && t[pos] == '.') {
        ++pos;
        long long scale = 100000;
        long long us = 0;
        const std::size_t start = pos;
        while (pos < t.size() && std::isdigit(static_cast<unsigned char>(t[pos]))) {
            us += (t[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == start) return reject("empty fractional seconds");
        frac = std::chrono::microseconds{us};
    }
    if (pos < t.size() && (t[pos] == 'Z' || t[pos] == 'z')) ++pos;
    if (pos != t.size()) return reject("trailing characters");

    auto date = make_date(y, mo, d);
    if (!date) return std::unexpected(date.error());
    using namespace std::chrono;
    return TimePoint{*date} + hours{h} + minutes{mi} + seconds{s} + frac;
}

} // anonymous namespace

auto trim(std::string_view s) noexcept -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

auto parse_number(std::string_view text) -> std::expected<double, core::error> {
    const auto t = trim(text);
    if (t.empty()) return reject("empty");
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), v);
    if (ec != std::errc() || ptr != t.data() + t.size()) return reject("not a number");
    if (!std::isfinite(v)) return reject("not finite");
    return v;
}

namespace strategies {

auto unit_decimal(std::string_view text) -> std::expected<double, core::error> {
    auto v = parse_number(text);
    if (!v) return v;
    if (*v < 0.0 || *v > 1.0) return reject("outside [0, 1]");
    return v;
}

auto percent_string(std::string_view text) -> std::expected<double, core::error> {
    auto t = trim(text);
    if (t.empty() || t.back() != '%') return reject("no '%' suffix");
    t.remove_suffix(1);
    auto v = parse_number(t);
    if (!v) return v;
    if (*v < 0.0 || *v > 100.0) return reject("outside [0%, 100%]");
    return *v / 100.0;
}

auto percent_number(std::string_view text) -> std::expected<double, core::error> {
    auto v = parse_number(text);
    if (!v) return v;
    if (*v <= 1.0 || *v > 100.0) return reject("outside (1, 100]");
    return *v / 100.0;
}

auto decimal_odds(std::string_view text) -> std::expected<double, core::error> {
    auto v = parse_number(text);
    if (!v) return v;
    if (*v <= 1.0) return reject("decimal odds must be > 1");
    return v;
}

auto american_odds(std::string_view text) -> std::expected<double, core::error> {
    auto t = trim(text);
    if (t.empty() || (t.front() != '+' && t.front() != '-')) return reject("no sign");
    const bool positive = t.front() == '+';
    auto v = parse_number(t.substr(1));
    if (!v) return v;
    if (*v < 100.0) return reject("magnitude below 100");
    return positive ? 1.0 + *v / 100.0 : 1.0 + 100.0 / *v;
}

auto fractional_odds(std::string_view text) -> std::expected<double, core::error> {
    auto t = trim(text);
    const auto slash = t.find('/');
    if (slash == std::string_view::npos) return reject("no '/'");
    auto num = parse_number(t.substr(0, slash));
    auto den = parse_number(t.substr(slash + 1));
    if (!num || !den) return reject("non-numeric fraction");
    if (*num <= 0.0 || *den <= 0.0) return reject("fraction terms must be > 0");
    return 1.0 + *num / *den;
}

auto date_only(std::string_view text) -> std::expected<TimePoint, core::error> {
    auto t = trim(text);
    if (t.size() != 10 || t[4] != '-' || t[7] != '-') return reject("expected YYYY-MM-DD");
    int y = 0, m = 0, d = 0;
    if (!fixed_int(t, 0, 4, y) || !fixed_int(t, 5, 2, m) || !fixed_int(t, 8, 2, d)) {
        return reject("non-numeric date field");
    }
    auto date = make_date(y, m, d);
    if (!date) return std::unexpected(date.error());
    return TimePoint{*date};
}

auto iso_datetime(std::string_view text) -> std::expected<TimePoint, core::error> {
    return parse_datetime(trim(text), 'T');
}

auto spaced_datetime(std::string_view text) -> std::expected<TimePoint, core::error> {
    return parse_datetime(trim(text), ' ');
}

} // namespace strategies

auto coerce_probability(std::string_view text) -> std::expected<double, core::error> {
    static constexpr std::array<Strategy<double>, 3> kStrategies{{
        {"decimal", &strategies::unit_decimal},
        {"percent_string", &strategies::percent_string},
        {"percent_number", &strategies::percent_number},
    }};
    return coerce<double>("probability", text, kStrategies);
}

auto coerce_confidence(std::string_view text) -> std::expected<double, core::error> {
    static constexpr std::array<Strategy<double>, 3> kStrategies{{
        {"decimal", &strategies::unit_decimal},
        {"percent_string", &strategies::percent_string},
        {"percent_number", &strategies::percent_number},
    }};
    return coerce<double>("confidence", text, kStrategies);
}

auto coerce_decimal_odds(std::string_view text) -> std::expected<double, core::error> {
    static constexpr std::array<Strategy<double>, 3> kStrategies{{
        {"decimal", &strategies::decimal_odds},
        {"american", &strategies::american_odds},
        {"fractional", &strategies::fractional_odds},
    }};
    return coerce<double>("odds", text, kStrategies);
}

auto coerce_event_time(std::string_view text) -> std::expected<TimePoint, core::error> {
    static constexpr std::array<Strategy<TimePoint>, 3> kStrategies{{
        {"date", &strategies::date_only},
        {"iso_datetime", &strategies::iso_datetime},
        {"spaced_datetime", &strategies::spaced_datetime},
    }};
    return coerce<TimePoint>("event time", text, kStrategies);
}

auto coerce_outcome(std::string_view text) -> std::expected<std::optional<double>, core::error> {
    const auto t = trim(text);
    for (std::string_view pending : {"", "pending", "nan", "na", "null", "none"}) {
        if (iequals(t, pending)) return std::optional<double>{};
    }
    auto v = parse_number(t);
    if (!v) {
        return core::make_error(core::error_code::invalid_argument,
                                "cannot coerce outcome \"" + std::string(t) + "\" (" + v.error().message + ")",
                                kComponent);
    }
    return std::optional<double>{*v};
}

auto format_event_time(TimePoint tp) -> std::string {
    using namespace std::chrono;
    const auto secs = floor<seconds>(tp);
    const auto day_start = floor<days>(secs);
    const year_month_day ymd{day_start};
    const hh_mm_ss hms{secs - day_start};
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()));
    return buf;
}

} // namespace calibet::backtest
