#pragma once

/** \file coercion.hpp
 *  \brief Ordered coercion strategies for loosely typed candidate fields.
 *
 * Each strategy accepts one textual shape and returns either a value or an
 * error whose message is the rejection reason. coerce() tries strategies in
 * order and returns the first success; when all reject, the error lists every
 * strategy with its reason.
 *
 * Input text is trimmed of surrounding whitespace before any strategy runs.
 */

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "calibet/backtest/bet.hpp"
#include "calibet/error.hpp"

namespace calibet::backtest {

template <typename T>
struct Strategy {
    std::string_view name;
    auto (*parse)(std::string_view text) -> std::expected<T, core::error>;
};

/** \brief Remove leading and trailing ASCII whitespace. */
[[nodiscard]] auto trim(std::string_view s) noexcept -> std::string_view;

/** \brief Strict decimal number (the whole string must parse, finite). */
auto parse_number(std::string_view text) -> std::expected<double, core::error>;

template <typename T>
auto coerce(std::string_view field, std::string_view text, std::span<const Strategy<T>> strategies)
    -> std::expected<T, core::error> {
    const auto t = trim(text);
    std::string reasons;
    for (const auto& s : strategies) {
        auto r = s.parse(t);
        if (r) return r;
        if (!reasons.empty()) reasons += "; ";
        reasons.append(s.name).append(": ").append(r.error().message);
    }
    return core::make_error(core::error_code::invalid_argument,
                            "cannot coerce " + std::string(field) + " \"" + std::string(t) + "\" (" + reasons + ")",
                            "backtest.coercion");
}

namespace strategies {

// probability / confidence
auto unit_decimal(std::string_view text) -> std::expected<double, core::error>;       // "0.62"
auto percent_string(std::string_view text) -> std::expected<double, core::error>;     // "62%"
auto percent_number(std::string_view text) -> std::expected<double, core::error>;     // "62" in (1,100]

// decimal odds
auto decimal_odds(std::string_view text) -> std::expected<double, core::error>;       // "2.5"
auto american_odds(std::string_view text) -> std::expected<double, core::error>;      // "+150", "-120"
auto fractional_odds(std::string_view text) -> std::expected<double, core::error>;    // "3/2"

// event time
auto date_only(std::string_view text) -> std::expected<TimePoint, core::error>;       // "2024-01-31"
auto iso_datetime(std::string_view text) -> std::expected<TimePoint, core::error>;    // "2024-01-31T19:30:00Z"
auto spaced_datetime(std::string_view text) -> std::expected<TimePoint, core::error>; // "2024-01-31 19:30:00"

} // namespace strategies

auto coerce_probability(std::string_view text) -> std::expected<double, core::error>;
auto coerce_confidence(std::string_view text) -> std::expected<double, core::error>;
auto coerce_decimal_odds(std::string_view text) -> std::expected<double, core::error>;
auto coerce_event_time(std::string_view text) -> std::expected<TimePoint, core::error>;

/** \brief Outcome value; empty, "pending", "nan", "na", "null" or "none" mean pending (nullopt). */
auto coerce_outcome(std::string_view text) -> std::expected<std::optional<double>, core::error>;

/** \brief "YYYY-MM-DDTHH:MM:SSZ" (UTC, whole seconds). */
[[nodiscard]] auto format_event_time(TimePoint tp) -> std::string;

} // namespace calibet::backtest
