#pragma once

/** \file candidate_csv.hpp
 *  \brief Load bet candidates from a header-named CSV file.
 *
 * Column names are matched case-insensitively; the first matching alias wins.
 *   event time   game_date | date | game_date_utc        (required)
 *   label        player | label                          (optional, empty)
 *   probability  over_probability | prob_over            (default 0.5)
 *   odds         decimal_odds | odds                     (default 2.0)
 *   under odds   decimal_odds_under                      (vig removed when present)
 *   confidence   confidence                              (optional)
 *   line         line                                    (optional)
 *   prediction   predicted_value                         (optional)
 *   actual       actual_value | value                    (optional; empty = pending)
 *
 * Fields may be double-quoted; "" inside quotes is a literal quote. Rows are
 * returned stable-sorted by event time.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "calibet/backtest/bet.hpp"
#include "calibet/error.hpp"

namespace calibet::backtest {

/** \brief Split one CSV record into fields. */
[[nodiscard]] auto split_csv_line(std::string_view line) -> std::vector<std::string>;

/** \brief Parse CSV text (header + rows); malformed fields -> data_integrity with line number. */
auto parse_candidates_csv(std::string_view text) -> std::expected<std::vector<BetCandidate>, core::error>;

auto load_candidates_csv(const std::filesystem::path& path)
    -> std::expected<std::vector<BetCandidate>, core::error>;

} // namespace calibet::backtest
