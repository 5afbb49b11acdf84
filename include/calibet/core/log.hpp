#pragma once

/** \file log.hpp
 *  \brief Minimal leveled diagnostics to stderr.
 *
 * Lines are written as "[component][level] message". The threshold is read once
 * from CALIBET_LOG_LEVEL (debug|info|warn|error|off, default warn).
 */

#include <string_view>

namespace calibet::core {

enum class log_level : int { debug = 0, info = 1, warn = 2, error = 3, off = 4 };

/** \brief Parse a level name; unknown names map to warn. */
auto parse_log_level(std::string_view name) noexcept -> log_level;

/** \brief Current threshold (environment value cached on first use). */
auto log_threshold() noexcept -> log_level;

/** \brief Override the threshold for this process (tests, embedding apps). */
auto set_log_threshold(log_level level) noexcept -> void;

[[nodiscard]] inline auto log_enabled(log_level level) noexcept -> bool {
  return level >= log_threshold() && level != log_level::off;
}

/** \brief Write one diagnostic line when the level passes the threshold. */
auto log(log_level level, std::string_view component, std::string_view message) noexcept -> void;

} // namespace calibet::core
