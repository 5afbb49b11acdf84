#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling (callers distinguish
 *   "degraded but valid" from "failed" by code, never by message text).
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace calibet::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,          /**< filesystem write/read failure (PersistenceError) */
  io_eof = 1002,
  config_invalid = 2001,
  data_integrity = 3001,     /**< corrupt or malformed persisted artifact */
  precondition_failed = 4001,
  insufficient_data = 4002,  /**< fewer paired samples than the configured minimum */
  shape_mismatch = 4003,     /**< paired inputs differ in length */
  numeric_failure = 4004,    /**< non-finite result from a numerical transform */
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "calibration.platt" */
};

/** \brief Stable lowercase name of an error code (for logs and reports). */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::insufficient_data: return "insufficient_data";
    case error_code::shape_mismatch: return "shape_mismatch";
    case error_code::numeric_failure: return "numeric_failure";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
  }
  return "unknown";
}

/** \brief Shorthand for building an unexpected error value. */
inline auto make_error(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace calibet::core
