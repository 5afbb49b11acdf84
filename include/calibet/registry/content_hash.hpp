#pragma once

/** \file content_hash.hpp
 *  \brief Content-addressed version identifiers (OpenSSL SHA-1).
 */

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "calibet/error.hpp"

namespace calibet::registry {

inline constexpr std::size_t kVersionIdLength = 12;

/** \brief Lowercase hex SHA-1 digest of data (40 chars). */
auto sha1_hex(std::string_view data) -> std::expected<std::string, core::error>;

/** \brief First 12 hex chars of SHA-1 over the canonical JSON {created_at, metadata, name}.
 *
 * nlohmann::json objects keep keys sorted, so dump() is canonical for a given
 * metadata value.
 */
auto make_version_id(std::string_view name, const nlohmann::json& metadata,
                     std::string_view created_at)
    -> std::expected<std::string, core::error>;

/** \brief True for exactly 12 lowercase hex characters. */
[[nodiscard]] auto is_version_id(std::string_view s) noexcept -> bool;

} // namespace calibet::registry
