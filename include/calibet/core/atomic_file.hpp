#pragma once

/** \file atomic_file.hpp
 *  \brief Durable whole-file writes and reads.
 *
 * write_file_atomic:
 * - Write contents to a temporary sibling file (<name>.tmp) in the same directory
 * - Flush and fsync the temporary file (POSIX)
 * - Atomically replace the destination with std::filesystem::rename
 * - Best-effort fsync of the parent directory
 * - On failure the temporary file is removed and io_failed is returned
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "calibet/error.hpp"

namespace calibet::core {

auto write_file_atomic(const std::filesystem::path& path, std::string_view contents,
                       bool durable = true)
    -> std::expected<void, error>;

/** \brief Read a whole file; a missing file is not_found, other failures io_failed. */
auto read_file(const std::filesystem::path& path) -> std::expected<std::string, error>;

} // namespace calibet::core
