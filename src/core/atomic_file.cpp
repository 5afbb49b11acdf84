#include "calibet/core/atomic_file.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace calibet::core {

namespace {

constexpr const char* kComponent = "core.atomic_file";

#if defined(__linux__) || defined(__APPLE__)
auto fsync_path(const std::filesystem::path& p) -> bool {
  int fd = ::open(p.c_str(), O_RDONLY);
  if (fd < 0) return false;
  const bool ok = ::fsync(fd) == 0;
  (void)::close(fd);
  return ok;
}
#endif

} // anonymous namespace

auto write_file_atomic(const std::filesystem::path& path, std::string_view contents, bool durable)
    -> std::expected<void, error> {
  auto tmp = path;
  tmp += ".tmp";
  // 1) Write tmp
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return make_error(error_code::io_failed, "open for write failed: " + tmp.string(), kComponent);
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code rec; (void)std::filesystem::remove(tmp, rec);
      return make_error(error_code::io_failed, "write failed: " + tmp.string(), kComponent);
    }
  }
  // 2) Ensure tmp contents durable
#if defined(__linux__) || defined(__APPLE__)
  if (durable && !fsync_path(tmp)) {
    std::error_code rec; (void)std::filesystem::remove(tmp, rec);
    return make_error(error_code::io_failed, "fsync failed: " + tmp.string(), kComponent);
  }
#endif
  // 3) Atomic replace
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code rec; (void)std::filesystem::remove(tmp, rec);
    return make_error(error_code::io_failed, "rename failed: " + path.string() + ": " + ec.message(), kComponent);
  }
  // 4) Best-effort directory flush
#if defined(__linux__) || defined(__APPLE__)
  if (durable) (void)fsync_path(path.parent_path());
#endif
  return {};
}

auto read_file(const std::filesystem::path& path) -> std::expected<std::string, error> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return make_error(error_code::not_found, "no such file: " + path.string(), kComponent);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) {
    return make_error(error_code::io_failed, "open for read failed: " + path.string(), kComponent);
  }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return make_error(error_code::io_failed, "read failed: " + path.string(), kComponent);
  }
  return data;
}

} // namespace calibet::core
