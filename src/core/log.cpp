#include "calibet/core/log.hpp"
#include "calibet/core/platform_utils.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace calibet::core {

namespace {

constexpr int kUnset = -1;
std::atomic<int> g_threshold{kUnset};
std::mutex g_write_mutex;

auto level_name(log_level level) noexcept -> const char* {
  switch (level) {
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warn: return "warn";
    case log_level::error: return "error";
    case log_level::off: return "off";
  }
  return "warn";
}

} // namespace

auto parse_log_level(std::string_view name) noexcept -> log_level {
  if (name == "debug") return log_level::debug;
  if (name == "info") return log_level::info;
  if (name == "warn" || name == "warning") return log_level::warn;
  if (name == "error") return log_level::error;
  if (name == "off" || name == "none" || name == "0") return log_level::off;
  return log_level::warn;
}

auto log_threshold() noexcept -> log_level {
  int v = g_threshold.load(std::memory_order_relaxed);
  if (v == kUnset) {
    const auto env = safe_getenv("CALIBET_LOG_LEVEL");
    const log_level lvl = env ? parse_log_level(*env) : log_level::warn;
    int expected = kUnset;
    g_threshold.compare_exchange_strong(expected, static_cast<int>(lvl), std::memory_order_relaxed);
    v = g_threshold.load(std::memory_order_relaxed);
  }
  return static_cast<log_level>(v);
}

auto set_log_threshold(log_level level) noexcept -> void {
  g_threshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

auto log(log_level level, std::string_view component, std::string_view message) noexcept -> void {
  if (!log_enabled(level)) return;
  std::lock_guard<std::mutex> lk(g_write_mutex);
  std::fprintf(stderr, "[%.*s][%s] %.*s\n",
               static_cast<int>(component.size()), component.data(),
               level_name(level),
               static_cast<int>(message.size()), message.data());
  std::fflush(stderr);
}

} // namespace calibet::core
