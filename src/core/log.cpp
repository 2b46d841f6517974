#include "walden/core/log.hpp"
#include "walden/core/env.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace walden::core {

namespace {
std::atomic<int> g_level{-1}; // -1 = not yet resolved from the environment
std::mutex g_out_mu;

constexpr std::string_view level_name(log_level level) {
  switch (level) {
    case log_level::error: return "error";
    case log_level::warn: return "warn";
    case log_level::info: return "info";
    case log_level::debug: return "debug";
    case log_level::off: return "off";
  }
  return "warn";
}
}

auto parse_log_level(std::string_view s) -> std::optional<log_level> {
  if (s == "off" || s == "0") return log_level::off;
  if (s == "error") return log_level::error;
  if (s == "warn" || s == "warning") return log_level::warn;
  if (s == "info") return log_level::info;
  if (s == "debug" || s == "1") return log_level::debug;
  return std::nullopt;
}

auto current_log_level() -> log_level {
  int lv = g_level.load(std::memory_order_acquire);
  if (lv < 0) {
    log_level resolved = log_level::warn;
    if (auto v = safe_getenv("WALDEN_LOG_LEVEL")) {
      if (auto parsed = parse_log_level(*v)) resolved = *parsed;
    }
    int expected = -1;
    g_level.compare_exchange_strong(expected, static_cast<int>(resolved), std::memory_order_acq_rel);
    lv = g_level.load(std::memory_order_acquire);
  }
  return static_cast<log_level>(lv);
}

void set_log_level(log_level level) {
  g_level.store(static_cast<int>(level), std::memory_order_release);
}

void log_line(log_level level, std::string_view component, std::string_view message) {
  if (!log_enabled(level)) return;
  std::string line;
  line.reserve(16 + component.size() + message.size());
  line.append("[WAL][").append(component).append("] ");
  line.append(level_name(level)).append(": ").append(message).append("\n");
  std::lock_guard<std::mutex> lk(g_out_mu);
  std::cerr << line;
}

} // namespace walden::core
