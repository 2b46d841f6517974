#pragma once

/** \file env.hpp
 *  \brief Environment variable access used by configuration overrides and log verbosity.
 */

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace walden::core {

// Cross-platform getenv wrapper.
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
  if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
  char* buf = nullptr;
  size_t len = 0;
  if (_dupenv_s(&buf, &len, name) != 0 || buf == nullptr) {
    if (buf) std::free(buf);
    return std::nullopt;
  }
  std::string value(buf);
  std::free(buf);
  return value;
#else
  const char* v = std::getenv(name);
  if (!v) return std::nullopt;
  return std::string(v);
#endif
}

// Strict decimal parse of the whole string; rejects signs, blanks and trailing junk.
inline std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
  if (s.empty()) return std::nullopt;
  std::uint64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

inline std::optional<double> parse_f64(std::string_view s) noexcept {
  if (s.empty()) return std::nullopt;
  double out = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

} // namespace walden::core
