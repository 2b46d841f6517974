#pragma once

/** \file log.hpp
 *  \brief Tagged diagnostic lines on stderr: "[WAL][<component>] <message>".
 *
 * Verbosity comes from WALDEN_LOG_LEVEL (off|error|warn|info|debug, default warn),
 * read once on first use. Lines from concurrent threads never interleave.
 */

#include <optional>
#include <string_view>

namespace walden::core {

enum class log_level : int { off = 0, error = 1, warn = 2, info = 3, debug = 4 };

auto parse_log_level(std::string_view s) -> std::optional<log_level>;

/** Active threshold; overridable for tests and tools. */
auto current_log_level() -> log_level;
void set_log_level(log_level level);

[[nodiscard]] inline bool log_enabled(log_level level) {
  return level != log_level::off && static_cast<int>(level) <= static_cast<int>(current_log_level());
}

void log_line(log_level level, std::string_view component, std::string_view message);

inline void log_error(std::string_view component, std::string_view message) { log_line(log_level::error, component, message); }
inline void log_warn(std::string_view component, std::string_view message) { log_line(log_level::warn, component, message); }
inline void log_info(std::string_view component, std::string_view message) { log_line(log_level::info, component, message); }
inline void log_debug(std::string_view component, std::string_view message) { log_line(log_level::debug, component, message); }

} // namespace walden::core
