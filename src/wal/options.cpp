#include "walden/wal/options.hpp"
#include "walden/core/env.hpp"

#include <string>

namespace walden::wal {

auto to_string(FsyncMode mode) noexcept -> std::string_view {
  switch (mode) {
    case FsyncMode::Always: return "always";
    case FsyncMode::Batch: return "batch";
    case FsyncMode::Periodic: return "periodic";
  }
  return "always";
}

auto parse_fsync_mode(std::string_view s) -> std::optional<FsyncMode> {
  if (s == "always") return FsyncMode::Always;
  if (s == "batch") return FsyncMode::Batch;
  if (s == "periodic") return FsyncMode::Periodic;
  return std::nullopt;
}

auto validate(const WalOptions& opts) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (opts.base_path.empty()) return std::unexpected(error{error_code::config_invalid, "base_path is required", "wal.options"});
  if (opts.batch_size == 0) return std::unexpected(error{error_code::config_invalid, "batch_size must be > 0", "wal.options"});
  if (!(opts.batch_timeout > 0.0)) return std::unexpected(error{error_code::config_invalid, "batch_timeout must be > 0", "wal.options"});
  if (opts.checkpoint_interval == 0) return std::unexpected(error{error_code::config_invalid, "checkpoint_interval must be > 0", "wal.options"});
  if (opts.max_segment_size == 0) return std::unexpected(error{error_code::config_invalid, "max_segment_size must be > 0", "wal.options"});
  if (opts.keep_checkpoints == 0) return std::unexpected(error{error_code::config_invalid, "keep_checkpoints must be > 0", "wal.options"});
  return {};
}

auto apply_env_overrides(WalOptions& opts) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto bad = [](const char* name, const std::string& v) {
    return std::unexpected(error{error_code::config_invalid, std::string("invalid ") + name + "=\"" + v + "\"", "wal.options"});
  };
  if (auto v = core::safe_getenv("WALDEN_WAL_FSYNC_MODE")) {
    auto m = parse_fsync_mode(*v); if (!m) return bad("WALDEN_WAL_FSYNC_MODE", *v);
    opts.fsync_mode = *m;
  }
  if (auto v = core::safe_getenv("WALDEN_WAL_BATCH_SIZE")) {
    auto n = core::parse_u64(*v); if (!n) return bad("WALDEN_WAL_BATCH_SIZE", *v);
    opts.batch_size = static_cast<std::size_t>(*n);
  }
  if (auto v = core::safe_getenv("WALDEN_WAL_BATCH_TIMEOUT")) {
    auto d = core::parse_f64(*v); if (!d) return bad("WALDEN_WAL_BATCH_TIMEOUT", *v);
    opts.batch_timeout = *d;
  }
  if (auto v = core::safe_getenv("WALDEN_WAL_CHECKPOINT_INTERVAL")) {
    auto n = core::parse_u64(*v); if (!n) return bad("WALDEN_WAL_CHECKPOINT_INTERVAL", *v);
    opts.checkpoint_interval = *n;
  }
  if (auto v = core::safe_getenv("WALDEN_WAL_MAX_SEGMENT_SIZE")) {
    auto n = core::parse_u64(*v); if (!n) return bad("WALDEN_WAL_MAX_SEGMENT_SIZE", *v);
    opts.max_segment_size = *n;
  }
  if (auto v = core::safe_getenv("WALDEN_WAL_KEEP_CHECKPOINTS")) {
    auto n = core::parse_u64(*v); if (!n) return bad("WALDEN_WAL_KEEP_CHECKPOINTS", *v);
    opts.keep_checkpoints = static_cast<std::size_t>(*n);
  }
  return validate(opts);
}

} // namespace walden::wal
